#include "minitest.hpp"
#include "FakeProcessTable.hpp"
#include "app/Terminator.hpp"
#include "collectors/PosixSignaller.hpp"
#include "collectors/ProcfsProcessTable.hpp"

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <thread>

using namespace std::chrono_literals;
using warden::app::KillOptions;
using warden::app::KillResult;
using warden::app::Registry;
using warden::app::Terminator;
using warden::model::Classification;
using warden::model::OrphanCandidate;

namespace {

OrphanCandidate cand(int32_t pid, Classification c = Classification::Confirmed) {
  OrphanCandidate oc;
  oc.pid = pid;
  oc.command = "test";
  oc.classification = c;
  oc.reason = "test";
  return oc;
}

KillOptions quick() {
  KillOptions o;
  o.timeout = 100ms;
  o.poll_interval = 10ms;
  o.confirm_wait = 20ms;
  return o;
}

struct Harness {
  TempDir dir;
  FakeProcessTable table;
  Registry registry;
  Terminator term;
  explicit Harness(const char* tag) : dir(tag), registry(dir.path), term(registry, table, table) {}
  void record(int32_t pid) {
    warden::model::ProcessMetadata m;
    m.command = "test";
    registry.add(pid, m);
  }
};

} // namespace

TEST(terminator_never_signals_low_pids) {
  Harness h("term_low");
  h.table.add(1, "init");
  h.table.add(50, "claude");
  h.table.add(100, "claude");
  auto o = quick();
  o.force = true;
  auto out = h.term.kill({cand(1), cand(50), cand(100)}, o);
  ASSERT_EQ(out.skipped.size(), 3u);
  ASSERT_TRUE(out.killed.empty());
  ASSERT_TRUE(h.table.signals().empty());
  ASSERT_EQ(h.term.terminate(42, o).result, Terminator::Result::Skipped);
  ASSERT_TRUE(h.table.signals().empty());
}

TEST(terminator_suspected_needs_force) {
  Harness h("term_force");
  h.table.add(2001, "claude");
  auto out = h.term.kill({cand(2001, Classification::Suspected)}, quick());
  ASSERT_TRUE(out.skipped.count(2001));
  ASSERT_TRUE(h.table.signals().empty());
  ASSERT_TRUE(h.table.alive(2001));

  auto o = quick();
  o.force = true;
  out = h.term.kill({cand(2001, Classification::Suspected)}, o);
  ASSERT_TRUE(out.killed.count(2001));
  ASSERT_TRUE(!h.table.alive(2001));
}

TEST(terminator_sigterm_is_enough_for_polite_process) {
  Harness h("term_polite");
  h.table.add(2100, "claude");
  h.record(2100);
  auto out = h.term.kill({cand(2100)}, quick());
  ASSERT_TRUE(out.killed.count(2100));
  ASSERT_EQ(out.notes[2100], "SIGTERM");
  auto sigs = h.table.signals_for(2100);
  ASSERT_EQ(sigs.size(), 1u);
  ASSERT_EQ(sigs[0].sig, SIGTERM);
  ASSERT_TRUE(!h.registry.contains(2100));
}

TEST(terminator_escalates_to_sigkill_after_timeout) {
  Harness h("term_escalate");
  h.table.add(2200, "stubborn").responds_to_term = false;
  h.record(2200);
  auto o = quick();
  o.timeout = 200ms;
  o.poll_interval = 20ms;
  auto out = h.term.kill({cand(2200)}, o);
  ASSERT_TRUE(out.killed.count(2200));
  ASSERT_EQ(out.notes[2200], "SIGKILL");
  auto sigs = h.table.signals_for(2200);
  ASSERT_EQ(sigs.size(), 2u);
  ASSERT_EQ(sigs[0].sig, SIGTERM);
  ASSERT_EQ(sigs[1].sig, SIGKILL);
  auto gap = sigs[1].at - sigs[0].at;
  ASSERT_TRUE(gap >= o.timeout);
  ASSERT_TRUE(gap <= o.timeout + o.poll_interval + 30ms); // scheduling slack
  ASSERT_TRUE(!h.registry.contains(2200));
}

TEST(terminator_reports_survivor) {
  Harness h("term_survivor");
  auto& p = h.table.add(2300, "unkillable");
  p.responds_to_term = false;
  p.survives_kill = true;
  h.record(2300);
  auto out = h.term.kill({cand(2300)}, quick());
  ASSERT_EQ(out.failed.size(), 1u);
  ASSERT_EQ(out.failed[0].pid, 2300);
  ASSERT_EQ(out.failed[0].error, "process survived SIGKILL");
  ASSERT_TRUE(h.registry.contains(2300));
}

TEST(terminator_permission_denied_does_not_abort_batch) {
  Harness h("term_eperm");
  h.table.add(2400, "root-owned").eperm = true;
  h.table.add(2401, "mine");
  h.table.add(2402, "mine too");
  auto out = h.term.kill({cand(2400), cand(2401), cand(2402)}, quick());
  ASSERT_EQ(out.failed.size(), 1u);
  ASSERT_EQ(out.failed[0].error, "permission denied");
  ASSERT_EQ(out.killed.size(), 2u);
  ASSERT_TRUE(out.has_failure(2400));
}

TEST(terminator_already_gone_counts_as_killed) {
  Harness h("term_gone");
  h.record(2500);
  auto out = h.term.kill({cand(2500)}, quick());
  ASSERT_TRUE(out.killed.count(2500));
  ASSERT_EQ(out.notes[2500], "already cleaned");
  ASSERT_TRUE(h.table.signals().empty());
  ASSERT_TRUE(!h.registry.contains(2500));
  // and again: still fine
  out = h.term.kill({cand(2500)}, quick());
  ASSERT_TRUE(out.killed.count(2500));
  ASSERT_TRUE(out.failed.empty());
}

TEST(terminator_dry_run_sends_nothing) {
  Harness h("term_dry");
  h.table.add(2600, "claude");
  h.record(2600);
  auto o = quick();
  o.dry_run = true;
  auto out = h.term.kill({cand(2600)}, o);
  ASSERT_TRUE(out.dry_run);
  ASSERT_TRUE(out.killed.count(2600));
  ASSERT_EQ(out.notes[2600], "would kill");
  ASSERT_TRUE(h.table.signals().empty());
  ASSERT_TRUE(h.table.alive(2600));
  ASSERT_TRUE(h.registry.contains(2600));
}

TEST(terminator_parallel_batch) {
  Harness h("term_parallel");
  std::vector<OrphanCandidate> cs;
  for (int32_t pid = 3000; pid < 3008; ++pid) {
    h.table.add(pid, "stubborn").responds_to_term = false;
    cs.push_back(cand(pid));
  }
  auto o = quick();
  o.timeout = 150ms;
  o.parallelism = 8;
  auto t0 = std::chrono::steady_clock::now();
  auto out = h.term.kill(cs, o);
  auto took = std::chrono::steady_clock::now() - t0;
  ASSERT_EQ(out.killed.size(), 8u);
  ASSERT_TRUE(took < 8 * o.timeout); // not serialized
}

TEST(terminator_reap_exited_drops_terminated_records) {
  Harness h("term_reap");
  h.record(3100);
  h.record(3101);
  h.table.add(3101, "test");
  h.registry.update_status(3100, warden::model::ProcessStatus::Terminated);
  ASSERT_EQ(h.term.reap_exited(), 1u);
  ASSERT_TRUE(!h.registry.contains(3100));
  ASSERT_TRUE(h.registry.contains(3101));
}

TEST(terminator_busy_registry_lock_does_not_abort_batch) {
  TempDir dir("term_lock_busy");
  FakeProcessTable table;
  warden::util::FileLockOptions lo;
  lo.retry_interval = 2ms;
  lo.max_retries = 2;
  lo.is_alive = [](int32_t) { return true; };
  Registry registry(dir.path, lo);
  Terminator term(registry, table, table);
  warden::model::ProcessMetadata m;
  m.command = "claude";
  for (int32_t pid : {4000, 4001}) {
    table.add(pid, "claude");
    registry.add(pid, m);
  }
  // another instance holds the state lock for the whole batch
  { std::ofstream lock(dir.path / "processes.json.lock"); lock << ::getpid(); }

  auto o = quick();
  o.parallelism = 4;
  auto out = term.kill({cand(4000), cand(4001)}, o);
  ASSERT_EQ(out.killed.size(), 2u);
  ASSERT_TRUE(out.failed.empty());
  ASSERT_EQ(out.notes[4000], "SIGTERM; registry update deferred");
  ASSERT_EQ(out.notes[4001], "SIGTERM; registry update deferred");
  ASSERT_TRUE(!registry.contains(4000));
  ASSERT_TRUE(!registry.contains(4001));

  // a single terminate reports the same way
  table.add(4002, "claude");
  auto one = term.terminate(4002, o);
  ASSERT_EQ(one.result, KillResult::Killed);
  ASSERT_EQ(one.note, "SIGTERM; registry update deferred");

  // once the lock frees up the next write drops both records from disk
  std::filesystem::remove(dir.path / "processes.json.lock");
  registry.persist();
  Registry reloaded(dir.path);
  reloaded.load();
  ASSERT_EQ(reloaded.size(), 0u);
}

TEST(terminator_reap_exited_with_busy_lock) {
  TempDir dir("term_reap_busy");
  FakeProcessTable table;
  warden::util::FileLockOptions lo;
  lo.retry_interval = 2ms;
  lo.max_retries = 2;
  lo.is_alive = [](int32_t) { return true; };
  Registry registry(dir.path, lo);
  Terminator term(registry, table, table);
  warden::model::ProcessMetadata m;
  m.command = "test";
  registry.add(4050, m);
  registry.update_status(4050, warden::model::ProcessStatus::Terminated);
  { std::ofstream lock(dir.path / "processes.json.lock"); lock << ::getpid(); }
  ASSERT_EQ(term.reap_exited(), 1u);
  ASSERT_TRUE(!registry.contains(4050));
}

TEST(terminator_reports_each_outcome_as_it_happens) {
  Harness h("term_events");
  h.table.add(4100, "claude");
  h.table.add(4101, "claude");
  h.table.add(4102, "root-owned").eperm = true;
  std::mutex mu;
  std::map<int32_t, std::pair<KillResult, std::string>> seen;
  int calls = 0;
  auto o = quick();
  o.parallelism = 4;
  o.on_event = [&](int32_t pid, KillResult r, const std::string& detail) {
    std::lock_guard<std::mutex> lk(mu);
    ++calls;
    seen[pid] = {r, detail};
  };
  auto out = h.term.kill({cand(50), cand(4100), cand(4101, Classification::Suspected), cand(4102)}, o);
  ASSERT_EQ(calls, 4);
  ASSERT_EQ(seen[50].first, KillResult::Skipped);
  ASSERT_EQ(seen[50].second, "protected pid");
  ASSERT_EQ(seen[4100].first, KillResult::Killed);
  ASSERT_EQ(seen[4100].second, "SIGTERM");
  ASSERT_EQ(seen[4101].first, KillResult::Skipped);
  ASSERT_EQ(seen[4101].second, "suspected; use force");
  ASSERT_EQ(seen[4102].first, KillResult::Failed);
  ASSERT_EQ(seen[4102].second, "permission denied");
  ASSERT_EQ(seen.size(), out.notes.size());
}

TEST(terminator_real_child_ignoring_sigterm) {
  pid_t pid = ::fork();
  if (pid == 0) {
    ::signal(SIGTERM, SIG_IGN);
    ::execlp("sleep", "sleep", "30", (char*)nullptr);
    _exit(127);
  }
  ASSERT_TRUE(pid > 0);
  if (pid <= 100) { // protected range in a fresh pid namespace
    ::kill(pid, SIGKILL);
    ::waitpid(pid, nullptr, 0);
    return;
  }
  std::this_thread::sleep_for(50ms); // let exec happen
  TempDir dir("term_real");
  Registry reg(dir.path);
  warden::collectors::ProcfsProcessTable table;
  warden::collectors::PosixSignaller sig;
  Terminator term(reg, table, sig);
  auto o = quick();
  o.timeout = 200ms;
  o.confirm_wait = 1000ms;
  auto out = term.kill({cand(pid)}, o);
  int status = 0;
  ::waitpid(pid, &status, 0);
  ASSERT_TRUE(out.killed.count(pid));
  ASSERT_EQ(out.notes[pid], "SIGKILL");
  ASSERT_TRUE(WIFSIGNALED(status));
  ASSERT_EQ(WTERMSIG(status), SIGKILL);
}
