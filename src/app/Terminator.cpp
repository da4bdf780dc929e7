#include "app/Terminator.hpp"
#include "util/FileLock.hpp"
#include "util/Log.hpp"

#include <signal.h>

#include <algorithm>
#include <atomic>
#include <cstring>
#include <mutex>
#include <thread>

namespace warden::app {

using collectors::SignalStatus;

Terminator::Terminator(Registry& registry, collectors::IProcessTable& table, collectors::ISignaller& signaller)
    : registry_(registry), table_(table), signaller_(signaller) {}

bool Terminator::wait_exit(int32_t pid, std::chrono::milliseconds budget, std::chrono::milliseconds poll) {
  auto deadline = std::chrono::steady_clock::now() + budget;
  if (poll.count() <= 0) poll = std::chrono::milliseconds(1);
  while (true) {
    if (!table_.alive(pid)) return true;
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) return false;
    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(poll, deadline - now));
  }
}

static Terminator::Single signal_failure(int32_t pid, int sig, const collectors::SignalResult& r) {
  Terminator::Single s;
  s.result = Terminator::Result::Failed;
  switch (r.status) {
    case SignalStatus::PermissionDenied: s.error = "permission denied"; break;
    case SignalStatus::Refused: s.error = "protected process"; break;
    default: s.error = r.err ? std::strerror(r.err) : "signal failed"; break;
  }
  util::log_warn("Terminator", "%s to pid %d failed: %s", sig == SIGKILL ? "SIGKILL" : "SIGTERM", pid,
                 s.error.c_str());
  return s;
}

Terminator::Single Terminator::escalate(int32_t pid, const KillOptions& opts) {
  if (pid <= 100) return {Result::Skipped, "protected pid", ""};
  if (!table_.alive(pid)) return {Result::Killed, "already cleaned", ""};
  if (opts.dry_run) return {Result::Killed, "would kill", ""};

  auto r = signaller_.send(pid, SIGTERM);
  if (r.status == SignalStatus::NoSuchProcess) return {Result::Killed, "already cleaned", ""};
  if (r.status != SignalStatus::Delivered) return signal_failure(pid, SIGTERM, r);
  util::log_debug("Terminator", "sent SIGTERM to pid %d", pid);

  if (wait_exit(pid, opts.timeout, opts.poll_interval)) return {Result::Killed, "SIGTERM", ""};

  r = signaller_.send(pid, SIGKILL);
  if (r.status == SignalStatus::NoSuchProcess) return {Result::Killed, "SIGTERM", ""};
  if (r.status != SignalStatus::Delivered) return signal_failure(pid, SIGKILL, r);
  util::log_info("Terminator", "pid %d ignored SIGTERM for %lldms; sent SIGKILL", pid,
                 static_cast<long long>(opts.timeout.count()));

  if (wait_exit(pid, opts.confirm_wait, opts.poll_interval)) return {Result::Killed, "SIGKILL", ""};
  util::log_error("Terminator", "pid %d survived SIGKILL", pid);
  return {Result::Failed, "", "process survived SIGKILL"};
}

Terminator::Single Terminator::terminate(int32_t pid, const KillOptions& opts) {
  auto s = escalate(pid, opts);
  if (s.result != Result::Killed || opts.dry_run) return s;
  try {
    registry_.remove(pid);
  } catch (const util::LockTimeout& e) {
    // The process is gone; only the snapshot write is late. The record has
    // already left memory, so the next persist drops it from disk too.
    util::log_warn("Terminator", "pid %d killed; registry update deferred: %s", pid, e.what());
    s.note += "; registry update deferred";
  }
  return s;
}

model::KillOutcome Terminator::kill(const std::vector<model::OrphanCandidate>& candidates, const KillOptions& opts) {
  model::KillOutcome out;
  out.dry_run = opts.dry_run;
  std::mutex out_mu;

  auto handle = [&](const model::OrphanCandidate& c) {
    Single s;
    try {
      if (c.pid <= 100) {
        s = {Result::Skipped, "protected pid", ""};
      } else if (c.classification == model::Classification::Suspected && !opts.force) {
        s = {Result::Skipped, "suspected; use force", ""};
      } else {
        s = terminate(c.pid, opts);
      }
    } catch (const std::exception& e) {
      // a worker thread must not unwind; the pid is reported as failed instead
      util::log_error("Terminator", "pid %d: %s", c.pid, e.what());
      s = {Result::Failed, "", e.what()};
    }
    const std::string& detail = s.result == Result::Failed ? s.error : s.note;
    {
      std::lock_guard<std::mutex> lk(out_mu);
      switch (s.result) {
        case Result::Killed: out.killed.insert(c.pid); break;
        case Result::Skipped: out.skipped.insert(c.pid); break;
        case Result::Failed: out.failed.push_back({c.pid, s.error}); break;
      }
      out.notes[c.pid] = detail;
    }
    if (opts.on_event) opts.on_event(c.pid, s.result, detail);
  };

  unsigned workers = std::max(1u, std::min<unsigned>(opts.parallelism, static_cast<unsigned>(candidates.size())));
  if (workers <= 1) {
    for (const auto& c : candidates) handle(c);
  } else {
    std::atomic<size_t> next{0};
    std::vector<std::jthread> pool;
    pool.reserve(workers);
    for (unsigned i = 0; i < workers; ++i) {
      pool.emplace_back([&] {
        for (size_t k = next.fetch_add(1); k < candidates.size(); k = next.fetch_add(1)) handle(candidates[k]);
      });
    }
  }

  std::sort(out.failed.begin(), out.failed.end(),
            [](const model::KillFailure& a, const model::KillFailure& b) { return a.pid < b.pid; });
  util::log_info("Terminator", "%s%zu killed, %zu skipped, %zu failed", opts.dry_run ? "(dry run) " : "",
                 out.killed.size(), out.skipped.size(), out.failed.size());
  return out;
}

size_t Terminator::reap_exited() {
  size_t removed = 0;
  for (const auto& r : registry_.list()) {
    if (r.status != model::ProcessStatus::Terminated) continue;
    if (table_.alive(r.pid)) {
      // pid reused by another process; the record is stale either way
      auto p = table_.find(r.pid);
      util::log_debug("Terminator", "dropping stale record for reused pid %d (%s)", r.pid,
                      p ? p->command.c_str() : "?");
    }
    try {
      registry_.remove(r.pid);
    } catch (const util::LockTimeout& e) {
      // dropped from memory; the rest waits for the next reap
      util::log_warn("Terminator", "registry lock busy after dropping pid %d: %s", r.pid, e.what());
      return removed + 1;
    }
    ++removed;
  }
  return removed;
}

} // namespace warden::app
