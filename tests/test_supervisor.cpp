#include "minitest.hpp"
#include "FakeProcessTable.hpp"
#include "app/Supervisor.hpp"
#include "collectors/ProcfsProcessTable.hpp"

#include <signal.h>
#include <unistd.h>

#include <fstream>
#include <memory>

using warden::app::Config;
using warden::app::ReclaimOptions;
using warden::app::Supervisor;
using warden::model::Classification;

namespace {

constexpr int32_t kOrchestrator = 8000;

Config test_config(const std::filesystem::path& state) {
  Config c;
  c.project_root = "/work/project";
  c.state_dir = state;
  c.kill_timeout_ms = 100;
  c.kill_poll_interval_ms = 10;
  c.lock_retry_interval_ms = 10;
  return c;
}

std::unique_ptr<Supervisor> with_fake(const Config& c, FakeProcessTable& fake) {
  return std::make_unique<Supervisor>(c, std::make_unique<FakeTableRef>(fake),
                                      std::make_unique<FakeSignallerRef>(fake));
}

void register_child(Supervisor& sup, FakeProcessTable& fake, int32_t pid, const char* cmd) {
  fake.add(pid, cmd, kOrchestrator).cwd = "/work/project";
  warden::model::ProcessMetadata m;
  m.command = cmd;
  m.ns = "agents";
  m.owner_pid = kOrchestrator;
  sup.registry().add(pid, m);
}

} // namespace

TEST(supervisor_lineage_lost_after_owner_dies) {
  TempDir dir("sup_lineage");
  FakeProcessTable fake;
  fake.add(kOrchestrator, "bun run loopwork start");
  auto cfg = test_config(dir.path);
  {
    auto sup = with_fake(cfg, fake);
    sup->open();
    register_child(*sup, fake, 8001, "claude");
    register_child(*sup, fake, 8002, "opencode");
    register_child(*sup, fake, 8003, "node");
  }

  // a fresh instance sees the persisted records
  auto sup = with_fake(cfg, fake);
  sup->open();
  ASSERT_EQ(sup->registry().size(), 3u);
  ASSERT_EQ(sup->registry().list_by_namespace("agents").size(), 3u);

  auto res = sup->reclaim();
  ASSERT_TRUE(res.candidates.empty());
  ASSERT_TRUE(fake.signals().empty());

  fake.remove(kOrchestrator); // children reparent to init
  ReclaimOptions dry;
  dry.dry_run = true;
  res = sup->reclaim(dry);
  ASSERT_EQ(res.candidates.size(), 3u);
  for (const auto& c : res.candidates) {
    ASSERT_TRUE(c.classification == Classification::Confirmed);
    ASSERT_EQ(c.reason, "lineage broken");
  }
  ASSERT_EQ(res.outcome.killed.size(), 3u);
  ASSERT_TRUE(fake.signals().empty());
  ASSERT_EQ(sup->registry().size(), 3u);
  ASSERT_TRUE(sup->registry().get(8001)->status == warden::model::ProcessStatus::Orphaned);

  res = sup->reclaim();
  ASSERT_EQ(res.outcome.killed.size(), 3u);
  ASSERT_TRUE(res.outcome.failed.empty());
  ASSERT_EQ(sup->registry().size(), 0u);
  ASSERT_TRUE(!fake.alive(8001) && !fake.alive(8002) && !fake.alive(8003));

  // and the snapshot on disk agrees
  auto again = with_fake(cfg, fake);
  again->open();
  ASSERT_EQ(again->registry().size(), 0u);
}

TEST(supervisor_reclaim_suspected_needs_force) {
  TempDir dir("sup_force");
  FakeProcessTable fake;
  fake.add(8100, "claude --print hello").cwd = "/work/project";
  auto sup = with_fake(test_config(dir.path), fake);
  sup->open();

  auto res = sup->reclaim();
  ASSERT_EQ(res.candidates.size(), 1u);
  ASSERT_TRUE(res.candidates[0].classification == Classification::Suspected);
  ASSERT_TRUE(res.outcome.skipped.count(8100));
  ASSERT_TRUE(fake.alive(8100));

  ReclaimOptions force;
  force.force = true;
  std::vector<std::pair<int32_t, warden::app::KillResult>> events;
  force.on_event = [&](int32_t pid, warden::app::KillResult r, const std::string&) { events.emplace_back(pid, r); };
  res = sup->reclaim(force);
  ASSERT_TRUE(res.outcome.killed.count(8100));
  ASSERT_TRUE(!fake.alive(8100));
  ASSERT_EQ(events.size(), 1u);
  ASSERT_EQ(events[0].first, 8100);
  ASSERT_EQ(events[0].second, warden::app::KillResult::Killed);
}

TEST(supervisor_reclaim_extra_patterns_and_min_age) {
  TempDir dir("sup_patterns");
  FakeProcessTable fake;
  fake.add(8200, "deno task serve").age_ms = 120000;
  fake.add(8201, "deno task serve --watch").age_ms = 1000;
  auto cfg = test_config(dir.path);
  cfg.extra_patterns = {"deno task"};
  auto sup = with_fake(cfg, fake);
  sup->open();
  ReclaimOptions o;
  o.dry_run = true;
  o.min_age_ms = 60000;
  auto res = sup->reclaim(o);
  ASSERT_EQ(res.candidates.size(), 1u);
  ASSERT_EQ(res.candidates[0].pid, 8200);
}

TEST(supervisor_spawn_and_wait_real_child) {
  TempDir dir("sup_spawn");
  auto cfg = test_config(dir.path);
  Supervisor sup(cfg);
  sup.open();
  auto pid = sup.spawn({"sh", "-c", "exit 3"}, "jobs");
  ASSERT_TRUE(pid > 0);
  ASSERT_TRUE(sup.registry().contains(pid));
  ASSERT_EQ(sup.registry().get(pid)->ns, "jobs");
  ASSERT_EQ(sup.registry().get(pid)->owner_pid, static_cast<int32_t>(::getpid()));
  ASSERT_TRUE(sup.tracked().contains(pid));
  ASSERT_EQ(sup.wait(pid), 3);
  ASSERT_TRUE(!sup.registry().contains(pid));
  ASSERT_TRUE(!sup.tracked().contains(pid));
}

TEST(supervisor_spawned_child_carries_marker) {
  TempDir dir("sup_marker");
  Supervisor sup(test_config(dir.path));
  sup.open();
  auto pid = sup.spawn({"sleep", "5"}, "default");
  warden::collectors::ProcfsProcessTable procfs;
  auto p = procfs.find(pid);
  ASSERT_TRUE(p.has_value());
  ASSERT_TRUE(p->owner_marker.has_value());
  ASSERT_EQ(*p->owner_marker, static_cast<int32_t>(::getpid()));
  ASSERT_EQ(::kill(pid, SIGTERM), 0);
  ASSERT_EQ(sup.wait(pid), 128 + SIGTERM);
}

TEST(supervisor_spawn_failure) {
  TempDir dir("sup_fail");
  Supervisor sup(test_config(dir.path));
  sup.open();
  bool threw = false;
  try {
    (void)sup.spawn({"/nonexistent/warden-test-binary"}, "default");
  } catch (const warden::app::SpawnError&) {
    threw = true;
  }
  ASSERT_TRUE(threw);
  ASSERT_EQ(sup.registry().size(), 0u);
  threw = false;
  try {
    (void)sup.spawn({}, "default");
  } catch (const warden::app::SpawnError&) {
    threw = true;
  }
  ASSERT_TRUE(threw);
}

TEST(supervisor_spawn_and_wait_survive_busy_state_locks) {
  TempDir dir("sup_locked");
  auto cfg = test_config(dir.path);
  cfg.lock_max_retries = 3;
  Supervisor sup(cfg);
  sup.open();
  // another live instance holds both state locks
  { std::ofstream lock(dir.path / "processes.json.lock"); lock << ::getpid(); }
  { std::ofstream lock(dir.path / "spawned-pids.json.lock"); lock << ::getpid(); }
  auto pid = sup.spawn({"sh", "-c", "exit 0"}, "jobs");
  ASSERT_TRUE(pid > 0);
  ASSERT_TRUE(sup.registry().contains(pid));
  ASSERT_EQ(sup.wait(pid), 0);
  ASSERT_TRUE(!sup.registry().contains(pid));
}
