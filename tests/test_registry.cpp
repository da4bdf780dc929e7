#include "minitest.hpp"
#include "FakeProcessTable.hpp"
#include "app/Registry.hpp"
#include "util/Log.hpp"

#include <nlohmann/json.hpp>

#include <sys/stat.h>
#include <unistd.h>

#include <fstream>
#include <sstream>
#include <thread>

using warden::app::Registry;
using warden::model::ProcessMetadata;
using warden::model::ProcessStatus;

static ProcessMetadata meta(const std::string& cmd, const std::string& ns, int32_t owner = 0) {
  ProcessMetadata m;
  m.command = cmd;
  m.args = {"--flag", "value"};
  m.ns = ns;
  m.start_time_ms = 1700000000000;
  m.owner_pid = owner;
  return m;
}

static nlohmann::json read_json(const std::filesystem::path& p) {
  std::ifstream in(p);
  std::stringstream ss; ss << in.rdbuf();
  return nlohmann::json::parse(ss.str());
}

TEST(registry_add_get_list) {
  TempDir dir("reg_basic");
  Registry reg(dir.path);
  reg.add(1234, meta("claude", "alpha"));
  reg.add(1200, meta("opencode", "beta", 77));
  auto r = reg.get(1234);
  ASSERT_TRUE(r.has_value());
  ASSERT_EQ(r->command, "claude");
  ASSERT_EQ(r->ns, "alpha");
  ASSERT_EQ(r->status, ProcessStatus::Running);
  ASSERT_EQ(r->owner_pid, static_cast<int32_t>(::getpid()));
  ASSERT_EQ(reg.get(1200)->owner_pid, 77);
  auto all = reg.list();
  ASSERT_EQ(all.size(), 2u);
  ASSERT_EQ(all[0].pid, 1200); // ordered by pid
  ASSERT_TRUE(!reg.get(9).has_value());
}

TEST(registry_one_record_per_pid) {
  TempDir dir("reg_unique");
  Registry reg(dir.path);
  reg.add(500, meta("a", "x"));
  reg.add(500, meta("b", "y"));
  ASSERT_EQ(reg.size(), 1u);
  ASSERT_EQ(reg.get(500)->command, "b");
}

TEST(registry_list_by_namespace) {
  TempDir dir("reg_ns");
  Registry reg(dir.path);
  reg.add(301, meta("a", "one"));
  reg.add(302, meta("b", "two"));
  reg.add(303, meta("c", "one"));
  auto one = reg.list_by_namespace("one");
  ASSERT_EQ(one.size(), 2u);
  ASSERT_EQ(one[0].pid, 301);
  ASSERT_EQ(one[1].pid, 303);
  ASSERT_TRUE(reg.list_by_namespace("none").empty());
}

TEST(registry_remove_is_idempotent) {
  TempDir dir("reg_remove");
  Registry reg(dir.path);
  reg.add(400, meta("a", "x"));
  reg.remove(400);
  reg.remove(400);
  reg.remove(12345);
  ASSERT_TRUE(!reg.contains(400));
  ASSERT_EQ(reg.size(), 0u);
}

TEST(registry_update_status) {
  TempDir dir("reg_status");
  Registry reg(dir.path);
  reg.add(401, meta("a", "x"));
  reg.update_status(401, ProcessStatus::Orphaned);
  ASSERT_EQ(reg.get(401)->status, ProcessStatus::Orphaned);
  reg.update_status(999, ProcessStatus::Terminated); // unknown pid: no-op
  ASSERT_EQ(reg.size(), 1u);
}

TEST(registry_snapshot_layout) {
  TempDir dir("reg_layout");
  Registry reg(dir.path);
  reg.add(600, meta("claude", "alpha"));
  auto doc = read_json(dir.path / "processes.json");
  ASSERT_EQ(doc["schemaVersion"].get<int>(), 1);
  ASSERT_EQ(doc["writerPid"].get<int>(), static_cast<int>(::getpid()));
  ASSERT_TRUE(doc["lastUpdated"].get<int64_t>() > 0);
  ASSERT_EQ(doc["processes"].size(), 1u);
  auto p = doc["processes"][0];
  ASSERT_EQ(p["pid"].get<int>(), 600);
  ASSERT_EQ(p["namespace"].get<std::string>(), "alpha");
  ASSERT_EQ(p["status"].get<std::string>(), "running");
  ASSERT_EQ(p["startTime"].get<int64_t>(), 1700000000000);
  ASSERT_EQ(p["args"].size(), 2u);
  // lock released after the write
  ASSERT_TRUE(!std::filesystem::exists(dir.path / "processes.json.lock"));
}

TEST(registry_persist_and_reload) {
  TempDir dir("reg_reload");
  {
    Registry reg(dir.path);
    reg.add(701, meta("claude", "a"));
    reg.add(702, meta("opencode", "b"));
    reg.add(703, meta("bun test", "a"));
    reg.update_status(702, ProcessStatus::Orphaned);
  }
  Registry again(dir.path);
  again.load();
  ASSERT_EQ(again.size(), 3u);
  ASSERT_EQ(again.get(702)->status, ProcessStatus::Orphaned);
  ASSERT_EQ(again.get(703)->command, "bun test");
  ASSERT_EQ(again.get(701)->args.size(), 2u);
}

TEST(registry_load_missing_snapshot_is_empty) {
  TempDir dir("reg_missing");
  Registry reg(dir.path);
  reg.load();
  ASSERT_EQ(reg.size(), 0u);
}

TEST(registry_load_rejects_malformed_snapshot) {
  TempDir dir("reg_bad");
  { std::ofstream out(dir.path / "processes.json"); out << "{ not json"; }
  Registry reg(dir.path);
  bool threw = false;
  try { reg.load(); } catch (const warden::app::PersistError&) { threw = true; }
  ASSERT_TRUE(threw);
}

TEST(registry_load_rejects_newer_schema) {
  TempDir dir("reg_schema");
  { std::ofstream out(dir.path / "processes.json"); out << R"({"schemaVersion":9,"processes":[]})"; }
  Registry reg(dir.path);
  bool threw = false;
  try { reg.load(); } catch (const warden::app::PersistError&) { threw = true; }
  ASSERT_TRUE(threw);
}

TEST(registry_load_rejects_unknown_status) {
  TempDir dir("reg_status_bad");
  { std::ofstream out(dir.path / "processes.json");
    out << R"({"schemaVersion":1,"processes":[{"pid":5,"command":"x","status":"zombie"}]})"; }
  Registry reg(dir.path);
  bool threw = false;
  try { reg.load(); } catch (const warden::app::PersistError&) { threw = true; }
  ASSERT_TRUE(threw);
}

TEST(registry_persist_failure_keeps_memory_state) {
  if (::geteuid() == 0) return; // root ignores directory permissions
  TempDir dir("reg_readonly");
  auto state = dir.path / "state";
  std::filesystem::create_directories(state);
  ::chmod(state.c_str(), 0500);
  std::vector<std::string> logged;
  warden::util::set_log_sink([&](warden::util::LogLevel, const std::string& line) { logged.push_back(line); });
  Registry reg(state);
  reg.add(800, meta("claude", "x"));  // lock cannot be created: logged, not thrown
  warden::util::set_log_sink({});
  ::chmod(state.c_str(), 0700);
  ASSERT_TRUE(reg.contains(800));
  ASSERT_TRUE(!logged.empty());
}

TEST(registry_mutation_propagates_lock_timeout) {
  TempDir dir("reg_locked");
  { std::ofstream out(dir.path / "processes.json.lock"); out << "4242"; }
  warden::util::FileLockOptions o;
  o.retry_interval = std::chrono::milliseconds(2);
  o.max_retries = 3;
  o.is_alive = [](int32_t) { return true; };
  Registry reg(dir.path, o);
  bool timed_out = false;
  try { reg.add(900, meta("a", "x")); } catch (const warden::util::LockTimeout&) { timed_out = true; }
  ASSERT_TRUE(timed_out);
  ASSERT_TRUE(reg.contains(900));
}

TEST(registry_concurrent_instances_do_not_lose_writes) {
  TempDir dir("reg_concurrent");
  Registry a(dir.path);
  Registry b(dir.path);
  std::thread ta([&] { for (int i = 0; i < 20; ++i) a.add(1000 + i, meta("a", "x")); });
  std::thread tb([&] { for (int i = 0; i < 20; ++i) b.add(2000 + i, meta("b", "y")); });
  ta.join(); tb.join();
  // each snapshot is complete JSON written under the lock
  auto doc = read_json(dir.path / "processes.json");
  ASSERT_EQ(doc["schemaVersion"].get<int>(), 1);
  ASSERT_EQ(doc["processes"].size(), 20u);
}
