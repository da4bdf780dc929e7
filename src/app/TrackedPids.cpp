#include "app/TrackedPids.hpp"
#include "model/Json.hpp"
#include "util/AtomicFile.hpp"
#include "util/Log.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <sstream>

namespace warden::app {

std::string iso8601_utc_now() {
  auto now = std::chrono::system_clock::now();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  ::gmtime_r(&t, &tm);
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                static_cast<int>(ms));
  return buf;
}

TrackedPidStore::TrackedPidStore(std::filesystem::path state_dir, util::FileLockOptions lock_opts)
    : path_(state_dir / "spawned-pids.json"),
      lock_(state_dir / "spawned-pids.json.lock", std::move(lock_opts)) {}

std::vector<model::TrackedPid> TrackedPidStore::read_unlocked() const {
  std::vector<model::TrackedPid> out;
  std::ifstream in(path_);
  if (!in) return out;
  std::stringstream ss;
  ss << in.rdbuf();
  try {
    auto doc = nlohmann::json::parse(ss.str());
    for (const auto& item : doc.at("pids")) out.push_back(item.get<model::TrackedPid>());
  } catch (const nlohmann::json::exception& e) {
    // A corrupt ledger only loses the secondary channel; start over.
    util::log_warn("TrackedPids", "ignoring unreadable %s: %s", path_.c_str(), e.what());
    out.clear();
  }
  return out;
}

bool TrackedPidStore::write_unlocked(const std::vector<model::TrackedPid>& pids) {
  nlohmann::json doc;
  doc["pids"] = pids;
  std::string err;
  if (!util::write_file_atomic(path_, doc.dump(2) + "\n", 0600, &err)) {
    util::log_error("TrackedPids", "failed to write %s: %s", path_.c_str(), err.c_str());
    return false;
  }
  return true;
}

bool TrackedPidStore::track(int32_t pid, const std::string& command, const std::string& working_dir) {
  std::lock_guard<std::mutex> lk(mu_);
  util::FileLockGuard guard(lock_);
  auto pids = read_unlocked();
  for (const auto& t : pids) if (t.pid == pid) return true;
  pids.push_back(model::TrackedPid{pid, command, iso8601_utc_now(), working_dir});
  util::log_debug("TrackedPids", "tracking pid %d (%s)", pid, command.c_str());
  return write_unlocked(pids);
}

bool TrackedPidStore::untrack(int32_t pid) {
  std::lock_guard<std::mutex> lk(mu_);
  util::FileLockGuard guard(lock_);
  auto pids = read_unlocked();
  auto it = std::remove_if(pids.begin(), pids.end(), [pid](const model::TrackedPid& t) { return t.pid == pid; });
  if (it == pids.end()) return true;
  pids.erase(it, pids.end());
  return write_unlocked(pids);
}

std::vector<model::TrackedPid> TrackedPidStore::list() const {
  std::lock_guard<std::mutex> lk(mu_);
  util::FileLockGuard guard(lock_);
  return read_unlocked();
}

bool TrackedPidStore::contains(int32_t pid) const {
  for (const auto& t : list()) if (t.pid == pid) return true;
  return false;
}

size_t TrackedPidStore::prune(const std::function<bool(int32_t)>& alive) {
  std::lock_guard<std::mutex> lk(mu_);
  util::FileLockGuard guard(lock_);
  auto pids = read_unlocked();
  auto before = pids.size();
  pids.erase(std::remove_if(pids.begin(), pids.end(),
                            [&](const model::TrackedPid& t) { return !alive(t.pid); }),
             pids.end());
  size_t removed = before - pids.size();
  if (removed == 0) return 0;
  if (!write_unlocked(pids)) return 0;
  util::log_debug("TrackedPids", "pruned %zu dead pids", removed);
  return removed;
}

} // namespace warden::app
