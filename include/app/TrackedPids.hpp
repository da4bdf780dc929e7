#pragma once
#include "model/Process.hpp"
#include "util/FileLock.hpp"

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace warden::app {

// Secondary ledger of spawned pids, kept in <state_dir>/spawned-pids.json
// (mode 0600) beside the Registry. Every call re-reads the file under its own
// sentinel lock so that independent instances see each other's entries.
class TrackedPidStore {
public:
  explicit TrackedPidStore(std::filesystem::path state_dir, util::FileLockOptions lock_opts = {});

  // Adds pid unless already present. Returns false if the file could not be written.
  bool track(int32_t pid, const std::string& command, const std::string& working_dir);
  bool untrack(int32_t pid);
  [[nodiscard]] std::vector<model::TrackedPid> list() const;
  [[nodiscard]] bool contains(int32_t pid) const;
  // Drops every entry whose pid fails alive(). Returns the number removed.
  size_t prune(const std::function<bool(int32_t)>& alive);

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
  std::vector<model::TrackedPid> read_unlocked() const;
  bool write_unlocked(const std::vector<model::TrackedPid>& pids);

  std::filesystem::path path_;
  mutable std::mutex mu_;
  mutable util::FileLock lock_;
};

// Current UTC time as 2024-01-31T12:34:56.789Z
[[nodiscard]] std::string iso8601_utc_now();

} // namespace warden::app
