#pragma once
#include "model/Process.hpp"
#include "util/FileLock.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace warden::app {

class PersistError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Durable store of every process an orchestrator spawned.
//
// The in-memory map is authoritative for this process's lifetime. Each
// mutation persists a full snapshot to <state_dir>/processes.json under the
// sentinel lock <state_dir>/processes.json.lock; an I/O failure there is
// logged and retried on the next mutation, while LockTimeout propagates to
// the caller of the mutation.
class Registry {
public:
  static constexpr int kSchemaVersion = 1;

  explicit Registry(std::filesystem::path state_dir, util::FileLockOptions lock_opts = {});
  Registry(const Registry&) = delete;
  Registry& operator=(const Registry&) = delete;

  void add(int32_t pid, const model::ProcessMetadata& meta);
  void remove(int32_t pid);
  void update_status(int32_t pid, model::ProcessStatus status);
  void clear();

  [[nodiscard]] std::optional<model::ProcessRecord> get(int32_t pid) const;
  [[nodiscard]] bool contains(int32_t pid) const;
  [[nodiscard]] std::vector<model::ProcessRecord> list() const;
  [[nodiscard]] std::vector<model::ProcessRecord> list_by_namespace(const std::string& ns) const;
  [[nodiscard]] size_t size() const;

  // Throws PersistError on I/O failure, util::LockTimeout on lock exhaustion.
  void persist();
  // Missing snapshot => empty registry. Throws PersistError if unreadable or malformed.
  void load();

  [[nodiscard]] const std::filesystem::path& snapshot_path() const { return snapshot_path_; }
  [[nodiscard]] std::filesystem::path lock_path() const { return lock_.path(); }

private:
  void persist_after(const char* what);

  std::filesystem::path snapshot_path_;
  mutable std::mutex mu_;   // records_
  std::mutex persist_mu_;   // one snapshot write at a time within this process
  std::map<int32_t, model::ProcessRecord> records_;
  util::FileLock lock_;
};

[[nodiscard]] int64_t now_epoch_ms();

} // namespace warden::app
