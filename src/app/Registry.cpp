#include "app/Registry.hpp"
#include "model/Json.hpp"
#include "util/AtomicFile.hpp"
#include "util/Log.hpp"

#include <unistd.h>

#include <chrono>
#include <fstream>
#include <sstream>

namespace warden::app {

int64_t now_epoch_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}

Registry::Registry(std::filesystem::path state_dir, util::FileLockOptions lock_opts)
    : snapshot_path_(state_dir / "processes.json"),
      lock_(state_dir / "processes.json.lock", std::move(lock_opts)) {}

void Registry::add(int32_t pid, const model::ProcessMetadata& meta) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    model::ProcessRecord r;
    r.pid = pid;
    r.command = meta.command;
    r.args = meta.args;
    r.ns = meta.ns;
    r.start_time_ms = meta.start_time_ms > 0 ? meta.start_time_ms : now_epoch_ms();
    r.status = model::ProcessStatus::Running;
    r.owner_pid = meta.owner_pid > 0 ? meta.owner_pid : static_cast<int32_t>(::getpid());
    records_[pid] = std::move(r);
  }
  persist_after("add");
}

void Registry::remove(int32_t pid) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (records_.erase(pid) == 0) return;
  }
  persist_after("remove");
}

void Registry::update_status(int32_t pid, model::ProcessStatus status) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = records_.find(pid);
    if (it == records_.end() || it->second.status == status) return;
    it->second.status = status;
  }
  persist_after("status update");
}

void Registry::clear() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    records_.clear();
  }
  persist_after("clear");
}

std::optional<model::ProcessRecord> Registry::get(int32_t pid) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = records_.find(pid);
  if (it == records_.end()) return std::nullopt;
  return it->second;
}

bool Registry::contains(int32_t pid) const {
  std::lock_guard<std::mutex> lk(mu_);
  return records_.count(pid) != 0;
}

std::vector<model::ProcessRecord> Registry::list() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<model::ProcessRecord> out;
  out.reserve(records_.size());
  for (const auto& [pid, r] : records_) out.push_back(r);
  return out;
}

std::vector<model::ProcessRecord> Registry::list_by_namespace(const std::string& ns) const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<model::ProcessRecord> out;
  for (const auto& [pid, r] : records_) if (r.ns == ns) out.push_back(r);
  return out;
}

size_t Registry::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return records_.size();
}

void Registry::persist_after(const char* what) {
  try {
    persist();
  } catch (const PersistError& e) {
    util::log_error("Registry", "failed to persist after %s: %s", what, e.what());
  }
}

void Registry::persist() {
  std::lock_guard<std::mutex> serial(persist_mu_);

  nlohmann::json doc;
  doc["schemaVersion"] = kSchemaVersion;
  doc["writerPid"] = static_cast<int32_t>(::getpid());
  doc["processes"] = list();
  doc["lastUpdated"] = now_epoch_ms();

  try {
    util::FileLockGuard guard(lock_);
    std::string err;
    if (!util::write_file_atomic(snapshot_path_, doc.dump(2) + "\n", 0644, &err)) {
      throw PersistError(err);
    }
  } catch (const util::LockTimeout&) {
    throw;
  } catch (const util::LockError& e) {
    throw PersistError(e.what());
  }
  util::log_debug("Registry", "persisted %zu records to %s", doc["processes"].size(), snapshot_path_.c_str());
}

void Registry::load() {
  std::error_code ec;
  if (!std::filesystem::exists(snapshot_path_, ec)) {
    std::lock_guard<std::mutex> lk(mu_);
    records_.clear();
    util::log_debug("Registry", "no snapshot at %s; starting empty", snapshot_path_.c_str());
    return;
  }

  std::ifstream in(snapshot_path_);
  if (!in) throw PersistError("cannot open " + snapshot_path_.string());
  std::stringstream ss;
  ss << in.rdbuf();

  std::map<int32_t, model::ProcessRecord> loaded;
  try {
    auto doc = nlohmann::json::parse(ss.str());
    int version = doc.value("schemaVersion", doc.value("version", 0));
    if (version < 1 || version > kSchemaVersion) {
      throw PersistError("unsupported schemaVersion " + std::to_string(version) + " in " + snapshot_path_.string());
    }
    for (const auto& item : doc.at("processes")) {
      auto r = item.get<model::ProcessRecord>();
      loaded[r.pid] = std::move(r);
    }
  } catch (const nlohmann::json::exception& e) {
    throw PersistError("malformed snapshot " + snapshot_path_.string() + ": " + e.what());
  } catch (const std::invalid_argument& e) {
    throw PersistError("malformed snapshot " + snapshot_path_.string() + ": " + e.what());
  }

  std::lock_guard<std::mutex> lk(mu_);
  records_ = std::move(loaded);
  util::log_debug("Registry", "loaded %zu records from %s", records_.size(), snapshot_path_.c_str());
}

} // namespace warden::app
