#include "model/Json.hpp"

#include <stdexcept>

namespace warden::model {

void to_json(nlohmann::json& j, const ProcessRecord& r) {
  j = nlohmann::json{
    {"pid", r.pid},
    {"command", r.command},
    {"args", r.args},
    {"namespace", r.ns},
    {"startTime", r.start_time_ms},
    {"status", to_string(r.status)},
    {"ownerPid", r.owner_pid},
  };
}

void from_json(const nlohmann::json& j, ProcessRecord& r) {
  j.at("pid").get_to(r.pid);
  j.at("command").get_to(r.command);
  r.args = j.value("args", std::vector<std::string>{});
  r.ns = j.value("namespace", std::string());
  r.start_time_ms = j.value("startTime", int64_t{0});
  auto status = j.value("status", std::string("running"));
  auto st = status_from_string(status);
  if (!st) throw std::invalid_argument("unknown process status \"" + status + "\"");
  r.status = *st;
  // older snapshots named the owner "parentPid"
  if (j.contains("ownerPid")) j.at("ownerPid").get_to(r.owner_pid);
  else r.owner_pid = j.value("parentPid", int32_t{0});
}

void to_json(nlohmann::json& j, const TrackedPid& t) {
  j = nlohmann::json{
    {"pid", t.pid},
    {"command", t.command},
    {"spawnedAt", t.spawned_at},
    {"workingDir", t.working_dir},
  };
}

void from_json(const nlohmann::json& j, TrackedPid& t) {
  j.at("pid").get_to(t.pid);
  t.command = j.value("command", std::string());
  t.spawned_at = j.value("spawnedAt", std::string());
  if (j.contains("workingDir")) j.at("workingDir").get_to(t.working_dir);
  else t.working_dir = j.value("cwd", std::string());
}

void to_json(nlohmann::json& j, const OrphanCandidate& c) {
  j = nlohmann::json{
    {"pid", c.pid},
    {"command", c.command},
    {"ageMs", c.age_ms},
    {"residentMemoryBytes", c.rss_bytes},
    {"classification", to_string(c.classification)},
    {"reason", c.reason},
  };
  if (c.working_dir) j["workingDir"] = *c.working_dir;
  else j["workingDir"] = nullptr;
}

} // namespace warden::model
