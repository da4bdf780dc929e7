#pragma once
#include "model/Process.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace warden::ui {

// "killed", "would kill", "skipped", "failed" or "-" for a pid in an outcome
[[nodiscard]] std::string action_for(int32_t pid, const model::KillOutcome& outcome);

// {orphans:[...], summary:{killed,skipped,failed}, failures:[{pid,error}], dryRun}
[[nodiscard]] nlohmann::json reclaim_json(const std::vector<model::OrphanCandidate>& candidates,
                                          const model::KillOutcome& outcome);
[[nodiscard]] std::vector<std::string> reclaim_table(const std::vector<model::OrphanCandidate>& candidates,
                                                     const model::KillOutcome& outcome, int width, bool unicode);

[[nodiscard]] nlohmann::json registry_json(const std::vector<model::ProcessRecord>& records);
[[nodiscard]] std::vector<std::string> registry_table(const std::vector<model::ProcessRecord>& records,
                                                      int64_t now_ms, int width, bool unicode);

} // namespace warden::ui
