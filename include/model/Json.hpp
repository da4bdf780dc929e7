// JSON mapping for persisted and reported types (nlohmann::json ADL hooks)
#pragma once
#include "model/Process.hpp"
#include <nlohmann/json.hpp>

namespace warden::model {

void to_json(nlohmann::json& j, const ProcessRecord& r);
void from_json(const nlohmann::json& j, ProcessRecord& r);

void to_json(nlohmann::json& j, const TrackedPid& t);
void from_json(const nlohmann::json& j, TrackedPid& t);

void to_json(nlohmann::json& j, const OrphanCandidate& c);

} // namespace warden::model
