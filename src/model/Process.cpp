#include "model/Process.hpp"

namespace warden::model {

const char* to_string(ProcessStatus s) {
  switch (s) {
    case ProcessStatus::Running: return "running";
    case ProcessStatus::Orphaned: return "orphaned";
    case ProcessStatus::Terminated: return "terminated";
  }
  return "running";
}

std::optional<ProcessStatus> status_from_string(const std::string& s) {
  if (s == "running") return ProcessStatus::Running;
  if (s == "orphaned") return ProcessStatus::Orphaned;
  if (s == "terminated") return ProcessStatus::Terminated;
  return std::nullopt;
}

const char* to_string(Classification c) {
  return c == Classification::Confirmed ? "confirmed" : "suspected";
}

} // namespace warden::model
