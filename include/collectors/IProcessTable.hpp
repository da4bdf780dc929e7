#pragma once
#include "model/Process.hpp"

#include <optional>
#include <string>
#include <vector>

namespace warden::collectors {

// Read-only view of the OS process table, so detection and monitoring can run
// against /proc or against an in-memory table in tests.
class IProcessTable {
public:
  virtual ~IProcessTable() = default;

  // Every visible process. Processes that vanish mid-scan are left out.
  [[nodiscard]] virtual std::vector<model::OsProcess> list_processes() = 0;

  [[nodiscard]] virtual std::optional<model::OsProcess> find(int32_t pid) = 0;

  // CPU percent since the previous call for the same pid (0 on the first) and
  // resident memory. std::nullopt if the process is gone or unreadable.
  [[nodiscard]] virtual std::optional<model::ResourceUsage> usage(int32_t pid) = 0;

  // Best effort; std::nullopt when permissions or platform forbid it.
  [[nodiscard]] virtual std::optional<std::string> working_directory(int32_t pid) = 0;

  // Exists and is not a zombie.
  [[nodiscard]] virtual bool alive(int32_t pid) = 0;

  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace warden::collectors
