#pragma once
#include <cstdint>

namespace warden::collectors {

enum class SignalStatus {
  Delivered,
  NoSuchProcess,    // ESRCH
  PermissionDenied, // EPERM
  Refused,          // protected pid, never sent
  Failed,           // any other errno
};

struct SignalResult {
  SignalStatus status{SignalStatus::Failed};
  int err{0};
};

class ISignaller {
public:
  virtual ~ISignaller() = default;
  [[nodiscard]] virtual SignalResult send(int32_t pid, int sig) = 0;
};

} // namespace warden::collectors
