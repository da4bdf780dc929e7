#include "collectors/PosixSignaller.hpp"
#include "util/Log.hpp"

#include <signal.h>
#include <unistd.h>

#include <cerrno>

namespace warden::collectors {

SignalResult PosixSignaller::send(int32_t pid, int sig) {
  if (pid <= 100 || pid == static_cast<int32_t>(::getpid())) {
    util::log_warn("Signaller", "refusing to signal protected pid %d", pid);
    return {SignalStatus::Refused, 0};
  }
  if (::kill(pid, sig) == 0) return {SignalStatus::Delivered, 0};
  int e = errno;
  switch (e) {
    case ESRCH: return {SignalStatus::NoSuchProcess, e};
    case EPERM: return {SignalStatus::PermissionDenied, e};
    default: return {SignalStatus::Failed, e};
  }
}

} // namespace warden::collectors
