#pragma once
#include "collectors/ISignaller.hpp"

namespace warden::collectors {

// kill(2). Refuses pid <= 100 and the calling process.
class PosixSignaller : public ISignaller {
public:
  SignalResult send(int32_t pid, int sig) override;
};

} // namespace warden::collectors
