#pragma once
#include "app/Registry.hpp"
#include "collectors/IProcessTable.hpp"
#include "collectors/ISignaller.hpp"
#include "model/Process.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace warden::app {

enum class KillResult { Killed, Skipped, Failed };

struct KillOptions {
  bool force{false};     // also terminate suspected candidates
  bool dry_run{false};   // report what would happen, send nothing
  std::chrono::milliseconds timeout{5000};       // SIGTERM grace
  std::chrono::milliseconds poll_interval{100};
  std::chrono::milliseconds confirm_wait{100};   // after SIGKILL
  unsigned parallelism{4};
  // Called once per candidate as soon as its outcome is known, from the
  // worker that handled it. detail is the note, or the error when Failed.
  std::function<void(int32_t pid, KillResult result, const std::string& detail)> on_event;
};

// Staged termination: SIGTERM, poll until timeout, SIGKILL, confirm.
// Never signals pid <= 100, never aborts a batch on a per-pid failure, and
// removes the Registry record of every process it confirms gone. When the
// Registry lock cannot be taken the process still counts as killed and its
// record is written out on the next successful persist.
class Terminator {
public:
  Terminator(Registry& registry, collectors::IProcessTable& table, collectors::ISignaller& signaller);

  [[nodiscard]] model::KillOutcome kill(const std::vector<model::OrphanCandidate>& candidates,
                                        const KillOptions& opts = {});

  using Result = KillResult;
  struct Single {
    Result result{Result::Failed};
    std::string note;   // "already cleaned", "would kill", "SIGTERM", "SIGKILL"
    std::string error;  // set when Failed
  };
  // One process, bypassing classification (Resource Monitor violations).
  [[nodiscard]] Single terminate(int32_t pid, const KillOptions& opts = {});

  // Drop Registry records marked terminated whose process is gone. Returns the count removed.
  size_t reap_exited();

private:
  Single escalate(int32_t pid, const KillOptions& opts);
  bool wait_exit(int32_t pid, std::chrono::milliseconds budget, std::chrono::milliseconds poll);

  Registry& registry_;
  collectors::IProcessTable& table_;
  collectors::ISignaller& signaller_;
};

} // namespace warden::app
