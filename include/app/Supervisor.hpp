#pragma once
#include "app/Config.hpp"
#include "app/OrphanDetector.hpp"
#include "app/Registry.hpp"
#include "app/ResourceMonitor.hpp"
#include "app/StaleRunnerReaper.hpp"
#include "app/Terminator.hpp"
#include "app/TrackedPids.hpp"
#include "collectors/IProcessTable.hpp"
#include "collectors/ISignaller.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace warden::app {

class SpawnError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct ReclaimOptions {
  bool force{false};
  bool dry_run{false};
  std::string root_path;                  // empty: project root
  std::vector<std::string> extra_patterns; // on top of the configured ones
  std::optional<int64_t> min_age_ms;      // unset: configured value
  // Per-pid progress, forwarded to KillOptions::on_event.
  std::function<void(int32_t pid, KillResult result, const std::string& detail)> on_event;
};

struct ReclaimResult {
  std::vector<model::OrphanCandidate> candidates;
  model::KillOutcome outcome;
};

// Owns every component and wires them together from a Config. Backends
// default to /proc and kill(2); tests pass their own.
class Supervisor {
public:
  explicit Supervisor(Config cfg,
                      std::unique_ptr<collectors::IProcessTable> table = nullptr,
                      std::unique_ptr<collectors::ISignaller> signaller = nullptr);
  ~Supervisor();
  Supervisor(const Supervisor&) = delete;
  Supervisor& operator=(const Supervisor&) = delete;

  // Loads the Registry snapshot. Throws PersistError.
  void open();

  // Starts argv[0] (PATH lookup) with the lineage marker in its environment,
  // registers and tracks it. Throws SpawnError. A busy state lock only
  // delays the snapshot write; the child stays registered in memory.
  int32_t spawn(const std::vector<std::string>& argv, const std::string& ns);
  // Waits for a spawned child, unregisters it and returns its exit code
  // (128 + signal when killed by one).
  int wait(int32_t pid);

  ReclaimResult reclaim(const ReclaimOptions& opts = {});

  [[nodiscard]] const Config& config() const { return cfg_; }
  Registry& registry() { return registry_; }
  TrackedPidStore& tracked() { return tracked_; }
  collectors::IProcessTable& table() { return *table_; }
  OrphanDetector& detector() { return detector_; }
  Terminator& terminator() { return terminator_; }
  ResourceMonitor& monitor() { return monitor_; }
  StaleRunnerReaper& stale_runners() { return stale_; }

private:
  Config cfg_;
  std::unique_ptr<collectors::IProcessTable> table_;
  std::unique_ptr<collectors::ISignaller> signaller_;
  Registry registry_;
  TrackedPidStore tracked_;
  OrphanDetector detector_;
  Terminator terminator_;
  ResourceMonitor monitor_;
  StaleRunnerReaper stale_;
};

} // namespace warden::app
