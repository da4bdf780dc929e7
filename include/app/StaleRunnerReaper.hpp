#pragma once
#include "app/OrphanDetector.hpp"
#include "app/Terminator.hpp"

#include <string>
#include <vector>

namespace warden::app {

struct StaleRunnerOptions {
  int64_t max_age_ms{600000};
  bool dry_run{false};
  bool silent{false};
  std::string root_path;
};

struct StaleRunnerResult {
  std::vector<model::OrphanCandidate> found;
  model::KillOutcome outcome;
};

// Finds test-runner processes older than max_age and kills them. Only the
// heuristic channel runs, against a fixed test-runner pattern list.
class StaleRunnerReaper {
public:
  StaleRunnerReaper(OrphanDetector& detector, Terminator& terminator, KillOptions kill_opts = {});

  StaleRunnerResult reap(const StaleRunnerOptions& opts = {});

  // Copy; callers cannot alter the built-in list.
  [[nodiscard]] std::vector<std::string> patterns() const;

private:
  OrphanDetector& detector_;
  Terminator& terminator_;
  KillOptions kill_opts_;
};

} // namespace warden::app
