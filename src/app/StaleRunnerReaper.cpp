#include "app/StaleRunnerReaper.hpp"
#include "util/Elapsed.hpp"
#include "util/Log.hpp"

namespace warden::app {

static const std::vector<std::string>& stale_runner_patterns() {
  static const std::vector<std::string> patterns = {
    "bun test",
    "jest",
    "vitest",
    "mocha",
    "npm test",
    "pnpm test",
    "yarn test",
    "npx jest",
    "npx vitest",
    "npx mocha",
  };
  return patterns;
}

StaleRunnerReaper::StaleRunnerReaper(OrphanDetector& detector, Terminator& terminator, KillOptions kill_opts)
    : detector_(detector), terminator_(terminator), kill_opts_(kill_opts) {}

std::vector<std::string> StaleRunnerReaper::patterns() const { return stale_runner_patterns(); }

StaleRunnerResult StaleRunnerReaper::reap(const StaleRunnerOptions& opts) {
  ScanOptions scan;
  scan.root_path = opts.root_path;
  scan.patterns = stale_runner_patterns();
  scan.min_age_ms = opts.max_age_ms;
  scan.tracked_channel = false;
  scan.registry_channel = false;
  scan.heuristic_channel = true;

  StaleRunnerResult res;
  res.found = detector_.scan(scan);
  if (res.found.empty()) {
    if (!opts.silent) util::log_info("StaleRunner", "no test runners older than %s", util::format_age(opts.max_age_ms).c_str());
    return res;
  }

  if (!opts.silent) {
    for (const auto& c : res.found) {
      util::log_info("StaleRunner", "%s pid %d (%s, age %s)", opts.dry_run ? "would kill" : "killing", c.pid,
                     c.command.c_str(), util::format_age(c.age_ms).c_str());
    }
  }

  auto ko = kill_opts_;
  ko.force = true;
  ko.dry_run = opts.dry_run;
  res.outcome = terminator_.kill(res.found, ko);

  if (!res.outcome.failed.empty()) {
    for (const auto& f : res.outcome.failed) util::log_warn("StaleRunner", "pid %d: %s", f.pid, f.error.c_str());
  }
  return res;
}

} // namespace warden::app
