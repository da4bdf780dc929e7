#pragma once
#include "app/Registry.hpp"
#include "app/TrackedPids.hpp"
#include "collectors/IProcessTable.hpp"
#include "model/Process.hpp"

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace warden::app {

struct ScanOptions {
  std::string root_path;                          // project root for the cwd check
  std::vector<std::string> extra_patterns;        // appended to the defaults
  std::optional<std::vector<std::string>> patterns; // replaces the defaults
  int64_t min_age_ms{0};
  bool tracked_channel{true};
  bool registry_channel{true};
  bool heuristic_channel{true};
};

// A command pattern: substring unless it contains ".*", then an ECMAScript regex.
class CommandPattern {
public:
  explicit CommandPattern(std::string text);
  [[nodiscard]] bool matches(const std::string& command) const;
  [[nodiscard]] const std::string& text() const { return text_; }
  [[nodiscard]] bool is_regex() const { return regex_.has_value(); }
private:
  std::string text_;
  std::optional<std::regex> regex_;
};

[[nodiscard]] const std::vector<std::string>& default_orphan_patterns();

// True when path equals root or lies below it ("/a/bc" is not inside "/a/b").
[[nodiscard]] bool path_inside(const std::string& path, const std::string& root);

// Cross-references the Registry, the tracked-pid ledger and the OS process
// table to find processes the orchestrator left behind.
class OrphanDetector {
public:
  OrphanDetector(Registry& registry, TrackedPidStore& tracked, collectors::IProcessTable& table,
                 std::vector<std::string> orchestrator_names = {"warden", "loopwork"},
                 int32_t self_pid = 0);

  // Candidates sorted by pid, one per pid, confirmed winning over suspected.
  // Side effects: dead pids are pruned from the tracked ledger; Registry
  // records are marked orphaned or terminated as lineage checks dictate.
  [[nodiscard]] std::vector<model::OrphanCandidate> scan(const ScanOptions& opts);

  [[nodiscard]] int32_t self_pid() const { return self_pid_; }

private:
  struct ProcessIndex;

  void scan_tracked(const std::vector<model::TrackedPid>& tracked, ProcessIndex& idx,
                    std::vector<model::OrphanCandidate>& out);
  void scan_registry(ProcessIndex& idx, std::vector<model::OrphanCandidate>& out);
  void scan_heuristic(const ScanOptions& opts, const std::vector<model::TrackedPid>& tracked,
                      ProcessIndex& idx, std::vector<model::OrphanCandidate>& out);

  [[nodiscard]] bool is_orchestrator_command(const std::string& command) const;
  [[nodiscard]] model::OrphanCandidate make_candidate(const model::OsProcess& p, model::Classification c,
                                                      std::string reason);

  Registry& registry_;
  TrackedPidStore& tracked_;
  collectors::IProcessTable& table_;
  std::vector<std::string> orchestrator_names_;
  int32_t self_pid_;
};

} // namespace warden::app
