#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace warden::model {

// Environment variable stamped into every supervised child; value is the
// orchestrator pid that spawned it.
inline constexpr const char* kOwnerMarkerEnv = "WARDEN_OWNER_PID";

enum class ProcessStatus { Running, Orphaned, Terminated };

// Registry entry for a process spawned by an orchestrator instance.
struct ProcessRecord {
  int32_t pid{};
  std::string command;
  std::vector<std::string> args;
  std::string ns;            // namespace
  int64_t start_time_ms{};   // epoch ms
  ProcessStatus status{ProcessStatus::Running};
  int32_t owner_pid{};       // orchestrator that registered it
};

// Caller-supplied part of a ProcessRecord.
struct ProcessMetadata {
  std::string command;
  std::vector<std::string> args;
  std::string ns;
  int64_t start_time_ms{};
  int32_t owner_pid{0};      // 0 => registering process
};

struct TrackedPid {
  int32_t pid{};
  std::string command;
  std::string spawned_at;    // ISO-8601 UTC
  std::string working_dir;
};

// One row of the OS process table as reported by a backend.
struct OsProcess {
  int32_t pid{};
  int32_t ppid{};
  std::string command;       // full command line, space joined
  std::string etime;         // [[dd-]hh:]mm:ss
  uint64_t rss_kb{};
  std::optional<int32_t> owner_marker; // lineage marker stamped at spawn
};

struct ResourceUsage {
  double cpu_pct{0.0};
  uint64_t rss_bytes{0};
};

enum class Classification { Confirmed, Suspected };

struct OrphanCandidate {
  int32_t pid{};
  std::string command;
  int64_t age_ms{};
  uint64_t rss_bytes{};
  std::optional<std::string> working_dir;
  Classification classification{Classification::Suspected};
  std::string reason;
};

struct ResourceLimits {
  std::optional<double> cpu_pct_ceiling;
  std::optional<double> memory_mb_ceiling;
  int64_t sample_interval_ms{10000};
  int64_t grace_period_ms{5000};
  bool enabled{true};
};

struct KillFailure {
  int32_t pid{};
  std::string error;
};

struct KillOutcome {
  std::set<int32_t> killed;
  std::set<int32_t> skipped;
  std::vector<KillFailure> failed; // sorted by pid
  bool dry_run{false};
  std::map<int32_t, std::string> notes; // pid -> what happened

  [[nodiscard]] bool has_failure(int32_t pid) const {
    for (const auto& f : failed) if (f.pid == pid) return true;
    return false;
  }
};

[[nodiscard]] const char* to_string(ProcessStatus s);
[[nodiscard]] std::optional<ProcessStatus> status_from_string(const std::string& s);
[[nodiscard]] const char* to_string(Classification c);

} // namespace warden::model
