#include "ui/Report.hpp"
#include "model/Json.hpp"
#include "ui/Formatting.hpp"
#include "util/Elapsed.hpp"

#include <algorithm>
#include <cstdio>

namespace warden::ui {

std::string action_for(int32_t pid, const model::KillOutcome& outcome) {
  if (outcome.killed.count(pid)) return outcome.dry_run ? "would kill" : "killed";
  if (outcome.skipped.count(pid)) return "skipped";
  if (outcome.has_failure(pid)) return "failed";
  return "-";
}

nlohmann::json reclaim_json(const std::vector<model::OrphanCandidate>& candidates,
                            const model::KillOutcome& outcome) {
  nlohmann::json orphans = nlohmann::json::array();
  for (const auto& c : candidates) {
    orphans.push_back({
      {"pid", c.pid},
      {"command", c.command},
      {"age", util::format_age(c.age_ms)},
      {"ageMs", c.age_ms},
      {"memoryBytes", c.rss_bytes},
      {"classification", model::to_string(c.classification)},
      {"reason", c.reason},
      {"cwd", c.working_dir ? nlohmann::json(*c.working_dir) : nlohmann::json(nullptr)},
      {"action", action_for(c.pid, outcome)},
    });
  }
  nlohmann::json failures = nlohmann::json::array();
  for (const auto& f : outcome.failed) failures.push_back({{"pid", f.pid}, {"error", f.error}});
  return nlohmann::json{
    {"orphans", orphans},
    {"summary", {
      {"killed", outcome.killed.size()},
      {"skipped", outcome.skipped.size()},
      {"failed", outcome.failed.size()},
    }},
    {"failures", failures},
    {"dryRun", outcome.dry_run},
  };
}

static std::string fmt_mem(uint64_t bytes) {
  char buf[32];
  double mb = static_cast<double>(bytes) / (1024.0 * 1024.0);
  if (mb >= 1024.0) std::snprintf(buf, sizeof(buf), "%.1fG", mb / 1024.0);
  else std::snprintf(buf, sizeof(buf), "%.0fM", mb);
  return buf;
}

std::vector<std::string> reclaim_table(const std::vector<model::OrphanCandidate>& candidates,
                                       const model::KillOutcome& outcome, int width, bool unicode) {
  int iw = std::max(40, width - 2);
  // PID  CLASS      AGE     MEM    ACTION      COMMAND
  const int pid_w = 7, cls_w = 10, age_w = 8, mem_w = 7, act_w = 11;
  int cmd_w = std::max(8, iw - (pid_w + cls_w + age_w + mem_w + act_w + 5));

  std::vector<std::string> lines;
  lines.push_back(rpad_trunc("PID", pid_w) + " " + trunc_pad("CLASS", cls_w, unicode) + " " +
                  rpad_trunc("AGE", age_w) + " " + rpad_trunc("MEM", mem_w) + " " +
                  trunc_pad("ACTION", act_w, unicode) + " " + "COMMAND");
  for (const auto& c : candidates) {
    lines.push_back(rpad_trunc(std::to_string(c.pid), pid_w) + " " +
                    trunc_pad(model::to_string(c.classification), cls_w, unicode) + " " +
                    rpad_trunc(util::format_age(c.age_ms), age_w) + " " +
                    rpad_trunc(fmt_mem(c.rss_bytes), mem_w) + " " +
                    trunc_pad(action_for(c.pid, outcome), act_w, unicode) + " " +
                    trunc_pad(c.command, cmd_w, unicode));
    lines.push_back(std::string(pid_w + 1, ' ') + c.reason);
  }
  if (candidates.empty()) lines.push_back("no orphan processes found");
  lines.push_back("");
  char summary[128];
  std::snprintf(summary, sizeof(summary), "%s%zu killed, %zu skipped, %zu failed",
                outcome.dry_run ? "dry run: " : "", outcome.killed.size(), outcome.skipped.size(),
                outcome.failed.size());
  lines.push_back(summary);
  for (const auto& f : outcome.failed) lines.push_back("  pid " + std::to_string(f.pid) + ": " + f.error);
  return make_box("orphans", lines, iw + 2, unicode);
}

nlohmann::json registry_json(const std::vector<model::ProcessRecord>& records) {
  return nlohmann::json{{"processes", records}};
}

std::vector<std::string> registry_table(const std::vector<model::ProcessRecord>& records,
                                        int64_t now_ms, int width, bool unicode) {
  int iw = std::max(40, width - 2);
  const int pid_w = 7, ns_w = 12, st_w = 10, age_w = 8, own_w = 7;
  int cmd_w = std::max(8, iw - (pid_w + ns_w + st_w + age_w + own_w + 5));
  std::vector<std::string> lines;
  lines.push_back(rpad_trunc("PID", pid_w) + " " + trunc_pad("NAMESPACE", ns_w, unicode) + " " +
                  trunc_pad("STATUS", st_w, unicode) + " " + rpad_trunc("AGE", age_w) + " " +
                  rpad_trunc("OWNER", own_w) + " COMMAND");
  for (const auto& r : records) {
    std::string cmd = r.command;
    for (const auto& a : r.args) cmd += " " + a;
    lines.push_back(rpad_trunc(std::to_string(r.pid), pid_w) + " " + trunc_pad(r.ns, ns_w, unicode) + " " +
                    trunc_pad(model::to_string(r.status), st_w, unicode) + " " +
                    rpad_trunc(util::format_age(std::max<int64_t>(0, now_ms - r.start_time_ms)), age_w) + " " +
                    rpad_trunc(std::to_string(r.owner_pid), own_w) + " " + trunc_pad(cmd, cmd_w, unicode));
  }
  if (records.empty()) lines.push_back("no registered processes");
  return make_box("registry", lines, iw + 2, unicode);
}

} // namespace warden::ui
