#include "app/OrphanDetector.hpp"
#include "util/Elapsed.hpp"
#include "util/Log.hpp"

#include <unistd.h>

#include <algorithm>
#include <map>
#include <set>
#include <unordered_map>

namespace warden::app {

using model::Classification;
using model::OrphanCandidate;
using model::OsProcess;

const std::vector<std::string>& default_orphan_patterns() {
  static const std::vector<std::string> patterns = {
    "bun test",
    "tail -f",
    "zsh -c -l source.*shell-snapshots",
    "claude",
    "opencode",
  };
  return patterns;
}

CommandPattern::CommandPattern(std::string text) : text_(std::move(text)) {
  if (text_.find(".*") == std::string::npos) return;
  try {
    regex_.emplace(text_, std::regex::ECMAScript | std::regex::optimize);
  } catch (const std::regex_error& e) {
    util::log_warn("Detector", "pattern \"%s\" is not a valid regex (%s); matching it literally",
                   text_.c_str(), e.what());
  }
}

bool CommandPattern::matches(const std::string& command) const {
  if (regex_) return std::regex_search(command, *regex_);
  return command.find(text_) != std::string::npos;
}

bool path_inside(const std::string& path, const std::string& root) {
  if (root.empty() || path.size() < root.size()) return false;
  if (path.compare(0, root.size(), root) != 0) return false;
  if (path.size() == root.size()) return true;
  return root.back() == '/' || path[root.size()] == '/';
}

static std::string basename_of(const std::string& s) {
  auto sp = s.find(' ');
  std::string first = s.substr(0, sp);
  auto slash = first.rfind('/');
  return slash == std::string::npos ? first : first.substr(slash + 1);
}

// A recycled pid runs something else; same binary name or a command line
// containing the recorded command counts as the same process.
static bool command_matches(const model::ProcessRecord& r, const OsProcess& p) {
  if (r.command.empty()) return true;
  if (p.command.find(r.command) != std::string::npos) return true;
  return basename_of(r.command) == basename_of(p.command);
}

// One table snapshot per scan; lookups for pids outside it go to the backend.
struct OrphanDetector::ProcessIndex {
  collectors::IProcessTable& table;
  std::vector<OsProcess> all;
  std::unordered_map<int32_t, size_t> by_pid;

  explicit ProcessIndex(collectors::IProcessTable& t) : table(t), all(t.list_processes()) {
    for (size_t i = 0; i < all.size(); ++i) by_pid[all[i].pid] = i;
  }
  std::optional<OsProcess> get(int32_t pid) {
    auto it = by_pid.find(pid);
    if (it != by_pid.end()) return all[it->second];
    return table.find(pid);
  }
};

OrphanDetector::OrphanDetector(Registry& registry, TrackedPidStore& tracked, collectors::IProcessTable& table,
                               std::vector<std::string> orchestrator_names, int32_t self_pid)
    : registry_(registry), tracked_(tracked), table_(table),
      orchestrator_names_(std::move(orchestrator_names)),
      self_pid_(self_pid > 0 ? self_pid : static_cast<int32_t>(::getpid())) {}

bool OrphanDetector::is_orchestrator_command(const std::string& command) const {
  for (const auto& n : orchestrator_names_) {
    if (!n.empty() && command.find(n) != std::string::npos) return true;
  }
  return false;
}

OrphanCandidate OrphanDetector::make_candidate(const OsProcess& p, Classification c, std::string reason) {
  OrphanCandidate oc;
  oc.pid = p.pid;
  oc.command = p.command;
  oc.age_ms = util::parse_elapsed(p.etime).value_or(0);
  oc.rss_bytes = p.rss_kb * 1024;
  oc.working_dir = table_.working_directory(p.pid);
  oc.classification = c;
  oc.reason = std::move(reason);
  return oc;
}

void OrphanDetector::scan_tracked(const std::vector<model::TrackedPid>& tracked, ProcessIndex& idx,
                                  std::vector<OrphanCandidate>& out) {
  for (const auto& t : tracked) {
    if (t.pid <= 100 || t.pid == self_pid_) continue;
    if (!table_.alive(t.pid)) continue;
    auto p = idx.get(t.pid);
    if (!p) continue;
    out.push_back(make_candidate(*p, Classification::Confirmed, "tracked by orchestrator"));
  }
}

void OrphanDetector::scan_registry(ProcessIndex& idx, std::vector<OrphanCandidate>& out) {
  for (const auto& r : registry_.list()) {
    if (r.status == model::ProcessStatus::Terminated) continue;
    auto p = table_.alive(r.pid) ? idx.get(r.pid) : std::nullopt;
    if (!p) {
      util::log_debug("Detector", "registry pid %d no longer exists", r.pid);
      registry_.update_status(r.pid, model::ProcessStatus::Terminated);
      continue;
    }
    if (!command_matches(r, *p)) {
      util::log_info("Detector", "pid %d was reused by \"%s\" (recorded \"%s\")", r.pid, p->command.c_str(),
                     r.command.c_str());
      registry_.update_status(r.pid, model::ProcessStatus::Terminated);
      continue;
    }
    if (r.owner_pid > 0 && table_.alive(r.owner_pid)) continue;
    registry_.update_status(r.pid, model::ProcessStatus::Orphaned);
    if (r.pid <= 100 || r.pid == self_pid_) continue;
    out.push_back(make_candidate(*p, Classification::Confirmed, "lineage broken"));
  }
}

void OrphanDetector::scan_heuristic(const ScanOptions& opts, const std::vector<model::TrackedPid>& tracked,
                                    ProcessIndex& idx, std::vector<OrphanCandidate>& out) {
  std::vector<CommandPattern> patterns;
  const auto& base = opts.patterns ? *opts.patterns : default_orphan_patterns();
  for (const auto& s : base) patterns.emplace_back(s);
  for (const auto& s : opts.extra_patterns) patterns.emplace_back(s);
  if (patterns.empty()) return;

  // self and its ancestors are never candidates
  std::set<int32_t> protected_pids;
  {
    int32_t cur = self_pid_;
    while (cur > 1 && protected_pids.insert(cur).second) {
      auto p = idx.get(cur);
      if (!p) break;
      cur = p->ppid;
    }
  }

  // pid -> owning orchestrator (0 when unknown)
  std::map<int32_t, int32_t> owned;
  for (const auto& t : tracked) owned.emplace(t.pid, 0);
  for (const auto& r : registry_.list()) owned[r.pid] = r.owner_pid;
  auto owner_alive = [&](int32_t pid) {
    auto it = owned.find(pid);
    return it != owned.end() && it->second > 0 && table_.alive(it->second);
  };

  for (const auto& p : idx.all) {
    bool hit = std::any_of(patterns.begin(), patterns.end(),
                           [&](const CommandPattern& pat) { return pat.matches(p.command); });
    if (!hit) continue;
    if (p.pid <= 100 || protected_pids.count(p.pid)) continue;
    if (!table_.alive(p.pid)) continue;

    auto age = util::parse_elapsed(p.etime);
    if (!age) util::log_debug("Detector", "unparseable etime \"%s\" for pid %d", p.etime.c_str(), p.pid);
    if (opts.min_age_ms > 0 && age.value_or(0) < opts.min_age_ms) continue;

    // Walk the parent chain once for every lineage signal.
    bool registered_live = owner_alive(p.pid);
    bool name_owner = false;
    bool owned_ancestor = false;
    std::optional<int32_t> marker = p.owner_marker;
    std::set<int32_t> visited{p.pid};
    int32_t cur = p.ppid;
    while (cur > 1 && visited.insert(cur).second) {
      auto anc = idx.get(cur);
      if (!anc) break;
      if (owned.count(cur)) {
        if (owner_alive(cur)) registered_live = true;
        else owned_ancestor = true;
      }
      if (!marker && anc->owner_marker) marker = anc->owner_marker;
      if (is_orchestrator_command(anc->command)) name_owner = true;
      cur = anc->ppid;
    }
    // Only a live marker owner or a live registry owner keeps a match off the list.
    bool live_owner = registered_live || (marker && table_.alive(*marker));
    if (live_owner) {
      util::log_debug("Detector", "pid %d is managed by a live orchestrator", p.pid);
      continue;
    }

    auto c = make_candidate(p, Classification::Suspected, "");
    if (owned.count(p.pid) || owned_ancestor) {
      c.classification = Classification::Confirmed;
      c.reason = "descendant of orchestrator-owned process";
    } else if ((marker || name_owner) && c.working_dir && path_inside(*c.working_dir, opts.root_path)) {
      c.classification = Classification::Confirmed;
      c.reason = "orchestrator descendant in project directory";
    } else if (c.working_dir && path_inside(*c.working_dir, opts.root_path)) {
      c.reason = "matches pattern in project directory but not tracked";
    } else {
      c.reason = "matches orphan pattern; cwd unknown or outside project";
    }
    out.push_back(std::move(c));
  }
}

std::vector<OrphanCandidate> OrphanDetector::scan(const ScanOptions& opts) {
  ProcessIndex idx(table_);
  auto tracked = tracked_.list();

  std::vector<OrphanCandidate> found;
  if (opts.tracked_channel) scan_tracked(tracked, idx, found);
  if (opts.registry_channel) scan_registry(idx, found);
  if (opts.heuristic_channel) scan_heuristic(opts, tracked, idx, found);

  std::map<int32_t, OrphanCandidate> merged;
  for (auto& c : found) {
    auto it = merged.find(c.pid);
    if (it == merged.end()) merged.emplace(c.pid, std::move(c));
    else if (it->second.classification == Classification::Suspected && c.classification == Classification::Confirmed)
      it->second = std::move(c);
  }

  auto pruned = tracked_.prune([this](int32_t pid) { return table_.alive(pid); });
  if (pruned > 0) util::log_debug("Detector", "pruned %zu exited pids from the tracked ledger", pruned);

  std::vector<OrphanCandidate> out;
  out.reserve(merged.size());
  for (auto& [pid, c] : merged) out.push_back(std::move(c));
  util::log_info("Detector", "scan found %zu candidates (%zu processes inspected)", out.size(), idx.all.size());
  return out;
}

} // namespace warden::app
