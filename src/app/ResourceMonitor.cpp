#include "app/ResourceMonitor.hpp"
#include "util/Log.hpp"

#include <algorithm>
#include <cstdio>

namespace warden::app {

ResourceMonitor::ResourceMonitor(Registry& registry, collectors::IProcessTable& table, Terminator& terminator,
                                 model::ResourceLimits limits, KillOptions kill_opts)
    : registry_(registry), table_(table), terminator_(terminator), kill_opts_(kill_opts),
      limits_(std::move(limits)) {
  // violations are decided here, not by classification
  kill_opts_.force = true;
  kill_opts_.dry_run = false;
  stats_.enabled = limits_.enabled;
}

ResourceMonitor::~ResourceMonitor() { stop(); }

void ResourceMonitor::start() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!limits_.enabled) {
      util::log_info("Monitor", "resource monitoring disabled");
      return;
    }
    if (stats_.running) return;
    stats_.running = true;
  }
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void ResourceMonitor::stop() {
  if (thread_.joinable()) {
    thread_.request_stop();
    wake_.notify_all();
    thread_.join();
  }
  std::lock_guard<std::mutex> lk(mu_);
  stats_.running = false;
}

void ResourceMonitor::run(std::stop_token st) {
  util::log_info("Monitor", "started (interval %lldms)", static_cast<long long>(limits().sample_interval_ms));
  while (!st.stop_requested()) {
    try {
      tick();
    } catch (const std::exception& e) {
      util::log_error("Monitor", "sample failed: %s", e.what());
    }
    auto interval = std::chrono::milliseconds(std::max<int64_t>(1, limits().sample_interval_ms));
    std::unique_lock<std::mutex> lk(wake_mu_);
    wake_.wait_for(lk, st, interval, [] { return false; });
  }
  util::log_info("Monitor", "stopped");
}

std::vector<Violation> ResourceMonitor::tick() { return tick(now_epoch_ms()); }

std::vector<Violation> ResourceMonitor::tick(int64_t now_ms) {
  std::lock_guard<std::mutex> serial(tick_mu_);
  auto lim = limits();
  std::vector<Violation> found;
  if (!lim.enabled) return found;

  for (const auto& rec : registry_.list()) {
    if (rec.status == model::ProcessStatus::Terminated) continue;
    auto u = table_.usage(rec.pid);
    if (!u) {
      util::log_debug("Monitor", "no sample for pid %d", rec.pid);
      continue;
    }
    double mem_mb = static_cast<double>(u->rss_bytes) / (1024.0 * 1024.0);
    bool over_cpu = lim.cpu_pct_ceiling && u->cpu_pct > *lim.cpu_pct_ceiling;
    bool over_mem = lim.memory_mb_ceiling && mem_mb > *lim.memory_mb_ceiling;
    if (!over_cpu && !over_mem) continue;

    Violation v;
    v.pid = rec.pid;
    v.cpu_pct = u->cpu_pct;
    v.memory_mb = mem_mb;
    char buf[160];
    if (over_cpu && over_mem) std::snprintf(buf, sizeof(buf), "cpu %.1f%% > %.1f%%, memory %.1fMB > %.1fMB", u->cpu_pct, *lim.cpu_pct_ceiling, mem_mb, *lim.memory_mb_ceiling);
    else if (over_cpu) std::snprintf(buf, sizeof(buf), "cpu %.1f%% > %.1f%%", u->cpu_pct, *lim.cpu_pct_ceiling);
    else std::snprintf(buf, sizeof(buf), "memory %.1fMB > %.1fMB", mem_mb, *lim.memory_mb_ceiling);
    v.detail = buf;

    if (now_ms - rec.start_time_ms < lim.grace_period_ms) {
      util::log_debug("Monitor", "pid %d over limit (%s) but inside grace period", rec.pid, buf);
      found.push_back(std::move(v));
      continue;
    }
    // Registry may have dropped it since the list was taken
    if (!registry_.contains(rec.pid)) {
      util::log_debug("Monitor", "pid %d already cleaned", rec.pid);
      continue;
    }
    util::log_warn("Monitor", "terminating pid %d (%s): %s", rec.pid, rec.command.c_str(), buf);
    auto r = terminator_.terminate(rec.pid, kill_opts_);
    v.terminated = r.result == Terminator::Result::Killed;
    if (r.result == Terminator::Result::Failed) {
      util::log_error("Monitor", "failed to terminate pid %d: %s", rec.pid, r.error.c_str());
    }
    found.push_back(std::move(v));
  }

  std::lock_guard<std::mutex> lk(mu_);
  ++stats_.ticks;
  for (const auto& v : found) if (v.terminated) ++stats_.terminated_total;
  stats_.last_violations = found;
  return found;
}

MonitorStats ResourceMonitor::stats() const {
  std::lock_guard<std::mutex> lk(mu_);
  return stats_;
}

model::ResourceLimits ResourceMonitor::limits() const {
  std::lock_guard<std::mutex> lk(mu_);
  return limits_;
}

void ResourceMonitor::set_limits(const model::ResourceLimits& limits) {
  std::lock_guard<std::mutex> lk(mu_);
  limits_ = limits;
  stats_.enabled = limits.enabled;
}

} // namespace warden::app
