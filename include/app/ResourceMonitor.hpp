#pragma once
#include "app/Registry.hpp"
#include "app/Terminator.hpp"
#include "collectors/IProcessTable.hpp"
#include "model/Process.hpp"

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace warden::app {

struct Violation {
  int32_t pid{};
  double cpu_pct{};
  double memory_mb{};
  bool terminated{false}; // false: still inside the grace period, or the kill failed
  std::string detail;
};

struct MonitorStats {
  uint64_t ticks{0};
  bool running{false};
  bool enabled{false};
  uint64_t terminated_total{0};
  std::vector<Violation> last_violations;
};

// Samples every Registry process on a fixed interval and hands processes over
// their CPU or memory ceiling to the Terminator once they are past the grace
// period. One background thread, so ticks never overlap.
class ResourceMonitor {
public:
  ResourceMonitor(Registry& registry, collectors::IProcessTable& table, Terminator& terminator,
                  model::ResourceLimits limits = {}, KillOptions kill_opts = {});
  ~ResourceMonitor();
  ResourceMonitor(const ResourceMonitor&) = delete;
  ResourceMonitor& operator=(const ResourceMonitor&) = delete;

  // No-op when disabled or already running.
  void start();
  void stop();

  // One sampling pass. now_ms is epoch milliseconds.
  std::vector<Violation> tick();
  std::vector<Violation> tick(int64_t now_ms);

  [[nodiscard]] MonitorStats stats() const;
  [[nodiscard]] model::ResourceLimits limits() const;
  void set_limits(const model::ResourceLimits& limits);

private:
  void run(std::stop_token st);

  Registry& registry_;
  collectors::IProcessTable& table_;
  Terminator& terminator_;
  KillOptions kill_opts_;

  mutable std::mutex mu_; // limits_, stats_
  std::mutex tick_mu_;
  model::ResourceLimits limits_;
  MonitorStats stats_;

  std::mutex wake_mu_;
  std::condition_variable_any wake_;
  std::jthread thread_;
};

} // namespace warden::app
