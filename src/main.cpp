#include "app/Config.hpp"
#include "app/Supervisor.hpp"
#include "ui/Formatting.hpp"
#include "ui/Report.hpp"
#include "util/FileLock.hpp"
#include "util/Log.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<bool> g_stop{false};

void on_sigint(int) { g_stop.store(true); }

void print_help() {
  std::cout <<
    "Usage: warden [--config PATH] [--state-dir DIR] [-v] <command> [options]\n"
    "\n"
    "Commands:\n"
    "  reclaim [--force] [--dry-run] [--json] [--root DIR] [--pattern P]... [--min-age-ms N]\n"
    "      find orphaned processes and terminate them (suspected ones need --force)\n"
    "  list [--namespace NS] [--json]\n"
    "      show registered processes\n"
    "  run [--namespace NS] -- CMD [ARGS...]\n"
    "      run CMD under supervision and exit with its status\n"
    "  stale-tests [--max-age-ms N] [--dry-run] [--json]\n"
    "      kill test runners older than the maximum age\n"
    "  monitor [--iterations N]\n"
    "      enforce CPU and memory ceilings on registered processes until Ctrl+C\n";
}

std::optional<int64_t> parse_i64(const char* s) {
  int64_t v = 0;
  auto end = s + std::strlen(s);
  auto [ptr, ec] = std::from_chars(s, end, v);
  if (ec != std::errc() || ptr != end) return std::nullopt;
  return v;
}

struct Args {
  std::vector<std::string> rest;
  size_t i{0};
  bool done() const { return i >= rest.size(); }
  const std::string& peek() const { return rest[i]; }
  const std::string& next() { return rest[i++]; }
};

// Fetches the value of a flag or reports it missing.
bool take_value(Args& a, const std::string& flag, std::string& out) {
  if (a.done()) {
    std::cerr << "warden: " << flag << " needs a value\n";
    return false;
  }
  out = a.next();
  return true;
}

bool take_int(Args& a, const std::string& flag, int64_t& out) {
  std::string v;
  if (!take_value(a, flag, v)) return false;
  auto n = parse_i64(v.c_str());
  if (!n || *n < 0) {
    std::cerr << "warden: " << flag << " expects a non-negative integer, got '" << v << "'\n";
    return false;
  }
  out = *n;
  return true;
}

void print_lines(const std::vector<std::string>& lines) {
  for (const auto& l : lines) std::cout << l << '\n';
}

int cmd_reclaim(warden::app::Supervisor& sup, Args& a) {
  warden::app::ReclaimOptions opts;
  bool json = false;
  while (!a.done()) {
    auto f = a.next();
    if (f == "--force") opts.force = true;
    else if (f == "--dry-run") opts.dry_run = true;
    else if (f == "--json") json = true;
    else if (f == "--root") { if (!take_value(a, f, opts.root_path)) return 2; }
    else if (f == "--pattern") {
      std::string p;
      if (!take_value(a, f, p)) return 2;
      opts.extra_patterns.push_back(p);
    }
    else if (f == "--min-age-ms") {
      int64_t v = 0;
      if (!take_int(a, f, v)) return 2;
      opts.min_age_ms = v;
    }
    else { std::cerr << "warden: reclaim: unknown option " << f << "\n"; return 2; }
  }
  std::mutex progress_mu;
  if (!json) {
    opts.on_event = [&](int32_t pid, warden::app::KillResult r, const std::string& detail) {
      const char* what = r == warden::app::KillResult::Killed    ? (opts.dry_run ? "would kill" : "killed")
                         : r == warden::app::KillResult::Skipped ? "skipped"
                                                                 : "failed";
      std::lock_guard<std::mutex> lk(progress_mu);
      std::cerr << "warden: pid " << pid << ' ' << what;
      if (!detail.empty() && detail != what) std::cerr << " (" << detail << ')';
      std::cerr << '\n';
    };
  }
  auto res = sup.reclaim(opts);
  if (json) std::cout << warden::ui::reclaim_json(res.candidates, res.outcome).dump(2) << '\n';
  else print_lines(warden::ui::reclaim_table(res.candidates, res.outcome, warden::ui::terminal_cols(), warden::ui::use_unicode()));
  return res.outcome.failed.empty() ? 0 : 1;
}

int cmd_list(warden::app::Supervisor& sup, Args& a) {
  std::optional<std::string> ns;
  bool json = false;
  while (!a.done()) {
    auto f = a.next();
    if (f == "--json") json = true;
    else if (f == "--namespace") {
      std::string v;
      if (!take_value(a, f, v)) return 2;
      ns = v;
    }
    else { std::cerr << "warden: list: unknown option " << f << "\n"; return 2; }
  }
  auto records = ns ? sup.registry().list_by_namespace(*ns) : sup.registry().list();
  if (json) std::cout << warden::ui::registry_json(records).dump(2) << '\n';
  else print_lines(warden::ui::registry_table(records, warden::app::now_epoch_ms(), warden::ui::terminal_cols(), warden::ui::use_unicode()));
  return 0;
}

int cmd_run(warden::app::Supervisor& sup, Args& a) {
  std::string ns = "default";
  while (!a.done() && a.peek() != "--") {
    auto f = a.next();
    if (f == "--namespace") { if (!take_value(a, f, ns)) return 2; }
    else { std::cerr << "warden: run: unknown option " << f << "\n"; return 2; }
  }
  if (!a.done()) a.next(); // "--"
  std::vector<std::string> argv(a.rest.begin() + static_cast<std::ptrdiff_t>(a.i), a.rest.end());
  if (argv.empty()) {
    std::cerr << "warden: run: missing command after --\n";
    return 2;
  }
  int32_t pid = 0;
  try {
    pid = sup.spawn(argv, ns);
  } catch (const warden::app::SpawnError& e) {
    std::cerr << "warden: " << e.what() << "\n";
    return 127;
  }
  return sup.wait(pid);
}

int cmd_stale_tests(warden::app::Supervisor& sup, Args& a) {
  warden::app::StaleRunnerOptions opts;
  opts.max_age_ms = sup.config().stale_max_age_ms;
  opts.root_path = sup.config().project_root.string();
  bool json = false;
  while (!a.done()) {
    auto f = a.next();
    if (f == "--dry-run") opts.dry_run = true;
    else if (f == "--json") { json = true; opts.silent = true; }
    else if (f == "--max-age-ms") { if (!take_int(a, f, opts.max_age_ms)) return 2; }
    else { std::cerr << "warden: stale-tests: unknown option " << f << "\n"; return 2; }
  }
  auto res = sup.stale_runners().reap(opts);
  if (json) std::cout << warden::ui::reclaim_json(res.found, res.outcome).dump(2) << '\n';
  else print_lines(warden::ui::reclaim_table(res.found, res.outcome, warden::ui::terminal_cols(), warden::ui::use_unicode()));
  return res.outcome.failed.empty() ? 0 : 1;
}

int cmd_monitor(warden::app::Supervisor& sup, Args& a) {
  int64_t iterations = 0; // 0 => until Ctrl+C
  while (!a.done()) {
    auto f = a.next();
    if (f == "--iterations") { if (!take_int(a, f, iterations)) return 2; }
    else { std::cerr << "warden: monitor: unknown option " << f << "\n"; return 2; }
  }
  auto& mon = sup.monitor();
  auto lim = mon.limits();
  if (!lim.enabled) {
    std::cerr << "warden: resource monitoring is disabled in the configuration\n";
    return 0;
  }
  auto report = [](const std::vector<warden::app::Violation>& vs) {
    for (const auto& v : vs) {
      std::cout << "pid " << v.pid << ": " << v.detail << (v.terminated ? " -> terminated" : " (within grace period)") << '\n';
    }
  };
  if (iterations > 0) {
    for (int64_t i = 0; i < iterations && !g_stop.load(); ++i) {
      if (i > 0) std::this_thread::sleep_for(std::chrono::milliseconds(lim.sample_interval_ms));
      report(mon.tick());
    }
  } else {
    mon.start();
    while (!g_stop.load()) std::this_thread::sleep_for(std::chrono::milliseconds(100));
    mon.stop();
  }
  auto st = mon.stats();
  std::cout << st.ticks << " samples, " << st.terminated_total << " processes terminated\n";
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, on_sigint);
  std::signal(SIGTERM, on_sigint);

  std::string config_path;
  std::string state_dir;
  std::string command;
  Args rest;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (command.empty()) {
      if (a == "--config" && i + 1 < argc) config_path = argv[++i];
      else if (a == "--state-dir" && i + 1 < argc) state_dir = argv[++i];
      else if (a == "-v" || a == "--verbose") warden::util::set_log_level(warden::util::LogLevel::Debug);
      else if (a == "-h" || a == "--help") { print_help(); return 0; }
      else if (!a.empty() && a[0] == '-') { std::cerr << "warden: unknown option " << a << "\n"; return 2; }
      else command = a;
    } else {
      rest.rest.push_back(a);
    }
  }
  if (command.empty()) { print_help(); return 2; }

  auto cfg = warden::app::load_config(config_path);
  if (!state_dir.empty()) {
    std::filesystem::path sd(state_dir);
    cfg.state_dir = sd.is_absolute() ? sd : cfg.project_root / sd;
  }

  try {
    warden::app::Supervisor sup(cfg);
    sup.open();
    if (command == "reclaim") return cmd_reclaim(sup, rest);
    if (command == "list") return cmd_list(sup, rest);
    if (command == "run") return cmd_run(sup, rest);
    if (command == "stale-tests") return cmd_stale_tests(sup, rest);
    if (command == "monitor") return cmd_monitor(sup, rest);
    std::cerr << "warden: unknown command " << command << "\n";
    print_help();
    return 2;
  } catch (const warden::util::LockTimeout& e) {
    std::cerr << "warden: " << e.what() << " (another instance may be stuck; remove the lock if not)\n";
    return 3;
  } catch (const warden::app::PersistError& e) {
    std::cerr << "warden: state error: " << e.what() << "\n";
    return 3;
  } catch (const warden::util::LockError& e) {
    std::cerr << "warden: " << e.what() << "\n";
    return 3;
  }
}
