#include "app/Supervisor.hpp"
#include "collectors/PosixSignaller.hpp"
#include "collectors/ProcfsProcessTable.hpp"
#include "util/FileLock.hpp"
#include "util/Log.hpp"

#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

extern char** environ;

namespace warden::app {

static std::unique_ptr<collectors::IProcessTable> or_procfs(std::unique_ptr<collectors::IProcessTable> t) {
  if (t) return t;
  return std::make_unique<collectors::ProcfsProcessTable>();
}

static std::unique_ptr<collectors::ISignaller> or_posix(std::unique_ptr<collectors::ISignaller> s) {
  if (s) return s;
  return std::make_unique<collectors::PosixSignaller>();
}

Supervisor::Supervisor(Config cfg, std::unique_ptr<collectors::IProcessTable> table,
                       std::unique_ptr<collectors::ISignaller> signaller)
    : cfg_(std::move(cfg)),
      table_(or_procfs(std::move(table))),
      signaller_(or_posix(std::move(signaller))),
      registry_(cfg_.state_dir, cfg_.lock_options()),
      tracked_(cfg_.state_dir, cfg_.lock_options()),
      detector_(registry_, tracked_, *table_, cfg_.orchestrator_names),
      terminator_(registry_, *table_, *signaller_),
      monitor_(registry_, *table_, terminator_, cfg_.limits, cfg_.kill_options()),
      stale_(detector_, terminator_, cfg_.kill_options()) {
  util::log_debug("Supervisor", "state dir %s, process table %s", cfg_.state_dir.c_str(), table_->name());
}

Supervisor::~Supervisor() { monitor_.stop(); }

void Supervisor::open() { registry_.load(); }

int32_t Supervisor::spawn(const std::vector<std::string>& argv, const std::string& ns) {
  if (argv.empty()) throw SpawnError("empty command");

  // Stable argv/envp arrays; the strings must outlive posix_spawnp.
  std::vector<char*> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto& a : argv) c_argv.push_back(const_cast<char*>(a.c_str()));
  c_argv.push_back(nullptr);

  const std::string marker_key = std::string(model::kOwnerMarkerEnv) + "=";
  std::vector<std::string> env_store;
  for (char** e = environ; e && *e; ++e) {
    if (std::strncmp(*e, marker_key.c_str(), marker_key.size()) == 0) continue;
    env_store.emplace_back(*e);
  }
  env_store.push_back(marker_key + std::to_string(::getpid()));
  std::vector<char*> c_env;
  c_env.reserve(env_store.size() + 1);
  for (auto& e : env_store) c_env.push_back(e.data());
  c_env.push_back(nullptr);

  pid_t pid = 0;
  int rc = ::posix_spawnp(&pid, c_argv[0], nullptr, nullptr, c_argv.data(), c_env.data());
  if (rc != 0) throw SpawnError("cannot start " + argv[0] + ": " + std::strerror(rc));

  model::ProcessMetadata meta;
  meta.command = argv[0];
  meta.args.assign(argv.begin() + 1, argv.end());
  meta.ns = ns;
  try {
    registry_.add(pid, meta);
  } catch (const util::LockTimeout& e) {
    // the record is held in memory and reaches disk with the next persist
    util::log_warn("Supervisor", "pid %d registered; snapshot write deferred: %s", static_cast<int>(pid), e.what());
  }

  std::string cmdline;
  for (const auto& a : argv) { if (!cmdline.empty()) cmdline += ' '; cmdline += a; }
  bool tracked = false;
  try {
    tracked = tracked_.track(pid, cmdline, cfg_.project_root.string());
  } catch (const util::LockError& e) {
    util::log_warn("Supervisor", "tracked pid ledger busy: %s", e.what());
  }
  if (!tracked) {
    util::log_warn("Supervisor", "pid %d registered but not tracked", static_cast<int>(pid));
  }
  util::log_info("Supervisor", "spawned pid %d [%s] %s", static_cast<int>(pid), ns.c_str(), cmdline.c_str());
  return pid;
}

int Supervisor::wait(int32_t pid) {
  int status = 0;
  pid_t r;
  do {
    r = ::waitpid(pid, &status, 0);
  } while (r < 0 && errno == EINTR);
  int code;
  if (r < 0) {
    util::log_error("Supervisor", "waitpid(%d) failed: %s", pid, std::strerror(errno));
    code = 1;
  } else if (WIFEXITED(status)) {
    code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    code = 128 + WTERMSIG(status);
  } else {
    code = 1;
  }
  try {
    registry_.remove(pid);
  } catch (const util::LockTimeout& e) {
    util::log_warn("Supervisor", "pid %d unregistered; snapshot write deferred: %s", pid, e.what());
  }
  bool untracked = false;
  try {
    untracked = tracked_.untrack(pid);
  } catch (const util::LockError& e) {
    util::log_warn("Supervisor", "tracked pid ledger busy: %s", e.what());
  }
  if (!untracked) util::log_warn("Supervisor", "could not untrack pid %d", pid);
  util::log_info("Supervisor", "pid %d exited with %d", pid, code);
  return code;
}

ReclaimResult Supervisor::reclaim(const ReclaimOptions& opts) {
  ScanOptions scan;
  scan.root_path = opts.root_path.empty() ? cfg_.project_root.string() : opts.root_path;
  scan.extra_patterns = cfg_.extra_patterns;
  scan.extra_patterns.insert(scan.extra_patterns.end(), opts.extra_patterns.begin(), opts.extra_patterns.end());
  scan.min_age_ms = opts.min_age_ms.value_or(cfg_.min_age_ms);

  ReclaimResult res;
  res.candidates = detector_.scan(scan);

  auto ko = cfg_.kill_options();
  ko.force = opts.force;
  ko.dry_run = opts.dry_run;
  ko.on_event = opts.on_event;
  res.outcome = terminator_.kill(res.candidates, ko);
  if (!opts.dry_run) {
    auto reaped = terminator_.reap_exited();
    if (reaped > 0) util::log_debug("Supervisor", "dropped %zu terminated records", reaped);
  }
  return res;
}

} // namespace warden::app
