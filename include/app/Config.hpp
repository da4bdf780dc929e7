#pragma once
#include "app/Terminator.hpp"
#include "model/Process.hpp"
#include "util/FileLock.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace warden::app {

struct Config {
  std::filesystem::path project_root;   // default: cwd
  std::filesystem::path state_dir;      // default: <project_root>/.warden

  int64_t lock_stale_after_ms{30000};
  int64_t lock_retry_interval_ms{100};
  int lock_max_retries{50};

  std::vector<std::string> extra_patterns;
  std::vector<std::string> orchestrator_names{"warden", "loopwork"};
  int64_t min_age_ms{0};

  int64_t kill_timeout_ms{5000};
  int64_t kill_poll_interval_ms{100};
  int kill_parallelism{4};

  model::ResourceLimits limits{100.0, 2048.0, 10000, 5000, true};

  int64_t stale_max_age_ms{600000};

  std::string source;                   // config file actually read, empty if none

  [[nodiscard]] util::FileLockOptions lock_options() const;
  [[nodiscard]] KillOptions kill_options() const;
};

// $XDG_CONFIG_HOME/warden/config.toml, else ~/.config/warden/config.toml.
[[nodiscard]] std::string config_file_path();

// Resolve every key TOML -> environment -> compiled default. An empty
// override path means the default location; a missing file is not an error.
[[nodiscard]] Config load_config(const std::string& override_path = {});

// WARDEN_X, falling back to warden_X (and the reverse).
const char* getenv_compat(const char* name);
int64_t getenv_int(const char* name, int64_t defv);

} // namespace warden::app
