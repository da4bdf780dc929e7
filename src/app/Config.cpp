#include "app/Config.hpp"
#include "util/Log.hpp"
#include "util/TomlReader.hpp"

#include <charconv>
#include <cstdlib>
#include <cstring>

namespace warden::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("WARDEN_", 0) == 0) {
    alt = std::string("warden_") + n.substr(7);
  } else if (n.rfind("warden_", 0) == 0) {
    alt = std::string("WARDEN_") + n.substr(7);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int64_t getenv_int(const char* name, int64_t defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  int64_t out = 0;
  auto end = v + std::strlen(v);
  auto [ptr, ec] = std::from_chars(v, end, out);
  if (ec != std::errc() || ptr != end) {
    util::log_warn("Config", "ignoring non-numeric %s=%s", name, v);
    return defv;
  }
  return out;
}

static double getenv_double(const char* name, double defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  char* end = nullptr;
  double out = std::strtod(v, &end);
  if (end == v || *end != '\0') {
    util::log_warn("Config", "ignoring non-numeric %s=%s", name, v);
    return defv;
  }
  return out;
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  if ((v[0]=='o'||v[0]=='O') && (v[1]=='f'||v[1]=='F')) return false; // off
  return true;
}

static std::vector<std::string> split_list(const char* v) {
  std::vector<std::string> out;
  std::string cur;
  for (const char* p = v; *p; ++p) {
    if (*p == ',') { if (!cur.empty()) out.push_back(cur); cur.clear(); }
    else cur.push_back(*p);
  }
  if (!cur.empty()) out.push_back(cur);
  return out;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/warden/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/warden/config.toml";
  return {};
}

// Resolve an int from TOML -> env -> compiled default
static int64_t resolve_int(const util::TomlReader& toml, bool have_toml,
                           const char* section, const char* key,
                           const char* env_name, int64_t def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

static double resolve_double(const util::TomlReader& toml, bool have_toml,
                             const char* section, const char* key,
                             const char* env_name, double def) {
  if (have_toml && toml.has(section, key))
    return toml.get_double(section, key, def);
  if (env_name)
    return getenv_double(env_name, def);
  return def;
}

static bool resolve_bool(const util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

static std::string resolve_string(const util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

static std::vector<std::string> resolve_list(const util::TomlReader& toml, bool have_toml,
                                             const char* section, const char* key,
                                             const char* env_name, const std::vector<std::string>& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string_array(section, key);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return split_list(v);
  }
  return def;
}

// A ceiling of 0 or less disables that check.
static std::optional<double> ceiling(double v) {
  if (v <= 0.0) return std::nullopt;
  return v;
}

Config load_config(const std::string& override_path) {
  Config c;
  util::TomlReader toml;
  std::string path = override_path.empty() ? config_file_path() : override_path;
  bool have_toml = !path.empty() && toml.load(path);
  if (have_toml) c.source = path;
  else if (!override_path.empty()) util::log_warn("Config", "cannot read %s; using defaults", override_path.c_str());

  std::error_code ec;
  auto cwd = std::filesystem::current_path(ec);
  if (ec) cwd = ".";
  c.project_root = resolve_string(toml, have_toml, "state", "project_root", "WARDEN_PROJECT_ROOT", cwd.string());
  std::filesystem::path state = resolve_string(toml, have_toml, "state", "dir", "WARDEN_STATE_DIR", ".warden");
  c.state_dir = state.is_absolute() ? state : c.project_root / state;

  c.lock_stale_after_ms = resolve_int(toml, have_toml, "lock", "stale_after_ms", "WARDEN_LOCK_STALE_MS", c.lock_stale_after_ms);
  c.lock_retry_interval_ms = resolve_int(toml, have_toml, "lock", "retry_interval_ms", "WARDEN_LOCK_RETRY_MS", c.lock_retry_interval_ms);
  c.lock_max_retries = static_cast<int>(resolve_int(toml, have_toml, "lock", "max_retries", "WARDEN_LOCK_MAX_RETRIES", c.lock_max_retries));

  c.extra_patterns = resolve_list(toml, have_toml, "detector", "patterns", "WARDEN_PATTERNS", c.extra_patterns);
  c.orchestrator_names = resolve_list(toml, have_toml, "detector", "orchestrator_names", "WARDEN_ORCHESTRATOR_NAMES", c.orchestrator_names);
  c.min_age_ms = resolve_int(toml, have_toml, "detector", "min_age_ms", "WARDEN_MIN_AGE_MS", c.min_age_ms);

  c.kill_timeout_ms = resolve_int(toml, have_toml, "kill", "timeout_ms", "WARDEN_KILL_TIMEOUT_MS", c.kill_timeout_ms);
  c.kill_poll_interval_ms = resolve_int(toml, have_toml, "kill", "poll_interval_ms", "WARDEN_KILL_POLL_MS", c.kill_poll_interval_ms);
  c.kill_parallelism = static_cast<int>(resolve_int(toml, have_toml, "kill", "parallelism", "WARDEN_KILL_PARALLELISM", c.kill_parallelism));
  if (c.kill_parallelism < 1) c.kill_parallelism = 1;

  c.limits.cpu_pct_ceiling = ceiling(resolve_double(toml, have_toml, "monitor", "cpu_percent_ceiling", "WARDEN_CPU_CEILING", 100.0));
  c.limits.memory_mb_ceiling = ceiling(resolve_double(toml, have_toml, "monitor", "memory_mb_ceiling", "WARDEN_MEM_CEILING_MB", 2048.0));
  c.limits.sample_interval_ms = resolve_int(toml, have_toml, "monitor", "sample_interval_ms", "WARDEN_SAMPLE_INTERVAL_MS", c.limits.sample_interval_ms);
  c.limits.grace_period_ms = resolve_int(toml, have_toml, "monitor", "grace_period_ms", "WARDEN_GRACE_MS", c.limits.grace_period_ms);
  c.limits.enabled = resolve_bool(toml, have_toml, "monitor", "enabled", "WARDEN_MONITOR", c.limits.enabled);

  c.stale_max_age_ms = resolve_int(toml, have_toml, "stale_tests", "max_age_ms", "WARDEN_STALE_MAX_AGE_MS", c.stale_max_age_ms);
  return c;
}

util::FileLockOptions Config::lock_options() const {
  util::FileLockOptions o;
  o.stale_after = std::chrono::milliseconds(lock_stale_after_ms);
  o.retry_interval = std::chrono::milliseconds(lock_retry_interval_ms);
  o.max_retries = lock_max_retries;
  return o;
}

KillOptions Config::kill_options() const {
  KillOptions o;
  o.timeout = std::chrono::milliseconds(kill_timeout_ms);
  o.poll_interval = std::chrono::milliseconds(kill_poll_interval_ms);
  o.parallelism = static_cast<unsigned>(kill_parallelism);
  return o;
}

} // namespace warden::app
