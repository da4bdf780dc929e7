#include "util/Log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>

namespace warden::util {

static LogLevel level_from_env() {
  const char* v = std::getenv("WARDEN_LOG_LEVEL");
  if (!v || !*v) v = std::getenv("warden_LOG_LEVEL");
  if (!v || !*v) return LogLevel::Warn;
  if (std::strcmp(v, "error") == 0 || std::strcmp(v, "0") == 0) return LogLevel::Error;
  if (std::strcmp(v, "warn") == 0 || std::strcmp(v, "1") == 0) return LogLevel::Warn;
  if (std::strcmp(v, "info") == 0 || std::strcmp(v, "2") == 0) return LogLevel::Info;
  if (std::strcmp(v, "debug") == 0 || std::strcmp(v, "3") == 0) return LogLevel::Debug;
  return LogLevel::Warn;
}

static std::atomic<int>& level_slot() {
  static std::atomic<int> lvl{static_cast<int>(level_from_env())};
  return lvl;
}

static std::mutex g_sink_mu;
static LogSink g_sink;

void set_log_level(LogLevel lvl) { level_slot().store(static_cast<int>(lvl)); }

LogLevel log_level() { return static_cast<LogLevel>(level_slot().load()); }

bool log_enabled(LogLevel lvl) { return static_cast<int>(lvl) <= level_slot().load(); }

void set_log_sink(LogSink sink) {
  std::lock_guard<std::mutex> lk(g_sink_mu);
  g_sink = std::move(sink);
}

static void vlog(LogLevel lvl, const char* component, const char* fmt, va_list ap) {
  if (!log_enabled(lvl)) return;
  char body[1024];
  std::vsnprintf(body, sizeof(body), fmt, ap);
  std::string line = std::string("warden: ") + component + ": " + body;
  std::lock_guard<std::mutex> lk(g_sink_mu);
  if (g_sink) { g_sink(lvl, line); return; }
  std::fprintf(stderr, "%s\n", line.c_str());
}

void log_error(const char* component, const char* fmt, ...) {
  va_list ap; va_start(ap, fmt); vlog(LogLevel::Error, component, fmt, ap); va_end(ap);
}

void log_warn(const char* component, const char* fmt, ...) {
  va_list ap; va_start(ap, fmt); vlog(LogLevel::Warn, component, fmt, ap); va_end(ap);
}

void log_info(const char* component, const char* fmt, ...) {
  va_list ap; va_start(ap, fmt); vlog(LogLevel::Info, component, fmt, ap); va_end(ap);
}

void log_debug(const char* component, const char* fmt, ...) {
  va_list ap; va_start(ap, fmt); vlog(LogLevel::Debug, component, fmt, ap); va_end(ap);
}

} // namespace warden::util
