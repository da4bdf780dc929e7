// stderr diagnostics: "warden: <Component>: <message>"
#pragma once
#include <functional>
#include <string>

namespace warden::util {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Threshold is read once from WARDEN_LOG_LEVEL (error|warn|info|debug or 0..3),
// default warn. set_log_level() overrides it for the rest of the process.
void set_log_level(LogLevel lvl);
[[nodiscard]] LogLevel log_level();
[[nodiscard]] bool log_enabled(LogLevel lvl);

// Replace the stderr writer (tests). Pass an empty function to restore stderr.
using LogSink = std::function<void(LogLevel, const std::string& line)>;
void set_log_sink(LogSink sink);

void log_error(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_warn(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_info(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_debug(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

} // namespace warden::util
