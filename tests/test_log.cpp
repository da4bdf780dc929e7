#include "minitest.hpp"
#include "util/Log.hpp"

#include <vector>

using warden::util::LogLevel;

namespace {

struct Capture {
  std::vector<std::string> lines;
  LogLevel saved = warden::util::log_level();
  Capture() {
    warden::util::set_log_sink([this](LogLevel, const std::string& l) { lines.push_back(l); });
  }
  ~Capture() {
    warden::util::set_log_sink({});
    warden::util::set_log_level(saved);
  }
};

} // namespace

TEST(log_line_shape) {
  Capture cap;
  warden::util::set_log_level(LogLevel::Warn);
  warden::util::log_warn("Registry", "failed to persist after %s: %s", "add", "disk full");
  ASSERT_EQ(cap.lines.size(), 1u);
  ASSERT_EQ(cap.lines[0], "warden: Registry: failed to persist after add: disk full");
}

TEST(log_threshold) {
  Capture cap;
  warden::util::set_log_level(LogLevel::Warn);
  warden::util::log_info("Monitor", "started");
  warden::util::log_debug("Monitor", "tick");
  warden::util::log_error("Monitor", "boom %d", 7);
  ASSERT_EQ(cap.lines.size(), 1u);
  ASSERT_EQ(cap.lines[0], "warden: Monitor: boom 7");
  ASSERT_TRUE(!warden::util::log_enabled(LogLevel::Info));

  warden::util::set_log_level(LogLevel::Debug);
  warden::util::log_debug("Monitor", "tick");
  ASSERT_EQ(cap.lines.size(), 2u);
  ASSERT_TRUE(warden::util::log_enabled(LogLevel::Info));
}

TEST(log_long_message_is_truncated_not_overrun) {
  Capture cap;
  warden::util::set_log_level(LogLevel::Error);
  std::string big(4000, 'x');
  warden::util::log_error("Test", "%s", big.c_str());
  ASSERT_EQ(cap.lines.size(), 1u);
  ASSERT_TRUE(cap.lines[0].size() < 1100);
}
