#include "util/Elapsed.hpp"

#include <charconv>
#include <cstdio>
#include <vector>

namespace warden::util {

static bool parse_field(std::string_view sv, int64_t& out) {
  if (sv.empty()) return false;
  for (char c : sv) if (c < '0' || c > '9') return false;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
  return ec == std::errc() && ptr == sv.data() + sv.size();
}

auto parse_elapsed(std::string_view etime) -> std::optional<int64_t> {
  while (!etime.empty() && (etime.front() == ' ' || etime.front() == '\t')) etime.remove_prefix(1);
  while (!etime.empty() && (etime.back() == ' ' || etime.back() == '\t' || etime.back() == '\n')) etime.remove_suffix(1);
  if (etime.empty()) return std::nullopt;

  int64_t days = 0;
  auto dash = etime.find('-');
  if (dash != std::string_view::npos) {
    if (!parse_field(etime.substr(0, dash), days)) return std::nullopt;
    etime.remove_prefix(dash + 1);
  }

  std::vector<int64_t> parts;
  size_t start = 0;
  while (true) {
    auto colon = etime.find(':', start);
    auto piece = etime.substr(start, colon == std::string_view::npos ? std::string_view::npos : colon - start);
    int64_t v = 0;
    if (!parse_field(piece, v)) return std::nullopt;
    parts.push_back(v);
    if (colon == std::string_view::npos) break;
    start = colon + 1;
  }
  if (parts.size() > 3) return std::nullopt;
  if (dash != std::string_view::npos && parts.size() != 3) return std::nullopt;

  int64_t secs = 0;
  switch (parts.size()) {
    case 1: secs = parts[0]; break;
    case 2: secs = parts[0] * 60 + parts[1]; break;
    case 3: secs = parts[0] * 3600 + parts[1] * 60 + parts[2]; break;
    default: return std::nullopt;
  }
  secs += days * 86400;
  return secs * 1000;
}

auto format_elapsed(int64_t seconds) -> std::string {
  if (seconds < 0) seconds = 0;
  int64_t d = seconds / 86400;
  int64_t h = (seconds % 86400) / 3600;
  int64_t m = (seconds % 3600) / 60;
  int64_t s = seconds % 60;
  char buf[48];
  if (d > 0) std::snprintf(buf, sizeof(buf), "%lld-%02lld:%02lld:%02lld", (long long)d, (long long)h, (long long)m, (long long)s);
  else if (h > 0) std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld", (long long)h, (long long)m, (long long)s);
  else std::snprintf(buf, sizeof(buf), "%02lld:%02lld", (long long)m, (long long)s);
  return buf;
}

auto format_age(int64_t ms) -> std::string {
  int64_t seconds = ms / 1000;
  int64_t minutes = seconds / 60;
  int64_t hours = minutes / 60;
  if (hours > 0) return std::to_string(hours) + "h " + std::to_string(minutes % 60) + "m";
  if (minutes > 0) return std::to_string(minutes) + "m";
  return std::to_string(seconds) + "s";
}

} // namespace warden::util
