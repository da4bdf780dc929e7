#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace warden::util {

// Parse a ps(1) etime value into milliseconds. Accepted forms:
//   ss, mm:ss, hh:mm:ss, dd-hh:mm:ss
// A day count is only valid in front of a full hh:mm:ss. Returns std::nullopt
// for anything else (empty fields, non-digits, too many separators).
[[nodiscard]] auto parse_elapsed(std::string_view etime) -> std::optional<int64_t>;

// Render seconds the way ps(1) does: mm:ss, hh:mm:ss or dd-hh:mm:ss.
[[nodiscard]] auto format_elapsed(int64_t seconds) -> std::string;

// Short human form used in reports: "42s", "7m", "3h 5m".
[[nodiscard]] auto format_age(int64_t ms) -> std::string;

} // namespace warden::util
