#pragma once

#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden::util {

// Flat TOML subset: [section] headers, key = value, # comments, "quoted"
// strings, integers, floats, booleans and single-line string arrays.
class TomlReader {
public:
  bool load(const std::string& path) {
    sections_.clear();
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::string current_section;
    std::string line;
    while (std::getline(in, line)) {
      auto sv = trim(strip_comment(line));
      if (sv.empty()) continue;
      if (sv.front() == '[' && sv.back() == ']' && sv.find('=') == std::string_view::npos) {
        current_section = std::string(trim(sv.substr(1, sv.size() - 2)));
        ensure_section(current_section);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) continue;
      std::string key(trim(sv.substr(0, eq)));
      std::string val(trim(sv.substr(eq + 1)));
      if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
        val = val.substr(1, val.size() - 2);
      ensure_section(current_section).set(key, val);
    }
    return true;
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                        const std::string& def = "") const {
    const auto* s = find_section(section);
    return s ? s->get(key, def) : def;
  }

  [[nodiscard]] int64_t get_int(std::string_view section, std::string_view key, int64_t def = 0) const {
    auto v = raw(section, key);
    if (!v) return def;
    int64_t out = 0;
    auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), out);
    if (ec != std::errc() || ptr != v->data() + v->size()) return def;
    return out;
  }

  [[nodiscard]] double get_double(std::string_view section, std::string_view key, double def = 0.0) const {
    auto v = raw(section, key);
    if (!v) return def;
    char* end = nullptr;
    double out = std::strtod(v->c_str(), &end);
    if (end == v->c_str() || *end != '\0') return def;
    return out;
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    auto v = raw(section, key);
    if (!v) return def;
    const auto& val = *v;
    if (val == "true" || val == "True" || val == "TRUE" || val == "1") return true;
    if (val == "false" || val == "False" || val == "FALSE" || val == "0") return false;
    return def;
  }

  // ["a", "b"] -> {a, b}. A bare string yields a single element.
  [[nodiscard]] std::vector<std::string> get_string_array(std::string_view section, std::string_view key) const {
    std::vector<std::string> out;
    auto v = raw(section, key);
    if (!v) return out;
    std::string_view sv(*v);
    if (sv.empty() || sv.front() != '[' || sv.back() != ']') {
      out.emplace_back(sv);
      return out;
    }
    sv = sv.substr(1, sv.size() - 2);
    size_t i = 0;
    while (i < sv.size()) {
      while (i < sv.size() && (std::isspace(static_cast<unsigned char>(sv[i])) || sv[i] == ',')) ++i;
      if (i >= sv.size()) break;
      if (sv[i] == '"') {
        std::string item;
        ++i;
        while (i < sv.size() && sv[i] != '"') {
          if (sv[i] == '\\' && i + 1 < sv.size()) ++i;
          item.push_back(sv[i++]);
        }
        ++i; // closing quote
        out.push_back(std::move(item));
      } else {
        size_t j = sv.find(',', i);
        if (j == std::string_view::npos) j = sv.size();
        out.emplace_back(trim(sv.substr(i, j - i)));
        i = j;
      }
    }
    return out;
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    const auto* s = find_section(section);
    return s && s->has(key);
  }

private:
  struct Section {
    std::vector<std::pair<std::string, std::string>> entries;

    [[nodiscard]] std::string get(std::string_view key, const std::string& def) const {
      for (const auto& [k, v] : entries)
        if (k == key) return v;
      return def;
    }

    void set(const std::string& key, const std::string& val) {
      for (auto& [k, v] : entries) {
        if (k == key) { v = val; return; }
      }
      entries.emplace_back(key, val);
    }

    [[nodiscard]] bool has(std::string_view key) const {
      for (const auto& [k, v] : entries)
        if (k == key) return true;
      return false;
    }
  };

  std::vector<std::pair<std::string, Section>> sections_;

  [[nodiscard]] std::optional<std::string> raw(std::string_view section, std::string_view key) const {
    const auto* s = find_section(section);
    if (!s || !s->has(key)) return std::nullopt;
    auto v = s->get(key, "");
    if (v.empty()) return std::nullopt;
    return v;
  }

  Section& ensure_section(const std::string& name) {
    for (auto& [n, s] : sections_)
      if (n == name) return s;
    sections_.emplace_back(name, Section{});
    return sections_.back().second;
  }

  [[nodiscard]] const Section* find_section(std::string_view name) const {
    for (const auto& [n, s] : sections_)
      if (n == name) return &s;
    return nullptr;
  }

  // '#' outside a quoted string starts a comment
  static std::string_view strip_comment(std::string_view sv) {
    bool quoted = false;
    for (size_t i = 0; i < sv.size(); ++i) {
      if (sv[i] == '"' && (i == 0 || sv[i - 1] != '\\')) quoted = !quoted;
      else if (sv[i] == '#' && !quoted) return sv.substr(0, i);
    }
    return sv;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }
};

} // namespace warden::util
