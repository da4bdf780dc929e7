#include "ui/Formatting.hpp"

#include <sys/ioctl.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace warden::ui {

bool use_unicode() {
  const char* lc = std::getenv("LC_ALL");
  if (!lc || !*lc) lc = std::getenv("LANG");
  if (!lc || !*lc) return false;
  std::string s = lc;
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s.find("utf") != std::string::npos;
}

int u8_len(unsigned char c){
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1;
}

int display_cols(const std::string& s){
  int cols = 0;
  for (size_t i=0; i<s.size();){
    int len = u8_len((unsigned char)s[i]);
    i += len;
    cols += 1;
  }
  return cols;
}

std::string take_cols(const std::string& s, int cols){
  if (cols <= 0) return std::string();
  std::string out;
  out.reserve(s.size());
  int seen = 0;
  size_t i = 0;
  while (i < s.size() && seen < cols) {
    int len = u8_len((unsigned char)s[i]);
    if (i + (size_t)len > s.size()) len = 1;
    out.append(s, i, len);
    i += len;
    seen += 1;
  }
  return out;
}

std::string trunc_pad(const std::string& s, int w, bool unicode) {
  if (w <= 0) return "";
  int cols = display_cols(s);
  if (cols == w) return s;
  if (cols < w) return s + std::string(w - cols, ' ');
  if (w <= 1) return take_cols(s, w);
  return take_cols(s, w - 1) + (unicode ? "…" : ".");
}

std::string rpad_trunc(const std::string& s, int w) {
  if (w <= 0) return "";
  int cols = display_cols(s);
  if (cols == w) return s;
  if (cols < w) return std::string(w - cols, ' ') + s;
  return take_cols(s, w);
}

static std::string repeat_str(const std::string& ch, int n){
  std::string r;
  r.reserve(std::max(0,n* (int)ch.size()));
  for (int i=0;i<n;i++) r += ch;
  return r;
}

std::vector<std::string> make_box(const std::string& title, const std::vector<std::string>& lines, int width, bool unicode) {
  int iw = std::max(3, width - 2);
  std::vector<std::string> out;
  const std::string TL = unicode? "╭" : "+";
  const std::string TR = unicode? "╮" : "+";
  const std::string BL = unicode? "╰" : "+";
  const std::string BR = unicode? "╯" : "+";
  const std::string H  = unicode? "─" : "-";
  const std::string V  = unicode? "│" : "|";
  auto top = [&]{
    std::string t = "[ " + title + " ]";
    int fill = std::max(0, iw - display_cols(t));
    int left = fill / 2; int right = fill - left;
    return TL + repeat_str(H, left) + t + repeat_str(H, right) + TR;
  }();
  out.push_back(top);
  for (const auto& ln : lines) out.push_back(V + trunc_pad(ln, iw, unicode) + V);
  out.push_back(BL + repeat_str(H, iw) + BR);
  return out;
}

int terminal_cols(int def) {
  if (!::isatty(STDOUT_FILENO)) return def;
  struct winsize ws{};
  if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) return ws.ws_col;
  return def;
}

} // namespace warden::ui
