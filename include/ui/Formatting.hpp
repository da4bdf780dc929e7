#pragma once

#include <string>
#include <vector>

namespace warden::ui {

// LANG/LC_ALL names a UTF-8 locale
bool use_unicode();

// UTF-8 text width utilities
int u8_len(unsigned char c);
int display_cols(const std::string& s);
std::string take_cols(const std::string& s, int cols);

// Text formatting and alignment
std::string trunc_pad(const std::string& s, int w, bool unicode);
std::string rpad_trunc(const std::string& s, int w);

// Box drawing
std::vector<std::string> make_box(const std::string& title, const std::vector<std::string>& lines,
                                  int width, bool unicode);

// Terminal width of stdout, or def when not a tty
int terminal_cols(int def = 100);

} // namespace warden::ui
