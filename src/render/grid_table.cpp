#include "json_table/grid_table.hpp"

#include <algorithm>
#include <clocale>
#include <cstring>
#include <cwchar>
#include <langinfo.h>
#include <string>
#include <vector>

namespace jt {

namespace {

bool codeset_is_utf8() {
  const char* cs = nl_langinfo(CODESET);
  return cs && (std::strcmp(cs, "UTF-8") == 0 || std::strcmp(cs, "utf8") == 0);
}

// LC_CTYPE from the environment, or C.UTF-8 when that is not UTF-8.
// False when no UTF-8 locale exists; wcwidth is then unusable.
bool ensure_utf8_locale() {
  static const bool utf8 = [] {
    std::setlocale(LC_CTYPE, "");
    if (codeset_is_utf8()) return true;
    return std::setlocale(LC_CTYPE, "C.UTF-8") != nullptr && codeset_is_utf8();
  }();
  return utf8;
}

// Width table for when wcwidth has no UTF-8 locale to work with.
int builtin_width(char32_t cp) {
  if ((cp >= 0x0300 && cp <= 0x036F) || (cp >= 0x200B && cp <= 0x200F) ||
      (cp >= 0xFE00 && cp <= 0xFE0F))
    return 0;
  if ((cp >= 0x1100 && cp <= 0x115F) || (cp >= 0x2E80 && cp <= 0x303E) ||
      (cp >= 0x3041 && cp <= 0x33FF) || (cp >= 0x3400 && cp <= 0x4DBF) ||
      (cp >= 0x4E00 && cp <= 0x9FFF) || (cp >= 0xA000 && cp <= 0xA4CF) ||
      (cp >= 0xAC00 && cp <= 0xD7A3) || (cp >= 0xF900 && cp <= 0xFAFF) ||
      (cp >= 0xFE30 && cp <= 0xFE4F) || (cp >= 0xFF00 && cp <= 0xFF60) ||
      (cp >= 0xFFE0 && cp <= 0xFFE6) || (cp >= 0x1F300 && cp <= 0x1F64F) ||
      (cp >= 0x1F900 && cp <= 0x1F9FF) || (cp >= 0x20000 && cp <= 0x3FFFD))
    return 2;
  return 1;
}

// Decodes one UTF-8 sequence at `i`. Returns false (and consumes one byte)
// on a malformed or truncated sequence.
bool next_code_point(const std::string& s, std::size_t& i, char32_t& cp) {
  const auto b0 = static_cast<unsigned char>(s[i]);
  std::size_t len = 0;
  if (b0 < 0x80)                { cp = b0; ++i; return true; }
  else if ((b0 & 0xE0) == 0xC0) { len = 2; cp = b0 & 0x1F; }
  else if ((b0 & 0xF0) == 0xE0) { len = 3; cp = b0 & 0x0F; }
  else if ((b0 & 0xF8) == 0xF0) { len = 4; cp = b0 & 0x07; }
  else { ++i; return false; }

  if (i + len > s.size()) { ++i; return false; }
  for (std::size_t k = 1; k < len; ++k) {
    const auto b = static_cast<unsigned char>(s[i + k]);
    if ((b & 0xC0) != 0x80) { ++i; return false; }
    cp = (cp << 6) | (b & 0x3F);
  }
  i += len;
  return true;
}

std::string sanitize_cell(std::string value) {
  for (char& c : value) {
    if (c == '\n' || c == '\r' || c == '\t') c = ' ';
  }
  return value;
}

void append_rule(std::string& out, const std::vector<std::size_t>& widths, char fill) {
  out += '+';
  for (std::size_t w : widths) {
    out.append(w + 2, fill);
    out += '+';
  }
  out += '\n';
}

void append_row(std::string& out, const Row& row, const std::vector<std::size_t>& widths) {
  out += '|';
  for (std::size_t i = 0; i < widths.size(); ++i) {
    std::string cell = i < row.size() ? sanitize_cell(row[i]) : std::string{};
    out += ' ';
    out += cell;
    out.append(widths[i] - display_width(cell) + 1, ' ');
    out += '|';
  }
  out += '\n';
}

}  // namespace

std::size_t display_width(const std::string& value) {
  const bool use_wcwidth = ensure_utf8_locale();
  std::size_t width = 0;
  std::size_t i = 0;
  while (i < value.size()) {
    char32_t cp = 0;
    if (!next_code_point(value, i, cp)) { ++width; continue; } // one column per bad byte
    if (cp < 0x80) { ++width; continue; }
    int w = use_wcwidth ? ::wcwidth(static_cast<wchar_t>(cp)) : -1;
    if (w < 0) w = builtin_width(cp);
    width += static_cast<std::size_t>(w);
  }
  return width;
}

std::string render_grid_table(const TableMatrix& table, bool include_header) {
  if (table.empty()) {
    return render_grid_table(TableMatrix{Row{"No data available"}}, false);
  }

  const std::size_t cols = std::max<std::size_t>(max_width(table), 1);
  std::vector<std::size_t> widths(cols, 1);
  for (const auto& row : table) {
    for (std::size_t i = 0; i < row.size(); ++i) {
      widths[i] = std::max(widths[i], display_width(sanitize_cell(row[i])));
    }
  }

  std::string out;
  append_rule(out, widths, '-');
  for (std::size_t r = 0; r < table.size(); ++r) {
    append_row(out, table[r], widths);
    append_rule(out, widths, (include_header && r == 0) ? '=' : '-');
  }
  return out;
}

}
