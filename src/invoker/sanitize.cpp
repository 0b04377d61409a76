#include "sessionrelay/invoker/sanitize.hpp"

#include "sessionrelay/common/fs.hpp"

#include <array>
#include <string_view>

namespace sessionrelay::invoker {

namespace {

constexpr char ESC = '\x1B';
constexpr char BEL = '\x07';

// Braille dots spinner used by CLI progress indicators.
constexpr std::array<std::string_view, 10> SPINNER_GLYPHS = {
    "⠋", "⠙", "⠹", "⠸", "⠼",
    "⠴", "⠦", "⠧", "⠇", "⠏"};

bool starts_with_spinner(std::string_view line) {
  for (const auto glyph : SPINNER_GLYPHS) {
    if (line.substr(0, glyph.size()) == glyph) {
      return true;
    }
  }
  return false;
}

std::size_t skip_csi(const std::string &text, std::size_t pos) {
  // pos points just past "ESC [". Parameter and intermediate bytes, then one final byte.
  while (pos < text.size()) {
    const auto ch = static_cast<unsigned char>(text[pos]);
    if (ch >= 0x40 && ch <= 0x7E) {
      return pos + 1;
    }
    if (ch < 0x20 || ch > 0x3F) {
      return pos;
    }
    ++pos;
  }
  return pos;
}

std::size_t skip_osc(const std::string &text, std::size_t pos) {
  // pos points just past "ESC ]". Terminated by BEL or "ESC \".
  while (pos < text.size()) {
    if (text[pos] == BEL) {
      return pos + 1;
    }
    if (text[pos] == ESC && pos + 1 < text.size() && text[pos + 1] == '\\') {
      return pos + 2;
    }
    ++pos;
  }
  return pos;
}

// pos points just past ESC. Intermediates 0x20-0x2F then one final 0x30-0x7E (e.g. "ESC 7",
// "ESC ( B"). Anything else is a stray ESC: only the ESC goes, the byte stays.
std::size_t skip_short_escape(const std::string &text, std::size_t pos) {
  std::size_t end = pos;
  while (end < text.size() && static_cast<unsigned char>(text[end]) >= 0x20 &&
         static_cast<unsigned char>(text[end]) <= 0x2F) {
    ++end;
  }
  if (end < text.size() && static_cast<unsigned char>(text[end]) >= 0x30 &&
      static_cast<unsigned char>(text[end]) <= 0x7E) {
    return end + 1;
  }
  return pos;
}

} // namespace

std::string strip_terminal_escapes(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  std::size_t pos = 0;
  while (pos < text.size()) {
    if (text[pos] != ESC) {
      out.push_back(text[pos]);
      ++pos;
      continue;
    }
    if (pos + 1 >= text.size()) {
      break;
    }
    const char kind = text[pos + 1];
    if (kind == '[') {
      pos = skip_csi(text, pos + 2);
    } else if (kind == ']') {
      pos = skip_osc(text, pos + 2);
    } else {
      pos = skip_short_escape(text, pos + 1);
    }
  }
  return out;
}

std::string sanitize_output(const std::string &raw) {
  const std::string stripped = strip_terminal_escapes(raw);

  std::string no_cr;
  no_cr.reserve(stripped.size());
  for (const char ch : stripped) {
    if (ch != '\r') {
      no_cr.push_back(ch);
    }
  }

  std::string no_spinner;
  no_spinner.reserve(no_cr.size());
  std::size_t line_start = 0;
  while (line_start <= no_cr.size()) {
    const auto newline = no_cr.find('\n', line_start);
    const auto line_end = newline == std::string::npos ? no_cr.size() : newline;
    const std::string_view line(no_cr.data() + line_start, line_end - line_start);
    if (!starts_with_spinner(line)) {
      no_spinner.append(line);
    }
    if (newline == std::string::npos) {
      break;
    }
    no_spinner.push_back('\n');
    line_start = newline + 1;
  }

  std::string collapsed;
  collapsed.reserve(no_spinner.size());
  std::size_t newline_run = 0;
  for (const char ch : no_spinner) {
    if (ch == '\n') {
      ++newline_run;
      if (newline_run <= 2) {
        collapsed.push_back(ch);
      }
      continue;
    }
    newline_run = 0;
    collapsed.push_back(ch);
  }

  return common::trim(collapsed);
}

} // namespace sessionrelay::invoker
