#pragma once

#include <string>

namespace sessionrelay::invoker {

/// Remove terminal escape sequences (CSI, OSC and two-byte ESC forms).
[[nodiscard]] std::string strip_terminal_escapes(const std::string &text);

/// Clean assistant stdout for chat delivery, in order: strip terminal escapes, drop
/// carriage returns, blank lines that start with a spinner glyph, collapse 3+ newlines to
/// two, trim.
[[nodiscard]] std::string sanitize_output(const std::string &raw);

} // namespace sessionrelay::invoker
