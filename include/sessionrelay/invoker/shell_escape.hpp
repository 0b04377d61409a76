#pragma once

#include <string>
#include <vector>

namespace sessionrelay::invoker {

/// Double-quote `value` for a POSIX shell, escaping backslash, double quote, dollar sign
/// and backtick so the shell passes the text through literally.
[[nodiscard]] std::string escape_shell_arg(const std::string &value);

/// Every argument escaped with `escape_shell_arg`, joined by single spaces.
[[nodiscard]] std::string render_command_line(const std::vector<std::string> &argv);

} // namespace sessionrelay::invoker
