#include "sessionrelay/invoker/shell_escape.hpp"

namespace sessionrelay::invoker {

std::string escape_shell_arg(const std::string &value) {
  std::string out;
  out.reserve(value.size() + 2);
  out.push_back('"');
  for (const char ch : value) {
    switch (ch) {
    case '\\':
    case '"':
    case '$':
    case '`':
      out.push_back('\\');
      out.push_back(ch);
      break;
    default:
      out.push_back(ch);
      break;
    }
  }
  out.push_back('"');
  return out;
}

std::string render_command_line(const std::vector<std::string> &argv) {
  std::string line;
  for (std::size_t i = 0; i < argv.size(); ++i) {
    if (i > 0) {
      line.push_back(' ');
    }
    line += escape_shell_arg(argv[i]);
  }
  return line;
}

} // namespace sessionrelay::invoker
