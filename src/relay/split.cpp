#include "sessionrelay/relay/split.hpp"

#include "sessionrelay/common/fs.hpp"

namespace sessionrelay::relay {

namespace {

// Never cut inside a UTF-8 sequence.
std::size_t utf8_boundary(const std::string &text, std::size_t pos) {
  while (pos > 0 && pos < text.size() &&
         (static_cast<unsigned char>(text[pos]) & 0xC0U) == 0x80U) {
    --pos;
  }
  return pos;
}

std::size_t find_split(const std::string &text, std::size_t max_length) {
  const std::size_t half = max_length / 2;
  std::size_t index = text.rfind('\n', max_length);
  if (index == std::string::npos || index < half) {
    index = text.rfind(' ', max_length);
  }
  if (index == std::string::npos || index < half || index == 0) {
    index = utf8_boundary(text, max_length);
    if (index == 0) {
      index = max_length;
    }
  }
  return index;
}

} // namespace

std::vector<std::string> split_message(const std::string &text, std::size_t max_length) {
  if (max_length == 0 || text.size() <= max_length) {
    return {text};
  }

  std::vector<std::string> parts;
  std::string remaining = text;
  while (!remaining.empty()) {
    if (remaining.size() <= max_length) {
      parts.push_back(remaining);
      break;
    }
    const std::size_t index = find_split(remaining, max_length);
    parts.push_back(remaining.substr(0, index));
    remaining = common::trim(remaining.substr(index));
  }
  return parts;
}

} // namespace sessionrelay::relay
