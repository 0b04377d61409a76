#include "sessionrelay/channels/allowlist.hpp"

#include "sessionrelay/common/fs.hpp"

#include <sstream>

namespace sessionrelay::channels {

std::string normalize_sender(std::string value) {
  value = common::to_lower(common::trim(value));
  if (!value.empty() && value.front() == '@') {
    value.erase(value.begin());
  }
  return value;
}

std::vector<std::string> parse_allowlist(const std::string &raw) {
  std::vector<std::string> out;
  std::stringstream stream(raw);
  std::string token;
  while (std::getline(stream, token, ',')) {
    token = normalize_sender(token);
    if (!token.empty()) {
      out.push_back(token);
    }
  }
  return out;
}

bool check_allowlist(std::string_view sender, const std::vector<std::string> &allowlist) {
  if (allowlist.empty()) {
    return false;
  }

  const std::string normalized_sender = normalize_sender(std::string(sender));
  if (normalized_sender.empty()) {
    return false;
  }
  for (const auto &entry : allowlist) {
    if (entry == "*") {
      return true;
    }
    if (normalize_sender(entry) == normalized_sender) {
      return true;
    }
  }

  return false;
}

} // namespace sessionrelay::channels
