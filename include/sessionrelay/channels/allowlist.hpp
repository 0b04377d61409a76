#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace sessionrelay::channels {

/// Lowercase, trimmed, leading '@' removed.
[[nodiscard]] std::string normalize_sender(std::string value);

/// Comma separated ids/usernames, normalized; empty tokens dropped.
[[nodiscard]] std::vector<std::string> parse_allowlist(const std::string &raw);

/// True when `sender` matches an entry or the list holds "*". An empty list matches nothing.
[[nodiscard]] bool check_allowlist(std::string_view sender,
                                   const std::vector<std::string> &allowlist);

} // namespace sessionrelay::channels
