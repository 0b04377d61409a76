#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace sessionrelay::relay {

constexpr std::size_t DEFAULT_MESSAGE_LIMIT = 4000;

/// Split `text` into chunks of at most `max_length` bytes. A chunk ends at the last newline
/// before the limit, else the last space, as long as that lies past half the limit;
/// otherwise the chunk is cut hard. Following chunks are trimmed.
[[nodiscard]] std::vector<std::string> split_message(const std::string &text,
                                                     std::size_t max_length = DEFAULT_MESSAGE_LIMIT);

} // namespace sessionrelay::relay
