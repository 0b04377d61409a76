#pragma once

#include <cstddef>
#include <string>

namespace sessionrelay::common {

/// RFC 4122 version 4 UUID, e.g. "3b241101-e2bb-4255-8caf-4136c566a962".
[[nodiscard]] std::string generate_uuid_v4();

[[nodiscard]] bool looks_like_uuid(const std::string &value);

} // namespace sessionrelay::common
