#pragma once

#include <string>

namespace sessionrelay::common {

/// Current UTC time as "YYYY-MM-DDTHH:MM:SSZ".
[[nodiscard]] std::string now_rfc3339();

} // namespace sessionrelay::common
