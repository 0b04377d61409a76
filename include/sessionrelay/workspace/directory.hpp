#pragma once

#include "sessionrelay/common/result.hpp"

#include <string>
#include <vector>

namespace sessionrelay::workspace {

struct DirectoryListing {
  std::vector<std::string> dirs;
  std::vector<std::string> files;
};

/// Sorted entry names of `path`; names starting with '.' are skipped.
[[nodiscard]] common::Result<DirectoryListing> list_directory(const std::string &path);

} // namespace sessionrelay::workspace
