#include "sessionrelay/workspace/directory.hpp"

#include <algorithm>
#include <filesystem>

namespace sessionrelay::workspace {

common::Result<DirectoryListing> list_directory(const std::string &path) {
  std::error_code ec;
  std::filesystem::directory_iterator it(path, ec);
  if (ec) {
    return common::Result<DirectoryListing>::failure("cannot list " + path + ": " + ec.message());
  }

  DirectoryListing listing;
  const std::filesystem::directory_iterator end;
  for (; it != end; it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (name.empty() || name.front() == '.') {
      continue;
    }
    std::error_code type_ec;
    if (it->is_directory(type_ec)) {
      listing.dirs.push_back(name);
    } else {
      listing.files.push_back(name);
    }
  }
  if (ec) {
    return common::Result<DirectoryListing>::failure("cannot list " + path + ": " + ec.message());
  }

  std::sort(listing.dirs.begin(), listing.dirs.end());
  std::sort(listing.files.begin(), listing.files.end());
  return common::Result<DirectoryListing>::success(std::move(listing));
}

} // namespace sessionrelay::workspace
