#pragma once

#include "sessionrelay/common/result.hpp"
#include <filesystem>
#include <string>

namespace sessionrelay::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// Whole-file read. A missing file is a failure with message "not found".
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

/// Write `content` to `path.tmp`, then rename over `path`. Creates the parent directory.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path,
                                       const std::string &content);

} // namespace sessionrelay::common
