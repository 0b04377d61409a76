#pragma once

#include "sessionrelay/common/result.hpp"
#include "sessionrelay/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace sessionrelay::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

/// Directory holding sessions.json and workspaces.json. `data_dir` from the config when set,
/// otherwise `<config dir>/data`.
[[nodiscard]] common::Result<std::filesystem::path> data_dir(const Config &config);

[[nodiscard]] common::Result<Config> load_config();

/// Fatal problems are returned as failure; everything else comes back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

[[nodiscard]] std::vector<std::string> split_user_list(const std::string &value);

} // namespace sessionrelay::config
