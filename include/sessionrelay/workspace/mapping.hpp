#pragma once

#include "sessionrelay/common/result.hpp"

#include <map>
#include <string>

namespace sessionrelay::workspace {

struct WorkspaceMapping {
  std::string path;
  std::string set_at;
};

using WorkspaceMap = std::map<std::string, WorkspaceMapping>;

[[nodiscard]] std::string encode_workspace_mappings(const WorkspaceMap &mappings);
[[nodiscard]] common::Result<WorkspaceMap> parse_workspace_mappings(const std::string &json);

} // namespace sessionrelay::workspace
