#include "sessionrelay/workspace/mapping.hpp"

#include "sessionrelay/common/fs.hpp"
#include "sessionrelay/common/json_util.hpp"

#include <sstream>

namespace sessionrelay::workspace {

namespace {

std::string quoted(const std::string &value) { return "\"" + common::json_escape(value) + "\""; }

} // namespace

std::string encode_workspace_mappings(const WorkspaceMap &mappings) {
  if (mappings.empty()) {
    return "{}\n";
  }
  std::ostringstream out;
  out << "{\n";
  bool first = true;
  for (const auto &[conversation_id, mapping] : mappings) {
    if (!first) {
      out << ",\n";
    }
    first = false;
    out << "  " << quoted(conversation_id) << ": {\n";
    out << "    \"path\": " << quoted(mapping.path) << ",\n";
    out << "    \"setAt\": " << quoted(mapping.set_at) << "\n";
    out << "  }";
  }
  out << "\n}\n";
  return out.str();
}

common::Result<WorkspaceMap> parse_workspace_mappings(const std::string &json) {
  if (common::trim(json).empty()) {
    return common::Result<WorkspaceMap>::success({});
  }
  auto members = common::json_object_members(json);
  if (!members.ok()) {
    return common::Result<WorkspaceMap>::failure(members.error());
  }

  WorkspaceMap mappings;
  for (const auto &[conversation_id, raw] : members.value()) {
    auto fields = common::json_object_members(raw);
    if (!fields.ok()) {
      return common::Result<WorkspaceMap>::failure("workspace '" + conversation_id +
                                                   "': " + fields.error());
    }
    WorkspaceMapping mapping;
    for (const auto &[name, value] : fields.value()) {
      if (name == "path") {
        mapping.path = common::json_string_value(value);
      } else if (name == "setAt") {
        mapping.set_at = common::json_string_value(value);
      }
    }
    if (mapping.path.empty()) {
      return common::Result<WorkspaceMap>::failure("workspace '" + conversation_id +
                                                   "': missing path");
    }
    mappings[conversation_id] = std::move(mapping);
  }
  return common::Result<WorkspaceMap>::success(std::move(mappings));
}

} // namespace sessionrelay::workspace
