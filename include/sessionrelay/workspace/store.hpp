#pragma once

#include "sessionrelay/common/result.hpp"
#include "sessionrelay/workspace/mapping.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace sessionrelay::workspace {

struct WorkspaceUpdate {
  WorkspaceMapping mapping;
  common::Status durability = common::Status::success();
};

/// Durable conversation id → working directory mapping backed by one JSON file.
class WorkspaceStore {
public:
  explicit WorkspaceStore(std::filesystem::path file_path);

  [[nodiscard]] common::Status load();
  [[nodiscard]] common::Status flush();

  /// Fails with "invalid path: <path> - <reason>" when `path` is not an existing directory;
  /// the store is left untouched in that case.
  [[nodiscard]] common::Result<WorkspaceUpdate> set(const std::string &conversation_id,
                                                    const std::string &path);
  [[nodiscard]] std::string get(const std::string &conversation_id,
                                const std::string &default_path) const;
  [[nodiscard]] std::optional<WorkspaceMapping> info(const std::string &conversation_id) const;
  [[nodiscard]] common::Status remove(const std::string &conversation_id);
  [[nodiscard]] WorkspaceMap list() const;

  [[nodiscard]] const std::filesystem::path &path() const { return file_path_; }

private:
  [[nodiscard]] common::Status persist_locked() const;

  std::filesystem::path file_path_;
  mutable std::mutex mutex_;
  WorkspaceMap mappings_;
};

} // namespace sessionrelay::workspace
