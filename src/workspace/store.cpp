#include "sessionrelay/workspace/store.hpp"

#include "sessionrelay/common/clock.hpp"
#include "sessionrelay/common/fs.hpp"
#include "sessionrelay/observability/global.hpp"

namespace sessionrelay::workspace {

namespace {

constexpr const char *COMPONENT = "workspaces";

common::Status validate_directory(const std::string &path) {
  if (path.empty()) {
    return common::Status::error("invalid path: (empty) - path is required");
  }
  if (!std::filesystem::path(path).is_absolute()) {
    return common::Status::error("invalid path: " + path + " - path must be absolute");
  }
  std::error_code ec;
  const auto status = std::filesystem::status(path, ec);
  if (!std::filesystem::exists(status)) {
    const std::string reason = ec ? ec.message() : std::string("no such file or directory");
    return common::Status::error("invalid path: " + path + " - " + reason);
  }
  if (!std::filesystem::is_directory(status)) {
    return common::Status::error("invalid path: " + path + " - not a directory");
  }
  return common::Status::success();
}

} // namespace

WorkspaceStore::WorkspaceStore(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

common::Status WorkspaceStore::load() {
  std::lock_guard<std::mutex> lock(mutex_);
  mappings_.clear();

  auto content = common::read_file(file_path_);
  if (!content.ok()) {
    if (content.error() == "not found") {
      return common::Status::success();
    }
    const std::string message = "cannot read " + file_path_.string() + ": " + content.error();
    observability::record_error(COMPONENT, message);
    return common::Status::error(message);
  }

  auto parsed = parse_workspace_mappings(content.value());
  if (!parsed.ok()) {
    const std::string message =
        "corrupt " + file_path_.string() + " (" + parsed.error() + "), starting empty";
    observability::record_error(COMPONENT, message);
    return common::Status::error(message);
  }

  mappings_ = std::move(parsed.value());
  observability::record_notice(COMPONENT, "loaded " + std::to_string(mappings_.size()) +
                                              " workspace mappings");
  return common::Status::success();
}

common::Status WorkspaceStore::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  return persist_locked();
}

common::Status WorkspaceStore::persist_locked() const {
  auto status = common::write_file_atomic(file_path_, encode_workspace_mappings(mappings_));
  if (!status.ok()) {
    observability::record_error(COMPONENT, "persist failed: " + status.error());
  }
  return status;
}

common::Result<WorkspaceUpdate> WorkspaceStore::set(const std::string &conversation_id,
                                                    const std::string &path) {
  if (auto valid = validate_directory(path); !valid.ok()) {
    return common::Result<WorkspaceUpdate>::failure(valid.error());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  WorkspaceMapping mapping{.path = path, .set_at = common::now_rfc3339()};
  mappings_[conversation_id] = mapping;
  observability::record_workspace(conversation_id, path, "set");
  return common::Result<WorkspaceUpdate>::success(
      WorkspaceUpdate{.mapping = std::move(mapping), .durability = persist_locked()});
}

std::string WorkspaceStore::get(const std::string &conversation_id,
                                const std::string &default_path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = mappings_.find(conversation_id);
  if (it == mappings_.end() || it->second.path.empty()) {
    return default_path;
  }
  return it->second.path;
}

std::optional<WorkspaceMapping> WorkspaceStore::info(const std::string &conversation_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = mappings_.find(conversation_id);
  if (it == mappings_.end()) {
    return std::nullopt;
  }
  return it->second;
}

common::Status WorkspaceStore::remove(const std::string &conversation_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (mappings_.erase(conversation_id) == 0) {
    return common::Status::success();
  }
  observability::record_workspace(conversation_id, "", "cleared");
  return persist_locked();
}

WorkspaceMap WorkspaceStore::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return mappings_;
}

} // namespace sessionrelay::workspace
