#pragma once

#include "sessionrelay/common/result.hpp"
#include "sessionrelay/sessions/session.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sessionrelay::sessions {

/// What a caller gets back from `get_or_create` / `reset`.
struct SessionLease {
  std::string handle;
  bool created = false;
  /// The external tool has already accepted this handle; resume instead of create.
  bool started = false;
  /// Result of the write-through. A failed write leaves the in-memory mapping in place.
  common::Status durability = common::Status::success();
};

/// Durable logical-key → session-handle mapping backed by one JSON file.
/// Reads come from the in-memory mirror; every mutation rewrites the file.
class SessionStore {
public:
  explicit SessionStore(std::filesystem::path file_path);

  /// Replace the mirror with the file contents. A missing file is an empty store; an
  /// unreadable or corrupt one also leaves the store empty but returns the error.
  [[nodiscard]] common::Status load();
  [[nodiscard]] common::Status flush();

  [[nodiscard]] SessionLease get_or_create(const std::string &key);
  [[nodiscard]] SessionLease reset(const std::string &key);
  [[nodiscard]] std::optional<SessionRecord> info(const std::string &key) const;
  [[nodiscard]] common::Status mark_started(const std::string &key);
  /// Forget that the tool knows the handle, so the next run creates it again.
  [[nodiscard]] common::Status mark_unstarted(const std::string &key);

  [[nodiscard]] std::vector<std::pair<std::string, SessionRecord>> list() const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] const std::filesystem::path &path() const { return file_path_; }

private:
  [[nodiscard]] common::Status persist_locked() const;
  [[nodiscard]] std::string fresh_handle_locked(const std::string &key) const;

  std::filesystem::path file_path_;
  mutable std::mutex mutex_;
  SessionRecordMap records_;
};

} // namespace sessionrelay::sessions
