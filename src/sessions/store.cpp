#include "sessionrelay/sessions/store.hpp"

#include "sessionrelay/common/clock.hpp"
#include "sessionrelay/common/fs.hpp"
#include "sessionrelay/common/id.hpp"
#include "sessionrelay/observability/global.hpp"

namespace sessionrelay::sessions {

namespace {

constexpr const char *COMPONENT = "sessions";

} // namespace

SessionStore::SessionStore(std::filesystem::path file_path) : file_path_(std::move(file_path)) {}

common::Status SessionStore::load() {
  std::lock_guard<std::mutex> lock(mutex_);
  records_.clear();

  auto content = common::read_file(file_path_);
  if (!content.ok()) {
    if (content.error() == "not found") {
      return common::Status::success();
    }
    const std::string message = "cannot read " + file_path_.string() + ": " + content.error();
    observability::record_error(COMPONENT, message);
    return common::Status::error(message);
  }

  auto parsed = parse_session_records(content.value());
  if (!parsed.ok()) {
    const std::string message =
        "corrupt " + file_path_.string() + " (" + parsed.error() + "), starting empty";
    observability::record_error(COMPONENT, message);
    return common::Status::error(message);
  }

  records_ = std::move(parsed.value());
  observability::record_notice(COMPONENT, "loaded " + std::to_string(records_.size()) +
                                              " session mappings");
  return common::Status::success();
}

common::Status SessionStore::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  return persist_locked();
}

common::Status SessionStore::persist_locked() const {
  auto status = common::write_file_atomic(file_path_, encode_session_records(records_));
  if (!status.ok()) {
    observability::record_error(COMPONENT, "persist failed: " + status.error());
  }
  return status;
}

std::string SessionStore::fresh_handle_locked(const std::string &key) const {
  const auto it = records_.find(key);
  std::string handle = common::generate_uuid_v4();
  if (it != records_.end()) {
    while (handle == it->second.handle ||
           (it->second.previous_handle.has_value() && handle == *it->second.previous_handle)) {
      handle = common::generate_uuid_v4();
    }
  }
  return handle;
}

SessionLease SessionStore::get_or_create(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (const auto it = records_.find(key); it != records_.end()) {
    return SessionLease{.handle = it->second.handle,
                        .created = false,
                        .started = it->second.started,
                        .durability = common::Status::success()};
  }

  SessionRecord record;
  record.handle = fresh_handle_locked(key);
  record.created_at = common::now_rfc3339();
  records_[key] = record;
  observability::record_session(key, record.handle, "created");

  return SessionLease{.handle = record.handle,
                      .created = true,
                      .started = false,
                      .durability = persist_locked()};
}

SessionLease SessionStore::reset(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  SessionRecord record;
  record.handle = fresh_handle_locked(key);
  record.created_at = common::now_rfc3339();
  if (const auto it = records_.find(key); it != records_.end()) {
    record.previous_handle = it->second.handle;
  }
  records_[key] = record;
  observability::record_session(key, record.handle, "reset");

  return SessionLease{.handle = record.handle,
                      .created = true,
                      .started = false,
                      .durability = persist_locked()};
}

std::optional<SessionRecord> SessionStore::info(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = records_.find(key);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

common::Status SessionStore::mark_started(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = records_.find(key);
  if (it == records_.end()) {
    return common::Status::error("unknown session: " + key);
  }
  it->second.started = true;
  it->second.last_used_at = common::now_rfc3339();
  return persist_locked();
}

common::Status SessionStore::mark_unstarted(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = records_.find(key);
  if (it == records_.end()) {
    return common::Status::error("unknown session: " + key);
  }
  if (!it->second.started) {
    return common::Status::success();
  }
  it->second.started = false;
  return persist_locked();
}

std::vector<std::pair<std::string, SessionRecord>> SessionStore::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {records_.begin(), records_.end()};
}

std::size_t SessionStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

} // namespace sessionrelay::sessions
