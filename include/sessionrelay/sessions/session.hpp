#pragma once

#include "sessionrelay/common/result.hpp"

#include <map>
#include <optional>
#include <string>

namespace sessionrelay::sessions {

struct SessionRecord {
  std::string handle;
  std::string created_at;
  std::optional<std::string> previous_handle;
  bool started = false;
  std::optional<std::string> last_used_at;
};

using SessionRecordMap = std::map<std::string, SessionRecord>;

/// Render the whole mapping as the sessions.json document (pretty-printed, keys sorted).
[[nodiscard]] std::string encode_session_records(const SessionRecordMap &records);

/// Parse one record object. Accepts the legacy "uuid"/"previousUUID" names.
[[nodiscard]] common::Result<SessionRecord> parse_session_record(const std::string &json);

/// Parse a sessions.json document. Blank input is an empty mapping.
[[nodiscard]] common::Result<SessionRecordMap> parse_session_records(const std::string &json);

} // namespace sessionrelay::sessions
