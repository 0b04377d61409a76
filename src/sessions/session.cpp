#include "sessionrelay/sessions/session.hpp"

#include "sessionrelay/common/fs.hpp"
#include "sessionrelay/common/json_util.hpp"

#include <sstream>

namespace sessionrelay::sessions {

namespace {

std::string quoted(const std::string &value) { return "\"" + common::json_escape(value) + "\""; }

bool is_string_literal(const std::string &raw) { return !raw.empty() && raw.front() == '"'; }

} // namespace

std::string encode_session_records(const SessionRecordMap &records) {
  if (records.empty()) {
    return "{}\n";
  }
  std::ostringstream out;
  out << "{\n";
  bool first = true;
  for (const auto &[key, record] : records) {
    if (!first) {
      out << ",\n";
    }
    first = false;
    out << "  " << quoted(key) << ": {\n";
    out << "    \"handle\": " << quoted(record.handle) << ",\n";
    out << "    \"createdAt\": " << quoted(record.created_at) << ",\n";
    if (record.previous_handle.has_value()) {
      out << "    \"previousHandle\": " << quoted(*record.previous_handle) << ",\n";
    }
    if (record.last_used_at.has_value()) {
      out << "    \"lastUsedAt\": " << quoted(*record.last_used_at) << ",\n";
    }
    out << "    \"started\": " << (record.started ? "true" : "false") << "\n";
    out << "  }";
  }
  out << "\n}\n";
  return out.str();
}

common::Result<SessionRecord> parse_session_record(const std::string &json) {
  auto members = common::json_object_members(json);
  if (!members.ok()) {
    return common::Result<SessionRecord>::failure(members.error());
  }

  SessionRecord record;
  std::string legacy_handle;
  std::optional<std::string> legacy_previous;
  for (const auto &[name, raw] : members.value()) {
    if (name == "handle" && is_string_literal(raw)) {
      record.handle = common::json_string_value(raw);
    } else if (name == "uuid" && is_string_literal(raw)) {
      legacy_handle = common::json_string_value(raw);
    } else if (name == "createdAt" && is_string_literal(raw)) {
      record.created_at = common::json_string_value(raw);
    } else if (name == "previousHandle" && is_string_literal(raw)) {
      record.previous_handle = common::json_string_value(raw);
    } else if (name == "previousUUID" && is_string_literal(raw)) {
      legacy_previous = common::json_string_value(raw);
    } else if (name == "lastUsedAt" && is_string_literal(raw)) {
      record.last_used_at = common::json_string_value(raw);
    } else if (name == "started") {
      record.started = raw == "true";
    }
  }

  if (record.handle.empty()) {
    record.handle = legacy_handle;
  }
  if (!record.previous_handle.has_value() && legacy_previous.has_value()) {
    record.previous_handle = legacy_previous;
  }
  if (record.handle.empty()) {
    return common::Result<SessionRecord>::failure("record has no handle");
  }
  if (!legacy_handle.empty() && record.handle == legacy_handle && !record.started) {
    // Files written by the previous bot only hold handles it already passed to the tool.
    record.started = true;
  }
  return common::Result<SessionRecord>::success(std::move(record));
}

common::Result<SessionRecordMap> parse_session_records(const std::string &json) {
  if (common::trim(json).empty()) {
    return common::Result<SessionRecordMap>::success({});
  }
  auto members = common::json_object_members(json);
  if (!members.ok()) {
    return common::Result<SessionRecordMap>::failure(members.error());
  }

  SessionRecordMap records;
  for (const auto &[key, raw] : members.value()) {
    auto record = parse_session_record(raw);
    if (!record.ok()) {
      return common::Result<SessionRecordMap>::failure("session '" + key +
                                                       "': " + record.error());
    }
    records[key] = std::move(record.value());
  }
  return common::Result<SessionRecordMap>::success(std::move(records));
}

} // namespace sessionrelay::sessions
