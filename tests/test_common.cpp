#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "sessionrelay/common/clock.hpp"
#include "sessionrelay/common/fs.hpp"
#include "sessionrelay/common/id.hpp"
#include "sessionrelay/common/json_util.hpp"
#include "sessionrelay/common/toml.hpp"

#include <set>

void register_common_tests(std::vector<sessionrelay::tests::TestCase> &tests) {
  using sessionrelay::tests::require;
  using sessionrelay::tests::require_eq;
  namespace c = sessionrelay::common;

  tests.push_back({"common_json_escape_and_unescape", [] {
                     const std::string raw = "line \"one\"\nback\\slash\ttab";
                     const std::string escaped = c::json_escape(raw);
                     require(escaped.find('\n') == std::string::npos, "newline must be escaped");
                     require(c::json_unescape(escaped) == raw, "unescape should invert escape");
                     require(c::json_unescape("caf\\u00e9") == "café", "\\u escape mismatch");
                   }});

  tests.push_back({"common_json_object_members_keeps_nested_raw", [] {
                     auto members = c::json_object_members(
                         R"({"a": "x", "b": {"c": [1, 2]}, "d": true})");
                     require(members.ok(), members.error());
                     require(members.value().size() == 3, "expected three members");
                     require(members.value()[1].first == "b", "member order should be kept");
                     require(members.value()[1].second == R"({"c": [1, 2]})",
                             "nested object should be verbatim");
                     require(members.value()[2].second == "true", "literal mismatch");
                   }});

  tests.push_back({"common_json_object_members_rejects_malformed", [] {
                     require(!c::json_object_members("[1,2]").ok(), "array is not an object");
                     require(!c::json_object_members(R"({"a": 1,})").ok(),
                             "trailing comma should fail");
                     require(!c::json_object_members(R"({"a" 1})").ok(), "missing colon");
                     require(!c::json_object_members(R"({"a": 1} extra)").ok(),
                             "trailing content should fail");
                     require(!c::json_object_members(R"({"a": "unterminated})").ok(),
                             "unterminated string should fail");
                   }});

  tests.push_back({"common_json_object_members_handles_empty_and_whitespace", [] {
                     auto empty = c::json_object_members("  { }\n");
                     require(empty.ok(), empty.error());
                     require(empty.value().empty(), "empty object has no members");

                     auto spaced = c::json_object_members(
                         "{\n  \"k\\u00e9y\" :\t\"v\" ,\n  \"n\" : -1.5e3\n}\n");
                     require(spaced.ok(), spaced.error());
                     require(spaced.value().size() == 2, "expected two members");
                     require_eq(spaced.value()[0].first, std::string("kéy"), "unescaped key");
                     require(spaced.value()[0].second == "\"v\"", "string value stays quoted");
                     require(spaced.value()[1].second == "-1.5e3", "number mismatch");

                     require(!c::json_object_members("").ok(), "empty input should fail");
                     require(!c::json_object_members(R"({"a": tru})").ok(), "bad literal");
                   }});

  tests.push_back({"common_json_split_skips_non_objects", [] {
                     const auto parts =
                         c::json_split_top_level_objects(R"( [ 1, "x", {"a":[1,{"b":2}]}, [] ] )");
                     require(parts.size() == 1, "only the object element is returned");
                     require_eq(parts[0], std::string(R"({"a":[1,{"b":2}]})"), "object text");
                     require(c::json_split_top_level_objects("[]").empty(), "empty array");
                     require(c::json_split_top_level_objects("{}").empty(), "not an array");
                   }});

  tests.push_back({"common_json_parse_flat_unescapes_strings", [] {
                     auto flat = c::json_parse_flat(R"({"text":"hi\nthere","id":42,"o":{"k":1}})");
                     require(flat["text"] == "hi\nthere", "string should be unescaped");
                     require(flat["id"] == "42", "number should stay raw");
                     require(flat["o"] == R"({"k":1})", "object should stay raw");
                     require(c::json_parse_flat("not json").empty(), "malformed gives empty map");
                   }});

  tests.push_back({"common_json_split_top_level_objects", [] {
                     const auto parts = c::json_split_top_level_objects(
                         R"([{"a":1},{"b":{"c":"}"}}])");
                     require(parts.size() == 2, "expected two objects");
                     require(parts[1] == R"({"b":{"c":"}"}})", "brace inside string mishandled");
                   }});

  tests.push_back({"common_toml_sections_and_arrays", [] {
                     auto doc = c::parse_toml("top = \"v\"\n"
                                              "[channels.telegram]\n"
                                              "bot_token = \"123:abc\" # comment\n"
                                              "allowed_users = [\"alice\", \"42\"]\n"
                                              "[assistant]\n"
                                              "timeout_seconds = 90\n"
                                              "skip_permissions = false\n");
                     require(doc.ok(), doc.error());
                     const auto &d = doc.value();
                     require(d.get_string("top") == "v", "top-level string mismatch");
                     require(d.get_string("channels.telegram.bot_token") == "123:abc",
                             "section key mismatch");
                     const auto users = d.get_string_array("channels.telegram.allowed_users");
                     require(users.size() == 2 && users[1] == "42", "array mismatch");
                     require(d.get_u64("assistant.timeout_seconds", 0) == 90, "u64 mismatch");
                     require(!d.get_bool("assistant.skip_permissions", true), "bool mismatch");
                     require(!c::parse_toml("no equals sign").ok(), "invalid line should fail");
                   }});

  tests.push_back({"common_toml_multiline_arrays_and_separators", [] {
                     auto doc = c::parse_toml("\xEF\xBB\xBF[channels.telegram]\n"
                                              "allowed_users = [\n"
                                              "  \"alice\", # owner\n"
                                              "  \"[bob]\",\n"
                                              "]\n"
                                              "message_limit = 4_000\n");
                     require(doc.ok(), doc.error());
                     const auto users =
                         doc.value().get_string_array("channels.telegram.allowed_users");
                     require(users.size() == 2, "multi-line array size");
                     require(users[1] == "[bob]", "bracket inside string split the array");
                     require(doc.value().get_u64("channels.telegram.message_limit", 0) == 4000,
                             "underscore separators not accepted");
                   }});

  tests.push_back({"common_toml_reports_line_numbers", [] {
                     const auto duplicate = c::parse_toml("a = 1\n\na = 2\n");
                     require(!duplicate.ok(), "duplicate key accepted");
                     require_eq(duplicate.error(), std::string("line 3: duplicate key 'a'"),
                                "duplicate key error");

                     const auto unterminated = c::parse_toml("[x]\nlist = [\"a\",\n");
                     require(!unterminated.ok(), "unterminated array accepted");
                     require(unterminated.error().rfind("line 2:", 0) == 0, unterminated.error());

                     require(!c::parse_toml("[[workspaces]]\n").ok(), "array table accepted");
                     require(!c::parse_toml("[]\n").ok(), "empty table accepted");
                     require(!c::parse_toml("name = \"open\n").ok(), "open string accepted");
                     require(!c::parse_toml("key =\n").ok(), "missing value accepted");
                   }});

  tests.push_back({"common_write_file_atomic_replaces_content", [] {
                     sessionrelay::testing::TempWorkspace ws;
                     const auto path = ws.path() / "nested" / "file.json";
                     require(c::write_file_atomic(path, "first").ok(), "first write failed");
                     require(c::write_file_atomic(path, "second").ok(), "second write failed");
                     auto content = c::read_file(path);
                     require(content.ok(), content.error());
                     require(content.value() == "second", "content should be replaced");
                     require(!std::filesystem::exists(ws.path() / "nested" / "file.json.tmp"),
                             "temporary file should be gone");
                   }});

  tests.push_back({"common_read_file_missing_reports_not_found", [] {
                     sessionrelay::testing::TempWorkspace ws;
                     auto content = c::read_file(ws.path() / "missing.json");
                     require(!content.ok(), "missing file should fail");
                     require(content.error() == "not found", "missing file error mismatch");
                   }});

  tests.push_back({"common_uuid_v4_shape_and_uniqueness", [] {
                     std::set<std::string> seen;
                     for (int i = 0; i < 200; ++i) {
                       const auto id = c::generate_uuid_v4();
                       require(c::looks_like_uuid(id), "not a uuid: " + id);
                       require(id[14] == '4', "version nibble should be 4");
                       seen.insert(id);
                     }
                     require(seen.size() == 200, "uuids should be unique");
                     require(!c::looks_like_uuid("not-a-uuid"), "invalid uuid accepted");
                   }});

  tests.push_back({"common_now_rfc3339_format", [] {
                     const auto now = c::now_rfc3339();
                     require(now.size() == 20, "timestamp length mismatch: " + now);
                     require(now[4] == '-' && now[10] == 'T' && now.back() == 'Z',
                             "timestamp shape mismatch: " + now);
                   }});

  tests.push_back({"common_trim_and_lower", [] {
                     require(c::trim("  a b \n") == "a b", "trim mismatch");
                     require(c::to_lower("AbC") == "abc", "lower mismatch");
                     require(c::starts_with("/setrepo x", "/setrepo"), "starts_with mismatch");
                   }});
}
