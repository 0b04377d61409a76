#pragma once

#include "sessionrelay/common/result.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sessionrelay::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape the body of a JSON string literal (\n, \t, \", \\, \/, \uXXXX incl. surrogates).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

/// One top-level member of a JSON object: unescaped key, raw value text.
using JsonMember = std::pair<std::string, std::string>;

/// Strictly parse the top-level members of a JSON object. Nested values are returned
/// verbatim; malformed input is a failure.
[[nodiscard]] Result<std::vector<JsonMember>> json_object_members(const std::string &json);

/// Parse a flat JSON object into a key→value map; string values are unescaped.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Decode a raw JSON string literal (with quotes). Returns empty for non-strings.
[[nodiscard]] std::string json_string_value(const std::string &raw);

} // namespace sessionrelay::common
