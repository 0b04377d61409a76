#include "sessionrelay/common/json_util.hpp"

#include "sessionrelay/common/fs.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>

namespace sessionrelay::common {

namespace {

int hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

bool read_hex4(const std::string &raw, const std::size_t pos, std::uint32_t &out) {
  if (pos + 4 > raw.size()) {
    return false;
  }
  std::uint32_t value = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const int digit = hex_value(raw[i]);
    if (digit < 0) {
      return false;
    }
    value = (value << 4U) | static_cast<std::uint32_t>(digit);
  }
  out = value;
  return true;
}

void append_utf8(std::string &out, const std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

bool is_literal_char(const char ch) {
  return ch != ',' && ch != '}' && ch != ']' && std::isspace(static_cast<unsigned char>(ch)) == 0;
}

bool is_valid_literal(const std::string &literal) {
  if (literal == "true" || literal == "false" || literal == "null") {
    return true;
  }
  if (literal.empty()) {
    return false;
  }
  if (literal.front() != '-' && std::isdigit(static_cast<unsigned char>(literal.front())) == 0) {
    return false;
  }
  for (const char ch : literal) {
    if (std::isdigit(static_cast<unsigned char>(ch)) == 0 && ch != '-' && ch != '+' &&
        ch != '.' && ch != 'e' && ch != 'E') {
      return false;
    }
  }
  return true;
}

// Returns the position one past the value starting at pos, or npos when malformed.
std::size_t scan_value_end(const std::string &json, const std::size_t pos) {
  if (pos >= json.size()) {
    return std::string::npos;
  }
  const char ch = json[pos];
  if (ch == '"') {
    const auto end = json_find_string_end(json, pos);
    return end == std::string::npos ? end : end + 1;
  }
  if (ch == '{' || ch == '[') {
    const auto end = json_find_matching_token(json, pos, ch, ch == '{' ? '}' : ']');
    return end == std::string::npos ? end : end + 1;
  }
  std::size_t end = pos;
  while (end < json.size() && is_literal_char(json[end])) {
    ++end;
  }
  if (!is_valid_literal(json.substr(pos, end - pos))) {
    return std::string::npos;
  }
  return end;
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      std::uint32_t cp = 0;
      if (!read_hex4(raw, i + 1, cp)) {
        out.push_back('u');
        break;
      }
      i += 4;
      if (cp >= 0xD800 && cp <= 0xDBFF) {
        std::uint32_t low = 0;
        if (i + 2 < raw.size() && raw[i + 1] == '\\' && raw[i + 2] == 'u' &&
            read_hex4(raw, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
          cp = 0x10000 + ((cp - 0xD800) << 10U) + (low - 0xDC00);
          i += 6;
        } else {
          cp = 0xFFFD;
        }
      } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
        cp = 0xFFFD;
      }
      append_utf8(out, cp);
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  std::vector<std::string> objects;
  std::size_t pos = json_skip_ws(array_json, 0);
  if (pos >= array_json.size() || array_json[pos] != '[') {
    return objects;
  }
  ++pos;
  while (pos < array_json.size()) {
    pos = json_skip_ws(array_json, pos);
    if (pos >= array_json.size() || array_json[pos] == ']') {
      break;
    }
    if (array_json[pos] == ',') {
      ++pos;
      continue;
    }
    if (array_json[pos] != '{') {
      // Non-object element: step over it.
      const auto end = scan_value_end(array_json, pos);
      if (end == std::string::npos) {
        break;
      }
      pos = end;
      continue;
    }
    const auto close = json_find_matching_token(array_json, pos, '{', '}');
    if (close == std::string::npos) {
      break;
    }
    objects.push_back(array_json.substr(pos, close - pos + 1));
    pos = close + 1;
  }
  return objects;
}

Result<std::vector<JsonMember>> json_object_members(const std::string &json) {
  using MembersResult = Result<std::vector<JsonMember>>;
  std::vector<JsonMember> members;

  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return MembersResult::failure("expected '{' at offset " + std::to_string(pos));
  }
  pos = json_skip_ws(json, pos + 1);

  if (pos < json.size() && json[pos] == '}') {
    pos = json_skip_ws(json, pos + 1);
    if (pos != json.size()) {
      return MembersResult::failure("unexpected content after object at offset " +
                                    std::to_string(pos));
    }
    return MembersResult::success(std::move(members));
  }

  while (true) {
    if (pos >= json.size() || json[pos] != '"') {
      return MembersResult::failure("expected member name at offset " + std::to_string(pos));
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      return MembersResult::failure("unterminated member name at offset " +
                                    std::to_string(pos));
    }
    std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));

    pos = json_skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      return MembersResult::failure("expected ':' after \"" + key + "\"");
    }
    pos = json_skip_ws(json, pos + 1);

    const auto value_end = scan_value_end(json, pos);
    if (value_end == std::string::npos) {
      return MembersResult::failure("malformed value for \"" + key + "\"");
    }
    members.emplace_back(std::move(key), json.substr(pos, value_end - pos));

    pos = json_skip_ws(json, value_end);
    if (pos < json.size() && json[pos] == ',') {
      pos = json_skip_ws(json, pos + 1);
      continue;
    }
    if (pos < json.size() && json[pos] == '}') {
      break;
    }
    return MembersResult::failure("expected ',' or '}' at offset " + std::to_string(pos));
  }

  pos = json_skip_ws(json, pos + 1);
  if (pos != json.size()) {
    return MembersResult::failure("unexpected content after object at offset " +
                                  std::to_string(pos));
  }
  return MembersResult::success(std::move(members));
}

JsonFlatMap json_parse_flat(const std::string &json) {
  JsonFlatMap result;
  auto members = json_object_members(json);
  if (!members.ok()) {
    return result;
  }
  for (const auto &[key, raw] : members.value()) {
    if (!raw.empty() && raw.front() == '"') {
      result[key] = json_string_value(raw);
    } else {
      result[key] = raw;
    }
  }
  return result;
}

std::string json_string_value(const std::string &raw) {
  const std::string value = trim(raw);
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return "";
  }
  return json_unescape(value.substr(1, value.size() - 2));
}

} // namespace sessionrelay::common
