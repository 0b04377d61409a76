#include "sessionrelay/common/toml.hpp"

#include "sessionrelay/common/fs.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>
#include <string_view>

namespace sessionrelay::common {

namespace {

constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";

/// Tracks whether a character position lies inside a '...' or "..." literal.
class QuoteTracker {
public:
  /// Feed the character at `i`; returns true while inside a string afterwards.
  bool step(const std::string &text, std::size_t i) {
    const char ch = text[i];
    if (quote_ == '\0') {
      if (ch == '"' || ch == '\'') {
        quote_ = ch;
      }
    } else if (ch == quote_ && (quote_ == '\'' || !escaped(text, i))) {
      quote_ = '\0';
      return true;
    }
    return quote_ != '\0';
  }

  [[nodiscard]] bool open() const { return quote_ != '\0'; }

private:
  /// Odd run of backslashes before `i`.
  static bool escaped(const std::string &text, std::size_t i) {
    std::size_t count = 0;
    while (i > 0 && text[i - 1] == '\\') {
      ++count;
      --i;
    }
    return count % 2 == 1;
  }

  char quote_ = '\0';
};

std::string strip_comment(const std::string &line) {
  QuoteTracker quotes;
  for (std::size_t i = 0; i < line.size(); ++i) {
    if (!quotes.step(line, i) && line[i] == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

/// Net '[' minus ']' outside strings.
int bracket_balance(const std::string &text) {
  QuoteTracker quotes;
  int depth = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (quotes.step(text, i)) {
      continue;
    }
    if (text[i] == '[') {
      ++depth;
    } else if (text[i] == ']') {
      --depth;
    }
  }
  return depth;
}

std::vector<std::string> split_array_elements(const std::string &body) {
  std::vector<std::string> result;
  QuoteTracker quotes;
  std::size_t start = 0;
  for (std::size_t i = 0; i < body.size(); ++i) {
    if (!quotes.step(body, i) && body[i] == ',') {
      result.push_back(trim(body.substr(start, i - start)));
      start = i + 1;
    }
  }
  if (const std::string tail = trim(body.substr(start)); !tail.empty()) {
    result.push_back(tail);
  }
  return result;
}

std::string unescape_basic(const std::string &body) {
  std::string out;
  out.reserve(body.size());
  for (std::size_t i = 0; i < body.size(); ++i) {
    if (body[i] != '\\' || i + 1 >= body.size()) {
      out.push_back(body[i]);
      continue;
    }
    switch (const char next = body[++i]) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::string unquote(const std::string &raw) {
  const std::string value = trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    return unescape_basic(value.substr(1, value.size() - 2));
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool has_unterminated_string(const std::string &value) {
  QuoteTracker quotes;
  for (std::size_t i = 0; i < value.size(); ++i) {
    (void)quotes.step(value, i);
  }
  return quotes.open();
}

Status line_error(std::size_t line_number, const std::string &message) {
  return Status::error("line " + std::to_string(line_number) + ": " + message);
}

Result<TomlDocument> fail(const Status &status) {
  return Result<TomlDocument>::failure(status.error());
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  return it == values.end() ? fallback : unquote(it->second);
}

bool TomlDocument::get_bool(const std::string &key, bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = to_lower(trim(it->second));
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, std::uint64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  std::string digits = trim(it->second);
  digits.erase(std::remove(digits.begin(), digits.end(), '_'), digits.end());
  std::uint64_t parsed = 0;
  const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), parsed);
  return ec == std::errc() && ptr == digits.data() + digits.size() && !digits.empty() ? parsed
                                                                                      : fallback;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string raw = trim(it->second);
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return fallback;
  }

  std::vector<std::string> out;
  for (const auto &element : split_array_elements(raw.substr(1, raw.size() - 2))) {
    if (!element.empty()) {
      out.push_back(unquote(element));
    }
  }
  return out;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content.rfind(UTF8_BOM, 0) == 0 ? content.substr(UTF8_BOM.size())
                                                            : content);
  std::string line;
  std::string section;
  std::size_t line_number = 0;

  // A multi-line array being collected: its key, first line and text so far.
  std::string pending_key;
  std::size_t pending_line = 0;
  std::string pending_value;

  auto store = [&](const std::string &full_key, std::string value,
                   std::size_t at_line) -> Status {
    if (has_unterminated_string(value)) {
      return line_error(at_line, "unterminated string for '" + full_key + "'");
    }
    if (!document.values.emplace(full_key, std::move(value)).second) {
      return line_error(at_line, "duplicate key '" + full_key + "'");
    }
    return Status::success();
  };

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean = trim(strip_comment(line));

    if (!pending_key.empty()) {
      pending_value += " " + clean;
      if (bracket_balance(pending_value) <= 0) {
        if (const Status stored = store(pending_key, pending_value, pending_line); !stored.ok()) {
          return fail(stored);
        }
        pending_key.clear();
        pending_value.clear();
      }
      continue;
    }

    if (clean.empty()) {
      continue;
    }

    if (clean.front() == '[') {
      if (clean.back() != ']' || clean.rfind("[[", 0) == 0) {
        return fail(line_error(line_number, "unsupported table header " + clean));
      }
      section = trim(clean.substr(1, clean.size() - 2));
      if (section.empty()) {
        return fail(line_error(line_number, "empty table name"));
      }
      continue;
    }

    const std::size_t equals = clean.find('=');
    if (equals == std::string::npos) {
      return fail(line_error(line_number, "expected key = value"));
    }
    const std::string key = unquote(clean.substr(0, equals));
    std::string value = trim(clean.substr(equals + 1));
    if (key.empty()) {
      return fail(line_error(line_number, "missing key"));
    }
    if (value.empty()) {
      return fail(line_error(line_number, "missing value for '" + key + "'"));
    }

    const std::string full_key = section.empty() ? key : section + "." + key;
    if (value.front() == '[' && bracket_balance(value) > 0) {
      pending_key = full_key;
      pending_line = line_number;
      pending_value = std::move(value);
      continue;
    }
    if (const Status stored = store(full_key, std::move(value), line_number); !stored.ok()) {
      return fail(stored);
    }
  }

  if (!pending_key.empty()) {
    return fail(line_error(pending_line, "unterminated array for '" + pending_key + "'"));
  }
  return Result<TomlDocument>::success(std::move(document));
}

} // namespace sessionrelay::common
