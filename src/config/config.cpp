#include "sessionrelay/config/config.hpp"

#include "sessionrelay/common/fs.hpp"
#include "sessionrelay/common/toml.hpp"
#include "sessionrelay/observability/factory.hpp"
#include "sessionrelay/observability/log_observer.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace sessionrelay::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".sessionrelay";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr const char *DATA_FOLDER = "data";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("SESSIONRELAY_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped) {
        if (ch == '\\') {
          escaped = true;
          continue;
        }
        out.push_back(ch);
        continue;
      }
      switch (ch) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      default:
        out.push_back(ch);
        break;
      }
      escaped = false;
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }

    const std::string key = common::trim(trimmed.substr(0, eq));
    if (key.empty()) {
      continue;
    }
    set_env_if_missing(key, strip_env_quotes(trimmed.substr(eq + 1)));
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const char *env_file = std::getenv("SESSIONRELAY_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    candidates.emplace_back(common::expand_path(env_file));
  }
  // Config dir .env wins over the working directory one.
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }

  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

const char *non_empty_env(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

TelegramConfig &ensure_telegram(Config &config) {
  if (!config.channels.telegram.has_value()) {
    config.channels.telegram = TelegramConfig{};
  }
  return *config.channels.telegram;
}

void load_channel_config(Config &config, const common::TomlDocument &doc) {
  if (!doc.has("channels.telegram.bot_token") && !doc.has("channels.telegram.allowed_users")) {
    return;
  }
  TelegramConfig &telegram = ensure_telegram(config);
  telegram.bot_token = expand_config_value(doc.get_string("channels.telegram.bot_token"));
  telegram.allowed_users = doc.get_string_array("channels.telegram.allowed_users");
  telegram.poll_timeout_seconds = static_cast<std::uint32_t>(
      doc.get_u64("channels.telegram.poll_timeout_seconds", telegram.poll_timeout_seconds));
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }

  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

common::Result<std::filesystem::path> data_dir(const Config &config) {
  if (!common::trim(config.data_dir).empty()) {
    return common::ensure_dir(common::expand_path(config.data_dir));
  }
  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::ensure_dir(cfg_dir.value() / DATA_FOLDER);
}

std::vector<std::string> split_user_list(const std::string &value) {
  std::vector<std::string> out;
  std::stringstream stream(value);
  std::string part;
  while (std::getline(stream, part, ',')) {
    part = common::trim(part);
    if (!part.empty()) {
      out.push_back(part);
    }
  }
  return out;
}

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const char *token = non_empty_env("TELEGRAM_BOT_TOKEN"); token != nullptr) {
    ensure_telegram(config).bot_token = token;
  }
  if (const char *users = non_empty_env("ALLOWED_USERS"); users != nullptr) {
    ensure_telegram(config).allowed_users = split_user_list(users);
  }
  if (const char *key = non_empty_env("ANTHROPIC_API_KEY"); key != nullptr) {
    config.assistant.api_key = std::string(key);
  }
  if (const char *key = non_empty_env("OPENAI_API_KEY"); key != nullptr) {
    config.voice.api_key = std::string(key);
  }
  if (const char *dir = non_empty_env("WORKING_DIRECTORY"); dir != nullptr) {
    config.relay.default_workspace = common::expand_path(dir);
  }
  if (const char *model = non_empty_env("CLAUDE_MODEL"); model != nullptr) {
    config.assistant.model = model;
  }
  if (const char *binary = non_empty_env("CLAUDE_BINARY"); binary != nullptr) {
    config.assistant.binary = binary;
  }
  if (const char *prefix = non_empty_env("SESSION_PREFIX"); prefix != nullptr) {
    config.relay.session_prefix = prefix;
  }
  if (const char *refine = non_empty_env("REFINE_TRANSCRIPTS"); refine != nullptr) {
    config.voice.refine = common::to_lower(common::trim(refine)) != "false";
  }
}

common::Result<Config> load_config() {
  Config config;

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code exists_ec;
  if (std::filesystem::exists(path, exists_ec)) {
    auto content = common::read_file(path);
    if (!content.ok()) {
      return common::Result<Config>::failure("Unable to open config file: " + path.string() +
                                             ": " + content.error());
    }
    const auto parsed = common::parse_toml(content.value());
    if (!parsed.ok()) {
      return common::Result<Config>::failure(path.string() + ": " + parsed.error());
    }
    const auto &doc = parsed.value();

    config.data_dir = expand_config_value(doc.get_string("data_dir", config.data_dir));

    config.relay.default_workspace =
        expand_config_value(doc.get_string("relay.default_workspace", config.relay.default_workspace));
    config.relay.session_prefix = doc.get_string("relay.session_prefix", config.relay.session_prefix);

    config.assistant.binary = expand_config_value(doc.get_string("assistant.binary", config.assistant.binary));
    config.assistant.model = doc.get_string("assistant.model", config.assistant.model);
    if (doc.has("assistant.api_key")) {
      config.assistant.api_key = expand_config_value(doc.get_string("assistant.api_key"));
    }
    config.assistant.credential_env =
        doc.get_string("assistant.credential_env", config.assistant.credential_env);
    config.assistant.timeout_seconds =
        doc.get_u64("assistant.timeout_seconds", config.assistant.timeout_seconds);
    config.assistant.max_output_bytes =
        doc.get_u64("assistant.max_output_bytes", config.assistant.max_output_bytes);
    config.assistant.skip_permissions =
        doc.get_bool("assistant.skip_permissions", config.assistant.skip_permissions);
    config.assistant.append_system_prompt =
        doc.get_string("assistant.append_system_prompt", config.assistant.append_system_prompt);
    config.assistant.shell = doc.get_string("assistant.shell", config.assistant.shell);

    load_channel_config(config, doc);

    config.voice.enabled = doc.get_bool("voice.enabled", config.voice.enabled);
    if (doc.has("voice.api_key")) {
      config.voice.api_key = expand_config_value(doc.get_string("voice.api_key"));
    }
    config.voice.refine = doc.get_bool("voice.refine", config.voice.refine);
    config.voice.language = doc.get_string("voice.language", config.voice.language);
    config.voice.transcription_model =
        doc.get_string("voice.transcription_model", config.voice.transcription_model);
    config.voice.refine_model = doc.get_string("voice.refine_model", config.voice.refine_model);

    config.observability.backend =
        doc.get_string("observability.backend", config.observability.backend);
    config.observability.level = doc.get_string("observability.level", config.observability.level);
  }

  apply_env_overrides(config);

  if (common::trim(config.relay.default_workspace).empty()) {
    std::error_code ec;
    const auto cwd = std::filesystem::current_path(ec);
    if (ec) {
      return common::Result<Config>::failure("unable to resolve current directory: " + ec.message());
    }
    config.relay.default_workspace = cwd.string();
  } else if (!std::filesystem::path(config.relay.default_workspace).is_absolute()) {
    // Session keys fingerprint this string, so it must not depend on the working directory.
    std::error_code ec;
    const auto absolute = std::filesystem::absolute(config.relay.default_workspace, ec);
    if (ec) {
      return common::Result<Config>::failure("unable to resolve relay.default_workspace: " +
                                             ec.message());
    }
    config.relay.default_workspace = absolute.lexically_normal().string();
  }

  return common::Result<Config>::success(std::move(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (common::trim(config.assistant.binary).empty()) {
    return common::Result<std::vector<std::string>>::failure("assistant.binary must not be empty");
  }
  if (config.assistant.timeout_seconds == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "assistant.timeout_seconds must be greater than 0");
  }
  if (config.assistant.max_output_bytes == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "assistant.max_output_bytes must be greater than 0");
  }
  if (common::trim(config.relay.session_prefix).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        "relay.session_prefix must not be empty");
  }

  std::error_code ec;
  if (!std::filesystem::is_directory(config.relay.default_workspace, ec)) {
    warnings.push_back("relay.default_workspace is not a directory: " +
                       config.relay.default_workspace);
  }

  if (!config.assistant.api_key.has_value() || common::trim(*config.assistant.api_key).empty()) {
    warnings.push_back("no assistant credential configured; " + config.assistant.binary +
                       " will use its own login");
  }

  if (!config.channels.telegram.has_value() ||
      common::trim(config.channels.telegram->bot_token).empty()) {
    warnings.push_back("channels.telegram.bot_token is not set; `run` will refuse to start");
  } else if (config.channels.telegram->allowed_users.empty()) {
    warnings.push_back("channels.telegram.allowed_users is empty; every sender is accepted");
  }

  if (config.voice.enabled &&
      (!config.voice.api_key.has_value() || common::trim(*config.voice.api_key).empty())) {
    warnings.push_back("voice is enabled but no OpenAI API key is set; voice messages will fail");
  }

  for (const auto &backend : observability::parse_backends(config.observability.backend)) {
    if (!observability::is_known_backend(backend)) {
      warnings.push_back("unknown observability.backend '" + backend + "', falling back to log");
    }
  }
  if (!observability::parse_log_level(config.observability.level).has_value()) {
    warnings.push_back("unknown observability.level '" + config.observability.level +
                       "', using info");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace sessionrelay::config
