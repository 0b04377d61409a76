#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sessionrelay::config {

struct RelaySettings {
  std::string default_workspace;
  std::string session_prefix = "telegram";
};

struct AssistantConfig {
  std::string binary = "claude";
  std::string model;
  std::optional<std::string> api_key;
  std::string credential_env = "ANTHROPIC_API_KEY";
  std::uint64_t timeout_seconds = 300;
  std::uint64_t max_output_bytes = 16ULL * 1024ULL * 1024ULL;
  bool skip_permissions = true;
  std::string append_system_prompt;
  std::string shell;
};

struct TelegramConfig {
  std::string bot_token;
  std::vector<std::string> allowed_users;
  std::uint32_t poll_timeout_seconds = 30;
};

struct ChannelsConfig {
  std::optional<TelegramConfig> telegram;
};

struct VoiceConfig {
  bool enabled = true;
  std::optional<std::string> api_key;
  bool refine = true;
  std::string language = "de";
  std::string transcription_model = "whisper-1";
  std::string refine_model = "gpt-4o-mini";
};

struct ObservabilityConfig {
  /// Comma list of `log`, `file`, `none`.
  std::string backend = "log";
  std::string level = "info";
};

struct Config {
  std::string data_dir;
  RelaySettings relay;
  AssistantConfig assistant;
  ChannelsConfig channels;
  VoiceConfig voice;
  ObservabilityConfig observability;
};

} // namespace sessionrelay::config
