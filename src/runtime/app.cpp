#include "sessionrelay/runtime/app.hpp"

#include "sessionrelay/config/config.hpp"
#include "sessionrelay/observability/factory.hpp"
#include "sessionrelay/observability/global.hpp"

namespace sessionrelay::runtime {

invoker::InvokerConfig invoker_config_from(const config::Config &config) {
  const auto &assistant = config.assistant;
  invoker::InvokerConfig out;
  out.binary = assistant.binary;
  out.model = assistant.model;
  out.credential = assistant.api_key.value_or("");
  out.credential_env = assistant.credential_env;
  out.timeout = std::chrono::seconds(assistant.timeout_seconds);
  out.max_output_bytes = static_cast<std::size_t>(assistant.max_output_bytes);
  out.skip_permissions = assistant.skip_permissions;
  out.append_system_prompt = assistant.append_system_prompt;
  out.shell = assistant.shell;
  return out;
}

relay::RelayConfig relay_config_from(const config::Config &config) {
  return relay::RelayConfig{.session_prefix = config.relay.session_prefix,
                            .default_workspace = config.relay.default_workspace,
                            .model = config.assistant.model,
                            .refine_transcripts = config.voice.enabled && config.voice.refine};
}

RuntimeContext::RuntimeContext(config::Config config) : config_(std::move(config)) {}

common::Result<RuntimeContext> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::failure(loaded.error());
  }
  return common::Result<RuntimeContext>::success(RuntimeContext(std::move(loaded.value())));
}

const config::Config &RuntimeContext::config() const { return config_; }

config::Config &RuntimeContext::mutable_config() { return config_; }

common::Result<std::unique_ptr<RelayServices>> RuntimeContext::create_relay_services() {
  using ServicesResult = common::Result<std::unique_ptr<RelayServices>>;
  observability::set_global_observer(observability::create_observer(config_));

  auto validated = config::validate_config(config_);
  if (!validated.ok()) {
    return ServicesResult::failure(validated.error());
  }

  auto data = config::data_dir(config_);
  if (!data.ok()) {
    return ServicesResult::failure(data.error());
  }

  auto services = std::make_unique<RelayServices>();
  services->warnings = validated.value();
  services->sessions = std::make_unique<sessions::SessionStore>(data.value() / "sessions.json");
  services->workspaces =
      std::make_unique<workspace::WorkspaceStore>(data.value() / "workspaces.json");
  if (auto status = services->sessions->load(); !status.ok()) {
    services->warnings.push_back(status.error());
  }
  if (auto status = services->workspaces->load(); !status.ok()) {
    services->warnings.push_back(status.error());
  }

  services->invoker = std::make_unique<invoker::AssistantInvoker>(invoker_config_from(config_));
  services->gate = std::make_unique<relay::AdmissionGate>();
  services->relay = std::make_unique<relay::Relay>(relay_config_from(config_), *services->sessions,
                                                   *services->workspaces, *services->invoker,
                                                   *services->gate);
  return ServicesResult::success(std::move(services));
}

std::shared_ptr<voice::Transcriber> RuntimeContext::create_transcriber() const {
  const auto &voice = config_.voice;
  if (!voice.enabled || !voice.api_key.has_value() || voice.api_key->empty()) {
    return nullptr;
  }
  return std::make_shared<voice::OpenAiTranscriber>(
      voice::OpenAiTranscriberConfig{.api_key = *voice.api_key,
                                     .api_base = "https://api.openai.com/v1",
                                     .language = voice.language,
                                     .transcription_model = voice.transcription_model,
                                     .refine_model = voice.refine_model,
                                     .refine = voice.refine,
                                     .timeout_ms = 120000});
}

} // namespace sessionrelay::runtime
