#pragma once

#include "sessionrelay/common/result.hpp"
#include "sessionrelay/config/schema.hpp"
#include "sessionrelay/invoker/invoker.hpp"
#include "sessionrelay/relay/admission.hpp"
#include "sessionrelay/relay/relay.hpp"
#include "sessionrelay/sessions/store.hpp"
#include "sessionrelay/voice/transcriber.hpp"
#include "sessionrelay/workspace/store.hpp"

#include <memory>
#include <vector>

namespace sessionrelay::runtime {

/// Everything one relay process shares between conversations. Owns the stores the relay
/// refers to, so it must outlive `relay`.
struct RelayServices {
  std::unique_ptr<sessions::SessionStore> sessions;
  std::unique_ptr<workspace::WorkspaceStore> workspaces;
  std::unique_ptr<invoker::AssistantInvoker> invoker;
  std::unique_ptr<relay::AdmissionGate> gate;
  std::unique_ptr<relay::Relay> relay;
  /// Store load problems; the relay still starts with whatever could be read.
  std::vector<std::string> warnings;
};

[[nodiscard]] invoker::InvokerConfig invoker_config_from(const config::Config &config);
[[nodiscard]] relay::RelayConfig relay_config_from(const config::Config &config);

class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config);

  [[nodiscard]] static common::Result<RuntimeContext> from_disk();

  [[nodiscard]] const config::Config &config() const;
  [[nodiscard]] config::Config &mutable_config();

  /// Installs the configured observer, loads both stores and wires the relay.
  [[nodiscard]] common::Result<std::unique_ptr<RelayServices>> create_relay_services();

  /// Null when voice is disabled or no OpenAI key is configured.
  [[nodiscard]] std::shared_ptr<voice::Transcriber> create_transcriber() const;

private:
  config::Config config_;
};

} // namespace sessionrelay::runtime
