#pragma once

#include "sessionrelay/invoker/invoker.hpp"
#include "sessionrelay/relay/admission.hpp"
#include "sessionrelay/sessions/session_key.hpp"
#include "sessionrelay/sessions/store.hpp"
#include "sessionrelay/workspace/store.hpp"

#include <optional>
#include <string>

namespace sessionrelay::relay {

struct RelayConfig {
  std::string session_prefix = "telegram";
  std::string default_workspace;
  /// Shown by /status; the invoker carries the model it actually passes.
  std::string model;
  bool refine_transcripts = true;
};

enum class ReplyKind { Answer, Busy, Error, Info };

struct RelayReply {
  ReplyKind kind = ReplyKind::Info;
  std::string text;
  std::optional<invoker::InvokeError> error;
  /// Telegram legacy Markdown; the channel falls back to plain text when rejected.
  bool markdown = false;
};

struct ParsedCommand {
  std::string name;
  std::string args;
};

/// "/name@bot args" -> {name, args}. Non-commands yield nothing.
[[nodiscard]] std::optional<ParsedCommand> parse_command(const std::string &text);

/// Routes one conversation's requests through workspace lookup, session key derivation,
/// the session store and the assistant invoker, serialised per conversation by the gate.
class Relay {
public:
  Relay(RelayConfig config, sessions::SessionStore &sessions, workspace::WorkspaceStore &workspaces,
        const invoker::AssistantInvoker &invoker, AdmissionGate &gate);

  [[nodiscard]] std::string workspace_for(const sessions::Conversation &conversation) const;
  [[nodiscard]] std::string session_key_for(const sessions::Conversation &conversation) const;

  [[nodiscard]] std::optional<AdmissionSlot> admit(const sessions::Conversation &conversation);

  /// Run `text` against the conversation's current session. `slot` is released on return.
  [[nodiscard]] RelayReply ask(const sessions::Conversation &conversation, const std::string &text,
                               AdmissionSlot slot);

  /// admit + ask; a Busy reply when another request for the conversation is in flight.
  [[nodiscard]] RelayReply process_text(const sessions::Conversation &conversation,
                                        const std::string &text);

  [[nodiscard]] RelayReply handle_command(const sessions::Conversation &conversation,
                                          const std::string &name, const std::string &args);

  [[nodiscard]] static std::string help_text();
  [[nodiscard]] static std::string busy_text();
  [[nodiscard]] const RelayConfig &config() const { return config_; }

private:
  [[nodiscard]] RelayReply command_start(const sessions::Conversation &conversation) const;
  [[nodiscard]] RelayReply command_setrepo(const sessions::Conversation &conversation,
                                           const std::string &args);
  [[nodiscard]] RelayReply command_repo(const sessions::Conversation &conversation) const;
  [[nodiscard]] RelayReply command_clearrepo(const sessions::Conversation &conversation);
  [[nodiscard]] RelayReply command_ls(const sessions::Conversation &conversation) const;
  [[nodiscard]] RelayReply command_status(const sessions::Conversation &conversation) const;
  [[nodiscard]] RelayReply command_reset(const sessions::Conversation &conversation);
  void track_session_state(const std::string &key, const sessions::SessionLease &lease,
                           const invoker::InvocationResult &result);

  RelayConfig config_;
  sessions::SessionStore &sessions_;
  workspace::WorkspaceStore &workspaces_;
  const invoker::AssistantInvoker &invoker_;
  AdmissionGate &gate_;
};

} // namespace sessionrelay::relay
