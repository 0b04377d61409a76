#include "sessionrelay/relay/relay.hpp"

#include "sessionrelay/common/fs.hpp"
#include "sessionrelay/observability/global.hpp"
#include "sessionrelay/workspace/directory.hpp"

#include <sstream>

namespace sessionrelay::relay {

namespace {

constexpr const char *COMPONENT = "relay";
constexpr std::size_t HANDLE_PREVIEW_CHARS = 8;

RelayReply info_reply(std::string text) {
  return RelayReply{.kind = ReplyKind::Info, .text = std::move(text), .error = std::nullopt,
                    .markdown = true};
}

RelayReply error_reply(std::string message) {
  return RelayReply{.kind = ReplyKind::Error, .text = "Error: " + message, .error = std::nullopt,
                    .markdown = false};
}

std::string durability_note(const common::Status &durability) {
  if (durability.ok()) {
    return "";
  }
  return "\n\n⚠️ Not saved to disk: " + durability.error();
}

} // namespace

std::optional<ParsedCommand> parse_command(const std::string &text) {
  const std::string trimmed = common::trim(text);
  if (trimmed.size() < 2 || trimmed.front() != '/') {
    return std::nullopt;
  }
  const auto space = trimmed.find_first_of(" \t\n");
  std::string name = trimmed.substr(1, space == std::string::npos ? std::string::npos : space - 1);
  if (const auto at = name.find('@'); at != std::string::npos) {
    name.resize(at);
  }
  if (name.empty()) {
    return std::nullopt;
  }
  std::string args = space == std::string::npos ? std::string() : common::trim(trimmed.substr(space));
  return ParsedCommand{.name = common::to_lower(name), .args = std::move(args)};
}

Relay::Relay(RelayConfig config, sessions::SessionStore &sessions,
             workspace::WorkspaceStore &workspaces, const invoker::AssistantInvoker &invoker,
             AdmissionGate &gate)
    : config_(std::move(config)), sessions_(sessions), workspaces_(workspaces), invoker_(invoker),
      gate_(gate) {}

std::string Relay::workspace_for(const sessions::Conversation &conversation) const {
  return workspaces_.get(conversation.id, config_.default_workspace);
}

std::string Relay::session_key_for(const sessions::Conversation &conversation) const {
  return sessions::derive_session_key(conversation, workspace_for(conversation),
                                      config_.session_prefix);
}

std::optional<AdmissionSlot> Relay::admit(const sessions::Conversation &conversation) {
  return gate_.admit(conversation.id);
}

RelayReply Relay::ask(const sessions::Conversation &conversation, const std::string &text,
                      AdmissionSlot slot) {
  const std::string working_dir = workspace_for(conversation);
  const std::string key =
      sessions::derive_session_key(conversation, working_dir, config_.session_prefix);
  const sessions::SessionLease lease = sessions_.get_or_create(key);

  const invoker::InvocationResult result =
      invoker_.invoke(invoker::InvocationRequest{.handle = lease.handle,
                                                 .resume = lease.started,
                                                 .text = text,
                                                 .working_dir = working_dir,
                                                 .model_override = "",
                                                 .session_key = key});

  track_session_state(key, lease, result);
  slot.release();

  if (!result.ok()) {
    RelayReply reply = error_reply(result.error->message);
    reply.error = result.error;
    return reply;
  }

  std::string output = result.output;
  if (output.empty()) {
    output = "(empty response)";
  }
  if (result.truncated) {
    output += "\n\n[output truncated]";
  }
  return RelayReply{.kind = ReplyKind::Answer, .text = std::move(output), .error = std::nullopt,
                    .markdown = true};
}

// Decides whether the next run resumes the handle or creates it. Any run that got as far as
// the tool (success, timeout, a failure after start, "already in use") means the tool holds
// the session. A resume the tool cannot find sends the next run back to create.
void Relay::track_session_state(const std::string &key, const sessions::SessionLease &lease,
                                const invoker::InvocationResult &result) {
  bool tool_holds_session = result.ok();
  if (!result.ok()) {
    switch (result.error->kind) {
    case invoker::InvokeErrorKind::Spawn:
      return;
    case invoker::InvokeErrorKind::Timeout:
      tool_holds_session = true;
      break;
    case invoker::InvokeErrorKind::ExternalProcess:
      tool_holds_session = invoker::diagnose_session_error(*result.error) !=
                           invoker::SessionDiagnosis::HandleUnknown;
      break;
    }
  }

  if (tool_holds_session) {
    if (auto marked = sessions_.mark_started(key); !marked.ok()) {
      observability::record_error(COMPONENT, "cannot mark " + key + " as started: " + marked.error());
    }
  } else if (lease.started) {
    observability::record_notice(COMPONENT, "session " + lease.handle +
                                                " is unknown to the assistant; next run creates it");
    if (auto cleared = sessions_.mark_unstarted(key); !cleared.ok()) {
      observability::record_error(COMPONENT, "cannot clear " + key + ": " + cleared.error());
    }
  }
}

RelayReply Relay::process_text(const sessions::Conversation &conversation,
                               const std::string &text) {
  auto slot = admit(conversation);
  if (!slot.has_value()) {
    return RelayReply{.kind = ReplyKind::Busy, .text = busy_text(), .error = std::nullopt,
                      .markdown = false};
  }
  return ask(conversation, text, std::move(*slot));
}

RelayReply Relay::handle_command(const sessions::Conversation &conversation,
                                 const std::string &name, const std::string &args) {
  if (name == "help") {
    return info_reply(help_text());
  }
  if (name == "start") {
    return command_start(conversation);
  }
  if (name == "setrepo") {
    return command_setrepo(conversation, args);
  }
  if (name == "repo") {
    return command_repo(conversation);
  }
  if (name == "clearrepo") {
    return command_clearrepo(conversation);
  }
  if (name == "ls") {
    return command_ls(conversation);
  }
  if (name == "status") {
    return command_status(conversation);
  }
  if (name == "reset") {
    return command_reset(conversation);
  }
  return RelayReply{.kind = ReplyKind::Info,
                    .text = "Unknown command /" + name + ". Send /help for the list of commands.",
                    .error = std::nullopt,
                    .markdown = false};
}

std::string Relay::help_text() {
  return "🤖 *Session Relay*\n"
         "\n"
         "Your bridge to the coding assistant.\n"
         "\n"
         "*Messages:*\n"
         "• Text message → the assistant answers\n"
         "• Voice message → transcription + assistant\n"
         "\n"
         "*Commands:*\n"
         "• `/help` - show this help\n"
         "• `/setrepo /path` - set the working directory for this chat\n"
         "• `/repo` - show the current working directory\n"
         "• `/ls` - list files in the working directory\n"
         "• `/status` - show session info\n"
         "• `/reset` - start a new session\n"
         "• `/clearrepo` - remove the working directory mapping";
}

std::string Relay::busy_text() {
  return "⏳ Please wait until the previous request has finished...";
}

RelayReply Relay::command_start(const sessions::Conversation &conversation) const {
  return info_reply(help_text() + "\n\n*Current repo:* `" + workspace_for(conversation) +
                    "`\n*Session:* `" + session_key_for(conversation) + "`");
}

RelayReply Relay::command_setrepo(const sessions::Conversation &conversation,
                                  const std::string &args) {
  const std::string path = common::trim(args);
  if (path.empty()) {
    return info_reply("📂 *Set repo*\n\n"
                      "Usage: `/setrepo /absolute/path/to/repo`\n\n"
                      "Example:\n"
                      "`/setrepo /home/user/projects/my-app`");
  }

  auto updated = workspaces_.set(conversation.id, path);
  if (!updated.ok()) {
    return RelayReply{.kind = ReplyKind::Error,
                      .text = "Error: could not set the repo\n\n" + updated.error() +
                              "\n\nMake sure the path exists and is a directory.",
                      .error = std::nullopt,
                      .markdown = false};
  }
  return info_reply("✅ *Repo set!*\n\nThis chat now works in:\n`" + path +
                    "`\n\nAll assistant requests run in this directory." +
                    durability_note(updated.value().durability));
}

RelayReply Relay::command_repo(const sessions::Conversation &conversation) const {
  if (const auto mapping = workspaces_.info(conversation.id); mapping.has_value()) {
    return info_reply("📂 *Current repo*\n\nPath: `" + mapping->path + "`\nSet at: " +
                      mapping->set_at + "\n\nChange with: `/setrepo /new/path`");
  }
  return info_reply("📂 *No repo set*\n\nThis chat uses the default directory:\n`" +
                    config_.default_workspace + "`\n\nSet a repo with: `/setrepo /path/to/repo`");
}

RelayReply Relay::command_clearrepo(const sessions::Conversation &conversation) {
  const common::Status removed = workspaces_.remove(conversation.id);
  return info_reply("🗑️ *Repo mapping removed*\n\nThis chat uses the default directory again:\n`" +
                    config_.default_workspace + "`" + durability_note(removed));
}

RelayReply Relay::command_ls(const sessions::Conversation &conversation) const {
  const std::string path = workspace_for(conversation);
  auto listing = workspace::list_directory(path);
  if (!listing.ok()) {
    return error_reply(listing.error());
  }

  std::ostringstream out;
  out << "📂 *" << path << "*\n\n";
  const auto &dirs = listing.value().dirs;
  const auto &files = listing.value().files;
  if (!dirs.empty()) {
    out << "*Folders:*\n";
    for (std::size_t i = 0; i < dirs.size(); ++i) {
      out << (i > 0 ? "\n" : "") << "📁 `" << dirs[i] << "`";
    }
    out << "\n\n";
  }
  if (!files.empty()) {
    out << "*Files:*\n";
    for (std::size_t i = 0; i < files.size(); ++i) {
      out << (i > 0 ? "\n" : "") << "📄 `" << files[i] << "`";
    }
  }
  if (dirs.empty() && files.empty()) {
    out << "_(directory is empty)_";
  }
  return info_reply(out.str());
}

RelayReply Relay::command_status(const sessions::Conversation &conversation) const {
  const std::string model = config_.model.empty() ? std::string("auto") : config_.model;
  std::ostringstream out;
  out << "📊 *Status*\n\n";
  out << "• Chat type: `" << (conversation.is_group ? "group" : "private") << "`\n";
  out << "• Chat ID: `" << conversation.id << "`\n";
  out << "• Session: `" << session_key_for(conversation) << "`\n";
  out << "• Repo: `" << workspace_for(conversation) << "`\n";
  out << "• Model: `" << model << "`\n";
  out << "• Voice refinement: " << (config_.refine_transcripts ? "✅" : "❌");
  return info_reply(out.str());
}

RelayReply Relay::command_reset(const sessions::Conversation &conversation) {
  const std::string key = session_key_for(conversation);
  const sessions::SessionLease lease = sessions_.reset(key);
  return info_reply("🔄 *New session started*\n\nSession: `" + key + "`\nNew handle: `" +
                    lease.handle.substr(0, HANDLE_PREVIEW_CHARS) +
                    "...`\n\nThe assistant no longer remembers earlier messages." +
                    durability_note(lease.durability));
}

} // namespace sessionrelay::relay
