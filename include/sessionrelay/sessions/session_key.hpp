#pragma once

#include <string>

namespace sessionrelay::sessions {

/// One chat. `id` is the transport's chat id rendered as a string.
struct Conversation {
  std::string id;
  bool is_group = false;
};

/// First 8 lowercase hex chars of the MD5 digest of `workspace_path`, taken verbatim.
[[nodiscard]] std::string workspace_fingerprint(const std::string &workspace_path);

/// "{prefix}-{id}-{fp}" for private chats, "{prefix}-group-{id}-{fp}" for groups.
[[nodiscard]] std::string derive_session_key(const std::string &conversation_id, bool is_group,
                                             const std::string &workspace_path,
                                             const std::string &prefix);

[[nodiscard]] std::string derive_session_key(const Conversation &conversation,
                                             const std::string &workspace_path,
                                             const std::string &prefix);

} // namespace sessionrelay::sessions
