#pragma once

#include "sessionrelay/common/result.hpp"
#include "sessionrelay/providers/http.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace sessionrelay::channels::telegram {

struct InboundMessage {
  std::uint64_t update_id = 0;
  std::string message_id;
  std::string chat_id;
  std::string chat_type;
  std::string sender_id;
  std::string sender_username;
  bool is_group = false;
  std::string text;
  std::string voice_file_id;
  bool has_audio = false;
};

struct TelegramSettings {
  std::string bot_token;
  /// Sender ids or usernames. Empty admits everyone.
  std::vector<std::string> allowed_users;
  std::uint32_t poll_timeout_seconds = 30;
  std::string api_base = "https://api.telegram.org";
};

using MessageCallback = std::function<void(const InboundMessage &)>;

[[nodiscard]] common::Result<InboundMessage> parse_update(const std::string &update_json);

class TelegramChannel {
public:
  explicit TelegramChannel(TelegramSettings settings,
                           std::shared_ptr<providers::HttpClient> http_client =
                               std::make_shared<providers::CurlHttpClient>());
  ~TelegramChannel();

  TelegramChannel(const TelegramChannel &) = delete;
  TelegramChannel &operator=(const TelegramChannel &) = delete;

  /// Start the long-poll thread; `callback` runs on that thread for every admitted message.
  [[nodiscard]] common::Status start(MessageCallback callback);
  void stop();
  [[nodiscard]] bool running() const { return running_.load(); }

  /// One getUpdates round trip, dispatching whatever arrived.
  [[nodiscard]] common::Status poll_once();
  [[nodiscard]] common::Status dispatch_updates(const std::string &response_body);
  [[nodiscard]] bool is_allowed_sender(const InboundMessage &message) const;
  [[nodiscard]] std::uint64_t next_offset() const;

  /// Markdown first, plain text when Telegram rejects the markup.
  [[nodiscard]] common::Status send_text(const std::string &chat_id, const std::string &text,
                                         bool markdown);
  /// Returns the new message id.
  [[nodiscard]] common::Result<std::string> send_message(const std::string &chat_id,
                                                         const std::string &text,
                                                         bool markdown);
  [[nodiscard]] common::Status edit_message(const std::string &chat_id,
                                            const std::string &message_id,
                                            const std::string &text, bool markdown);
  [[nodiscard]] common::Status delete_message(const std::string &chat_id,
                                              const std::string &message_id);
  [[nodiscard]] common::Status send_chat_action(const std::string &chat_id,
                                                const std::string &action = "typing");

  [[nodiscard]] common::Result<std::string> get_file_path(const std::string &file_id);
  [[nodiscard]] common::Status download_file(const std::string &file_path,
                                             const std::filesystem::path &destination);

private:
  void run_loop();
  [[nodiscard]] common::Result<std::string> call(const std::string &method,
                                                 const std::string &body,
                                                 std::uint64_t timeout_ms);
  [[nodiscard]] common::Result<std::string> send_once(const std::string &chat_id,
                                                      const std::string &text,
                                                      const std::string &parse_mode);

  TelegramSettings settings_;
  std::string base_url_;
  std::shared_ptr<providers::HttpClient> http_client_;
  std::atomic<bool> running_{false};
  std::thread worker_;

  mutable std::mutex state_mutex_;
  MessageCallback callback_;
  std::uint64_t next_update_offset_ = 0;
};

/// Keeps "typing..." visible in a chat: sends the action now and every `interval` until
/// destroyed or stopped.
class TypingIndicator {
public:
  TypingIndicator(TelegramChannel &channel, std::string chat_id,
                  std::chrono::milliseconds interval = std::chrono::seconds(4));
  ~TypingIndicator();

  TypingIndicator(const TypingIndicator &) = delete;
  TypingIndicator &operator=(const TypingIndicator &) = delete;

  void stop();

private:
  void run();

  TelegramChannel &channel_;
  std::string chat_id_;
  std::chrono::milliseconds interval_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool stopped_ = false;
  std::thread worker_;
};

[[nodiscard]] common::Status check_api_response(const providers::HttpResponse &response,
                                                std::string_view operation);

} // namespace sessionrelay::channels::telegram
