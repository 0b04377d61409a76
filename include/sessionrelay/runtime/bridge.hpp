#pragma once

#include "sessionrelay/channels/telegram/telegram.hpp"
#include "sessionrelay/relay/relay.hpp"
#include "sessionrelay/relay/split.hpp"
#include "sessionrelay/voice/transcriber.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

namespace sessionrelay::runtime {

struct BridgeOptions {
  /// Where voice downloads land before transcription.
  std::filesystem::path temp_dir = std::filesystem::temp_directory_path();
  std::chrono::milliseconds typing_interval{std::chrono::seconds(4)};
  std::size_t message_limit = relay::DEFAULT_MESSAGE_LIMIT;
};

/// Connects inbound Telegram messages to the relay. Commands are answered on the polling
/// thread; assistant requests run on their own worker so a slow conversation never blocks
/// the others.
class TelegramBridge {
public:
  TelegramBridge(relay::Relay &relay, channels::telegram::TelegramChannel &channel,
                 std::shared_ptr<voice::Transcriber> transcriber, BridgeOptions options = {});
  ~TelegramBridge();

  TelegramBridge(const TelegramBridge &) = delete;
  TelegramBridge &operator=(const TelegramBridge &) = delete;

  void handle(const channels::telegram::InboundMessage &message);

  /// Block until every request accepted so far has been answered.
  void wait_idle();
  [[nodiscard]] std::size_t pending() const;

  /// Split into chunks and send each one.
  void send_reply(const std::string &chat_id, const relay::RelayReply &reply);

private:
  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void handle_text(const channels::telegram::InboundMessage &message,
                   const sessions::Conversation &conversation);
  void handle_voice(const channels::telegram::InboundMessage &message,
                    const sessions::Conversation &conversation);
  void run_voice(const channels::telegram::InboundMessage &message,
                 const sessions::Conversation &conversation, relay::AdmissionSlot slot);
  void spawn(std::function<void()> task);
  void reap_finished_locked();
  void send_plain(const std::string &chat_id, const std::string &text);

  relay::Relay &relay_;
  channels::telegram::TelegramChannel &channel_;
  std::shared_ptr<voice::Transcriber> transcriber_;
  BridgeOptions options_;

  mutable std::mutex workers_mutex_;
  std::list<Worker> workers_;
};

} // namespace sessionrelay::runtime
