#include "sessionrelay/runtime/bridge.hpp"

#include "sessionrelay/common/fs.hpp"
#include "sessionrelay/common/id.hpp"
#include "sessionrelay/observability/global.hpp"
#include "sessionrelay/relay/split.hpp"

namespace sessionrelay::runtime {

namespace {

constexpr const char *COMPONENT = "bridge";
constexpr std::size_t LOG_PREVIEW_CHARS = 100;

std::string preview(const std::string &text) {
  if (text.size() <= LOG_PREVIEW_CHARS) {
    return text;
  }
  return text.substr(0, LOG_PREVIEW_CHARS) + "...";
}

} // namespace

TelegramBridge::TelegramBridge(relay::Relay &relay, channels::telegram::TelegramChannel &channel,
                               std::shared_ptr<voice::Transcriber> transcriber,
                               BridgeOptions options)
    : relay_(relay), channel_(channel), transcriber_(std::move(transcriber)),
      options_(std::move(options)) {}

TelegramBridge::~TelegramBridge() { wait_idle(); }

void TelegramBridge::handle(const channels::telegram::InboundMessage &message) {
  const sessions::Conversation conversation{.id = message.chat_id, .is_group = message.is_group};

  if (!message.voice_file_id.empty()) {
    handle_voice(message, conversation);
    return;
  }
  if (message.has_audio) {
    send_plain(message.chat_id, "ℹ️ Please send voice messages directly (hold the microphone "
                                "button), not as audio files.");
    return;
  }
  if (message.text.empty()) {
    return;
  }

  if (auto command = relay::parse_command(message.text); command.has_value()) {
    send_reply(message.chat_id, relay_.handle_command(conversation, command->name, command->args));
    return;
  }
  handle_text(message, conversation);
}

void TelegramBridge::handle_text(const channels::telegram::InboundMessage &message,
                                 const sessions::Conversation &conversation) {
  auto slot = relay_.admit(conversation);
  if (!slot.has_value()) {
    send_plain(message.chat_id, relay::Relay::busy_text());
    return;
  }

  observability::record_notice(COMPONENT, "chat " + message.chat_id + " in " +
                                              relay_.workspace_for(conversation) + ": " +
                                              preview(message.text));
  auto held = std::make_shared<relay::AdmissionSlot>(std::move(*slot));
  spawn([this, message, conversation, held]() {
    channels::telegram::TypingIndicator typing(channel_, message.chat_id,
                                               options_.typing_interval);
    const relay::RelayReply reply = relay_.ask(conversation, message.text, std::move(*held));
    typing.stop();
    send_reply(message.chat_id, reply);
  });
}

void TelegramBridge::handle_voice(const channels::telegram::InboundMessage &message,
                                  const sessions::Conversation &conversation) {
  if (transcriber_ == nullptr) {
    send_plain(message.chat_id, "🎤 Voice messages are not enabled on this relay.");
    return;
  }
  auto slot = relay_.admit(conversation);
  if (!slot.has_value()) {
    send_plain(message.chat_id, relay::Relay::busy_text());
    return;
  }

  auto held = std::make_shared<relay::AdmissionSlot>(std::move(*slot));
  spawn([this, message, conversation, held]() {
    channels::telegram::TypingIndicator typing(channel_, message.chat_id,
                                               options_.typing_interval);
    run_voice(message, conversation, std::move(*held));
  });
}

void TelegramBridge::run_voice(const channels::telegram::InboundMessage &message,
                               const sessions::Conversation &conversation,
                               relay::AdmissionSlot slot) {
  const std::string &chat_id = message.chat_id;

  std::string status_id;
  if (auto status = channel_.send_message(chat_id, "🎤 Transcribing voice message...", false);
      status.ok()) {
    status_id = status.value();
  } else {
    observability::record_error(COMPONENT, status.error());
  }

  auto file_path = channel_.get_file_path(message.voice_file_id);
  if (!file_path.ok()) {
    send_plain(chat_id, "Error: " + file_path.error());
    return;
  }

  const auto audio = options_.temp_dir / ("voice_" + common::generate_uuid_v4() + ".ogg");
  auto transcript = common::Result<voice::Transcript>::failure("voice file was not downloaded");
  if (auto downloaded = channel_.download_file(file_path.value(), audio); !downloaded.ok()) {
    transcript = common::Result<voice::Transcript>::failure(downloaded.error());
  } else {
    transcript = transcriber_->transcribe(audio);
  }

  std::error_code ec;
  std::filesystem::remove(audio, ec);
  if (ec) {
    observability::record_notice(COMPONENT, "cannot remove " + audio.string() + ": " + ec.message());
  }

  if (!transcript.ok()) {
    send_plain(chat_id, "Error: " + transcript.error());
    return;
  }
  const std::string text = common::trim(transcript.value().refined);
  if (text.empty()) {
    send_plain(chat_id, "Error: the voice message contained no recognizable speech");
    return;
  }

  if (!status_id.empty()) {
    if (auto edited = channel_.edit_message(
            chat_id, status_id, "📝 *Understood:*\n" + text + "\n\n⏳ Sending to the assistant...",
            true);
        !edited.ok()) {
      observability::record_error(COMPONENT, edited.error());
    }
  }

  observability::record_notice(COMPONENT, "voice chat " + chat_id + " in " +
                                              relay_.workspace_for(conversation) + ": " +
                                              preview(text));
  const relay::RelayReply reply = relay_.ask(conversation, text, std::move(slot));

  if (!status_id.empty()) {
    if (auto deleted = channel_.delete_message(chat_id, status_id); !deleted.ok()) {
      observability::record_error(COMPONENT, deleted.error());
    }
  }
  send_reply(chat_id, reply);
}

void TelegramBridge::send_reply(const std::string &chat_id, const relay::RelayReply &reply) {
  for (const auto &part : relay::split_message(reply.text, options_.message_limit)) {
    if (auto sent = channel_.send_text(chat_id, part, reply.markdown); !sent.ok()) {
      observability::record_error(COMPONENT, "reply to " + chat_id + ": " + sent.error());
      return;
    }
  }
}

void TelegramBridge::send_plain(const std::string &chat_id, const std::string &text) {
  if (auto sent = channel_.send_text(chat_id, text, false); !sent.ok()) {
    observability::record_error(COMPONENT, "reply to " + chat_id + ": " + sent.error());
  }
}

void TelegramBridge::spawn(std::function<void()> task) {
  auto done = std::make_shared<std::atomic<bool>>(false);
  std::lock_guard<std::mutex> lock(workers_mutex_);
  reap_finished_locked();
  workers_.push_back(Worker{.thread = std::thread([task = std::move(task), done]() {
                              task();
                              done->store(true);
                            }),
                            .done = done});
}

void TelegramBridge::reap_finished_locked() {
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (it->done->load()) {
      if (it->thread.joinable()) {
        it->thread.join();
      }
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

void TelegramBridge::wait_idle() {
  std::list<Worker> joining;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    joining.swap(workers_);
  }
  for (auto &worker : joining) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }
}

std::size_t TelegramBridge::pending() const {
  std::lock_guard<std::mutex> lock(workers_mutex_);
  std::size_t count = 0;
  for (const auto &worker : workers_) {
    if (!worker.done->load()) {
      ++count;
    }
  }
  return count;
}

} // namespace sessionrelay::runtime
