#include "sessionrelay/channels/telegram/telegram.hpp"

#include "sessionrelay/channels/allowlist.hpp"
#include "sessionrelay/common/fs.hpp"
#include "sessionrelay/common/json_util.hpp"
#include "sessionrelay/observability/global.hpp"

#include <sstream>

namespace sessionrelay::channels::telegram {

namespace {

constexpr const char *COMPONENT = "telegram";
constexpr std::uint64_t SEND_TIMEOUT_MS = 15000;
constexpr std::uint64_t DOWNLOAD_TIMEOUT_MS = 60000;
constexpr auto ERROR_BACKOFF = std::chrono::seconds(1);

std::string quoted(const std::string &value) { return "\"" + common::json_escape(value) + "\""; }

/// Telegram ids are integers; anything else is sent as a string.
std::string id_literal(const std::string &id) {
  if (id.empty()) {
    return "\"\"";
  }
  const std::size_t start = id.front() == '-' ? 1 : 0;
  if (start == id.size()) {
    return quoted(id);
  }
  for (std::size_t i = start; i < id.size(); ++i) {
    if (id[i] < '0' || id[i] > '9') {
      return quoted(id);
    }
  }
  return id;
}

std::uint64_t parse_u64(const std::string &raw) {
  try {
    return raw.empty() ? 0 : static_cast<std::uint64_t>(std::stoull(raw));
  } catch (const std::exception &) {
    return 0;
  }
}

} // namespace

common::Status check_api_response(const providers::HttpResponse &response,
                                  std::string_view operation) {
  if (response.network_error || response.timeout) {
    return common::Status::error(std::string(operation) + " failed: " +
                                 providers::describe_failure(response));
  }

  const auto fields = common::json_parse_flat(response.body);
  const auto ok = fields.find("ok");
  if (response.status < 200 || response.status >= 300 || ok == fields.end() ||
      ok->second != "true") {
    std::string reason;
    if (const auto description = fields.find("description"); description != fields.end()) {
      reason = description->second;
    }
    if (reason.empty()) {
      reason = "HTTP " + std::to_string(response.status);
    }
    return common::Status::error(std::string(operation) + " failed: " + reason);
  }
  return common::Status::success();
}

common::Result<InboundMessage> parse_update(const std::string &update_json) {
  auto update = common::json_parse_flat(update_json);
  if (update.empty()) {
    return common::Result<InboundMessage>::failure("update is not a JSON object");
  }

  InboundMessage message;
  message.update_id = parse_u64(update["update_id"]);

  std::string message_json = update["message"];
  if (message_json.empty()) {
    message_json = update["edited_message"];
  }
  if (message_json.empty()) {
    return common::Result<InboundMessage>::failure("update has no message");
  }

  auto fields = common::json_parse_flat(message_json);
  message.message_id = fields["message_id"];
  message.text = fields["text"];

  auto chat = common::json_parse_flat(fields["chat"]);
  message.chat_id = chat["id"];
  message.chat_type = chat["type"];
  message.is_group = message.chat_type == "group" || message.chat_type == "supergroup";

  auto from = common::json_parse_flat(fields["from"]);
  message.sender_id = from["id"];
  message.sender_username = from["username"];

  if (const auto voice = fields.find("voice"); voice != fields.end()) {
    message.voice_file_id = common::json_parse_flat(voice->second)["file_id"];
  }
  message.has_audio = fields.find("audio") != fields.end();

  if (message.chat_id.empty()) {
    return common::Result<InboundMessage>::failure("message has no chat id");
  }
  return common::Result<InboundMessage>::success(std::move(message));
}

TelegramChannel::TelegramChannel(TelegramSettings settings,
                                 std::shared_ptr<providers::HttpClient> http_client)
    : settings_(std::move(settings)), http_client_(std::move(http_client)) {
  base_url_ = settings_.api_base + "/bot" + settings_.bot_token;
  for (auto &entry : settings_.allowed_users) {
    entry = normalize_sender(entry);
  }
}

TelegramChannel::~TelegramChannel() { stop(); }

common::Status TelegramChannel::start(MessageCallback callback) {
  if (settings_.bot_token.empty()) {
    return common::Status::error("telegram bot token is not configured");
  }
  if (running_.exchange(true)) {
    return common::Status::success();
  }
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    callback_ = std::move(callback);
  }
  worker_ = std::thread([this]() { run_loop(); });
  observability::record_notice(COMPONENT, "polling started");
  return common::Status::success();
}

void TelegramChannel::stop() {
  running_ = false;
  if (worker_.joinable()) {
    worker_.join();
  }
}

std::uint64_t TelegramChannel::next_offset() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return next_update_offset_;
}

bool TelegramChannel::is_allowed_sender(const InboundMessage &message) const {
  if (settings_.allowed_users.empty()) {
    return true;
  }
  return check_allowlist(message.sender_id, settings_.allowed_users) ||
         check_allowlist(message.sender_username, settings_.allowed_users);
}

void TelegramChannel::run_loop() {
  while (running_) {
    auto status = poll_once();
    if (!status.ok()) {
      observability::record_error(COMPONENT, status.error());
      std::this_thread::sleep_for(ERROR_BACKOFF);
    }
  }
}

common::Result<std::string> TelegramChannel::call(const std::string &method,
                                                  const std::string &body,
                                                  std::uint64_t timeout_ms) {
  const auto response = http_client_->post_json(base_url_ + "/" + method, {}, body, timeout_ms);
  if (auto status = check_api_response(response, method); !status.ok()) {
    return common::Result<std::string>::failure(status.error());
  }
  return common::Result<std::string>::success(response.body);
}

common::Status TelegramChannel::poll_once() {
  std::ostringstream body;
  body << "{\"offset\":" << next_offset() << ",\"timeout\":" << settings_.poll_timeout_seconds
       << ",\"allowed_updates\":[\"message\"]}";

  auto response = call("getUpdates", body.str(),
                       (static_cast<std::uint64_t>(settings_.poll_timeout_seconds) + 2) * 1000);
  if (!response.ok()) {
    return common::Status::error(response.error());
  }
  return dispatch_updates(response.value());
}

common::Status TelegramChannel::dispatch_updates(const std::string &response_body) {
  auto fields = common::json_parse_flat(response_body);
  const std::string result = fields["result"];
  if (result.empty() || result.front() != '[') {
    return common::Status::error("getUpdates returned no result array");
  }

  MessageCallback callback;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    callback = callback_;
  }

  for (const auto &update_json : common::json_split_top_level_objects(result)) {
    const auto update_id = parse_u64(common::json_parse_flat(update_json)["update_id"]);
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      if (update_id >= next_update_offset_) {
        next_update_offset_ = update_id + 1;
      }
    }

    auto parsed = parse_update(update_json);
    if (!parsed.ok()) {
      continue;
    }
    const InboundMessage &message = parsed.value();
    observability::record_channel_message(COMPONENT, "inbound", message.chat_id);

    if (!is_allowed_sender(message)) {
      observability::record_notice(COMPONENT, "rejected sender " + message.sender_id +
                                                  (message.sender_username.empty()
                                                       ? std::string()
                                                       : " (@" + message.sender_username + ")"));
      if (auto sent = send_text(message.chat_id, "⛔ You are not authorized to use this bot.",
                                false);
          !sent.ok()) {
        observability::record_error(COMPONENT, sent.error());
      }
      continue;
    }

    if (callback) {
      callback(message);
    }
  }
  return common::Status::success();
}

common::Result<std::string> TelegramChannel::send_once(const std::string &chat_id,
                                                       const std::string &text,
                                                       const std::string &parse_mode) {
  std::string body = "{\"chat_id\":" + id_literal(chat_id) + ",\"text\":" + quoted(text);
  if (!parse_mode.empty()) {
    body += ",\"parse_mode\":" + quoted(parse_mode);
  }
  body += "}";

  auto response = call("sendMessage", body, SEND_TIMEOUT_MS);
  if (!response.ok()) {
    return response;
  }
  auto result = common::json_parse_flat(common::json_parse_flat(response.value())["result"]);
  observability::record_channel_message(COMPONENT, "outbound", chat_id);
  return common::Result<std::string>::success(result["message_id"]);
}

common::Result<std::string> TelegramChannel::send_message(const std::string &chat_id,
                                                          const std::string &text,
                                                          bool markdown) {
  if (!markdown) {
    return send_once(chat_id, text, "");
  }
  auto sent = send_once(chat_id, text, "Markdown");
  if (sent.ok()) {
    return sent;
  }
  // Assistant output often carries markup Telegram refuses to parse.
  return send_once(chat_id, text, "");
}

common::Status TelegramChannel::send_text(const std::string &chat_id, const std::string &text,
                                          bool markdown) {
  return send_message(chat_id, text, markdown).status();
}

common::Status TelegramChannel::edit_message(const std::string &chat_id,
                                             const std::string &message_id,
                                             const std::string &text, bool markdown) {
  const std::string base = "{\"chat_id\":" + id_literal(chat_id) +
                           ",\"message_id\":" + id_literal(message_id) +
                           ",\"text\":" + quoted(text);
  if (markdown) {
    auto edited = call("editMessageText", base + ",\"parse_mode\":\"Markdown\"}", SEND_TIMEOUT_MS);
    if (edited.ok()) {
      return common::Status::success();
    }
  }
  return call("editMessageText", base + "}", SEND_TIMEOUT_MS).status();
}

common::Status TelegramChannel::delete_message(const std::string &chat_id,
                                               const std::string &message_id) {
  return call("deleteMessage",
              "{\"chat_id\":" + id_literal(chat_id) + ",\"message_id\":" + id_literal(message_id) +
                  "}",
              SEND_TIMEOUT_MS)
      .status();
}

common::Status TelegramChannel::send_chat_action(const std::string &chat_id,
                                                 const std::string &action) {
  return call("sendChatAction",
              "{\"chat_id\":" + id_literal(chat_id) + ",\"action\":" + quoted(action) + "}",
              SEND_TIMEOUT_MS)
      .status();
}

common::Result<std::string> TelegramChannel::get_file_path(const std::string &file_id) {
  auto response = call("getFile", "{\"file_id\":" + quoted(file_id) + "}", SEND_TIMEOUT_MS);
  if (!response.ok()) {
    return response;
  }
  auto result = common::json_parse_flat(common::json_parse_flat(response.value())["result"]);
  const std::string file_path = result["file_path"];
  if (file_path.empty()) {
    return common::Result<std::string>::failure("getFile returned no file_path");
  }
  return common::Result<std::string>::success(file_path);
}

common::Status TelegramChannel::download_file(const std::string &file_path,
                                              const std::filesystem::path &destination) {
  const std::string url =
      settings_.api_base + "/file/bot" + settings_.bot_token + "/" + file_path;
  const auto response = http_client_->get(url, {}, DOWNLOAD_TIMEOUT_MS);
  if (!response.ok()) {
    return common::Status::error("download failed: " + providers::describe_failure(response));
  }
  return common::write_file_atomic(destination, response.body);
}

TypingIndicator::TypingIndicator(TelegramChannel &channel, std::string chat_id,
                                 std::chrono::milliseconds interval)
    : channel_(channel), chat_id_(std::move(chat_id)), interval_(interval) {
  worker_ = std::thread([this]() { run(); });
}

TypingIndicator::~TypingIndicator() { stop(); }

void TypingIndicator::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

void TypingIndicator::run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stopped_) {
    lock.unlock();
    if (auto status = channel_.send_chat_action(chat_id_); !status.ok()) {
      observability::record_notice(COMPONENT, "typing indicator: " + status.error());
    }
    lock.lock();
    cv_.wait_for(lock, interval_, [this]() { return stopped_; });
  }
}

} // namespace sessionrelay::channels::telegram
