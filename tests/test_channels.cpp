#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "sessionrelay/channels/allowlist.hpp"
#include "sessionrelay/channels/telegram/telegram.hpp"
#include "sessionrelay/common/fs.hpp"

#include <memory>
#include <mutex>
#include <thread>

namespace {

namespace tg = sessionrelay::channels::telegram;
using sessionrelay::testing::MockHttpClient;

tg::TelegramSettings settings(std::vector<std::string> allowed = {}) {
  return tg::TelegramSettings{.bot_token = "TOKEN",
                              .allowed_users = std::move(allowed),
                              .poll_timeout_seconds = 1,
                              .api_base = "http://telegram.test"};
}

std::string private_update(int update_id, const std::string &sender_id,
                           const std::string &username, const std::string &text) {
  return R"({"update_id":)" + std::to_string(update_id) +
         R"(,"message":{"message_id":7,"from":{"id":)" + sender_id + R"(,"username":")" +
         username + R"("},"chat":{"id":)" + sender_id + R"(,"type":"private"},"text":")" + text +
         R"("}})";
}

sessionrelay::providers::HttpResponse http_error(std::uint16_t status, const std::string &body) {
  return sessionrelay::providers::HttpResponse{.status = status,
                                               .body = body,
                                               .headers = {},
                                               .timeout = false,
                                               .network_error = false,
                                               .network_error_message = ""};
}

} // namespace

void register_channels_tests(std::vector<sessionrelay::tests::TestCase> &tests) {
  using sessionrelay::tests::require;

  tests.push_back({"channels_allowlist_normalizes_entries", [] {
                     const auto list = sessionrelay::channels::parse_allowlist(" @Alice, 42 ,,bob");
                     require(list.size() == 3, "three entries expected");
                     require(list[0] == "alice", "entry should be normalized");
                     require(sessionrelay::channels::check_allowlist("@ALICE", list), "alice");
                     require(sessionrelay::channels::check_allowlist("42", list), "numeric id");
                     require(!sessionrelay::channels::check_allowlist("mallory", list), "mallory");
                     require(sessionrelay::channels::check_allowlist("anyone", {"*"}), "wildcard");
                     require(!sessionrelay::channels::check_allowlist("anyone", {}),
                             "empty list matches nothing");
                   }});

  tests.push_back({"channels_parse_private_text_update", [] {
                     auto parsed = tg::parse_update(private_update(10, "42", "alice", "hi \\\"there\\\""));
                     require(parsed.ok(), parsed.ok() ? "" : parsed.error());
                     const auto &message = parsed.value();
                     require(message.update_id == 10, "update id mismatch");
                     require(message.chat_id == "42" && message.sender_id == "42", "ids mismatch");
                     require(message.sender_username == "alice", "username mismatch");
                     require(!message.is_group, "private chat expected");
                     require(message.text == "hi \"there\"", "text should be unescaped");
                     require(message.voice_file_id.empty() && !message.has_audio, "no media");
                   }});

  tests.push_back({"channels_parse_group_voice_and_audio_updates", [] {
                     auto voice = tg::parse_update(
                         R"({"update_id":11,"message":{"message_id":1,"from":{"id":5},)"
                         R"("chat":{"id":-100200,"type":"supergroup"},)"
                         R"("voice":{"file_id":"VOICE1","duration":3}}})");
                     require(voice.ok(), "voice update should parse");
                     require(voice.value().is_group, "supergroup is a group");
                     require(voice.value().chat_id == "-100200", "negative chat id mismatch");
                     require(voice.value().voice_file_id == "VOICE1", "voice file id mismatch");

                     auto audio = tg::parse_update(
                         R"({"update_id":12,"edited_message":{"message_id":2,"from":{"id":5},)"
                         R"("chat":{"id":5,"type":"private"},"audio":{"file_id":"A"}}})");
                     require(audio.ok() && audio.value().has_audio, "audio flag expected");

                     require(!tg::parse_update(R"({"update_id":13})").ok(), "no message");
                     require(!tg::parse_update("not json").ok(), "malformed update");
                     require(!tg::parse_update(R"({"update_id":14,"message":{"text":"x"}})").ok(),
                             "missing chat id");
                   }});

  tests.push_back({"channels_check_api_response", [] {
                     require(tg::check_api_response(http_error(200, R"({"ok":true})"), "x").ok(),
                             "ok response");
                     auto described = tg::check_api_response(
                         http_error(400, R"({"ok":false,"description":"Bad Request: can't parse"})"),
                         "sendMessage");
                     require(!described.ok(), "400 should fail");
                     require(described.error() == "sendMessage failed: Bad Request: can't parse",
                             "description mismatch: " + described.error());
                     auto bare = tg::check_api_response(http_error(502, "gateway"), "getUpdates");
                     require(bare.error() == "getUpdates failed: HTTP 502", bare.error());
                     auto not_ok = tg::check_api_response(http_error(200, R"({"ok":false})"), "x");
                     require(!not_ok.ok(), "ok:false should fail");
                   }});

  tests.push_back({"channels_poll_dispatches_and_advances_offset", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->respond_ok("getUpdates",
                                      R"({"ok":true,"result":[)" +
                                          private_update(100, "42", "alice", "one") + "," +
                                          private_update(101, "42", "alice", "two") + "]}");
                     tg::TelegramChannel channel(settings(), http);
                     require(channel.dispatch_updates(R"({"ok":true,"result":[]})").ok(),
                             "empty result is fine");
                     require(!channel.dispatch_updates(R"({"ok":true})").ok(),
                             "missing result array is an error");

                     auto poll = [&]() {
                       auto status = channel.poll_once();
                       require(status.ok(), status.ok() ? "" : status.error());
                     };
                     poll();
                     require(channel.next_offset() == 102, "offset should follow the last update");

                     const auto polls = http->requests_to("getUpdates");
                     require(polls.size() == 1, "one poll expected");
                     require(polls[0].url == "http://telegram.test/botTOKEN/getUpdates", polls[0].url);
                     require(polls[0].body.find("\"offset\":0") != std::string::npos,
                             "first poll starts at offset 0");
                     require(polls[0].timeout_ms == 3000, "http timeout should exceed poll timeout");

                     poll();
                     const auto second = http->requests_to("getUpdates");
                     require(second[1].body.find("\"offset\":102") != std::string::npos,
                             "second poll should acknowledge processed updates");
                   }});

  tests.push_back({"channels_callback_receives_allowed_messages", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     tg::TelegramChannel channel(settings({"alice"}), http);
                     std::vector<std::string> texts;
                     std::mutex texts_mutex;
                     http->respond_ok("getUpdates",
                                      R"({"ok":true,"result":[)" +
                                          private_update(1, "42", "alice", "allowed") + "," +
                                          private_update(2, "66", "mallory", "blocked") + "]}");
                     require(channel
                                 .start([&](const tg::InboundMessage &message) {
                                   std::lock_guard<std::mutex> lock(texts_mutex);
                                   texts.push_back(message.text);
                                 })
                                 .ok(),
                             "start should succeed");
                     require(http->wait_for_requests("sendMessage", 1, std::chrono::seconds(5)),
                             "unauthorized sender should get a reply");
                     channel.stop();

                     std::lock_guard<std::mutex> lock(texts_mutex);
                     require(texts.size() == 1 && texts[0] == "allowed", "only alice passes");
                     const auto replies = http->requests_to("sendMessage");
                     require(replies[0].body.find("\"chat_id\":66") != std::string::npos,
                             "rejection goes to the blocked chat");
                     require(replies[0].body.find("not authorized") != std::string::npos,
                             "rejection text expected");
                   }});

  tests.push_back({"channels_start_requires_token", [] {
                     auto config = settings();
                     config.bot_token.clear();
                     tg::TelegramChannel channel(config, std::make_shared<MockHttpClient>());
                     auto status = channel.start([](const tg::InboundMessage &) {});
                     require(!status.ok(), "missing token should fail");
                     require(!channel.running(), "channel should not run");
                   }});

  tests.push_back({"channels_allowlist_matches_id_or_username", [] {
                     tg::TelegramChannel open(settings(), std::make_shared<MockHttpClient>());
                     tg::InboundMessage message;
                     message.sender_id = "42";
                     message.sender_username = "Alice";
                     require(open.is_allowed_sender(message), "empty allowlist admits everyone");

                     tg::TelegramChannel by_name(settings({"@alice"}),
                                                 std::make_shared<MockHttpClient>());
                     require(by_name.is_allowed_sender(message), "username match");
                     tg::TelegramChannel by_id(settings({"42"}), std::make_shared<MockHttpClient>());
                     require(by_id.is_allowed_sender(message), "id match");
                     tg::TelegramChannel other(settings({"bob"}), std::make_shared<MockHttpClient>());
                     require(!other.is_allowed_sender(message), "no match");
                   }});

  tests.push_back({"channels_markdown_falls_back_to_plain_text", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->respond("sendMessage",
                                   http_error(400, R"({"ok":false,"description":"can't parse"})"));
                     http->respond_ok("sendMessage", R"({"ok":true,"result":{"message_id":55}})");
                     tg::TelegramChannel channel(settings(), http);

                     auto sent = channel.send_message("-100", "*broken", true);
                     require(sent.ok() && sent.value() == "55", "fallback should return the id");
                     const auto requests = http->requests_to("sendMessage");
                     require(requests.size() == 2, "two attempts expected");
                     require(requests[0].body.find("\"parse_mode\":\"Markdown\"") != std::string::npos,
                             "first attempt uses Markdown");
                     require(requests[1].body.find("parse_mode") == std::string::npos,
                             "second attempt is plain");
                     require(requests[0].body.find("\"chat_id\":-100") != std::string::npos,
                             "numeric chat ids are unquoted");
                   }});

  tests.push_back({"channels_plain_send_failure_is_reported", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->respond("sendMessage", http_error(403, R"({"ok":false,"description":"Forbidden"})"));
                     tg::TelegramChannel channel(settings(), http);
                     auto status = channel.send_text("1", "hello", false);
                     require(!status.ok(), "failure expected");
                     require(status.error() == "sendMessage failed: Forbidden", status.error());
                     require(http->requests_to("sendMessage").size() == 1, "no retry for plain text");
                   }});

  tests.push_back({"channels_edit_delete_and_chat_action", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->default_response.body = R"({"ok":true,"result":true})";
                     tg::TelegramChannel channel(settings(), http);
                     require(channel.edit_message("1", "9", "new *text*", true).ok(), "edit");
                     require(channel.delete_message("1", "9").ok(), "delete");
                     require(channel.send_chat_action("1").ok(), "action");

                     const auto edits = http->requests_to("editMessageText");
                     require(edits.size() == 1 && edits[0].body.find("\"message_id\":9") != std::string::npos,
                             "edit body mismatch");
                     require(http->requests_to("deleteMessage").size() == 1, "delete request");
                     const auto actions = http->requests_to("sendChatAction");
                     require(actions[0].body.find("\"action\":\"typing\"") != std::string::npos,
                             "typing action expected");
                   }});

  tests.push_back({"channels_get_file_and_download", [] {
                     sessionrelay::testing::TempWorkspace ws;
                     auto http = std::make_shared<MockHttpClient>();
                     http->respond_ok("getFile",
                                      R"({"ok":true,"result":{"file_id":"V","file_path":"voice/file_3.oga"}})");
                     http->respond_ok("/file/botTOKEN/voice/file_3.oga", "OGGDATA");
                     tg::TelegramChannel channel(settings(), http);

                     auto path = channel.get_file_path("V");
                     require(path.ok() && path.value() == "voice/file_3.oga", "file path mismatch");
                     const auto target = ws.path() / "voice.ogg";
                     require(channel.download_file(path.value(), target).ok(), "download failed");
                     auto content = sessionrelay::common::read_file(target);
                     require(content.ok() && content.value() == "OGGDATA", "downloaded bytes mismatch");
                     require(http->requests_to("/file/")[0].method == "GET", "download uses GET");

                     http->respond_ok("getFile", R"({"ok":true,"result":{"file_id":"V"}})");
                     require(!channel.get_file_path("V").ok(), "missing file_path should fail");
                     http->respond("/file/botTOKEN/gone", http_error(404, "not found"));
                     require(!channel.download_file("gone", ws.path() / "gone.ogg").ok(),
                             "404 download should fail");
                   }});

  tests.push_back({"channels_typing_indicator_repeats_until_stopped", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     tg::TelegramChannel channel(settings(), http);
                     {
                       tg::TypingIndicator typing(channel, "77", std::chrono::milliseconds(20));
                       require(http->wait_for_requests("sendChatAction", 3, std::chrono::seconds(5)),
                               "typing should repeat");
                       typing.stop();
                       typing.stop();
                     }
                     const auto count = http->requests_to("sendChatAction").size();
                     std::this_thread::sleep_for(std::chrono::milliseconds(60));
                     require(http->requests_to("sendChatAction").size() == count,
                             "no actions after stop");
                   }});
}
