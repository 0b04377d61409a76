#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "sessionrelay/common/fs.hpp"
#include "sessionrelay/common/id.hpp"
#include "sessionrelay/sessions/session.hpp"
#include "sessionrelay/sessions/session_key.hpp"
#include "sessionrelay/sessions/store.hpp"

#include <atomic>
#include <set>
#include <thread>
#include <vector>

void register_sessions_tests(std::vector<sessionrelay::tests::TestCase> &tests) {
  using sessionrelay::tests::require;
  namespace s = sessionrelay::sessions;

  tests.push_back({"sessions_fingerprint_is_md5_prefix", [] {
                     require(s::workspace_fingerprint("") == "d41d8cd9",
                             "md5 of empty string mismatch");
                     require(s::workspace_fingerprint("abc") == "90015098", "md5(abc) mismatch");
                     require(s::workspace_fingerprint("/a") != s::workspace_fingerprint("/a/"),
                             "paths are hashed verbatim");
                   }});

  tests.push_back({"sessions_key_format_private_and_group", [] {
                     const std::string fp = s::workspace_fingerprint("/repo");
                     require(s::derive_session_key("123", false, "/repo", "telegram") ==
                                 "telegram-123-" + fp,
                             "private key format mismatch");
                     require(s::derive_session_key("-100987", true, "/repo", "telegram") ==
                                 "telegram-group--100987-" + fp,
                             "group key format mismatch");
                     require(s::derive_session_key(s::Conversation{.id = "5", .is_group = false},
                                                   "/other", "bot") !=
                                 s::derive_session_key("5", false, "/repo", "bot"),
                             "different workspace should give different key");
                   }});

  tests.push_back({"sessions_record_codec_roundtrip_with_optional_fields", [] {
                     s::SessionRecordMap records;
                     records["a"] = s::SessionRecord{.handle = "h1",
                                                     .created_at = "2024-01-01T00:00:00Z",
                                                     .previous_handle = std::string("h0"),
                                                     .started = true,
                                                     .last_used_at = std::string("2024-01-02T00:00:00Z")};
                     records["b"] = s::SessionRecord{.handle = "h2",
                                                     .created_at = "2024-01-03T00:00:00Z",
                                                     .previous_handle = std::nullopt,
                                                     .started = false,
                                                     .last_used_at = std::nullopt};
                     auto parsed = s::parse_session_records(s::encode_session_records(records));
                     require(parsed.ok(), parsed.error());
                     const auto &a = parsed.value().at("a");
                     require(a.handle == "h1" && a.started, "record a mismatch");
                     require(a.previous_handle.value_or("") == "h0", "previous handle lost");
                     const auto &b = parsed.value().at("b");
                     require(!b.previous_handle.has_value() && !b.started, "record b mismatch");
                   }});

  tests.push_back({"sessions_legacy_uuid_records_are_started", [] {
                     auto parsed = s::parse_session_records(
                         R"({"telegram-1-abcd1234": {"uuid": "11111111-2222-4333-8444-555555555555",
                             "createdAt": "2024-05-01T10:00:00.000Z",
                             "previousUUID": "00000000-2222-4333-8444-555555555555"}})");
                     require(parsed.ok(), parsed.error());
                     const auto &record = parsed.value().at("telegram-1-abcd1234");
                     require(record.handle == "11111111-2222-4333-8444-555555555555",
                             "legacy uuid should become the handle");
                     require(record.started, "legacy sessions already exist on the tool side");
                     require(record.previous_handle.has_value(), "previousUUID should be kept");
                   }});

  tests.push_back({"sessions_parse_rejects_corrupt_documents", [] {
                     require(s::parse_session_records("   ").ok(), "blank is an empty mapping");
                     require(!s::parse_session_records("{not json").ok(), "garbage should fail");
                     require(!s::parse_session_records(R"({"k": {"createdAt": "x"}})").ok(),
                             "record without handle should fail");
                   }});

  tests.push_back({"sessions_get_or_create_is_stable", [] {
                     sessionrelay::testing::TempWorkspace ws;
                     s::SessionStore store(ws.path() / "sessions.json");
                     require(store.load().ok(), "missing file should load as empty");

                     const auto first = store.get_or_create("k");
                     require(first.created && !first.started, "first lease should be new");
                     require(first.durability.ok(), first.durability.error());
                     require(sessionrelay::common::looks_like_uuid(first.handle),
                             "handle should be a uuid");

                     const auto second = store.get_or_create("k");
                     require(!second.created, "second lease should reuse");
                     require(second.handle == first.handle, "handle should be stable");
                     require(store.size() == 1, "one mapping expected");
                   }});

  tests.push_back({"sessions_reset_rotates_and_keeps_previous", [] {
                     sessionrelay::testing::TempWorkspace ws;
                     s::SessionStore store(ws.path() / "sessions.json");
                     const auto original = store.get_or_create("k");
                     require(store.mark_started("k").ok(), "mark_started failed");

                     const auto fresh = store.reset("k");
                     require(fresh.handle != original.handle, "reset must produce new handle");
                     require(!fresh.started, "reset session is not started");
                     const auto info = store.info("k");
                     require(info.has_value(), "record should exist");
                     require(info->previous_handle.value_or("") == original.handle,
                             "previous handle should be the old one");

                     const auto unknown = store.reset("never-seen");
                     require(!store.info("never-seen")->previous_handle.has_value(),
                             "reset of unknown key has no previous handle");
                     require(!unknown.handle.empty(), "reset of unknown key creates a session");
                   }});

  tests.push_back({"sessions_mark_started_unknown_key_fails", [] {
                     sessionrelay::testing::TempWorkspace ws;
                     s::SessionStore store(ws.path() / "sessions.json");
                     require(!store.mark_started("missing").ok(), "unknown key should fail");
                   }});

  tests.push_back({"sessions_mark_unstarted_persists", [] {
                     sessionrelay::testing::TempWorkspace ws;
                     const auto file = ws.path() / "sessions.json";
                     s::SessionStore store(file);
                     const auto lease = store.get_or_create("k");
                     require(store.mark_started("k").ok(), "mark_started failed");
                     require(store.mark_unstarted("k").ok(), "mark_unstarted failed");
                     require(store.mark_unstarted("k").ok(), "repeat should be a no-op");
                     require(!store.mark_unstarted("missing").ok(), "unknown key should fail");

                     s::SessionStore reloaded(file);
                     require(reloaded.load().ok(), "reload failed");
                     const auto record = reloaded.info("k");
                     require(record.has_value() && record->handle == lease.handle, "handle kept");
                     require(!record->started, "unstarted flag should be persisted");
                   }});

  tests.push_back({"sessions_survive_reload", [] {
                     sessionrelay::testing::TempWorkspace ws;
                     const auto path = ws.path() / "sessions.json";
                     std::string handle;
                     {
                       s::SessionStore store(path);
                       handle = store.get_or_create("telegram-1-aaaa0000").handle;
                       require(store.mark_started("telegram-1-aaaa0000").ok(), "mark failed");
                     }
                     s::SessionStore reloaded(path);
                     require(reloaded.load().ok(), "reload failed");
                     const auto lease = reloaded.get_or_create("telegram-1-aaaa0000");
                     require(lease.handle == handle, "handle should survive restart");
                     require(lease.started, "started flag should survive restart");
                   }});

  tests.push_back({"sessions_corrupt_file_loads_empty_with_error", [] {
                     sessionrelay::testing::TempWorkspace ws;
                     ws.create_file("sessions.json", "{ this is not json");
                     s::SessionStore store(ws.path() / "sessions.json");
                     const auto status = store.load();
                     require(!status.ok(), "corrupt file should be reported");
                     require(store.size() == 0, "store should start empty");
                     const auto lease = store.get_or_create("k");
                     require(lease.created, "store should still be usable");
                   }});

  tests.push_back({"sessions_write_failure_keeps_memory_mapping", [] {
                     sessionrelay::testing::TempWorkspace ws;
                     // A regular file where the parent directory should be makes every write fail.
                     ws.create_file("blocker", "x");
                     s::SessionStore store(ws.path() / "blocker" / "sessions.json");
                     const auto lease = store.get_or_create("k");
                     require(!lease.durability.ok(), "write should fail");
                     require(store.get_or_create("k").handle == lease.handle,
                             "in-memory mapping should remain");
                   }});

  tests.push_back({"sessions_concurrent_get_or_create_agrees", [] {
                     sessionrelay::testing::TempWorkspace ws;
                     s::SessionStore store(ws.path() / "sessions.json");
                     std::vector<std::string> handles(8);
                     std::vector<std::thread> threads;
                     for (std::size_t i = 0; i < handles.size(); ++i) {
                       threads.emplace_back(
                           [&store, &handles, i]() { handles[i] = store.get_or_create("shared").handle; });
                     }
                     for (auto &thread : threads) {
                       thread.join();
                     }
                     const std::set<std::string> unique(handles.begin(), handles.end());
                     require(unique.size() == 1, "all callers should see the same handle");
                   }});
}
