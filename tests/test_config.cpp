#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "sessionrelay/config/config.hpp"

#include <filesystem>
#include <memory>
#include <vector>

namespace {

using sessionrelay::testing::EnvGuard;

/// Clears every variable the loader reads so the host environment cannot leak in.
std::vector<std::unique_ptr<EnvGuard>> isolate_env(const std::filesystem::path &home) {
  std::vector<std::unique_ptr<EnvGuard>> guards;
  guards.push_back(std::make_unique<EnvGuard>("HOME", home.string()));
  for (const char *name :
       {"SESSIONRELAY_CONFIG_PATH", "SESSIONRELAY_ENV_FILE", "TELEGRAM_BOT_TOKEN",
        "ALLOWED_USERS", "ANTHROPIC_API_KEY", "OPENAI_API_KEY", "WORKING_DIRECTORY",
        "CLAUDE_MODEL", "CLAUDE_BINARY", "SESSION_PREFIX", "REFINE_TRANSCRIPTS"}) {
    guards.push_back(std::make_unique<EnvGuard>(name, std::nullopt));
  }
  return guards;
}

struct OverrideReset {
  ~OverrideReset() { sessionrelay::config::clear_config_path_override(); }
};

} // namespace

void register_config_tests(std::vector<sessionrelay::tests::TestCase> &tests) {
  using sessionrelay::tests::require;
  namespace cfg = sessionrelay::config;

  tests.push_back({"config_defaults_without_file", [] {
                     sessionrelay::testing::TempWorkspace ws;
                     auto env = isolate_env(ws.path());
                     OverrideReset reset;
                     cfg::set_config_path_override(ws.path() / "config.toml");

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &c = loaded.value();
                     require(c.assistant.binary == "claude", "default binary mismatch");
                     require(c.relay.session_prefix == "telegram", "default prefix mismatch");
                     require(c.assistant.timeout_seconds == 300, "default timeout mismatch");
                     require(!c.relay.default_workspace.empty(),
                             "default workspace should fall back to cwd");
                     require(!c.channels.telegram.has_value(), "telegram should be unset");
                     require(c.voice.refine, "refine should default on");
                   }});

  tests.push_back({"config_loads_toml_file", [] {
                     sessionrelay::testing::TempWorkspace ws;
                     auto env = isolate_env(ws.path());
                     OverrideReset reset;
                     const auto repo = ws.create_dir("repo");
                     ws.create_file("config.toml",
                                    "data_dir = \"" + (ws.path() / "state").string() + "\"\n"
                                    "[relay]\n"
                                    "default_workspace = \"" + repo.string() + "\"\n"
                                    "session_prefix = \"bot\"\n"
                                    "[assistant]\n"
                                    "binary = \"/opt/claude\"\n"
                                    "model = \"sonnet\"\n"
                                    "timeout_seconds = 60\n"
                                    "skip_permissions = false\n"
                                    "[channels.telegram]\n"
                                    "bot_token = \"123:abc\"\n"
                                    "allowed_users = [\"alice\", \"42\"]\n"
                                    "[voice]\n"
                                    "refine = false\n"
                                    "language = \"en\"\n");
                     cfg::set_config_path_override(ws.path() / "config.toml");

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &c = loaded.value();
                     require(c.relay.default_workspace == repo.string(), "workspace mismatch");
                     require(c.relay.session_prefix == "bot", "prefix mismatch");
                     require(c.assistant.binary == "/opt/claude", "binary mismatch");
                     require(c.assistant.model == "sonnet", "model mismatch");
                     require(c.assistant.timeout_seconds == 60, "timeout mismatch");
                     require(!c.assistant.skip_permissions, "skip_permissions mismatch");
                     require(c.channels.telegram.has_value(), "telegram should be set");
                     require(c.channels.telegram->bot_token == "123:abc", "token mismatch");
                     require(c.channels.telegram->allowed_users.size() == 2, "allowlist mismatch");
                     require(!c.voice.refine, "refine mismatch");
                     require(c.voice.language == "en", "language mismatch");

                     auto data = cfg::data_dir(c);
                     require(data.ok(), data.error());
                     require(data.value() == ws.path() / "state", "data dir mismatch");
                   }});

  tests.push_back({"config_env_overrides_win", [] {
                     sessionrelay::testing::TempWorkspace ws;
                     auto env = isolate_env(ws.path());
                     OverrideReset reset;
                     ws.create_file("config.toml", "[assistant]\nmodel = \"from-file\"\n");
                     cfg::set_config_path_override(ws.path() / "config.toml");

                     EnvGuard token("TELEGRAM_BOT_TOKEN", std::string("999:env"));
                     EnvGuard users("ALLOWED_USERS", std::string(" 1, 2 ,,3 "));
                     EnvGuard model("CLAUDE_MODEL", std::string("opus"));
                     EnvGuard refine("REFINE_TRANSCRIPTS", std::string("false"));
                     EnvGuard openai("OPENAI_API_KEY", std::string("sk-test"));
                     EnvGuard workdir("WORKING_DIRECTORY", ws.path().string());

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &c = loaded.value();
                     require(c.assistant.model == "opus", "env model should win");
                     require(c.channels.telegram->bot_token == "999:env", "env token mismatch");
                     require(c.channels.telegram->allowed_users ==
                                 std::vector<std::string>({"1", "2", "3"}),
                             "allowlist should be split and trimmed");
                     require(!c.voice.refine, "REFINE_TRANSCRIPTS=false should disable");
                     require(c.voice.api_key.value_or("") == "sk-test", "openai key mismatch");
                     require(c.relay.default_workspace == ws.path().string(),
                             "workspace env mismatch");
                   }});

  tests.push_back({"config_relative_workspace_becomes_absolute", [] {
                     sessionrelay::testing::TempWorkspace ws;
                     auto env = isolate_env(ws.path());
                     OverrideReset reset;
                     cfg::set_config_path_override(ws.path() / "config.toml");
                     EnvGuard workdir("WORKING_DIRECTORY", std::string("./projects/../repo"));

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const std::string expected =
                         (std::filesystem::current_path() / "repo").lexically_normal().string();
                     sessionrelay::tests::require_eq(loaded.value().relay.default_workspace, expected,
                                                     "resolved default workspace");
                   }});

  tests.push_back({"config_dotenv_file_fills_missing_vars", [] {
                     sessionrelay::testing::TempWorkspace ws;
                     auto env = isolate_env(ws.path());
                     OverrideReset reset;
                     ws.create_file("custom.env", "# comment\n"
                                                  "export TELEGRAM_BOT_TOKEN=\"111:dotenv\"\n"
                                                  "CLAUDE_BINARY='/usr/local/bin/claude'\n");
                     EnvGuard env_file("SESSIONRELAY_ENV_FILE", (ws.path() / "custom.env").string());
                     cfg::set_config_path_override(ws.path() / "config.toml");

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().channels.telegram.has_value(),
                             "dotenv token should create telegram config");
                     require(loaded.value().channels.telegram->bot_token == "111:dotenv",
                             "dotenv token mismatch");
                     require(loaded.value().assistant.binary == "/usr/local/bin/claude",
                             "single-quoted value mismatch");
                   }});

  tests.push_back({"config_invalid_toml_fails", [] {
                     sessionrelay::testing::TempWorkspace ws;
                     auto env = isolate_env(ws.path());
                     OverrideReset reset;
                     ws.create_file("config.toml", "this is not toml\n");
                     cfg::set_config_path_override(ws.path() / "config.toml");
                     require(!cfg::load_config().ok(), "invalid config should fail");
                   }});

  tests.push_back({"config_validate_fatal_and_warnings", [] {
                     auto c = sessionrelay::testing::mock_config();
                     c.assistant.timeout_seconds = 0;
                     require(!cfg::validate_config(c).ok(), "zero timeout should be fatal");

                     c = sessionrelay::testing::mock_config();
                     c.relay.session_prefix = " ";
                     require(!cfg::validate_config(c).ok(), "empty prefix should be fatal");

                     c = sessionrelay::testing::mock_config();
                     c.channels.telegram = cfg::TelegramConfig{};
                     c.channels.telegram->bot_token = "1:x";
                     auto warnings = cfg::validate_config(c);
                     require(warnings.ok(), warnings.error());
                     bool open_allowlist = false;
                     for (const auto &w : warnings.value()) {
                       if (w.find("every sender is accepted") != std::string::npos) {
                         open_allowlist = true;
                       }
                     }
                     require(open_allowlist, "empty allowlist should be warned about");
                   }});

  tests.push_back({"config_path_override_directory", [] {
                     sessionrelay::testing::TempWorkspace ws;
                     auto env = isolate_env(ws.path());
                     OverrideReset reset;
                     cfg::set_config_path_override(ws.path());
                     auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == ws.path() / "config.toml",
                             "directory override should resolve to config.toml");
                   }});
}
