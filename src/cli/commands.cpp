#include "sessionrelay/cli/commands.hpp"

#include "sessionrelay/channels/telegram/telegram.hpp"
#include "sessionrelay/common/fs.hpp"
#include "sessionrelay/config/config.hpp"
#include "sessionrelay/observability/global.hpp"
#include "sessionrelay/runtime/app.hpp"
#include "sessionrelay/runtime/bridge.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace sessionrelay::cli {

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_stop_signal(int) { g_stop_requested = true; }

std::string version_string() {
#ifdef SESSIONRELAY_VERSION
  std::string version = SESSIONRELAY_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "sessionrelay " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

void print_warnings(const std::vector<std::string> &warnings) {
  for (const auto &warning : warnings) {
    std::cerr << "warning: " << warning << "\n";
  }
}

common::Result<std::unique_ptr<runtime::RelayServices>> open_services() {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    return common::Result<std::unique_ptr<runtime::RelayServices>>::failure(context.error());
  }
  return context.value().create_relay_services();
}

int run_relay(std::vector<std::string> args) {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  const auto &cfg = context.value().config();
  if (!cfg.channels.telegram.has_value() || cfg.channels.telegram->bot_token.empty()) {
    std::cerr << "TELEGRAM_BOT_TOKEN is not configured\n";
    return 1;
  }

  std::string duration_raw;
  (void)take_option(args, "--duration-secs", "", duration_raw);

  auto services = context.value().create_relay_services();
  if (!services.ok()) {
    std::cerr << services.error() << "\n";
    return 1;
  }
  print_warnings(services.value()->warnings);

  const auto &telegram = *cfg.channels.telegram;
  channels::telegram::TelegramChannel channel(channels::telegram::TelegramSettings{
      .bot_token = telegram.bot_token,
      .allowed_users = telegram.allowed_users,
      .poll_timeout_seconds = telegram.poll_timeout_seconds,
      .api_base = "https://api.telegram.org"});
  auto transcriber = context.value().create_transcriber();
  runtime::TelegramBridge bridge(*services.value()->relay, channel, transcriber);

  auto started = channel.start(
      [&bridge](const channels::telegram::InboundMessage &message) { bridge.handle(message); });
  if (!started.ok()) {
    std::cerr << started.error() << "\n";
    return 1;
  }

  std::cout << "Relay running\n";
  std::cout << "  Working directory: " << cfg.relay.default_workspace << "\n";
  std::cout << "  Session prefix: " << cfg.relay.session_prefix << "\n";
  std::cout << "  Allowed users: "
            << (telegram.allowed_users.empty() ? std::string("everyone")
                                               : join_tokens(telegram.allowed_users))
            << "\n";
  std::cout << "  Voice: " << (transcriber != nullptr ? "enabled" : "disabled") << "\n";

  g_stop_requested = false;
  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);

  const auto started_at = std::chrono::steady_clock::now();
  int duration = 0;
  if (!duration_raw.empty()) {
    try {
      duration = std::stoi(duration_raw);
    } catch (const std::exception &) {
      std::cerr << "invalid duration: " << duration_raw << "\n";
      channel.stop();
      return 1;
    }
  }
  while (!g_stop_requested) {
    if (duration > 0 &&
        std::chrono::steady_clock::now() - started_at >= std::chrono::seconds(duration)) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  std::cout << "Shutting down...\n";
  channel.stop();
  bridge.wait_idle();
  if (auto observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return 0;
}

int run_ask(std::vector<std::string> args) {
  std::string chat_id;
  if (!take_option(args, "--chat", "-c", chat_id) || chat_id.empty()) {
    std::cerr << "Usage: sessionrelay ask --chat ID [--group] TEXT\n";
    return 1;
  }
  const bool is_group = take_flag(args, "--group");
  std::string text = join_tokens(args);
  if (text.empty() || text == "-") {
    text = read_stdin_all();
  }
  text = common::trim(text);
  if (text.empty()) {
    std::cerr << "nothing to ask\n";
    return 1;
  }

  auto services = open_services();
  if (!services.ok()) {
    std::cerr << services.error() << "\n";
    return 1;
  }
  print_warnings(services.value()->warnings);

  const sessions::Conversation conversation{.id = chat_id, .is_group = is_group};
  relay::RelayReply reply;
  if (auto command = relay::parse_command(text); command.has_value()) {
    reply = services.value()->relay->handle_command(conversation, command->name, command->args);
  } else {
    reply = services.value()->relay->process_text(conversation, text);
  }

  if (reply.kind == relay::ReplyKind::Error || reply.kind == relay::ReplyKind::Busy) {
    std::cerr << reply.text << "\n";
    return 1;
  }
  std::cout << reply.text << "\n";
  return 0;
}

int run_sessions(std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "Usage: sessionrelay sessions list|info KEY|reset KEY\n";
    return 1;
  }
  const std::string action = args[0];
  auto services = open_services();
  if (!services.ok()) {
    std::cerr << services.error() << "\n";
    return 1;
  }
  auto &store = *services.value()->sessions;

  if (action == "list") {
    const auto entries = store.list();
    if (entries.empty()) {
      std::cout << "No sessions\n";
      return 0;
    }
    for (const auto &[key, record] : entries) {
      std::cout << key << "  " << record.handle << "  " << (record.started ? "started" : "new")
                << "  " << record.created_at << "\n";
    }
    return 0;
  }

  if (args.size() < 2) {
    std::cerr << "missing session key\n";
    return 1;
  }
  const std::string key = args[1];
  if (action == "info") {
    const auto record = store.info(key);
    if (!record.has_value()) {
      std::cerr << "no session for " << key << "\n";
      return 1;
    }
    std::cout << "Key: " << key << "\n";
    std::cout << "Handle: " << record->handle << "\n";
    std::cout << "Created: " << record->created_at << "\n";
    std::cout << "Started: " << (record->started ? "yes" : "no") << "\n";
    if (record->previous_handle.has_value()) {
      std::cout << "Previous handle: " << *record->previous_handle << "\n";
    }
    if (record->last_used_at.has_value()) {
      std::cout << "Last used: " << *record->last_used_at << "\n";
    }
    return 0;
  }
  if (action == "reset") {
    const auto lease = store.reset(key);
    std::cout << "New handle for " << key << ": " << lease.handle << "\n";
    if (!lease.durability.ok()) {
      std::cerr << "warning: not saved: " << lease.durability.error() << "\n";
      return 1;
    }
    return 0;
  }

  std::cerr << "Unknown sessions action: " << action << "\n";
  return 1;
}

int run_workspaces(std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "Usage: sessionrelay workspaces list|set ID PATH|clear ID\n";
    return 1;
  }
  const std::string action = args[0];
  auto services = open_services();
  if (!services.ok()) {
    std::cerr << services.error() << "\n";
    return 1;
  }
  auto &store = *services.value()->workspaces;

  if (action == "list") {
    const auto mappings = store.list();
    if (mappings.empty()) {
      std::cout << "No workspace mappings\n";
      return 0;
    }
    for (const auto &[conversation_id, mapping] : mappings) {
      std::cout << conversation_id << "  " << mapping.path << "  " << mapping.set_at << "\n";
    }
    return 0;
  }
  if (action == "set") {
    if (args.size() < 3) {
      std::cerr << "Usage: sessionrelay workspaces set ID PATH\n";
      return 1;
    }
    // Relative paths mean the caller's directory here; the store only keeps absolute ones.
    std::error_code ec;
    const auto absolute = std::filesystem::absolute(args[2], ec);
    auto updated = store.set(args[1], ec ? args[2] : absolute.lexically_normal().string());
    if (!updated.ok()) {
      std::cerr << updated.error() << "\n";
      return 1;
    }
    std::cout << args[1] << " -> " << updated.value().mapping.path << "\n";
    if (!updated.value().durability.ok()) {
      std::cerr << "warning: not saved: " << updated.value().durability.error() << "\n";
      return 1;
    }
    return 0;
  }
  if (action == "clear") {
    if (args.size() < 2) {
      std::cerr << "Usage: sessionrelay workspaces clear ID\n";
      return 1;
    }
    if (auto removed = store.remove(args[1]); !removed.ok()) {
      std::cerr << removed.error() << "\n";
      return 1;
    }
    std::cout << "Cleared " << args[1] << "\n";
    return 0;
  }

  std::cerr << "Unknown workspaces action: " << action << "\n";
  return 1;
}

int run_status() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }
  const auto &config = cfg.value();
  auto cp = config::config_path();
  auto data = config::data_dir(config);

  std::cout << "Assistant: " << config.assistant.binary << "\n";
  std::cout << "Model: " << (config.assistant.model.empty() ? "auto" : config.assistant.model)
            << "\n";
  std::cout << "Default workspace: " << config.relay.default_workspace << "\n";
  std::cout << "Session prefix: " << config.relay.session_prefix << "\n";
  std::cout << "Telegram: "
            << (config.channels.telegram.has_value() && !config.channels.telegram->bot_token.empty()
                    ? "configured"
                    : "not configured")
            << "\n";
  std::cout << "Voice: "
            << (config.voice.enabled && config.voice.api_key.has_value() ? "enabled" : "disabled")
            << "\n";
  if (cp.ok()) {
    std::cout << "Config: " << cp.value().string() << "\n";
  }
  if (data.ok()) {
    std::cout << "Data: " << data.value().string() << "\n";
  }

  auto validated = config::validate_config(config);
  if (!validated.ok()) {
    std::cerr << "[FAIL] " << validated.error() << "\n";
    return 1;
  }
  print_warnings(validated.value());
  return 0;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "Usage: sessionrelay [--config PATH] <command> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  run [--duration-secs N]          Poll Telegram and relay messages\n";
  std::cout << "  ask --chat ID [--group] TEXT     Send one message through the relay\n";
  std::cout << "  sessions list|info KEY|reset KEY Inspect or rotate stored sessions\n";
  std::cout << "  workspaces list|set ID PATH|clear ID\n";
  std::cout << "                                   Manage per-chat working directories\n";
  std::cout << "  status                           Show configuration summary\n";
  std::cout << "  config-path                      Print the config file location\n";
  std::cout << "  version                          Print the version\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argc > 0 ? argv + 1 : argv);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "run") {
    return run_relay(std::move(args));
  }
  if (subcommand == "ask") {
    return run_ask(std::move(args));
  }
  if (subcommand == "sessions") {
    return run_sessions(std::move(args));
  }
  if (subcommand == "workspaces") {
    return run_workspaces(std::move(args));
  }
  if (subcommand == "status") {
    return run_status();
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace sessionrelay::cli
