#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sessionrelay::invoker {

constexpr std::size_t DEFAULT_MAX_OUTPUT_BYTES = 16 * 1024 * 1024;

struct ProcessSpec {
  /// argv[0] is resolved through PATH.
  std::vector<std::string> argv;
  std::string working_dir;
  /// Set (or replace) these variables on top of the inherited environment.
  std::vector<std::pair<std::string, std::string>> env_overrides;
  std::chrono::milliseconds timeout{std::chrono::minutes(5)};
  std::size_t max_output_bytes = DEFAULT_MAX_OUTPUT_BYTES;
};

struct ProcessOutcome {
  bool spawned = false;
  std::string spawn_error;
  bool timed_out = false;
  std::optional<int> exit_code;
  std::optional<int> term_signal;
  std::string stdout_data;
  std::string stderr_data;
  bool truncated = false;
  std::chrono::milliseconds duration{0};

  [[nodiscard]] bool succeeded() const {
    return spawned && !timed_out && exit_code.has_value() && *exit_code == 0;
  }
};

/// Run one child process to completion. stdout and stderr are drained concurrently; the
/// child runs in its own process group, which is SIGKILLed when `timeout` expires.
/// Never leaves a live or unreaped child behind.
[[nodiscard]] ProcessOutcome run_process(const ProcessSpec &spec);

} // namespace sessionrelay::invoker
