#pragma once

#include "sessionrelay/invoker/process.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace sessionrelay::invoker {

struct InvokerConfig {
  std::string binary = "claude";
  /// Empty lets the assistant pick its own default model.
  std::string model;
  /// Injected as `credential_env` when non-empty; otherwise the environment is inherited.
  std::string credential;
  std::string credential_env = "ANTHROPIC_API_KEY";
  std::chrono::milliseconds timeout{std::chrono::minutes(5)};
  std::size_t max_output_bytes = DEFAULT_MAX_OUTPUT_BYTES;
  bool skip_permissions = true;
  std::string append_system_prompt;
  /// When set (e.g. "/bin/sh"), run the escaped command line through `shell -c`.
  std::string shell;
};

struct InvocationRequest {
  std::string handle;
  /// The assistant already knows `handle`: resume it instead of creating it.
  bool resume = false;
  std::string text;
  std::string working_dir;
  std::string model_override;
  /// Only used to tag log lines.
  std::string session_key;
};

enum class InvokeErrorKind { Spawn, ExternalProcess, Timeout };

struct InvokeError {
  InvokeErrorKind kind = InvokeErrorKind::ExternalProcess;
  std::optional<int> exit_code;
  std::string message;
  /// stderr, else stdout, else "exit code N"; capped.
  std::string detail;
};

struct InvocationResult {
  std::string output;
  std::optional<InvokeError> error;
  bool truncated = false;
  std::chrono::milliseconds duration{0};

  [[nodiscard]] bool ok() const { return !error.has_value(); }
};

[[nodiscard]] std::string invoke_error_kind_name(InvokeErrorKind kind);

/// What a failed run's diagnostic says about the session handle it was given.
enum class SessionDiagnosis {
  Unrelated,
  /// `--session-id` named a handle the tool already holds.
  HandleInUse,
  /// `--resume` named a handle the tool has no conversation for.
  HandleUnknown,
};

[[nodiscard]] SessionDiagnosis diagnose_session_error(const InvokeError &error);

class AssistantInvoker {
public:
  explicit AssistantInvoker(InvokerConfig config);

  [[nodiscard]] std::vector<std::string> build_arguments(const InvocationRequest &request) const;
  [[nodiscard]] ProcessSpec build_process_spec(const InvocationRequest &request) const;
  [[nodiscard]] InvocationResult invoke(const InvocationRequest &request) const;

  [[nodiscard]] const InvokerConfig &config() const { return config_; }

private:
  InvokerConfig config_;
};

} // namespace sessionrelay::invoker
