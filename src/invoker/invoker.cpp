#include "sessionrelay/invoker/invoker.hpp"

#include "sessionrelay/common/fs.hpp"
#include "sessionrelay/invoker/sanitize.hpp"
#include "sessionrelay/invoker/shell_escape.hpp"
#include "sessionrelay/observability/global.hpp"

#include <csignal>
#include <cstring>

namespace sessionrelay::invoker {

namespace {

constexpr std::size_t MAX_DETAIL_BYTES = 2000;
constexpr std::size_t LOGGED_PROMPT_CHARS = 100;

std::string cap(std::string text, std::size_t limit) {
  if (text.size() <= limit) {
    return text;
  }
  if (limit <= 3) {
    text.resize(limit);
    return text;
  }
  text.resize(limit - 3);
  text += "...";
  return text;
}

std::string describe_timeout(std::chrono::milliseconds timeout) {
  const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout).count();
  if (seconds >= 60 && seconds % 60 == 0) {
    const auto minutes = seconds / 60;
    return std::to_string(minutes) + (minutes == 1 ? " minute" : " minutes");
  }
  if (seconds > 0) {
    return std::to_string(seconds) + (seconds == 1 ? " second" : " seconds");
  }
  return std::to_string(timeout.count()) + " ms";
}

std::string diagnostic_excerpt(const ProcessOutcome &outcome) {
  std::string text = common::trim(strip_terminal_escapes(outcome.stderr_data));
  if (text.empty()) {
    text = common::trim(strip_terminal_escapes(outcome.stdout_data));
  }
  if (text.empty()) {
    if (outcome.exit_code.has_value()) {
      text = "exit code " + std::to_string(*outcome.exit_code);
    } else if (outcome.term_signal.has_value()) {
      text = std::string("terminated by signal ") + strsignal(*outcome.term_signal);
    } else {
      text = "unknown error";
    }
  }
  return cap(std::move(text), MAX_DETAIL_BYTES);
}

} // namespace

std::string invoke_error_kind_name(const InvokeErrorKind kind) {
  switch (kind) {
  case InvokeErrorKind::Spawn:
    return "spawn_error";
  case InvokeErrorKind::ExternalProcess:
    return "process_error";
  case InvokeErrorKind::Timeout:
    return "timeout";
  }
  return "unknown";
}

SessionDiagnosis diagnose_session_error(const InvokeError &error) {
  if (error.kind != InvokeErrorKind::ExternalProcess) {
    return SessionDiagnosis::Unrelated;
  }
  const std::string detail = common::to_lower(error.detail);
  if (detail.find("already in use") != std::string::npos) {
    return SessionDiagnosis::HandleInUse;
  }
  if (detail.find("no conversation found") != std::string::npos) {
    return SessionDiagnosis::HandleUnknown;
  }
  return SessionDiagnosis::Unrelated;
}

AssistantInvoker::AssistantInvoker(InvokerConfig config) : config_(std::move(config)) {}

std::vector<std::string> AssistantInvoker::build_arguments(const InvocationRequest &request) const {
  std::vector<std::string> argv;
  argv.reserve(12);
  argv.push_back(config_.binary);
  argv.push_back(request.resume ? "--resume" : "--session-id");
  argv.push_back(request.handle);
  argv.push_back("-p");
  argv.push_back(request.text);

  const std::string &model =
      common::trim(request.model_override).empty() ? config_.model : request.model_override;
  if (!common::trim(model).empty()) {
    argv.push_back("--model");
    argv.push_back(model);
  }
  if (!config_.append_system_prompt.empty()) {
    argv.push_back("--append-system-prompt");
    argv.push_back(config_.append_system_prompt);
  }
  if (config_.skip_permissions) {
    argv.push_back("--dangerously-skip-permissions");
  }
  return argv;
}

ProcessSpec AssistantInvoker::build_process_spec(const InvocationRequest &request) const {
  ProcessSpec spec;
  auto argv = build_arguments(request);
  if (config_.shell.empty()) {
    spec.argv = std::move(argv);
  } else {
    spec.argv = {config_.shell, "-c", render_command_line(argv)};
  }
  spec.working_dir = request.working_dir;
  if (!config_.credential.empty() && !config_.credential_env.empty()) {
    spec.env_overrides.emplace_back(config_.credential_env, config_.credential);
  }
  spec.timeout = config_.timeout;
  spec.max_output_bytes = config_.max_output_bytes;
  return spec;
}

InvocationResult AssistantInvoker::invoke(const InvocationRequest &request) const {
  const ProcessSpec spec = build_process_spec(request);

  auto logged = build_arguments(request);
  logged[4] = cap(logged[4], LOGGED_PROMPT_CHARS);
  observability::record_invocation_start(request.session_key, request.working_dir,
                                         render_command_line(logged));

  const ProcessOutcome outcome = run_process(spec);

  InvocationResult result;
  result.duration = outcome.duration;
  result.truncated = outcome.truncated;

  if (!outcome.spawned) {
    result.error = InvokeError{.kind = InvokeErrorKind::Spawn,
                               .exit_code = std::nullopt,
                               .message = "failed to start " + config_.binary + ": " +
                                          outcome.spawn_error,
                               .detail = outcome.spawn_error};
  } else if (outcome.timed_out) {
    result.error = InvokeError{.kind = InvokeErrorKind::Timeout,
                               .exit_code = std::nullopt,
                               .message = config_.binary + " timed out after " +
                                          describe_timeout(config_.timeout),
                               .detail = cap(common::trim(outcome.stderr_data), MAX_DETAIL_BYTES)};
  } else if (!outcome.succeeded()) {
    const std::string excerpt = diagnostic_excerpt(outcome);
    result.error = InvokeError{.kind = InvokeErrorKind::ExternalProcess,
                               .exit_code = outcome.exit_code,
                               .message = config_.binary + " failed: " + excerpt,
                               .detail = excerpt};
  } else {
    result.output = sanitize_output(outcome.stdout_data);
  }

  const std::string outcome_name =
      result.ok() ? std::string("ok") : invoke_error_kind_name(result.error->kind);
  observability::record_invocation_end(request.session_key, outcome.duration, outcome_name);
  if (!result.ok()) {
    observability::record_error("invoker", result.error->message);
  }
  return result;
}

} // namespace sessionrelay::invoker
