#include "sessionrelay/observability/log_observer.hpp"

#include "sessionrelay/common/clock.hpp"
#include "sessionrelay/common/fs.hpp"

#include <iostream>
#include <type_traits>

namespace sessionrelay::observability {

std::optional<LogLevel> parse_log_level(const std::string &name) {
  const std::string value = common::to_lower(common::trim(name));
  if (value == "debug") {
    return LogLevel::Debug;
  }
  if (value == "info") {
    return LogLevel::Info;
  }
  if (value == "warn" || value == "warning") {
    return LogLevel::Warn;
  }
  if (value == "error") {
    return LogLevel::Error;
  }
  return std::nullopt;
}

std::string_view log_level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

LogObserver::LogObserver(LogLevel min_level, std::shared_ptr<std::ostream> sink)
    : min_level_(min_level), sink_(std::move(sink)) {}

void LogObserver::write(const LogLevel level, const std::string &message) {
  if (level < min_level_) {
    return;
  }
  std::ostream &out = sink_ ? *sink_ : std::cerr;
  std::lock_guard<std::mutex> lock(mutex_);
  out << common::now_rfc3339() << " [" << log_level_name(level) << "] " << message << "\n";
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  (sink_ ? *sink_ : std::cerr).flush();
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, InvocationStartEvent>) {
          write(LogLevel::Info, "invocation.start key=" + evt.session_key +
                                    " cwd=" + evt.working_dir + " command=" + evt.command);
        } else if constexpr (std::is_same_v<T, InvocationEndEvent>) {
          write(evt.outcome == "ok" ? LogLevel::Info : LogLevel::Warn,
                "invocation.end key=" + evt.session_key + " outcome=" + evt.outcome +
                    " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, SessionEvent>) {
          write(LogLevel::Info,
                "session." + evt.action + " key=" + evt.session_key + " handle=" + evt.handle);
        } else if constexpr (std::is_same_v<T, WorkspaceEvent>) {
          write(LogLevel::Info, "workspace." + evt.action + " conversation=" + evt.conversation_id +
                                    (evt.path.empty() ? std::string() : " path=" + evt.path));
        } else if constexpr (std::is_same_v<T, ChannelMessageEvent>) {
          write(LogLevel::Debug, "channel.message channel=" + evt.channel + " direction=" +
                                     evt.direction + " conversation=" + evt.conversation_id);
        } else if constexpr (std::is_same_v<T, NoticeEvent>) {
          write(LogLevel::Info, evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          write(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, InvocationLatencyMetric>) {
          write(LogLevel::Debug, "metric.invocation_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, InFlightMetric>) {
          write(LogLevel::Debug, "metric.in_flight=" + std::to_string(m.count));
        }
      },
      metric);
}

} // namespace sessionrelay::observability
