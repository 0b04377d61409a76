#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace sessionrelay::observability {

struct InvocationStartEvent {
  std::string session_key;
  std::string working_dir;
  std::string command;
};

struct InvocationEndEvent {
  std::string session_key;
  std::chrono::milliseconds duration{0};
  std::string outcome;
};

struct SessionEvent {
  std::string session_key;
  std::string handle;
  std::string action;
};

struct WorkspaceEvent {
  std::string conversation_id;
  std::string path;
  std::string action;
};

struct ChannelMessageEvent {
  std::string channel;
  std::string direction;
  std::string conversation_id;
};

struct NoticeEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<InvocationStartEvent, InvocationEndEvent, SessionEvent, WorkspaceEvent,
                 ChannelMessageEvent, NoticeEvent, ErrorEvent>;

struct InvocationLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct InFlightMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<InvocationLatencyMetric, InFlightMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace sessionrelay::observability
