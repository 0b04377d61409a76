#include "sessionrelay/observability/global.hpp"

#include <mutex>

namespace sessionrelay::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::shared_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

std::shared_ptr<IObserver> get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

void record_event(const ObserverEvent &event) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_invocation_start(const std::string &session_key, const std::string &working_dir,
                             const std::string &command) {
  record_event(InvocationStartEvent{
      .session_key = session_key, .working_dir = working_dir, .command = command});
}

void record_invocation_end(const std::string &session_key, std::chrono::milliseconds duration,
                           const std::string &outcome) {
  record_event(
      InvocationEndEvent{.session_key = session_key, .duration = duration, .outcome = outcome});
  record_metric(InvocationLatencyMetric{.latency = duration});
}

void record_session(const std::string &session_key, const std::string &handle,
                    const std::string &action) {
  record_event(SessionEvent{.session_key = session_key, .handle = handle, .action = action});
}

void record_workspace(const std::string &conversation_id, const std::string &path,
                      const std::string &action) {
  record_event(
      WorkspaceEvent{.conversation_id = conversation_id, .path = path, .action = action});
}

void record_channel_message(const std::string &channel, const std::string &direction,
                            const std::string &conversation_id) {
  record_event(ChannelMessageEvent{
      .channel = channel, .direction = direction, .conversation_id = conversation_id});
}

void record_notice(const std::string &component, const std::string &message) {
  record_event(NoticeEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

void record_in_flight(const std::uint64_t count) {
  record_metric(InFlightMetric{.count = count});
}

} // namespace sessionrelay::observability
