#pragma once

#include "sessionrelay/observability/observer.hpp"

#include <memory>

namespace sessionrelay::observability {

void set_global_observer(std::shared_ptr<IObserver> observer);
[[nodiscard]] std::shared_ptr<IObserver> get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_invocation_start(const std::string &session_key, const std::string &working_dir,
                             const std::string &command);
void record_invocation_end(const std::string &session_key, std::chrono::milliseconds duration,
                           const std::string &outcome);
void record_session(const std::string &session_key, const std::string &handle,
                    const std::string &action);
void record_workspace(const std::string &conversation_id, const std::string &path,
                      const std::string &action);
void record_channel_message(const std::string &channel, const std::string &direction,
                            const std::string &conversation_id);
void record_notice(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);
void record_in_flight(std::uint64_t count);

} // namespace sessionrelay::observability
