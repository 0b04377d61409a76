#pragma once

#include "sessionrelay/observability/observer.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

namespace sessionrelay::observability {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/// "debug", "info", "warn"/"warning", "error"; case-insensitive.
[[nodiscard]] std::optional<LogLevel> parse_log_level(const std::string &name);
[[nodiscard]] std::string_view log_level_name(LogLevel level);

/// Writes "<utc time> [LEVEL] message" lines. Without a sink it writes to stderr.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Info,
                       std::shared_ptr<std::ostream> sink = nullptr);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return sink_ ? "file" : "log"; }
  [[nodiscard]] LogLevel min_level() const { return min_level_; }

private:
  void write(LogLevel level, const std::string &message);

  LogLevel min_level_;
  std::shared_ptr<std::ostream> sink_;
  std::mutex mutex_;
};

} // namespace sessionrelay::observability
