#include "sessionrelay/observability/factory.hpp"

#include "sessionrelay/common/fs.hpp"
#include "sessionrelay/config/config.hpp"
#include "sessionrelay/observability/log_observer.hpp"
#include "sessionrelay/observability/multi_observer.hpp"
#include "sessionrelay/observability/noop_observer.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

namespace sessionrelay::observability {

namespace {

constexpr const char *LOG_FILENAME = "relay.log";

std::unique_ptr<IObserver> create_file_observer(const config::Config &config, LogLevel level) {
  auto dir = config::data_dir(config);
  if (!dir.ok()) {
    std::cerr << "file log disabled: " << dir.error() << "\n";
    return nullptr;
  }
  const auto path = dir.value() / LOG_FILENAME;
  auto file = std::make_shared<std::ofstream>(path, std::ios::app);
  if (!*file) {
    std::cerr << "file log disabled: cannot open " << path.string() << "\n";
    return nullptr;
  }
  return std::make_unique<LogObserver>(level, std::move(file));
}

} // namespace

std::vector<std::string> parse_backends(const std::string &backend) {
  std::vector<std::string> out;
  std::stringstream stream(backend);
  std::string part;
  while (std::getline(stream, part, ',')) {
    part = common::to_lower(common::trim(part));
    if (!part.empty()) {
      out.push_back(part);
    }
  }
  return out;
}

bool is_known_backend(const std::string &name) {
  return name == "log" || name == "file" || name == "none" || name == "noop";
}

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const LogLevel level = parse_log_level(config.observability.level).value_or(LogLevel::Info);
  const auto backends = parse_backends(config.observability.backend);
  if (backends.empty()) {
    return std::make_unique<NoopObserver>();
  }

  auto make = [&](const std::string &name) -> std::unique_ptr<IObserver> {
    if (name == "none" || name == "noop") {
      return std::make_unique<NoopObserver>();
    }
    if (name == "file") {
      return create_file_observer(config, level);
    }
    return std::make_unique<LogObserver>(level);
  };

  if (backends.size() == 1) {
    auto single = make(backends.front());
    return single != nullptr ? std::move(single) : std::make_unique<LogObserver>(level);
  }

  auto multi = std::make_unique<MultiObserver>();
  for (const auto &name : backends) {
    multi->add(make(name));
  }
  return multi;
}

} // namespace sessionrelay::observability
