#pragma once

#include "sessionrelay/config/schema.hpp"
#include "sessionrelay/observability/observer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace sessionrelay::observability {

/// Lowercased, trimmed entries of a comma-separated backend list; empty entries dropped.
[[nodiscard]] std::vector<std::string> parse_backends(const std::string &backend);

[[nodiscard]] bool is_known_backend(const std::string &name);

/// `log` (stderr), `file` (<data_dir>/relay.log) and `none`. A list fans out to every entry;
/// unknown names fall back to `log`.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace sessionrelay::observability
