#pragma once

#include "rmount/config/schema.hpp"
#include "rmount/observability/observer.hpp"

#include <memory>
#include <string>

namespace rmount::observability {

/// `backend` is "log", "none" or a comma separated list of those. Unknown
/// names fall back to "log" with a warning.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const std::string &backend,
                                                         bool verbose = false);
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace rmount::observability
