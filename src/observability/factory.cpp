#include "rmount/observability/factory.hpp"

#include "rmount/common/fs.hpp"
#include "rmount/observability/observers.hpp"

#include <iostream>
#include <sstream>

namespace rmount::observability {

namespace {

std::unique_ptr<IObserver> create_single(const std::string &name, const bool verbose) {
  if (name.empty() || name == "none" || name == "noop") {
    return std::make_unique<NoopObserver>();
  }
  if (name != "log") {
    std::cerr << "[observability] unknown backend '" << name << "', using log\n";
  }
  return std::make_unique<LogObserver>(verbose);
}

} // namespace

std::unique_ptr<IObserver> create_observer(const std::string &backend, const bool verbose) {
  const std::string normalized = common::to_lower(common::trim(backend));
  if (normalized.find(',') == std::string::npos) {
    return create_single(normalized, verbose);
  }

  auto multi = std::make_unique<MultiObserver>();
  std::stringstream stream(normalized);
  std::string part;
  while (std::getline(stream, part, ',')) {
    multi->add(create_single(common::trim(part), verbose));
  }
  return multi;
}

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  return create_observer(config.observability.backend, config.observability.verbose);
}

} // namespace rmount::observability
