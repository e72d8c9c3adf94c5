#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace rmount::tests {

struct TestCase {
  std::string name;
  std::function<void()> fn;
};

inline void require(bool condition, const std::string &message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

/// Fails with the error carried by a Status or Result.
template <typename StatusLike>
void require_ok(const StatusLike &status, const std::string &context = "") {
  if (!status.ok()) {
    throw std::runtime_error(context.empty() ? status.error() : context + ": " + status.error());
  }
}

} // namespace rmount::tests
