#pragma once

#include <string>

namespace rmount::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// `value` escaped and wrapped in double quotes.
[[nodiscard]] std::string json_quote(const std::string &value);

} // namespace rmount::common
