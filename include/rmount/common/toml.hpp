#pragma once

#include "rmount/common/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace rmount::common {

struct TomlEntry {
  std::string raw;
  std::size_t line = 0;
};

/// Flat view of a TOML subset: `[section]` headers, `key = value` pairs,
/// single-line arrays and `#` comments. Keys are stored as "section.key".
///
/// The `read_*` accessors return `fallback` for a missing key and a
/// ErrorCode::Config failure naming the line when the value has the wrong
/// type, so a typo never silently becomes a default.
class TomlDocument {
public:
  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::vector<std::string> keys() const;

  [[nodiscard]] Result<std::string> read_string(const std::string &key,
                                                const std::string &fallback = "") const;
  [[nodiscard]] Result<bool> read_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] Result<std::uint64_t> read_u64(const std::string &key,
                                               std::uint64_t fallback) const;
  [[nodiscard]] Result<double> read_double(const std::string &key, double fallback) const;
  [[nodiscard]] Result<std::vector<std::string>>
  read_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;
  [[nodiscard]] Result<std::vector<double>>
  read_double_array(const std::string &key, const std::vector<double> &fallback = {}) const;

private:
  friend Result<TomlDocument> parse_toml(const std::string &content);

  std::unordered_map<std::string, TomlEntry> entries_;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace rmount::common
