#include "rmount/common/toml.hpp"

#include "rmount/common/fs.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <optional>
#include <sstream>

namespace rmount::common {

namespace {

bool is_quote_at(const std::string &text, const std::size_t i) {
  return text[i] == '"' && (i == 0 || text[i - 1] != '\\');
}

std::string strip_comment(const std::string &line) {
  bool in_quotes = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    if (is_quote_at(line, i)) {
      in_quotes = !in_quotes;
    } else if (!in_quotes && line[i] == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

std::vector<std::string> split_array_elements(const std::string &body) {
  std::vector<std::string> result;
  std::size_t start = 0;
  bool in_quotes = false;
  for (std::size_t i = 0; i < body.size(); ++i) {
    if (is_quote_at(body, i)) {
      in_quotes = !in_quotes;
    } else if (!in_quotes && body[i] == ',') {
      result.push_back(trim(body.substr(start, i - start)));
      start = i + 1;
    }
  }
  // A trailing comma leaves an empty tail, which TOML allows.
  if (const auto tail = trim(body.substr(start)); !tail.empty()) {
    result.push_back(tail);
  }
  return result;
}

std::optional<std::string> parse_string(const std::string &raw) {
  const std::string value = trim(raw);
  if (value.size() < 2) {
    return std::nullopt;
  }
  if (value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  if (value.front() != '"' || value.back() != '"') {
    return std::nullopt;
  }
  std::string out;
  out.reserve(value.size() - 2);
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    char ch = value[i];
    if (ch == '\\' && i + 2 < value.size()) {
      ch = value[++i];
      if (ch == 'n') {
        ch = '\n';
      } else if (ch == 't') {
        ch = '\t';
      }
    }
    out.push_back(ch);
  }
  return out;
}

std::optional<double> parse_double(const std::string &raw) {
  const std::string normalized = trim(raw);
  if (normalized.empty()) {
    return std::nullopt;
  }
  char *end = nullptr;
  const double parsed = std::strtod(normalized.c_str(), &end);
  if (end == nullptr || *end != '\0') {
    return std::nullopt;
  }
  return parsed;
}

std::optional<std::vector<std::string>> array_elements(const std::string &raw) {
  const std::string value = trim(raw);
  if (value.size() < 2 || value.front() != '[' || value.back() != ']') {
    return std::nullopt;
  }
  return split_array_elements(value.substr(1, value.size() - 2));
}

template <typename T>
Result<T> type_error(const std::string &key, const TomlEntry &entry, const std::string &expected) {
  return Result<T>::failure(ErrorCode::Config, "line " + std::to_string(entry.line) + ": " + key +
                                                   " must be " + expected + ", got " +
                                                   entry.raw);
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return entries_.contains(key); }

std::vector<std::string> TomlDocument::keys() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto &[key, entry] : entries_) {
    (void)entry;
    out.push_back(key);
  }
  std::sort(out.begin(), out.end());
  return out;
}

Result<std::string> TomlDocument::read_string(const std::string &key,
                                              const std::string &fallback) const {
  const auto it = entries_.find(key);
  if (it == entries_.end()) {
    return Result<std::string>::success(fallback);
  }
  auto parsed = parse_string(it->second.raw);
  if (!parsed.has_value()) {
    return type_error<std::string>(key, it->second, "a quoted string");
  }
  return Result<std::string>::success(std::move(*parsed));
}

Result<bool> TomlDocument::read_bool(const std::string &key, const bool fallback) const {
  const auto it = entries_.find(key);
  if (it == entries_.end()) {
    return Result<bool>::success(fallback);
  }
  const std::string value = trim(it->second.raw);
  if (value == "true" || value == "false") {
    return Result<bool>::success(value == "true");
  }
  return type_error<bool>(key, it->second, "true or false");
}

Result<std::uint64_t> TomlDocument::read_u64(const std::string &key,
                                             const std::uint64_t fallback) const {
  const auto it = entries_.find(key);
  if (it == entries_.end()) {
    return Result<std::uint64_t>::success(fallback);
  }
  const std::string value = trim(it->second.raw);
  std::uint64_t parsed = 0;
  const auto *first = value.data();
  const auto *last = first + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (value.empty() || ec != std::errc() || ptr != last) {
    return type_error<std::uint64_t>(key, it->second, "a non-negative integer");
  }
  return Result<std::uint64_t>::success(parsed);
}

Result<double> TomlDocument::read_double(const std::string &key, const double fallback) const {
  const auto it = entries_.find(key);
  if (it == entries_.end()) {
    return Result<double>::success(fallback);
  }
  const auto parsed = parse_double(it->second.raw);
  if (!parsed.has_value()) {
    return type_error<double>(key, it->second, "a number");
  }
  return Result<double>::success(*parsed);
}

Result<std::vector<std::string>>
TomlDocument::read_string_array(const std::string &key,
                                const std::vector<std::string> &fallback) const {
  const auto it = entries_.find(key);
  if (it == entries_.end()) {
    return Result<std::vector<std::string>>::success(fallback);
  }
  const auto elements = array_elements(it->second.raw);
  if (!elements.has_value()) {
    return type_error<std::vector<std::string>>(key, it->second, "an array of strings");
  }
  std::vector<std::string> out;
  for (const auto &element : *elements) {
    auto parsed = parse_string(element);
    if (!parsed.has_value()) {
      return type_error<std::vector<std::string>>(key, it->second, "an array of strings");
    }
    out.push_back(std::move(*parsed));
  }
  return Result<std::vector<std::string>>::success(std::move(out));
}

Result<std::vector<double>>
TomlDocument::read_double_array(const std::string &key,
                                const std::vector<double> &fallback) const {
  const auto it = entries_.find(key);
  if (it == entries_.end()) {
    return Result<std::vector<double>>::success(fallback);
  }
  const auto elements = array_elements(it->second.raw);
  if (!elements.has_value()) {
    return type_error<std::vector<double>>(key, it->second, "an array of numbers");
  }
  std::vector<double> out;
  for (const auto &element : *elements) {
    const auto parsed = parse_double(element);
    if (!parsed.has_value()) {
      return type_error<std::vector<double>>(key, it->second, "an array of numbers");
    }
    out.push_back(*parsed);
  }
  return Result<std::vector<double>>::success(std::move(out));
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean = trim(strip_comment(line));
    if (clean.empty()) {
      continue;
    }
    const std::string where = "line " + std::to_string(line_number) + ": ";

    if (clean.front() == '[') {
      if (clean.back() != ']' || trim(clean.substr(1, clean.size() - 2)).empty()) {
        return Result<TomlDocument>::failure(ErrorCode::Config, where + "invalid section header");
      }
      section = trim(clean.substr(1, clean.size() - 2));
      continue;
    }

    const std::size_t equals = clean.find('=');
    if (equals == std::string::npos) {
      return Result<TomlDocument>::failure(ErrorCode::Config, where + "expected key = value");
    }
    const std::string key = trim(clean.substr(0, equals));
    const std::string value = trim(clean.substr(equals + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure(ErrorCode::Config, where + "missing key");
    }
    if (value.empty()) {
      return Result<TomlDocument>::failure(ErrorCode::Config, where + "missing value for " + key);
    }

    const std::string full_key = section.empty() ? key : section + "." + key;
    const auto [it, inserted] =
        document.entries_.emplace(full_key, TomlEntry{.raw = value, .line = line_number});
    if (!inserted) {
      return Result<TomlDocument>::failure(
          ErrorCode::Config, where + full_key + " is already defined at line " +
                                 std::to_string(it->second.line));
    }
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped.push_back('"');
  for (const char ch : value) {
    if (ch == '\n') {
      escaped += "\\n";
    } else if (ch == '\t') {
      escaped += "\\t";
    } else {
      if (ch == '"' || ch == '\\') {
        escaped.push_back('\\');
      }
      escaped.push_back(ch);
    }
  }
  escaped.push_back('"');
  return escaped;
}

} // namespace rmount::common
