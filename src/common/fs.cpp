#include "rmount/common/fs.hpp"

#include <cctype>
#include <cstdlib>

namespace rmount::common {

namespace {

constexpr const char *kWhitespace = " \t\r\n\f\v";

bool is_name_char(char c, bool first) {
  const auto uc = static_cast<unsigned char>(c);
  return c == '_' || std::isalpha(uc) != 0 || (!first && std::isdigit(uc) != 0);
}

} // namespace

std::string trim(const std::string &input) {
  const auto first = input.find_first_not_of(kWhitespace);
  if (first == std::string::npos) {
    return "";
  }
  const auto last = input.find_last_not_of(kWhitespace);
  return input.substr(first, last - first + 1);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

std::string to_lower(std::string value) {
  for (auto &c : value) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return value;
}

Result<std::filesystem::path> home_dir() {
  const char *home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    return Result<std::filesystem::path>::failure(ErrorCode::Config, "HOME is not set");
  }
  return Result<std::filesystem::path>::success(std::filesystem::path(home));
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path,
                                         std::optional<std::filesystem::perms> mode) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure(
        ErrorCode::Io, "cannot create directory " + path.string() + ": " + ec.message());
  }
  if (!std::filesystem::is_directory(path, ec)) {
    return Result<std::filesystem::path>::failure(ErrorCode::Io,
                                                  path.string() + " is not a directory");
  }
  if (mode.has_value()) {
    std::filesystem::permissions(path, *mode, std::filesystem::perm_options::replace, ec);
    if (ec) {
      return Result<std::filesystem::path>::failure(
          ErrorCode::Io, "cannot restrict " + path.string() + ": " + ec.message());
    }
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_path(std::string value) {
  if (!value.empty() && value[0] == '~' && (value.size() == 1 || value[1] == '/')) {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  // $NAME and ${NAME}; unset variables expand to nothing.
  std::string out;
  out.reserve(value.size());
  std::size_t i = 0;
  while (i < value.size()) {
    if (value[i] != '$' || i + 1 >= value.size()) {
      out.push_back(value[i++]);
      continue;
    }
    const bool braced = value[i + 1] == '{';
    std::size_t begin = i + (braced ? 2 : 1);
    std::size_t end = begin;
    while (end < value.size() && is_name_char(value[end], end == begin)) {
      ++end;
    }
    if (end == begin || (braced && (end >= value.size() || value[end] != '}'))) {
      out.push_back(value[i++]);
      continue;
    }
    if (const char *var = std::getenv(value.substr(begin, end - begin).c_str()); var != nullptr) {
      out += var;
    }
    i = braced ? end + 1 : end;
  }
  return out;
}

std::filesystem::path normalize_mountpoint(const std::filesystem::path &path) {
  std::filesystem::path absolute = path;
  if (absolute.is_relative()) {
    std::error_code ec;
    const auto cwd = std::filesystem::current_path(ec);
    if (!ec) {
      absolute = cwd / absolute;
    }
  }
  auto normal = absolute.lexically_normal();
  std::string text = normal.string();
  while (text.size() > 1 && text.back() == '/') {
    text.pop_back();
  }
  return std::filesystem::path(text);
}

std::string join_args(const std::vector<std::string> &args) {
  std::string out;
  for (const auto &arg : args) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += arg;
  }
  return out;
}

std::optional<std::pair<std::string, std::string>> split_assignment(const std::string &text) {
  const auto eq = text.find('=');
  if (eq == std::string::npos || eq == 0) {
    return std::nullopt;
  }
  return std::make_pair(trim(text.substr(0, eq)), text.substr(eq + 1));
}

} // namespace rmount::common
