#pragma once

#include "rmount/common/result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rmount::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
/// Creates `path` and its parents. When `mode` is set, the leaf directory's
/// permissions are replaced with it.
[[nodiscard]] Result<std::filesystem::path>
ensure_dir(const std::filesystem::path &path,
           std::optional<std::filesystem::perms> mode = std::nullopt);
/// Expands a leading `~` and `$NAME` / `${NAME}` references.
[[nodiscard]] std::string expand_path(std::string value);

/// Absolute, lexically normalized form of a mountpoint path without a
/// trailing separator. Does not touch the filesystem, so it is safe to call
/// on a path served by a hung mount.
[[nodiscard]] std::filesystem::path normalize_mountpoint(const std::filesystem::path &path);

[[nodiscard]] std::string join_args(const std::vector<std::string> &args);
[[nodiscard]] std::optional<std::pair<std::string, std::string>>
split_assignment(const std::string &text);

} // namespace rmount::common
