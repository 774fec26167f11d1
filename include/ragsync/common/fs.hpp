#pragma once

#include "ragsync/common/result.hpp"
#include <filesystem>
#include <string>

namespace ragsync::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// Writes `content` to a uniquely named sibling of `target` and fsyncs it. Returns the
/// temporary path; the caller renames it into place.
[[nodiscard]] Result<std::filesystem::path> write_temp_sibling(const std::filesystem::path &target,
                                                              const std::string &content);

/// fsync(2) on a file or directory.
[[nodiscard]] Status sync_path(const std::filesystem::path &path);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

} // namespace ragsync::common
