#pragma once

#include "almanac/common/result.hpp"
#include <filesystem>
#include <string>

namespace almanac::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

/// Writes content to a sibling temp file of `path` and flushes it to disk. The target itself
/// is not touched until commit_staged_file renames the temp file over it.
[[nodiscard]] Result<std::filesystem::path> stage_file(const std::filesystem::path &path,
                                                       const std::string &content);
[[nodiscard]] Status commit_staged_file(const std::filesystem::path &staged,
                                        const std::filesystem::path &path);
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path,
                                       const std::string &content);

} // namespace almanac::common
