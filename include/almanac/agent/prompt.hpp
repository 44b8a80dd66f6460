#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace almanac::agent {

/// Built-in template used when no prompt file is configured or it cannot be read.
[[nodiscard]] std::string default_prompt_template();

/// Reads the template file. Empty path, unreadable or blank file falls back to the default.
[[nodiscard]] std::string load_prompt_template(const std::filesystem::path &path);

/// Substitutes {{MODEL_NAME}} and {{CURRENT_TIME}} ("YYYY-MM-DD HH:MM", local).
[[nodiscard]] std::string render_system_prompt(const std::string &prompt_template,
                                               const std::string &model,
                                               std::chrono::system_clock::time_point now);

} // namespace almanac::agent
