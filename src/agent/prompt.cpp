#include "almanac/agent/prompt.hpp"

#include "almanac/common/fs.hpp"
#include "almanac/observability/global.hpp"
#include "almanac/schedule/time.hpp"

namespace almanac::agent {

namespace {

void replace_all(std::string &text, const std::string &needle, const std::string &value) {
  std::size_t pos = 0;
  while ((pos = text.find(needle, pos)) != std::string::npos) {
    text.replace(pos, needle.size(), value);
    pos += value.size();
  }
}

} // namespace

std::string default_prompt_template() {
  return "You are a workday schedule assistant running on {{MODEL_NAME}}. The current local time "
         "is {{CURRENT_TIME}}.\n"
         "Help the user manage meetings, tasks and reminders with the available tools: "
         "create_schedule, list_schedules, update_schedule and delete_schedule. Times use the "
         "format YYYY-MM-DD HH:MM in the user's local time zone.\n"
         "When a request is ambiguous (missing date, time or which entry is meant), call "
         "askUserQuestion instead of guessing.\n"
         "Keep answers short and confirm what was changed.";
}

std::string load_prompt_template(const std::filesystem::path &path) {
  if (path.empty()) {
    return default_prompt_template();
  }
  auto content = common::read_file(path);
  if (!content.ok()) {
    observability::record_error("agent", "system prompt: " + content.error() +
                                             "; using built-in prompt");
    return default_prompt_template();
  }
  if (common::trim(content.value()).empty()) {
    return default_prompt_template();
  }
  return content.value();
}

std::string render_system_prompt(const std::string &prompt_template, const std::string &model,
                                 const std::chrono::system_clock::time_point now) {
  std::string prompt = prompt_template;
  replace_all(prompt, "{{MODEL_NAME}}", model);
  replace_all(prompt, "{{CURRENT_TIME}}", schedule::format_local_minute(now));
  return prompt;
}

} // namespace almanac::agent
