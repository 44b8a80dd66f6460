#include "almanac/tools/builtin/schedule.hpp"

#include "almanac/schedule/time.hpp"
#include "schedule_internal.hpp"

namespace almanac::tools {

namespace si = builtin::schedule_internal;

CreateScheduleTool::CreateScheduleTool(std::shared_ptr<schedule::ScheduleStore> store)
    : store_(std::move(store)) {}

std::string_view CreateScheduleTool::name() const { return "create_schedule"; }

std::string_view CreateScheduleTool::description() const {
  return "Create a schedule entry (meeting, reminder, alarm). Returns the stored schedule as "
         "JSON.";
}

std::vector<ToolParam> CreateScheduleTool::parameters() const {
  return {
      {.name = "title", .type = ParamType::String, .required = true,
       .description = "Short title of the event"},
      {.name = "datetime", .type = ParamType::String, .required = true,
       .description = "Local time as YYYY-MM-DD HH:MM, e.g. 2024-03-15 14:30"},
      {.name = "description", .type = ParamType::String, .description = "Optional details"},
      {.name = "reminder_minutes", .type = ParamType::Integer,
       .description = "Minutes before the event to send the reminder (default 15)"},
      {.name = "repeat", .type = ParamType::String, .description = "Recurrence (default once)",
       .enum_values = {"once", "daily", "weekly", "monthly"}},
  };
}

common::Result<ToolResult> CreateScheduleTool::execute(const ToolArgs &args,
                                                       const ToolContext &) {
  const std::string tool(name());
  const std::string when_text = si::optional_arg(args, "datetime").value_or("");
  const auto when = schedule::parse_local_time(when_text);
  if (!when.has_value()) {
    return common::Result<ToolResult>::success(si::error_result(
        tool, "Invalid datetime '" + when_text + "'. Use YYYY-MM-DD HH:MM, e.g. 2024-03-15 14:30."));
  }

  const std::string repeat = si::optional_arg(args, "repeat").value_or("once");
  if (repeat == "once" && *when < schedule::Clock::now()) {
    return common::Result<ToolResult>::success(si::error_result(
        tool, "The time " + when_text + " is already in the past; choose a future time."));
  }

  const int reminder = si::int_arg(args, "reminder_minutes").value_or(15);
  if (reminder < 0 || reminder > schedule::MAX_REMINDER_MINUTES) {
    return common::Result<ToolResult>::success(si::error_result(
        tool, "reminder_minutes must be between 0 and " +
                  std::to_string(schedule::MAX_REMINDER_MINUTES) + "."));
  }

  schedule::ScheduleDraft draft{
      .title = si::optional_arg(args, "title").value_or(""),
      .start_time = when_text,
      .recurrence = repeat,
      .notes = si::optional_arg(args, "description"),
      .reminder_minutes = reminder,
  };
  auto created = store_->create(draft);
  if (!created.ok()) {
    return si::store_failure(tool, created.status());
  }

  return common::Result<ToolResult>::success(
      si::make_result(tool, true, "Schedule created",
                      "{\"schedule\":" + schedule::record_to_json(created.value()) + "}"));
}

} // namespace almanac::tools
