#include "almanac/tools/builtin/schedule.hpp"

#include "schedule_internal.hpp"

namespace almanac::tools {

namespace si = builtin::schedule_internal;

UpdateScheduleTool::UpdateScheduleTool(std::shared_ptr<schedule::ScheduleStore> store)
    : store_(std::move(store)) {}

std::string_view UpdateScheduleTool::name() const { return "update_schedule"; }

std::string_view UpdateScheduleTool::description() const {
  return "Update title, time, description, reminder lead time or status of an existing "
         "schedule. Use list_schedules to find ids.";
}

std::vector<ToolParam> UpdateScheduleTool::parameters() const {
  return {
      {.name = "schedule_id", .type = ParamType::String, .required = true},
      {.name = "title", .type = ParamType::String},
      {.name = "datetime", .type = ParamType::String, .description = "YYYY-MM-DD HH:MM"},
      {.name = "description", .type = ParamType::String},
      {.name = "reminder_minutes", .type = ParamType::Integer},
      {.name = "status", .type = ParamType::String,
       .enum_values = {"pending", "notified", "cancelled"}},
  };
}

common::Result<ToolResult> UpdateScheduleTool::execute(const ToolArgs &args,
                                                       const ToolContext &) {
  const std::string tool(name());
  const std::string id = si::optional_arg(args, "schedule_id").value_or("");

  schedule::SchedulePatch patch;
  std::vector<std::string> updated_fields;
  if (auto title = si::optional_arg(args, "title"); title.has_value()) {
    patch.title = title;
    updated_fields.push_back("title");
  }
  if (auto when = si::optional_arg(args, "datetime"); when.has_value()) {
    patch.start_time = when;
    updated_fields.push_back("datetime");
  }
  if (args.contains("description")) {
    patch.notes = args.at("description");
    updated_fields.push_back("description");
  }
  if (auto minutes = si::int_arg(args, "reminder_minutes"); minutes.has_value()) {
    patch.reminder_minutes = minutes;
    updated_fields.push_back("reminder_minutes");
  }
  if (auto status = si::optional_arg(args, "status"); status.has_value()) {
    patch.status = schedule::parse_status(*status);
    updated_fields.push_back("status");
  }

  if (patch.empty()) {
    return common::Result<ToolResult>::success(
        si::error_result(tool, "No fields to update were provided."));
  }

  auto updated = store_->update(id, patch);
  if (!updated.ok()) {
    if (updated.kind() == common::ErrorKind::NotFound) {
      return common::Result<ToolResult>::success(si::error_result(
          tool, "No schedule with id '" + id + "'. Use list_schedules to see existing ids."));
    }
    return si::store_failure(tool, updated.status());
  }

  return common::Result<ToolResult>::success(si::make_result(
      tool, true, "Schedule updated",
      "{\"schedule\":" + schedule::record_to_json(updated.value()) +
          ",\"updated_fields\":" + common::json_string_array(updated_fields) + "}"));
}

} // namespace almanac::tools
