#include "almanac/tools/builtin/schedule.hpp"

#include "schedule_internal.hpp"

namespace almanac::tools {

namespace si = builtin::schedule_internal;

DeleteScheduleTool::DeleteScheduleTool(std::shared_ptr<schedule::ScheduleStore> store)
    : store_(std::move(store)) {}

std::string_view DeleteScheduleTool::name() const { return "delete_schedule"; }

std::string_view DeleteScheduleTool::description() const {
  return "Delete a schedule by id.";
}

std::vector<ToolParam> DeleteScheduleTool::parameters() const {
  return {{.name = "schedule_id", .type = ParamType::String, .required = true}};
}

common::Result<ToolResult> DeleteScheduleTool::execute(const ToolArgs &args,
                                                       const ToolContext &) {
  const std::string tool(name());
  const std::string id = si::optional_arg(args, "schedule_id").value_or("");

  auto existing = store_->get(id);
  if (!existing.ok()) {
    if (existing.kind() == common::ErrorKind::NotFound) {
      return common::Result<ToolResult>::success(si::error_result(
          tool, "No schedule with id '" + id + "'. Use list_schedules to see existing ids."));
    }
    return si::store_failure(tool, existing.status());
  }

  auto removed = store_->remove(id);
  if (!removed.ok()) {
    return si::store_failure(tool, removed);
  }
  return common::Result<ToolResult>::success(si::make_result(
      tool, true, "Schedule deleted",
      "{\"deleted_schedule\":" + schedule::record_to_json(existing.value()) + "}"));
}

} // namespace almanac::tools
