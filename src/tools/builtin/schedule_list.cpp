#include "almanac/tools/builtin/schedule.hpp"

#include "schedule_internal.hpp"

#include <algorithm>

namespace almanac::tools {

namespace si = builtin::schedule_internal;

ListSchedulesTool::ListSchedulesTool(std::shared_ptr<schedule::ScheduleStore> store)
    : store_(std::move(store)) {}

std::string_view ListSchedulesTool::name() const { return "list_schedules"; }

std::string_view ListSchedulesTool::description() const {
  return "List schedules ordered by start time, optionally including cancelled ones.";
}

std::vector<ToolParam> ListSchedulesTool::parameters() const {
  return {
      {.name = "status", .type = ParamType::String,
       .description = "active (not cancelled, default) or all", .enum_values = {"active", "all"}},
      {.name = "limit", .type = ParamType::Integer,
       .description = "Maximum number of schedules to return (default 10)"},
  };
}

common::Result<ToolResult> ListSchedulesTool::execute(const ToolArgs &args, const ToolContext &) {
  const std::string tool(name());
  const std::string status = si::optional_arg(args, "status").value_or("active");
  const int limit = std::max(0, si::int_arg(args, "limit").value_or(10));

  auto records = store_->list();
  if (!records.ok()) {
    return si::store_failure(tool, records.status());
  }

  std::vector<schedule::ScheduleRecord> selected;
  for (const auto &record : records.value()) {
    if (status != "all" && record.status == schedule::ScheduleStatus::Cancelled) {
      continue;
    }
    if (selected.size() >= static_cast<std::size_t>(limit)) {
      break;
    }
    selected.push_back(record);
  }

  std::ostringstream data;
  data << "{\"schedules\":[";
  for (std::size_t i = 0; i < selected.size(); ++i) {
    if (i > 0) {
      data << ",";
    }
    data << schedule::record_to_json(selected[i]);
  }
  data << "],\"status\":\"" << common::json_escape(status) << "\",\"limit\":" << limit << "}";

  const std::string message = selected.empty()
                                  ? "No schedules found."
                                  : "Returned " + std::to_string(selected.size()) +
                                        " schedule(s).";
  return common::Result<ToolResult>::success(si::make_result(tool, true, message, data.str()));
}

} // namespace almanac::tools
