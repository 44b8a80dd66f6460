#include "almanac/schedule/record.hpp"

#include "almanac/common/fs.hpp"
#include "almanac/common/json_util.hpp"
#include "almanac/schedule/time.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>
#include <unordered_set>

namespace almanac::schedule {

namespace {

void write_optional(std::ostringstream &out, const char *key,
                    const std::optional<std::string> &value) {
  if (value.has_value()) {
    out << ",\"" << key << "\":\"" << common::json_escape(*value) << "\"";
  }
}

std::optional<std::string> optional_field(const common::JsonFlatMap &fields,
                                          const std::string &key) {
  const auto it = fields.find(key);
  if (it == fields.end() || it->second == "null" || it->second.empty()) {
    return std::nullopt;
  }
  return it->second;
}

std::string field_or(const common::JsonFlatMap &fields, const std::string &key,
                     const std::string &fallback = "") {
  const auto it = fields.find(key);
  return it == fields.end() ? fallback : it->second;
}

} // namespace

std::string_view status_name(const ScheduleStatus status) {
  switch (status) {
  case ScheduleStatus::Pending:
    return "pending";
  case ScheduleStatus::Notified:
    return "notified";
  case ScheduleStatus::Cancelled:
    return "cancelled";
  }
  return "pending";
}

std::optional<ScheduleStatus> parse_status(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "pending" || normalized == "active") {
    return ScheduleStatus::Pending;
  }
  if (normalized == "notified") {
    return ScheduleStatus::Notified;
  }
  if (normalized == "cancelled" || normalized == "canceled") {
    return ScheduleStatus::Cancelled;
  }
  return std::nullopt;
}

bool is_valid_transition(const ScheduleStatus from, const ScheduleStatus to) {
  if (from == to) {
    return true;
  }
  switch (from) {
  case ScheduleStatus::Pending:
    return to == ScheduleStatus::Notified || to == ScheduleStatus::Cancelled;
  case ScheduleStatus::Notified:
    return to == ScheduleStatus::Cancelled;
  case ScheduleStatus::Cancelled:
    return false;
  }
  return false;
}

bool is_valid_recurrence(const std::string &value) {
  return value == "once" || value == "daily" || value == "weekly" || value == "monthly";
}

std::string record_to_json(const ScheduleRecord &record) {
  std::ostringstream out;
  out << "{\"id\":\"" << common::json_escape(record.id) << "\"";
  out << ",\"title\":\"" << common::json_escape(record.title) << "\"";
  out << ",\"start_time\":\"" << common::json_escape(record.start_time) << "\"";
  write_optional(out, "recurrence", record.recurrence);
  write_optional(out, "notes", record.notes);
  out << ",\"status\":\"" << status_name(record.status) << "\"";
  out << ",\"reminder_minutes\":" << record.reminder_minutes;
  out << ",\"created_at\":\"" << common::json_escape(record.created_at) << "\"";
  write_optional(out, "updated_at", record.updated_at);
  write_optional(out, "notified_at", record.notified_at);
  out << "}";
  return out.str();
}

common::Result<ScheduleRecord> record_from_json(const std::string &json) {
  const auto fields = common::json_parse_flat(json);

  ScheduleRecord record;
  record.id = common::trim(field_or(fields, "id"));
  if (record.id.empty()) {
    return common::Result<ScheduleRecord>::failure("schedule record without id");
  }
  record.title = field_or(fields, "title");
  // Older files used "datetime"/"description"/"repeat".
  record.start_time = field_or(fields, "start_time", field_or(fields, "datetime"));
  if (!parse_local_time(record.start_time).has_value()) {
    return common::Result<ScheduleRecord>::failure("schedule " + record.id +
                                                   " has invalid start_time '" +
                                                   record.start_time + "'");
  }
  record.notes = optional_field(fields, "notes");
  if (!record.notes.has_value()) {
    record.notes = optional_field(fields, "description");
  }
  auto recurrence = optional_field(fields, "recurrence");
  if (!recurrence.has_value()) {
    recurrence = optional_field(fields, "repeat");
  }
  if (recurrence.has_value() && *recurrence != "once") {
    record.recurrence = recurrence;
  }

  const auto status = parse_status(field_or(fields, "status", "pending"));
  if (!status.has_value()) {
    return common::Result<ScheduleRecord>::failure("schedule " + record.id +
                                                   " has unknown status");
  }
  record.status = *status;
  if (record.status == ScheduleStatus::Pending && field_or(fields, "notified") == "true") {
    record.status = ScheduleStatus::Notified;
  }

  const std::string minutes = common::trim(field_or(fields, "reminder_minutes", "0"));
  int parsed_minutes = 0;
  const auto [ptr, ec] = std::from_chars(minutes.data(), minutes.data() + minutes.size(),
                                         parsed_minutes);
  if (ec == std::errc() && parsed_minutes >= 0) {
    record.reminder_minutes = std::min(parsed_minutes, MAX_REMINDER_MINUTES);
  }
  (void)ptr;

  record.created_at = field_or(fields, "created_at");
  record.updated_at = optional_field(fields, "updated_at");
  record.notified_at = optional_field(fields, "notified_at");
  return common::Result<ScheduleRecord>::success(std::move(record));
}

std::string records_to_json(const std::vector<ScheduleRecord> &records,
                            const std::vector<std::string> &unparsed) {
  std::ostringstream out;
  out << "[";
  std::size_t written = 0;
  for (const auto &record : records) {
    out << (written++ == 0 ? "\n  " : ",\n  ") << record_to_json(record);
  }
  for (const auto &object : unparsed) {
    out << (written++ == 0 ? "\n  " : ",\n  ") << object;
  }
  out << (written == 0 ? "]\n" : "\n]\n");
  return out.str();
}

common::Result<ScheduleFile> parse_schedule_file(const std::string &json) {
  const std::string trimmed = common::trim(json);
  if (trimmed.empty()) {
    return common::Result<ScheduleFile>::success({});
  }
  if (!common::json_is_valid(trimmed)) {
    return common::Result<ScheduleFile>::failure("schedule file is not valid JSON");
  }

  std::string array = trimmed;
  if (trimmed.front() == '{') {
    array = common::json_get_array(trimmed, "schedules");
  }
  if (array.empty() || array.front() != '[') {
    return common::Result<ScheduleFile>::failure("schedule file does not hold an array");
  }

  ScheduleFile file;
  std::unordered_set<std::string> seen;
  for (auto &object : common::json_split_top_level_objects(array)) {
    auto record = record_from_json(object);
    if (!record.ok() || !seen.insert(record.value().id).second) {
      file.unparsed.push_back(common::trim(object));
      continue;
    }
    file.records.push_back(std::move(record.value()));
  }
  return common::Result<ScheduleFile>::success(std::move(file));
}

std::optional<std::string> find_duplicate_id(const std::vector<ScheduleRecord> &records) {
  std::unordered_set<std::string> seen;
  for (const auto &record : records) {
    if (!seen.insert(record.id).second) {
      return record.id;
    }
  }
  return std::nullopt;
}

} // namespace almanac::schedule
