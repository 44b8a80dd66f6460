#pragma once

#include "almanac/common/result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace almanac::schedule {

enum class ScheduleStatus { Pending, Notified, Cancelled };

[[nodiscard]] std::string_view status_name(ScheduleStatus status);
[[nodiscard]] std::optional<ScheduleStatus> parse_status(const std::string &value);

/// Status only moves forward: pending -> notified, pending|notified -> cancelled. Re-applying
/// the current status is accepted as a no-op.
[[nodiscard]] bool is_valid_transition(ScheduleStatus from, ScheduleStatus to);

/// Upper bound for reminder lead time (one year).
inline constexpr int MAX_REMINDER_MINUTES = 365 * 24 * 60;

/// Recurrence values accepted on records. "once" is stored as an absent recurrence.
[[nodiscard]] bool is_valid_recurrence(const std::string &value);

struct ScheduleRecord {
  std::string id;
  std::string title;
  std::string start_time; // local "YYYY-MM-DD HH:MM"
  std::optional<std::string> recurrence;
  std::optional<std::string> notes;
  ScheduleStatus status = ScheduleStatus::Pending;
  int reminder_minutes = 0;
  std::string created_at;
  std::optional<std::string> updated_at;
  std::optional<std::string> notified_at;
};

[[nodiscard]] std::string record_to_json(const ScheduleRecord &record);
[[nodiscard]] common::Result<ScheduleRecord> record_from_json(const std::string &json);

/// Contents of a schedule file. Objects that fail to parse, or repeat an id seen earlier in
/// the file, are kept verbatim in `unparsed` and written back on every rewrite.
struct ScheduleFile {
  std::vector<ScheduleRecord> records;
  std::vector<std::string> unparsed;
};

/// Serialized file body: a JSON array with one record per line, unparsed objects last.
[[nodiscard]] std::string records_to_json(const std::vector<ScheduleRecord> &records,
                                          const std::vector<std::string> &unparsed = {});

/// Parses a file body. Accepts a bare array or `{"schedules":[...]}`.
[[nodiscard]] common::Result<ScheduleFile> parse_schedule_file(const std::string &json);

/// First id that occurs more than once, if any.
[[nodiscard]] std::optional<std::string>
find_duplicate_id(const std::vector<ScheduleRecord> &records);

} // namespace almanac::schedule
