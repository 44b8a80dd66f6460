#pragma once

#include "almanac/common/result.hpp"
#include "almanac/schedule/record.hpp"

#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace almanac::schedule {

struct ScheduleDraft {
  std::string title;
  std::string start_time;
  std::optional<std::string> recurrence;
  std::optional<std::string> notes;
  int reminder_minutes = 0;
};

struct SchedulePatch {
  std::optional<std::string> title;
  std::optional<std::string> start_time;
  std::optional<std::string> recurrence;
  std::optional<std::string> notes;
  std::optional<int> reminder_minutes;
  std::optional<ScheduleStatus> status;

  [[nodiscard]] bool empty() const {
    return !title && !start_time && !recurrence && !notes && !reminder_minutes && !status;
  }
};

/// File-backed schedule records. Every operation is a read-modify-write of the whole file,
/// serialized by one mutex per instance plus an advisory lock on `<file>.lock` shared with
/// other processes.
class ScheduleStore {
public:
  /// Receives the current records; sets `changed` when the file must be rewritten.
  using Mutation =
      std::function<common::Status(std::vector<ScheduleRecord> &records, bool &changed)>;

  explicit ScheduleStore(std::filesystem::path path);

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

  /// Missing or unparsable file yields an empty set. Mutations refuse to rewrite an
  /// unparsable file (Io) and carry unreadable or duplicate objects over verbatim.
  [[nodiscard]] common::Result<std::vector<ScheduleRecord>> load();
  /// Full overwrite through a staged temp file and rename. Repeated ids fail with
  /// InvalidArguments.
  [[nodiscard]] common::Status save(const std::vector<ScheduleRecord> &records);

  [[nodiscard]] common::Result<ScheduleRecord> create(const ScheduleDraft &draft);
  /// Sorted by start time.
  [[nodiscard]] common::Result<std::vector<ScheduleRecord>> list();
  [[nodiscard]] common::Result<ScheduleRecord> get(const std::string &id);
  [[nodiscard]] common::Result<ScheduleRecord> update(const std::string &id,
                                                      const SchedulePatch &patch);
  [[nodiscard]] common::Status remove(const std::string &id);

  [[nodiscard]] common::Status mutate(const Mutation &mutation);

private:
  class FileLock;

  /// Parse failures come back as Protocol; read failures as Io.
  [[nodiscard]] common::Result<ScheduleFile> load_unlocked() const;
  [[nodiscard]] common::Status save_unlocked(const ScheduleFile &file) const;

  std::filesystem::path path_;
  std::mutex mutex_;
};

} // namespace almanac::schedule
