#include "almanac/schedule/store.hpp"

#include "almanac/common/fs.hpp"
#include "almanac/common/random.hpp"
#include "almanac/observability/global.hpp"
#include "almanac/schedule/time.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace almanac::schedule {

class ScheduleStore::FileLock {
public:
  explicit FileLock(const std::filesystem::path &target) {
    const std::string lock_path = target.string() + ".lock";
    if (!target.parent_path().empty()) {
      auto dir = common::ensure_dir(target.parent_path());
      if (!dir.ok()) {
        error_ = dir.error();
        return;
      }
    }
    fd_ = ::open(lock_path.c_str(), O_CREAT | O_RDWR, 0600);
    if (fd_ < 0) {
      error_ = "Failed to open schedule lock " + lock_path + ": " + std::strerror(errno);
      return;
    }

    struct flock fl {};
    fl.l_type = F_WRLCK;
    fl.l_whence = SEEK_SET;
    fl.l_start = 0;
    fl.l_len = 0;
    while (::fcntl(fd_, F_SETLKW, &fl) != 0) {
      if (errno == EINTR) {
        continue;
      }
      error_ = std::string("Failed to lock schedule file: ") + std::strerror(errno);
      ::close(fd_);
      fd_ = -1;
      return;
    }
  }

  ~FileLock() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  FileLock(const FileLock &) = delete;
  FileLock &operator=(const FileLock &) = delete;

  [[nodiscard]] common::Status status() const {
    if (fd_ < 0) {
      return common::Status::error(common::ErrorKind::Io, error_);
    }
    return common::Status::success();
  }

private:
  int fd_ = -1;
  std::string error_;
};

namespace {

common::Status apply_patch(ScheduleRecord &record, const SchedulePatch &patch) {
  if (patch.title.has_value()) {
    const std::string title = common::trim(*patch.title);
    if (title.empty()) {
      return common::Status::error(common::ErrorKind::InvalidArguments, "title cannot be empty");
    }
    record.title = title;
  }
  if (patch.start_time.has_value()) {
    const auto when = parse_local_time(*patch.start_time);
    if (!when.has_value()) {
      return common::Status::error(common::ErrorKind::InvalidArguments,
                                   "invalid start time '" + *patch.start_time +
                                       "', expected YYYY-MM-DD HH:MM");
    }
    record.start_time = format_local_minute(*when);
  }
  if (patch.recurrence.has_value()) {
    if (!is_valid_recurrence(*patch.recurrence)) {
      return common::Status::error(common::ErrorKind::InvalidArguments,
                                   "invalid recurrence '" + *patch.recurrence + "'");
    }
    record.recurrence = *patch.recurrence == "once" ? std::nullopt : patch.recurrence;
  }
  if (patch.notes.has_value()) {
    record.notes = patch.notes->empty() ? std::nullopt : patch.notes;
  }
  if (patch.reminder_minutes.has_value()) {
    if (*patch.reminder_minutes < 0 || *patch.reminder_minutes > MAX_REMINDER_MINUTES) {
      return common::Status::error(common::ErrorKind::InvalidArguments,
                                   "reminder_minutes must be between 0 and " +
                                       std::to_string(MAX_REMINDER_MINUTES));
    }
    record.reminder_minutes = *patch.reminder_minutes;
  }
  if (patch.status.has_value() && *patch.status != record.status) {
    if (!is_valid_transition(record.status, *patch.status)) {
      return common::Status::error(common::ErrorKind::InvalidTransition,
                                   "cannot move schedule " + record.id + " from " +
                                       std::string(status_name(record.status)) + " to " +
                                       std::string(status_name(*patch.status)));
    }
    record.status = *patch.status;
    if (record.status == ScheduleStatus::Notified) {
      record.notified_at = format_local_second(Clock::now());
    }
  }
  return common::Status::success();
}

common::Status not_found(const std::string &id) {
  return common::Status::error(common::ErrorKind::NotFound, "schedule not found: " + id);
}

} // namespace

ScheduleStore::ScheduleStore(std::filesystem::path path) : path_(std::move(path)) {}

common::Result<std::vector<ScheduleRecord>> ScheduleStore::load() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto file = load_unlocked();
  if (!file.ok()) {
    if (file.kind() == common::ErrorKind::Protocol) {
      return common::Result<std::vector<ScheduleRecord>>::success({});
    }
    return common::Result<std::vector<ScheduleRecord>>::failure(file.status());
  }
  return common::Result<std::vector<ScheduleRecord>>::success(std::move(file.value().records));
}

common::Status ScheduleStore::save(const std::vector<ScheduleRecord> &records) {
  std::lock_guard<std::mutex> lock(mutex_);
  FileLock file_lock(path_);
  if (auto locked = file_lock.status(); !locked.ok()) {
    return locked;
  }
  return save_unlocked({.records = records});
}

common::Status ScheduleStore::mutate(const Mutation &mutation) {
  std::lock_guard<std::mutex> lock(mutex_);
  FileLock file_lock(path_);
  if (auto locked = file_lock.status(); !locked.ok()) {
    return locked;
  }

  auto file = load_unlocked();
  if (!file.ok()) {
    // A file that cannot be read or parsed is never replaced.
    return common::Status::error(common::ErrorKind::Io, file.error());
  }
  bool changed = false;
  auto status = mutation(file.value().records, changed);
  if (!status.ok()) {
    return status;
  }
  if (!changed) {
    return common::Status::success();
  }
  return save_unlocked(file.value());
}

common::Result<ScheduleRecord> ScheduleStore::create(const ScheduleDraft &draft) {
  ScheduleRecord record;
  record.title = common::trim(draft.title);
  if (record.title.empty()) {
    return common::Result<ScheduleRecord>::failure(common::ErrorKind::InvalidArguments,
                                                   "title is required");
  }
  const auto when = parse_local_time(draft.start_time);
  if (!when.has_value()) {
    return common::Result<ScheduleRecord>::failure(common::ErrorKind::InvalidArguments,
                                                   "invalid start time '" + draft.start_time +
                                                       "', expected YYYY-MM-DD HH:MM");
  }
  if (draft.recurrence.has_value() && !is_valid_recurrence(*draft.recurrence)) {
    return common::Result<ScheduleRecord>::failure(
        common::ErrorKind::InvalidArguments, "invalid recurrence '" + *draft.recurrence + "'");
  }
  if (draft.reminder_minutes < 0 || draft.reminder_minutes > MAX_REMINDER_MINUTES) {
    return common::Result<ScheduleRecord>::failure(
        common::ErrorKind::InvalidArguments,
        "reminder_minutes must be between 0 and " + std::to_string(MAX_REMINDER_MINUTES));
  }

  record.start_time = format_local_minute(*when);
  if (draft.recurrence.has_value() && *draft.recurrence != "once") {
    record.recurrence = draft.recurrence;
  }
  if (draft.notes.has_value() && !draft.notes->empty()) {
    record.notes = draft.notes;
  }
  record.reminder_minutes = draft.reminder_minutes;
  record.created_at = format_local_second(Clock::now());

  auto status = mutate([&record](std::vector<ScheduleRecord> &records, bool &changed) {
    do {
      record.id = common::random_hex(4);
    } while (std::any_of(records.begin(), records.end(),
                         [&record](const ScheduleRecord &existing) {
                           return existing.id == record.id;
                         }));
    records.push_back(record);
    changed = true;
    return common::Status::success();
  });
  if (!status.ok()) {
    return common::Result<ScheduleRecord>::failure(status);
  }
  return common::Result<ScheduleRecord>::success(std::move(record));
}

common::Result<std::vector<ScheduleRecord>> ScheduleStore::list() {
  auto records = load();
  if (!records.ok()) {
    return records;
  }
  auto sorted = std::move(records.value());
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const ScheduleRecord &a, const ScheduleRecord &b) {
                     return a.start_time < b.start_time;
                   });
  return common::Result<std::vector<ScheduleRecord>>::success(std::move(sorted));
}

common::Result<ScheduleRecord> ScheduleStore::get(const std::string &id) {
  auto records = load();
  if (!records.ok()) {
    return common::Result<ScheduleRecord>::failure(records.status());
  }
  for (const auto &record : records.value()) {
    if (record.id == id) {
      return common::Result<ScheduleRecord>::success(record);
    }
  }
  return common::Result<ScheduleRecord>::failure(not_found(id));
}

common::Result<ScheduleRecord> ScheduleStore::update(const std::string &id,
                                                     const SchedulePatch &patch) {
  ScheduleRecord updated;
  auto status = mutate([&](std::vector<ScheduleRecord> &records, bool &changed) {
    auto it = std::find_if(records.begin(), records.end(),
                           [&id](const ScheduleRecord &record) { return record.id == id; });
    if (it == records.end()) {
      return not_found(id);
    }
    ScheduleRecord candidate = *it;
    auto applied = apply_patch(candidate, patch);
    if (!applied.ok()) {
      return applied;
    }
    candidate.updated_at = format_local_second(Clock::now());
    *it = candidate;
    updated = std::move(candidate);
    changed = true;
    return common::Status::success();
  });
  if (!status.ok()) {
    return common::Result<ScheduleRecord>::failure(status);
  }
  return common::Result<ScheduleRecord>::success(std::move(updated));
}

common::Status ScheduleStore::remove(const std::string &id) {
  return mutate([&id](std::vector<ScheduleRecord> &records, bool &changed) {
    const auto before = records.size();
    records.erase(std::remove_if(records.begin(), records.end(),
                                 [&id](const ScheduleRecord &record) { return record.id == id; }),
                  records.end());
    if (records.size() == before) {
      return not_found(id);
    }
    changed = true;
    return common::Status::success();
  });
}

common::Result<ScheduleFile> ScheduleStore::load_unlocked() const {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    return common::Result<ScheduleFile>::success({});
  }
  auto content = common::read_file(path_);
  if (!content.ok()) {
    return common::Result<ScheduleFile>::failure(common::ErrorKind::Io, content.error());
  }

  auto file = parse_schedule_file(content.value());
  if (!file.ok()) {
    observability::record_error("schedule", path_.string() + ": " + file.error() +
                                                "; treating as empty");
    return common::Result<ScheduleFile>::failure(common::ErrorKind::Protocol,
                                                 path_.string() + ": " + file.error());
  }
  if (!file.value().unparsed.empty()) {
    observability::record_error("schedule", "kept " +
                                                std::to_string(file.value().unparsed.size()) +
                                                " unreadable or duplicate record(s) in " +
                                                path_.string() + " as-is");
  }
  return file;
}

common::Status ScheduleStore::save_unlocked(const ScheduleFile &file) const {
  if (const auto duplicate = find_duplicate_id(file.records); duplicate.has_value()) {
    return common::Status::error(common::ErrorKind::InvalidArguments,
                                 "duplicate schedule id: " + *duplicate);
  }
  return common::write_file_atomic(path_, records_to_json(file.records, file.unparsed));
}

} // namespace almanac::schedule
