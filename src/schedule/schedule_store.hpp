#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "schedule/schedule_lock.hpp"
#include "schedule/schedule_types.hpp"
#include "utils/common.hpp"

namespace cadence::schedule {

// File-per-record persistence under <root>/schedules, plus the per-id locks in
// <root>/schedules/locks. Several stores may point at the same root from
// different processes; record writes are atomic replaces and execution is
// serialized through the locks.
class ScheduleStore {
public:
    struct ListOptions {
        // When set (and all is false) only records of this session and global
        // records without a session are returned.
        std::optional<std::string> session_id;
        bool all = false;
    };

    using Updater = std::function<ScheduleRecord(const ScheduleRecord&)>;

    explicit ScheduleStore(std::filesystem::path root, utils::Clock clock = utils::SystemClock());

    // Sorted by id. Unreadable files are skipped.
    std::vector<ScheduleRecord> List() const;
    std::vector<ScheduleRecord> List(const ListOptions& options) const;
    std::optional<ScheduleRecord> Get(const std::string& id) const;

    // Throws std::invalid_argument for an unsafe id (nothing is written) and
    // std::runtime_error when the file cannot be written.
    void Save(const ScheduleRecord& record);

    bool Delete(const std::string& id);

    // nullopt when the record does not exist; the id cannot be changed.
    std::optional<ScheduleRecord> Update(const std::string& id, const Updater& updater);

    // Active records whose nextRunAt is at or before now_ms.
    std::vector<ScheduleRecord> GetDue(long long now_ms) const;

    bool AcquireLock(const std::string& id, const std::string& owner_id, long long ttl_ms = kDefaultLockTtlMs);
    void ReleaseLock(const std::string& id, const std::string& owner_id);
    bool RefreshLock(const std::string& id, const std::string& owner_id);

    const std::filesystem::path& SchedulesDir() const { return schedules_dir_; }
    std::filesystem::path RecordPath(const std::string& id) const;
    ScheduleLock& Locks() { return locks_; }
    long long Now() const { return clock_(); }

private:
    void EnsureDirs() const;

    std::filesystem::path root_;
    std::filesystem::path schedules_dir_;
    utils::Clock clock_;
    ScheduleLock locks_;
};

}  // namespace cadence::schedule
