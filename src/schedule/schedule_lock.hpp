#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "utils/common.hpp"

namespace cadence::schedule {

constexpr long long kDefaultLockTtlMs = 10 * 60 * 1000;

// Creation attempts per Acquire call: the first try plus two stale takeovers.
constexpr int kMaxLockAttempts = 3;

struct LockInfo {
    std::string owner_id;
    long long created_at_ms = 0;
    long long updated_at_ms = 0;
    std::optional<long long> ttl_ms;
};

// Owner-scoped advisory lock stored as <locks_dir>/<id>.lock.json.
//
// The lock file is published with link(2), so it never exists half-written. A
// lock whose updatedAt is older than its ttlMs, or a file that cannot be
// parsed, may be taken over by another owner. Takeover, release and refresh
// run under a short flock(2) on <id>.lock.guard and re-read the file inside
// it, which keeps two contenders from deleting each other's fresh lock.
class ScheduleLock {
public:
    explicit ScheduleLock(std::filesystem::path locks_dir, utils::Clock clock = utils::SystemClock());

    // false when the id is unsafe or another owner holds a live lock.
    // Throws std::system_error on unexpected I/O failures.
    bool Acquire(const std::string& id, const std::string& owner_id, long long ttl_ms = kDefaultLockTtlMs);

    // Removes the lock only when owner_id recorded in it matches.
    void Release(const std::string& id, const std::string& owner_id);

    // Moves updatedAt to now; false when the lock is gone or owned by someone else.
    bool Refresh(const std::string& id, const std::string& owner_id);

    // Removes the <id>.lock.guard sidecar when no lock file is present.
    void Forget(const std::string& id);

    std::optional<LockInfo> Read(const std::string& id) const;

    std::filesystem::path LockPath(const std::string& id) const;
    const std::filesystem::path& LocksDir() const { return locks_dir_; }

private:
    enum class ReadStatus {
        kOk,
        kMissing,
        kCorrupt
    };

    ReadStatus ReadLockFile(const std::filesystem::path& path, LockInfo& out) const;
    bool TryCreate(const std::filesystem::path& path, const LockInfo& info);
    std::filesystem::path GuardPath(const std::string& id) const;

    std::filesystem::path locks_dir_;
    utils::Clock clock_;
};

}  // namespace cadence::schedule
