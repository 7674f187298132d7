#include "schedule/schedule_lock.hpp"

#include <atomic>
#include <cerrno>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <sys/file.h>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

#include "nlohmann/json.hpp"
#include "schedule/schedule_json.hpp"
#include "schedule/schedule_types.hpp"
#include "utils/file_io.hpp"
#include "utils/logging.hpp"

namespace cadence::schedule {
namespace {

std::atomic<unsigned long> g_lock_temp_counter{0};

// Exclusive flock(2) on a guard file, held for the lifetime of the object.
// The guard may be unlinked by ScheduleLock::Forget while others wait on it, so
// after locking, the open file must still be the one at path; otherwise retry.
class FileGuard {
public:
    explicit FileGuard(const std::filesystem::path& path) {
        for (;;) {
            fd_ = ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
            if (fd_ < 0) {
                throw std::system_error(errno, std::generic_category(), "open " + path.string());
            }
            while (::flock(fd_, LOCK_EX) != 0) {
                if (errno == EINTR) {
                    continue;
                }
                const int error = errno;
                ::close(fd_);
                throw std::system_error(error, std::generic_category(), "flock " + path.string());
            }
            struct stat held {};
            struct stat current {};
            if (::fstat(fd_, &held) == 0 && ::stat(path.c_str(), &current) == 0 &&
                held.st_dev == current.st_dev && held.st_ino == current.st_ino) {
                return;
            }
            ::flock(fd_, LOCK_UN);
            ::close(fd_);
        }
    }

    ~FileGuard() {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }

    FileGuard(const FileGuard&) = delete;
    FileGuard& operator=(const FileGuard&) = delete;

private:
    int fd_ = -1;
};

std::string SerializeLock(const LockInfo& info) {
    nlohmann::json json = {
        {"ownerId", info.owner_id},
        {"createdAt", info.created_at_ms},
        {"updatedAt", info.updated_at_ms},
        {"ttlMs", info.ttl_ms.value_or(kDefaultLockTtlMs)}
    };
    return json.dump(2);
}

long long ReadMillis(const nlohmann::json& data, const char* key) {
    if (!data.contains(key)) {
        return 0;
    }
    return MillisFromJson(data[key]).value_or(0);
}

bool IsStale(const LockInfo& lock, long long fallback_ttl_ms, long long now_ms) {
    long long updated_at = lock.updated_at_ms;
    if (updated_at == 0) {
        updated_at = lock.created_at_ms;
    }
    const auto ttl = lock.ttl_ms.value_or(fallback_ttl_ms);
    if (updated_at >= now_ms) {
        return false;
    }
    // In double so that a bogus timestamp far in the past cannot overflow the subtraction.
    return static_cast<double>(now_ms) - static_cast<double>(updated_at) > static_cast<double>(ttl);
}

}  // namespace

ScheduleLock::ScheduleLock(std::filesystem::path locks_dir, utils::Clock clock)
    : locks_dir_(std::move(locks_dir)), clock_(clock ? std::move(clock) : utils::SystemClock()) {}

std::filesystem::path ScheduleLock::LockPath(const std::string& id) const {
    return locks_dir_ / (id + ".lock.json");
}

std::filesystem::path ScheduleLock::GuardPath(const std::string& id) const {
    return locks_dir_ / (id + ".lock.guard");
}

ScheduleLock::ReadStatus ScheduleLock::ReadLockFile(const std::filesystem::path& path, LockInfo& out) const {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return ReadStatus::kMissing;
    }
    const auto raw = utils::ReadTextFile(path);
    if (!raw.has_value()) {
        return std::filesystem::exists(path, ec) ? ReadStatus::kCorrupt : ReadStatus::kMissing;
    }
    const auto data = nlohmann::json::parse(*raw, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        return ReadStatus::kCorrupt;
    }
    try {
        LockInfo info;
        if (data.contains("ownerId") && data["ownerId"].is_string()) {
            info.owner_id = data["ownerId"].get<std::string>();
        }
        info.created_at_ms = ReadMillis(data, "createdAt");
        info.updated_at_ms = ReadMillis(data, "updatedAt");
        if (data.contains("ttlMs")) {
            info.ttl_ms = MillisFromJson(data["ttlMs"]);
        }
        out = info;
        return ReadStatus::kOk;
    } catch (const nlohmann::json::exception&) {
        return ReadStatus::kCorrupt;
    }
}

bool ScheduleLock::TryCreate(const std::filesystem::path& path, const LockInfo& info) {
    std::ostringstream temp_name;
    temp_name << "." << path.filename().string() << "." << ::getpid() << "-" << g_lock_temp_counter.fetch_add(1);
    const auto temp_path = locks_dir_ / temp_name.str();
    {
        std::ofstream output(temp_path, std::ios::trunc);
        output << SerializeLock(info);
        output.flush();
        if (!output.good()) {
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            throw std::system_error(std::make_error_code(std::errc::io_error), "write " + temp_path.string());
        }
    }
    const int rc = ::link(temp_path.c_str(), path.c_str());
    const int error = errno;
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    if (rc == 0) {
        return true;
    }
    if (error == EEXIST) {
        return false;
    }
    throw std::system_error(error, std::generic_category(), "link " + path.string());
}

bool ScheduleLock::Acquire(const std::string& id, const std::string& owner_id, long long ttl_ms) {
    if (!IsSafeId(id)) {
        return false;
    }
    std::filesystem::create_directories(locks_dir_);
    const auto path = LockPath(id);

    for (int attempt = 0; attempt < kMaxLockAttempts; ++attempt) {
        const auto now = clock_();
        LockInfo mine;
        mine.owner_id = owner_id;
        mine.created_at_ms = now;
        mine.updated_at_ms = now;
        mine.ttl_ms = ttl_ms;
        if (TryCreate(path, mine)) {
            return true;
        }

        FileGuard guard(GuardPath(id));
        LockInfo existing;
        const auto status = ReadLockFile(path, existing);
        if (status == ReadStatus::kMissing) {
            continue;
        }
        if (status == ReadStatus::kOk && !IsStale(existing, ttl_ms, clock_())) {
            return false;
        }
        utils::Log(utils::LogLevel::kInfo, "lock",
                   "taking over " + std::string(status == ReadStatus::kCorrupt ? "corrupt" : "stale") +
                   " lock " + id + (existing.owner_id.empty() ? std::string() : " from " + existing.owner_id));
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            utils::Log(utils::LogLevel::kWarn, "lock", "failed to remove " + path.string() + ": " + ec.message());
            return false;
        }
    }
    return false;
}

void ScheduleLock::Release(const std::string& id, const std::string& owner_id) {
    if (!IsSafeId(id)) {
        return;
    }
    const auto path = LockPath(id);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return;
    }
    FileGuard guard(GuardPath(id));
    LockInfo existing;
    if (ReadLockFile(path, existing) != ReadStatus::kOk) {
        return;
    }
    if (existing.owner_id != owner_id) {
        utils::Log(utils::LogLevel::kDebug, "lock",
                   "release of " + id + " by " + owner_id + " ignored; held by " + existing.owner_id);
        return;
    }
    std::filesystem::remove(path, ec);
    if (ec) {
        throw std::system_error(ec, "remove " + path.string());
    }
}

bool ScheduleLock::Refresh(const std::string& id, const std::string& owner_id) {
    if (!IsSafeId(id)) {
        return false;
    }
    const auto path = LockPath(id);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return false;
    }
    FileGuard guard(GuardPath(id));
    LockInfo existing;
    if (ReadLockFile(path, existing) != ReadStatus::kOk || existing.owner_id != owner_id) {
        return false;
    }
    existing.updated_at_ms = clock_();
    utils::AtomicWriteFile(path, SerializeLock(existing));
    return true;
}

void ScheduleLock::Forget(const std::string& id) {
    if (!IsSafeId(id)) {
        return;
    }
    const auto guard_path = GuardPath(id);
    std::error_code ec;
    if (!std::filesystem::exists(guard_path, ec)) {
        return;
    }
    FileGuard guard(guard_path);
    if (std::filesystem::exists(LockPath(id), ec)) {
        return;
    }
    std::filesystem::remove(guard_path, ec);
    if (ec) {
        utils::Log(utils::LogLevel::kWarn, "lock", "failed to remove " + guard_path.string() + ": " + ec.message());
    }
}

std::optional<LockInfo> ScheduleLock::Read(const std::string& id) const {
    if (!IsSafeId(id)) {
        return std::nullopt;
    }
    LockInfo info;
    if (ReadLockFile(LockPath(id), info) != ReadStatus::kOk) {
        return std::nullopt;
    }
    return info;
}

}  // namespace cadence::schedule
