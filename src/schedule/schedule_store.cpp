#include "schedule/schedule_store.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

#include "schedule/schedule_json.hpp"
#include "utils/file_io.hpp"
#include "utils/logging.hpp"

namespace cadence::schedule {
namespace {

constexpr const char* kRecordSuffix = ".json";

bool IsRecordFile(const std::filesystem::path& path) {
    const auto name = path.filename().string();
    if (name.empty() || name.front() == '.') {
        return false;
    }
    return path.extension() == kRecordSuffix;
}

}  // namespace

ScheduleStore::ScheduleStore(std::filesystem::path root, utils::Clock clock)
    : root_(std::move(root))
    , schedules_dir_(root_ / "schedules")
    , clock_(clock ? std::move(clock) : utils::SystemClock())
    , locks_(schedules_dir_ / "locks", clock_) {}

std::filesystem::path ScheduleStore::RecordPath(const std::string& id) const {
    return schedules_dir_ / (id + kRecordSuffix);
}

void ScheduleStore::EnsureDirs() const {
    std::filesystem::create_directories(schedules_dir_);
    std::filesystem::create_directories(locks_.LocksDir());
}

std::vector<ScheduleRecord> ScheduleStore::List() const {
    return List(ListOptions{});
}

std::vector<ScheduleRecord> ScheduleStore::List(const ListOptions& options) const {
    std::vector<ScheduleRecord> records;
    std::error_code ec;
    std::filesystem::directory_iterator it(schedules_dir_, ec);
    if (ec) {
        return records;
    }
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        const auto& entry = *it;
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec) || !IsRecordFile(entry.path())) {
            continue;
        }
        const auto raw = utils::ReadTextFile(entry.path());
        if (!raw.has_value()) {
            continue;
        }
        auto record = ParseRecord(*raw);
        if (!record.has_value()) {
            utils::Log(utils::LogLevel::kDebug, "store", "skipping unreadable " + entry.path().string());
            continue;
        }
        records.push_back(std::move(*record));
    }

    if (options.session_id.has_value() && !options.all) {
        const auto& session = *options.session_id;
        records.erase(std::remove_if(records.begin(), records.end(), [&](const ScheduleRecord& record) {
            return record.session_id.has_value() && !record.session_id->empty() && *record.session_id != session;
        }), records.end());
    }

    std::sort(records.begin(), records.end(), [](const ScheduleRecord& a, const ScheduleRecord& b) {
        return a.id < b.id;
    });
    return records;
}

std::optional<ScheduleRecord> ScheduleStore::Get(const std::string& id) const {
    if (!IsSafeId(id)) {
        return std::nullopt;
    }
    const auto raw = utils::ReadTextFile(RecordPath(id));
    if (!raw.has_value()) {
        return std::nullopt;
    }
    return ParseRecord(*raw);
}

void ScheduleStore::Save(const ScheduleRecord& record) {
    if (!IsSafeId(record.id)) {
        throw std::invalid_argument("Invalid schedule id: " + record.id);
    }
    try {
        EnsureDirs();
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("failed to create schedule directory: ") + ex.what());
    }
    utils::AtomicWriteFile(RecordPath(record.id), ToJson(record).dump(2));
}

bool ScheduleStore::Delete(const std::string& id) {
    if (!IsSafeId(id)) {
        return false;
    }
    std::error_code ec;
    const bool removed = std::filesystem::remove(RecordPath(id), ec);
    if (ec) {
        utils::Log(utils::LogLevel::kWarn, "store", "failed to delete " + id + ": " + ec.message());
        return false;
    }
    try {
        locks_.Forget(id);
    } catch (const std::system_error& ex) {
        utils::Log(utils::LogLevel::kWarn, "store", "failed to clean up lock guard for " + id + ": " + ex.what());
    }
    return removed;
}

std::optional<ScheduleRecord> ScheduleStore::Update(const std::string& id, const Updater& updater) {
    auto current = Get(id);
    if (!current.has_value()) {
        return std::nullopt;
    }
    auto updated = updater(*current);
    updated.id = current->id;
    Save(updated);
    return updated;
}

std::vector<ScheduleRecord> ScheduleStore::GetDue(long long now_ms) const {
    auto records = List();
    records.erase(std::remove_if(records.begin(), records.end(), [now_ms](const ScheduleRecord& record) {
        return record.status != ScheduleStatus::kActive ||
               !record.next_run_at_ms.has_value() ||
               record.next_run_at_ms.value() > now_ms;
    }), records.end());
    return records;
}

bool ScheduleStore::AcquireLock(const std::string& id, const std::string& owner_id, long long ttl_ms) {
    return locks_.Acquire(id, owner_id, ttl_ms);
}

void ScheduleStore::ReleaseLock(const std::string& id, const std::string& owner_id) {
    locks_.Release(id, owner_id);
}

bool ScheduleStore::RefreshLock(const std::string& id, const std::string& owner_id) {
    return locks_.Refresh(id, owner_id);
}

}  // namespace cadence::schedule
