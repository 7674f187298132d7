#include "heartbeat/schedule_poller.hpp"

#include <algorithm>
#include <exception>
#include <utility>
#include <variant>

#include "schedule/next_run.hpp"
#include "utils/logging.hpp"

namespace cadence::heartbeat {
namespace {

using schedule::RunResult;
using schedule::ScheduleRecord;
using schedule::ScheduleStatus;
using schedule::ScheduleStore;

// Keeps a held lock fresh on a background thread until destroyed.
class LeaseKeeper {
public:
    LeaseKeeper(ScheduleStore& store, std::string id, std::string owner_id, std::chrono::milliseconds interval)
        : store_(store)
        , id_(std::move(id))
        , owner_id_(std::move(owner_id))
        , interval_(interval)
        , thread_([this]() { Run(); }) {}

    ~LeaseKeeper() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
        }
        wake_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    LeaseKeeper(const LeaseKeeper&) = delete;
    LeaseKeeper& operator=(const LeaseKeeper&) = delete;

private:
    void Run() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!wake_.wait_for(lock, interval_, [this]() { return stopped_; })) {
            lock.unlock();
            try {
                if (!store_.RefreshLock(id_, owner_id_)) {
                    utils::Log(utils::LogLevel::kWarn, "scheduler", "lost lock on " + id_ + " while running");
                }
            } catch (const std::exception& ex) {
                utils::Log(utils::LogLevel::kWarn, "scheduler", "lock refresh failed for " + id_ + ": " + ex.what());
            }
            lock.lock();
        }
    }

    ScheduleStore& store_;
    std::string id_;
    std::string owner_id_;
    std::chrono::milliseconds interval_;
    std::mutex mutex_;
    std::condition_variable wake_;
    bool stopped_ = false;
    std::thread thread_;
};

// Releases the lock when the execution scope ends, however it ends.
class HeldLock {
public:
    HeldLock(ScheduleStore& store, std::string id, std::string owner_id)
        : store_(store), id_(std::move(id)), owner_id_(std::move(owner_id)) {}

    ~HeldLock() {
        try {
            store_.ReleaseLock(id_, owner_id_);
        } catch (const std::exception& ex) {
            utils::Log(utils::LogLevel::kError, "scheduler", "failed to release lock " + id_ + ": " + ex.what());
        }
    }

    HeldLock(const HeldLock&) = delete;
    HeldLock& operator=(const HeldLock&) = delete;

private:
    ScheduleStore& store_;
    std::string id_;
    std::string owner_id_;
};

}  // namespace

SchedulePoller::SchedulePoller(ScheduleStore& store, ActionHandler on_action, Options options)
    : store_(store), on_action_(std::move(on_action)), options_(std::move(options)) {}

SchedulePoller::~SchedulePoller() {
    Stop();
}

void SchedulePoller::Start() {
    if (running_.exchange(true)) {
        return;
    }
    worker_ = std::thread([this]() { RunLoop(); });
}

void SchedulePoller::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    wake_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void SchedulePoller::RunLoop() {
    while (running_) {
        Tick();
        std::unique_lock<std::mutex> lock(mutex_);
        wake_.wait_for(lock, options_.tick_interval, [this]() { return !running_; });
    }
}

std::vector<std::string> SchedulePoller::Tick() {
    std::vector<std::string> executed;
    std::vector<ScheduleRecord> due;
    try {
        due = store_.GetDue(store_.Now());
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kError, "scheduler", std::string("due query failed: ") + ex.what());
        return executed;
    }

    for (const auto& record : due) {
        if (BelongsToOtherSession(record)) {
            continue;
        }
        try {
            if (Execute(record.id, true) == RunOutcome::kRan) {
                executed.push_back(record.id);
            }
        } catch (const std::exception& ex) {
            utils::Log(utils::LogLevel::kError, "scheduler", "schedule " + record.id + " failed: " + ex.what());
        }
    }
    return executed;
}

SchedulePoller::RunOutcome SchedulePoller::RunNow(const std::string& id) {
    return Execute(id, false);
}

bool SchedulePoller::BelongsToOtherSession(const ScheduleRecord& record) const {
    if (!options_.session_id.has_value() || !record.session_id.has_value() || record.session_id->empty()) {
        return false;
    }
    return *record.session_id != *options_.session_id;
}

SchedulePoller::RunOutcome SchedulePoller::Execute(const std::string& id, bool require_due) {
    if (!store_.AcquireLock(id, options_.owner_id, options_.lock_ttl_ms)) {
        utils::Log(utils::LogLevel::kDebug, "scheduler", "schedule " + id + " is locked elsewhere; skipping");
        return RunOutcome::kLocked;
    }
    HeldLock held(store_, id, options_.owner_id);

    auto current = store_.Get(id);
    if (!current.has_value()) {
        return RunOutcome::kNotFound;
    }
    if (BelongsToOtherSession(*current)) {
        return RunOutcome::kOtherSession;
    }
    if (require_due) {
        const auto now = store_.Now();
        if (current->status != ScheduleStatus::kActive ||
            !current->next_run_at_ms.has_value() ||
            current->next_run_at_ms.value() > now) {
            return RunOutcome::kNotDue;
        }
    }

    if (options_.claim_global && options_.session_id.has_value() &&
        (!current->session_id.has_value() || current->session_id->empty())) {
        const auto session = *options_.session_id;
        const auto claimed = store_.Update(id, [this, &session](const ScheduleRecord& live) {
            auto next = live;
            if (!next.session_id.has_value() || next.session_id->empty()) {
                next.session_id = session;
                next.updated_at_ms = store_.Now();
            }
            return next;
        });
        if (!claimed.has_value()) {
            return RunOutcome::kNotFound;
        }
        if (claimed->session_id != session) {
            return RunOutcome::kOtherSession;
        }
        current = claimed;
    }

    utils::Log(utils::LogLevel::kInfo, "scheduler",
               "running " + current->id + " [" + schedule::KindName(current->schedule) + "] " + current->command);
    RunResult result;
    {
        LeaseKeeper lease(store_, id, options_.owner_id, LeaseInterval());
        result = RunAction(*current);
    }

    const auto finished = store_.Now();
    const auto updated = store_.Update(id, [&result, finished](const ScheduleRecord& live) {
        auto next = live;
        next.updated_at_ms = finished;
        next.last_run_at_ms = finished;
        next.last_result = result;
        if (std::holds_alternative<schedule::OnceSchedule>(live.schedule)) {
            next.status = result.ok ? ScheduleStatus::kCompleted : ScheduleStatus::kError;
            next.next_run_at_ms.reset();
        } else {
            next.status = live.status == ScheduleStatus::kPaused ? ScheduleStatus::kPaused : ScheduleStatus::kActive;
            next.next_run_at_ms = schedule::ComputeNextRun(next, finished);
        }
        return next;
    });

    if (!updated.has_value()) {
        utils::Log(utils::LogLevel::kWarn, "scheduler", "schedule " + id + " disappeared while running");
    } else if (!result.ok) {
        utils::Log(utils::LogLevel::kWarn, "scheduler", "schedule " + id + " failed: " + result.error);
    } else if (updated->status == ScheduleStatus::kActive && !updated->next_run_at_ms.has_value()) {
        utils::Log(utils::LogLevel::kWarn, "scheduler", "schedule " + id + " has no next run");
    }
    return RunOutcome::kRan;
}

schedule::RunResult SchedulePoller::RunAction(const ScheduleRecord& record) {
    if (!on_action_) {
        RunResult result;
        result.ok = false;
        result.error = "no action handler configured";
        return result;
    }
    try {
        return on_action_(record);
    } catch (const std::exception& ex) {
        RunResult result;
        result.ok = false;
        result.error = ex.what();
        return result;
    }
}

std::chrono::milliseconds SchedulePoller::LeaseInterval() const {
    if (options_.lease_interval.count() > 0) {
        return options_.lease_interval;
    }
    // Several refreshes fit inside one ttl, so a single late wakeup cannot let the lock go stale.
    return std::max(std::chrono::milliseconds(1), std::chrono::milliseconds(options_.lock_ttl_ms / 3));
}

}  // namespace cadence::heartbeat
