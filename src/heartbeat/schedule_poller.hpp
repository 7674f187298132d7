#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "schedule/schedule_store.hpp"
#include "schedule/schedule_types.hpp"

namespace cadence::heartbeat {

// Periodic poll-execute-release loop over one ScheduleStore. Each tick asks the
// store for due schedules and, per schedule, takes the lock, re-reads the
// record, runs the action, records the outcome with a freshly computed
// nextRunAt and releases the lock. A schedule whose lock is held elsewhere is
// skipped until the next tick.
class SchedulePoller {
public:
    enum class RunOutcome {
        kRan,
        kLocked,
        kNotFound,
        kOtherSession,
        kNotDue
    };

    using ActionHandler = std::function<schedule::RunResult(const schedule::ScheduleRecord&)>;

    struct Options {
        std::string owner_id;
        // Schedules bound to a different session are left alone. Unset means
        // this poller serves every session.
        std::optional<std::string> session_id;
        // Bind global schedules to session_id before running them.
        bool claim_global = false;
        std::chrono::milliseconds tick_interval{30 * 1000};
        long long lock_ttl_ms = schedule::kDefaultLockTtlMs;
        // Lock refresh period while an action runs; zero means ttl/3.
        std::chrono::milliseconds lease_interval{0};
    };

    SchedulePoller(schedule::ScheduleStore& store, ActionHandler on_action, Options options);
    ~SchedulePoller();

    SchedulePoller(const SchedulePoller&) = delete;
    SchedulePoller& operator=(const SchedulePoller&) = delete;

    void Start();
    void Stop();
    bool IsRunning() const { return running_; }

    // One pass over the due schedules; returns the ids that were executed.
    std::vector<std::string> Tick();

    // Executes one schedule now, whether or not it is due or paused. Anything
    // other than kRan means the action was not started.
    RunOutcome RunNow(const std::string& id);

private:
    void RunLoop();
    RunOutcome Execute(const std::string& id, bool require_due);
    bool BelongsToOtherSession(const schedule::ScheduleRecord& record) const;
    schedule::RunResult RunAction(const schedule::ScheduleRecord& record);
    std::chrono::milliseconds LeaseInterval() const;

    schedule::ScheduleStore& store_;
    ActionHandler on_action_;
    Options options_;
    std::atomic<bool> running_{false};
    std::mutex mutex_;
    std::condition_variable wake_;
    std::thread worker_;
};

}  // namespace cadence::heartbeat
