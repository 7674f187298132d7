#include "schedule/next_run.hpp"

#include <cmath>
#include <random>

#include "cron/cron_expression.hpp"
#include "cron/time_zone.hpp"
#include "utils/common.hpp"

namespace cadence::schedule {
namespace {

std::mt19937_64& RandomEngine() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

std::string UsableTimeZone(const std::string& time_zone) {
    if (!time_zone.empty() && cron::IsValidTimeZone(time_zone)) {
        return time_zone;
    }
    return {};
}

// nullopt when the delay is not finite or too large to add to an epoch time.
std::optional<long long> ToMillis(double amount, IntervalUnit unit) {
    constexpr double kMaxDelayMs = 4611686018427387904.0;  // 2^62
    const double ms = amount * static_cast<double>(UnitMultiplierMs(unit));
    if (!std::isfinite(ms) || ms >= kMaxDelayMs || ms <= -kMaxDelayMs) {
        return std::nullopt;
    }
    return std::llround(ms);
}

struct NextRunVisitor {
    long long from_ms;

    std::optional<long long> operator()(const OnceSchedule& once) const {
        if (once.at.empty()) {
            return std::nullopt;
        }
        const auto at = cron::ParseScheduledTime(once.at, UsableTimeZone(once.timezone));
        if (!at.has_value() || at.value() <= from_ms) {
            return std::nullopt;
        }
        return at;
    }

    std::optional<long long> operator()(const CronSchedule& cron) const {
        if (cron.cron.empty()) {
            return std::nullopt;
        }
        return cron::GetNextCronRun(cron.cron, from_ms, UsableTimeZone(cron.timezone));
    }

    std::optional<long long> operator()(const IntervalSchedule& interval) const {
        if (!(interval.interval > 0)) {
            return std::nullopt;
        }
        const auto delay = ToMillis(interval.interval, interval.unit);
        if (!delay.has_value() || *delay <= 0) {
            return std::nullopt;
        }
        return from_ms + *delay;
    }

    std::optional<long long> operator()(const RandomSchedule& random) const {
        if (!(random.min_interval > 0) || !(random.max_interval > 0) ||
            random.min_interval > random.max_interval) {
            return std::nullopt;
        }
        const auto min_ms = ToMillis(random.min_interval, random.unit);
        const auto max_ms = ToMillis(random.max_interval, random.unit);
        if (!min_ms.has_value() || !max_ms.has_value() || *min_ms <= 0 || *min_ms > *max_ms) {
            return std::nullopt;
        }
        std::uniform_int_distribution<long long> dist(*min_ms, *max_ms);
        return from_ms + dist(RandomEngine());
    }
};

struct SpecValidator {
    std::optional<std::string> operator()(const OnceSchedule& once) const {
        if (utils::Trim(once.at).empty()) {
            return std::string("at is required for a one-time schedule.");
        }
        return CheckTimeZone(once.timezone);
    }

    std::optional<std::string> operator()(const CronSchedule& cron) const {
        if (utils::Trim(cron.cron).empty()) {
            return std::string("cron is required for a cron schedule.");
        }
        if (!cron::CronExpression::Parse(cron.cron).has_value()) {
            return "invalid cron expression \"" + cron.cron + "\".";
        }
        return CheckTimeZone(cron.timezone);
    }

    std::optional<std::string> operator()(const IntervalSchedule& interval) const {
        if (!(interval.interval > 0)) {
            return std::string("every must be a positive number.");
        }
        const auto delay = ToMillis(interval.interval, interval.unit);
        if (!delay.has_value()) {
            return std::string("every is too large.");
        }
        if (*delay < 1000) {
            return std::string("minimum interval is 1 second.");
        }
        return std::nullopt;
    }

    std::optional<std::string> operator()(const RandomSchedule& random) const {
        if (!(random.min_interval > 0) || !(random.max_interval > 0)) {
            return std::string("minInterval and maxInterval must be positive numbers.");
        }
        if (random.min_interval > random.max_interval) {
            return std::string("minInterval cannot be greater than maxInterval.");
        }
        if (!ToMillis(random.max_interval, random.unit).has_value()) {
            return std::string("maxInterval is too large.");
        }
        return std::nullopt;
    }

    static std::optional<std::string> CheckTimeZone(const std::string& time_zone) {
        if (!time_zone.empty() && !cron::IsValidTimeZone(time_zone)) {
            return "invalid timezone \"" + time_zone + "\".";
        }
        return std::nullopt;
    }
};

}  // namespace

std::optional<long long> ComputeNextRun(const ScheduleSpec& spec, long long from_ms) {
    return std::visit(NextRunVisitor{from_ms}, spec);
}

std::optional<long long> ComputeNextRun(const ScheduleRecord& record, long long from_ms) {
    return ComputeNextRun(record.schedule, from_ms);
}

std::optional<std::string> ValidateSchedule(const ScheduleRecord& record) {
    if (!IsSafeId(record.id)) {
        return "invalid schedule id \"" + record.id + "\".";
    }
    if (utils::Trim(record.command).empty()) {
        return std::string("command is required.");
    }
    return std::visit(SpecValidator{}, record.schedule);
}

}  // namespace cadence::schedule
