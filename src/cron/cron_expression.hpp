#pragma once

#include <bitset>
#include <optional>
#include <string>

#include "cron/time_zone.hpp"

namespace cadence::cron {

// Upper bound of the forward scan: one leap year of minutes.
constexpr int kMaxScanMinutes = 366 * 24 * 60;

// A parsed 5-field cron expression: minute hour day-of-month month weekday.
// Every field accepts "*", lists ("1,5"), ranges ("1-5") and steps ("*/15",
// "10/5", "1-30/2"). Weekday 0 is Sunday. A candidate matches when all five
// fields contain its wall-clock value.
class CronExpression {
public:
    // Returns nullopt unless there are exactly five fields and each of them
    // keeps at least one in-range value.
    static std::optional<CronExpression> Parse(const std::string& expr);

    bool Matches(const CivilTime& time) const;

    // First minute boundary strictly after from_ms that matches, evaluated in
    // time_zone (host zone when empty). nullopt when nothing matches within
    // kMaxScanMinutes.
    std::optional<long long> NextRun(long long from_ms, const std::string& time_zone = {}) const;

    const std::string& Source() const { return source_; }

private:
    CronExpression() = default;

    std::string source_;
    std::bitset<64> minutes_;
    std::bitset<64> hours_;
    std::bitset<64> days_;
    std::bitset<64> months_;
    std::bitset<64> weekdays_;
};

std::optional<long long> GetNextCronRun(const std::string& expr,
                                        long long from_ms,
                                        const std::string& time_zone = {});

}  // namespace cadence::cron
