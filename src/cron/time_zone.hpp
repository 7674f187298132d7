#pragma once

#include <mutex>
#include <optional>
#include <string>

namespace cadence::cron {

// Wall-clock breakdown of an instant. month is 1-12, weekday 0 (Sunday) - 6.
struct CivilTime {
    int year = 1970;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int weekday = 4;
};

// True for "UTC" and for any IANA name that resolves to a zoneinfo file.
bool IsValidTimeZone(const std::string& name);

// Switches the process time zone (TZ) for its lifetime and restores the previous
// value afterwards. An empty name keeps the host zone. All conversions in this
// module go through a ScopedTimeZone, which serializes them on one mutex.
class ScopedTimeZone {
public:
    explicit ScopedTimeZone(const std::string& name);
    ~ScopedTimeZone();

    ScopedTimeZone(const ScopedTimeZone&) = delete;
    ScopedTimeZone& operator=(const ScopedTimeZone&) = delete;

    CivilTime ToCivil(long long epoch_ms) const;

    // Interprets the wall-clock fields in the active zone (mktime semantics).
    std::optional<long long> FromCivil(const CivilTime& civil) const;

private:
    std::unique_lock<std::mutex> lock_;
    bool switched_ = false;
    bool had_previous_ = false;
    std::string previous_;
};

CivilTime ToCivilTime(long long epoch_ms, const std::string& time_zone);

// Wall clock minus UTC at the given instant, in milliseconds.
long long ZoneOffsetMs(long long epoch_ms, const std::string& time_zone);

// Treats the wall-clock fields as UTC.
long long CivilToUtcMs(const CivilTime& civil);

// Parses "YYYY-MM-DD[(T| )HH:MM[:SS[.fff]]][Z|+HH:MM]". An explicit offset is honored
// literally; otherwise the fields are wall-clock time in time_zone, or in the host
// zone when time_zone is empty.
std::optional<long long> ParseScheduledTime(const std::string& value, const std::string& time_zone);

// "2026-02-01T00:05:00.000Z"
std::string FormatIsoUtc(long long epoch_ms);

}  // namespace cadence::cron
