#pragma once

#include <optional>
#include <string>

#include "schedule/schedule_types.hpp"

namespace cadence::schedule {

// Next fire time strictly after from_ms, or nullopt when it cannot be computed
// (unparsable or past "once" time, bad cron, non-positive or inverted bounds).
// Invalid time zone names are ignored here and rejected by ValidateSchedule.
std::optional<long long> ComputeNextRun(const ScheduleSpec& spec, long long from_ms);
std::optional<long long> ComputeNextRun(const ScheduleRecord& record, long long from_ms);

// Error message for a record that must not be created, nullopt when it is fine.
std::optional<std::string> ValidateSchedule(const ScheduleRecord& record);

}  // namespace cadence::schedule
