#pragma once

#include <optional>
#include <string>

#include "nlohmann/json.hpp"
#include "schedule/schedule_types.hpp"

namespace cadence::schedule {

// camelCase record layout; absent optionals are omitted.
nlohmann::json ToJson(const ScheduleRecord& record);
nlohmann::json ToJson(const ScheduleSpec& spec);

// nullopt for anything that is not a well-formed record with an id.
std::optional<ScheduleRecord> RecordFromJson(const nlohmann::json& data);
std::optional<ScheduleRecord> ParseRecord(const std::string& text);

// Epoch milliseconds held in a JSON number; nullopt for non-numbers, non-finite
// values and values outside the range of long long.
std::optional<long long> MillisFromJson(const nlohmann::json& value);

}  // namespace cadence::schedule
