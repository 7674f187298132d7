#include "cron/cron_expression.hpp"

#include <sstream>
#include <vector>

namespace cadence::cron {
namespace {

constexpr long long kMinuteMs = 60 * 1000;

bool ParseNumber(const std::string& text, int& out) {
    if (text.empty() || text.size() > 4) {
        return false;
    }
    int value = 0;
    for (const char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

// Adds the values described by one comma-separated part. Malformed parts and
// out-of-range values add nothing.
void AddPart(const std::string& part, int min, int max, std::bitset<64>& out) {
    if (part.empty()) {
        return;
    }
    std::string base = part;
    int step = 1;
    const auto slash = part.find('/');
    if (slash != std::string::npos) {
        base = part.substr(0, slash);
        if (!ParseNumber(part.substr(slash + 1), step) || step <= 0) {
            return;
        }
    }

    int low = 0;
    int high = 0;
    if (base == "*") {
        low = min;
        high = max;
    } else {
        const auto dash = base.find('-');
        if (dash != std::string::npos) {
            if (!ParseNumber(base.substr(0, dash), low) || !ParseNumber(base.substr(dash + 1), high)) {
                return;
            }
        } else {
            if (!ParseNumber(base, low)) {
                return;
            }
            high = slash != std::string::npos ? max : low;
        }
    }
    if (low > high) {
        return;
    }
    for (int value = low; value <= high; value += step) {
        if (value >= min && value <= max) {
            out.set(static_cast<std::size_t>(value));
        }
    }
}

std::optional<std::bitset<64>> ParseField(const std::string& field, int min, int max) {
    std::bitset<64> values;
    std::stringstream stream(field);
    std::string part;
    while (std::getline(stream, part, ',')) {
        AddPart(part, min, max, values);
    }
    if (values.none()) {
        return std::nullopt;
    }
    return values;
}

long long FloorToMinute(long long epoch_ms) {
    long long minutes = epoch_ms / kMinuteMs;
    if (epoch_ms % kMinuteMs != 0 && epoch_ms < 0) {
        --minutes;
    }
    return minutes * kMinuteMs;
}

}  // namespace

std::optional<CronExpression> CronExpression::Parse(const std::string& expr) {
    std::istringstream stream(expr);
    std::vector<std::string> fields;
    std::string field;
    while (stream >> field) {
        fields.push_back(field);
    }
    if (fields.size() != 5) {
        return std::nullopt;
    }

    const auto minutes = ParseField(fields[0], 0, 59);
    const auto hours = ParseField(fields[1], 0, 23);
    const auto days = ParseField(fields[2], 1, 31);
    const auto months = ParseField(fields[3], 1, 12);
    const auto weekdays = ParseField(fields[4], 0, 6);
    if (!minutes || !hours || !days || !months || !weekdays) {
        return std::nullopt;
    }

    CronExpression parsed;
    parsed.source_ = expr;
    parsed.minutes_ = *minutes;
    parsed.hours_ = *hours;
    parsed.days_ = *days;
    parsed.months_ = *months;
    parsed.weekdays_ = *weekdays;
    return parsed;
}

bool CronExpression::Matches(const CivilTime& time) const {
    const auto in = [](const std::bitset<64>& set, int value) {
        return value >= 0 && value < 64 && set.test(static_cast<std::size_t>(value));
    };
    return in(minutes_, time.minute) &&
           in(hours_, time.hour) &&
           in(days_, time.day) &&
           in(months_, time.month) &&
           in(weekdays_, time.weekday);
}

std::optional<long long> CronExpression::NextRun(long long from_ms, const std::string& time_zone) const {
    ScopedTimeZone zone(time_zone);
    long long candidate = FloorToMinute(from_ms) + kMinuteMs;
    for (int i = 0; i < kMaxScanMinutes; ++i, candidate += kMinuteMs) {
        if (Matches(zone.ToCivil(candidate))) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::optional<long long> GetNextCronRun(const std::string& expr, long long from_ms, const std::string& time_zone) {
    const auto parsed = CronExpression::Parse(expr);
    if (!parsed.has_value()) {
        return std::nullopt;
    }
    return parsed->NextRun(from_ms, time_zone);
}

}  // namespace cadence::cron
