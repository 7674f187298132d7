#include "cron/time_zone.hpp"

#include <cctype>
#include <cstdlib>
#include <ctime>
#include <cstdio>
#include <filesystem>
#include <regex>

#include "utils/common.hpp"

namespace cadence::cron {
namespace {

std::mutex g_tz_mutex;

long long FloorDiv(long long value, long long divisor) {
    long long quotient = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --quotient;
    }
    return quotient;
}

std::filesystem::path ZoneInfoDir() {
    const char* tzdir = std::getenv("TZDIR");
    if (tzdir && *tzdir) {
        return std::filesystem::path(tzdir);
    }
    return std::filesystem::path("/usr/share/zoneinfo");
}

bool IsLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int DaysInMonth(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && IsLeapYear(year)) {
        return 29;
    }
    return kDays[month - 1];
}

std::tm ToTm(const CivilTime& civil) {
    std::tm tm{};
    tm.tm_year = civil.year - 1900;
    tm.tm_mon = civil.month - 1;
    tm.tm_mday = civil.day;
    tm.tm_hour = civil.hour;
    tm.tm_min = civil.minute;
    tm.tm_sec = civil.second;
    tm.tm_isdst = -1;
    return tm;
}

const std::regex& TimestampPattern() {
    static const std::regex pattern(
        R"(^(\d{4})-(\d{2})-(\d{2})(?:[T ](\d{2}):(\d{2})(?::(\d{2})(?:\.(\d{1,9}))?)?)?\s*([zZ]|[+-]\d{2}:?\d{2})?$)");
    return pattern;
}

int ParseMillis(const std::string& fraction) {
    if (fraction.empty()) {
        return 0;
    }
    std::string padded = fraction.substr(0, 3);
    while (padded.size() < 3) {
        padded.push_back('0');
    }
    return std::stoi(padded);
}

long long ParseOffsetMs(const std::string& offset) {
    if (offset.empty() || offset == "Z" || offset == "z") {
        return 0;
    }
    const int sign = offset[0] == '-' ? -1 : 1;
    const int hours = std::stoi(offset.substr(1, 2));
    const int minutes = std::stoi(offset.substr(offset.size() - 2, 2));
    return sign * (static_cast<long long>(hours) * 3600000LL + static_cast<long long>(minutes) * 60000LL);
}

}  // namespace

bool IsValidTimeZone(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    if (name == "UTC" || name == "Etc/UTC" || name == "GMT") {
        return true;
    }
    if (name.front() == '/' || name.find("..") != std::string::npos) {
        return false;
    }
    for (const char c : name) {
        const auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '/' && c != '_' && c != '-' && c != '+') {
            return false;
        }
    }
    std::error_code ec;
    return std::filesystem::is_regular_file(ZoneInfoDir() / name, ec);
}

ScopedTimeZone::ScopedTimeZone(const std::string& name)
    : lock_(g_tz_mutex) {
    if (name.empty()) {
        return;
    }
    const char* current = std::getenv("TZ");
    had_previous_ = current != nullptr;
    if (had_previous_) {
        previous_ = current;
    }
    ::setenv("TZ", name.c_str(), 1);
    ::tzset();
    switched_ = true;
}

ScopedTimeZone::~ScopedTimeZone() {
    if (!switched_) {
        return;
    }
    if (had_previous_) {
        ::setenv("TZ", previous_.c_str(), 1);
    } else {
        ::unsetenv("TZ");
    }
    ::tzset();
}

CivilTime ScopedTimeZone::ToCivil(long long epoch_ms) const {
    const std::time_t seconds = static_cast<std::time_t>(FloorDiv(epoch_ms, 1000));
    std::tm tm{};
    ::localtime_r(&seconds, &tm);
    CivilTime civil;
    civil.year = tm.tm_year + 1900;
    civil.month = tm.tm_mon + 1;
    civil.day = tm.tm_mday;
    civil.hour = tm.tm_hour;
    civil.minute = tm.tm_min;
    civil.second = tm.tm_sec;
    civil.weekday = tm.tm_wday;
    return civil;
}

std::optional<long long> ScopedTimeZone::FromCivil(const CivilTime& civil) const {
    std::tm tm = ToTm(civil);
    const std::time_t seconds = std::mktime(&tm);
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return static_cast<long long>(seconds) * 1000;
}

CivilTime ToCivilTime(long long epoch_ms, const std::string& time_zone) {
    ScopedTimeZone zone(time_zone);
    return zone.ToCivil(epoch_ms);
}

long long CivilToUtcMs(const CivilTime& civil) {
    std::tm tm = ToTm(civil);
    tm.tm_isdst = 0;
    return static_cast<long long>(::timegm(&tm)) * 1000;
}

long long ZoneOffsetMs(long long epoch_ms, const std::string& time_zone) {
    const auto civil = ToCivilTime(epoch_ms, time_zone);
    return CivilToUtcMs(civil) - FloorDiv(epoch_ms, 1000) * 1000;
}

std::optional<long long> ParseScheduledTime(const std::string& value, const std::string& time_zone) {
    const auto trimmed = utils::Trim(value);
    std::smatch match;
    if (trimmed.empty() || !std::regex_match(trimmed, match, TimestampPattern())) {
        return std::nullopt;
    }

    CivilTime civil;
    civil.year = std::stoi(match[1].str());
    civil.month = std::stoi(match[2].str());
    civil.day = std::stoi(match[3].str());
    civil.hour = match[4].matched ? std::stoi(match[4].str()) : 0;
    civil.minute = match[5].matched ? std::stoi(match[5].str()) : 0;
    civil.second = match[6].matched ? std::stoi(match[6].str()) : 0;
    const int millis = ParseMillis(match[7].matched ? match[7].str() : std::string());

    if (civil.month < 1 || civil.month > 12 ||
        civil.day < 1 || civil.day > DaysInMonth(civil.year, civil.month) ||
        civil.hour > 23 || civil.minute > 59 || civil.second > 59) {
        return std::nullopt;
    }

    if (match[8].matched) {
        return CivilToUtcMs(civil) + millis - ParseOffsetMs(match[8].str());
    }

    if (!time_zone.empty()) {
        const auto utc_guess = CivilToUtcMs(civil);
        return utc_guess - ZoneOffsetMs(utc_guess, time_zone) + millis;
    }

    ScopedTimeZone host_zone(std::string{});
    const auto local = host_zone.FromCivil(civil);
    if (!local.has_value()) {
        return std::nullopt;
    }
    return local.value() + millis;
}

std::string FormatIsoUtc(long long epoch_ms) {
    const std::time_t seconds = static_cast<std::time_t>(FloorDiv(epoch_ms, 1000));
    const long long millis = epoch_ms - FloorDiv(epoch_ms, 1000) * 1000;
    std::tm tm{};
    ::gmtime_r(&seconds, &tm);
    char buffer[40];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03lldZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
    return buffer;
}

}  // namespace cadence::cron
