#include "mdcache/core/types.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>

namespace mdcache {
namespace core {

const char* to_string(DataKind kind) {
    switch (kind) {
        case DataKind::CANDLES:
            return "CANDLES";
        case DataKind::FUNDING:
            return "FUNDING";
        case DataKind::OPEN_INTEREST:
            return "OPEN_INTEREST";
        case DataKind::AGG_TRADES:
            return "AGG_TRADES";
        case DataKind::PREMIUM_INDEX:
            return "PREMIUM_INDEX";
        case DataKind::INDICATOR:
            return "INDICATOR";
    }
    return "UNKNOWN";
}

const char* to_string(PageState state) {
    switch (state) {
        case PageState::EMPTY:
            return "EMPTY";
        case PageState::LOADING:
            return "LOADING";
        case PageState::READY:
            return "READY";
        case PageState::UPDATING:
            return "UPDATING";
        case PageState::ERROR:
            return "ERROR";
    }
    return "UNKNOWN";
}

TimeRange TimeRange::intersect(const TimeRange& other) const {
    TimeRange result(std::max(start, other.start), std::min(end, other.end));
    if (result.end < result.start) {
        result.end = result.start;
    }
    return result;
}

TimeRange TimeRange::hull(const TimeRange& other) const {
    if (empty()) {
        return other;
    }
    if (other.empty()) {
        return *this;
    }
    return TimeRange(std::min(start, other.start), std::max(end, other.end));
}

std::string TimeRange::to_string() const {
    std::ostringstream oss;
    oss << "[" << start << ", " << end << ")";
    return oss.str();
}

std::string SeriesKey::to_string() const {
    std::ostringstream oss;
    oss << core::to_string(kind) << ":" << symbol << ":" << sub_key;
    return oss.str();
}

std::optional<Duration> parse_timeframe(const std::string& timeframe) {
    if (timeframe.size() < 2) {
        return std::nullopt;
    }
    const char unit = timeframe.back();
    const std::string digits = timeframe.substr(0, timeframe.size() - 1);
    if (digits.size() > 9 ||
        !std::all_of(digits.begin(), digits.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }

    const Duration count = std::stoll(digits);
    if (count <= 0) {
        return std::nullopt;
    }

    switch (unit) {
        case 's':
            return count * kSecondMs;
        case 'm':
            return count * kMinuteMs;
        case 'h':
            return count * kHourMs;
        case 'd':
            return count * kDayMs;
        case 'w':
            return count * 7 * kDayMs;
        case 'M':
            return count * kMonthMs;
        default:
            return std::nullopt;
    }
}

std::optional<Duration> expected_record_interval(DataKind kind, const std::string& sub_key) {
    switch (kind) {
        case DataKind::CANDLES:
        case DataKind::PREMIUM_INDEX:
        case DataKind::INDICATOR:
            return parse_timeframe(sub_key);
        case DataKind::FUNDING:
            // Perpetual futures settle funding every 8 hours
            return 8 * kHourMs;
        case DataKind::OPEN_INTEREST: {
            auto period = parse_timeframe(sub_key);
            return period ? period : std::optional<Duration>(5 * kMinuteMs);
        }
        case DataKind::AGG_TRADES:
            return std::nullopt;
    }
    return std::nullopt;
}

Timestamp align_down(Timestamp ts, Duration step) {
    if (step <= 1) {
        return ts;
    }
    Timestamp rem = ts % step;
    if (rem < 0) {
        rem += step;
    }
    return ts - rem;
}

Timestamp align_up(Timestamp ts, Duration step) {
    const Timestamp down = align_down(ts, step);
    return down == ts ? ts : down + step;
}

TimeRange align_outward(const TimeRange& range, Duration step) {
    return TimeRange(align_down(range.start, step), align_up(range.end, step));
}

Timestamp now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace core
} // namespace mdcache
