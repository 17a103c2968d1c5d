#ifndef MDCACHE_CORE_TYPES_H_
#define MDCACHE_CORE_TYPES_H_

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>

namespace mdcache {
namespace core {

/**
 * @brief Represents a timestamp in milliseconds since Unix epoch
 */
using Timestamp = int64_t;

/**
 * @brief Represents a duration in milliseconds
 */
using Duration = int64_t;

constexpr Duration kSecondMs = 1'000;
constexpr Duration kMinuteMs = 60 * kSecondMs;
constexpr Duration kHourMs = 60 * kMinuteMs;
constexpr Duration kDayMs = 24 * kHourMs;
constexpr Duration kMonthMs = 30 * kDayMs;  // storage month, not calendar month

/**
 * @brief Sub-key used by data kinds that have no sub-resolution
 */
constexpr const char* kDefaultSubKey = "default";

/**
 * @brief Kinds of market data served by the page cache
 */
enum class DataKind : uint8_t {
    CANDLES,
    FUNDING,
    OPEN_INTEREST,
    AGG_TRADES,
    PREMIUM_INDEX,
    INDICATOR
};

/**
 * @brief Lifecycle state of a cached page
 *
 * EMPTY -> LOADING -> READY -> UPDATING -> READY, with ERROR reachable from
 * LOADING and UPDATING and left again through LOADING on retry.
 */
enum class PageState : uint8_t {
    EMPTY,
    LOADING,
    READY,
    UPDATING,
    ERROR
};

const char* to_string(DataKind kind);
const char* to_string(PageState state);

/**
 * @brief Half-open time interval [start, end)
 */
struct TimeRange {
    Timestamp start{0};
    Timestamp end{0};

    TimeRange() = default;
    TimeRange(Timestamp s, Timestamp e) : start(s), end(e) {}

    Duration duration() const { return end > start ? end - start : 0; }
    bool empty() const { return end <= start; }
    bool contains(Timestamp ts) const { return ts >= start && ts < end; }
    bool contains(const TimeRange& other) const {
        return other.start >= start && other.end <= end;
    }
    bool overlaps(const TimeRange& other) const {
        return other.start < end && start < other.end;
    }
    // Overlapping or adjacent
    bool touches(const TimeRange& other) const {
        return other.start <= end && start <= other.end;
    }

    TimeRange intersect(const TimeRange& other) const;
    TimeRange hull(const TimeRange& other) const;
    std::string to_string() const;

    bool operator==(const TimeRange& other) const {
        return start == other.start && end == other.end;
    }
    bool operator!=(const TimeRange& other) const { return !(*this == other); }
};

/**
 * @brief Identity of one time series: data kind, symbol and sub-key
 *
 * The sub-key is the timeframe for candles and premium index, the sampling
 * period for open interest and kDefaultSubKey otherwise.
 */
struct SeriesKey {
    DataKind kind{DataKind::CANDLES};
    std::string symbol;
    std::string sub_key;

    std::string to_string() const;

    bool operator==(const SeriesKey& other) const {
        return kind == other.kind && symbol == other.symbol && sub_key == other.sub_key;
    }
    bool operator!=(const SeriesKey& other) const { return !(*this == other); }
    bool operator<(const SeriesKey& other) const {
        return std::tie(kind, symbol, sub_key) < std::tie(other.kind, other.symbol, other.sub_key);
    }
};

/**
 * @brief Parses a Binance-style timeframe ("1m", "4h", "1d", "1w", "1M")
 * @return Duration in milliseconds, or std::nullopt if unrecognised
 */
std::optional<Duration> parse_timeframe(const std::string& timeframe);

/**
 * @brief Spacing between consecutive records of a series, if fixed
 *
 * Used to estimate the expected record count of a fetch. Aggregated trades
 * have no fixed spacing and return std::nullopt.
 */
std::optional<Duration> expected_record_interval(DataKind kind, const std::string& sub_key);

Timestamp align_down(Timestamp ts, Duration step);
Timestamp align_up(Timestamp ts, Duration step);

/**
 * @brief Widens a range outward to multiples of step
 */
TimeRange align_outward(const TimeRange& range, Duration step);

/**
 * @brief Current wall-clock time in milliseconds
 */
Timestamp now_ms();

} // namespace core
} // namespace mdcache

#endif // MDCACHE_CORE_TYPES_H_
