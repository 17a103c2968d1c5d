#pragma once

#include <string>
#include <vector>

#include "mdcache/core/types.h"

namespace mdcache {
namespace cache {

/**
 * @brief Identity of a page: series plus aligned range
 *
 * Two keys describe the same page when the series matches and the ranges
 * overlap sufficiently; see PageManager::request for the selection rules.
 */
struct PageKey {
    core::DataKind kind{core::DataKind::CANDLES};
    std::string symbol;
    std::string sub_key;
    core::TimeRange range;

    PageKey() = default;
    PageKey(core::DataKind k, std::string sym, std::string sub, core::TimeRange r)
        : kind(k), symbol(std::move(sym)), sub_key(std::move(sub)), range(r) {}

    core::SeriesKey series() const { return core::SeriesKey{kind, symbol, sub_key}; }

    bool same_series(const PageKey& other) const {
        return kind == other.kind && symbol == other.symbol && sub_key == other.sub_key;
    }

    /**
     * @brief "KIND:SYMBOL:SUBKEY:start:end"
     */
    std::string to_string() const;

    bool operator==(const PageKey& other) const {
        return same_series(other) && range == other.range;
    }
    bool operator!=(const PageKey& other) const { return !(*this == other); }
};

/**
 * @brief Read-only point-in-time projection of one page for dashboards
 */
struct PageInfo {
    std::string id;                 // Stable identifier, also the event log key
    PageKey key;                    // Current key; the range may have grown
    core::PageState state{core::PageState::EMPTY};
    size_t consumer_count{0};
    size_t listener_count{0};
    size_t record_count{0};
    int load_progress{0};           // 0-100, -1 when indeterminate
    std::string error;              // Empty unless state is ERROR
    bool retryable{false};
    std::vector<core::TimeRange> failed_ranges;
    std::vector<std::string> consumers;
    std::vector<core::TimeRange> coverage;
    core::Timestamp last_sync_time{0};
    uint64_t data_version{0};
    bool idle{false};               // No consumers, waiting for eviction
};

} // namespace cache
} // namespace mdcache
