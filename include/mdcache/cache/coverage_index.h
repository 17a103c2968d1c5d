#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>

#include "mdcache/core/config.h"
#include "mdcache/core/types.h"

namespace mdcache {
namespace cache {

/**
 * @brief How completely an interval of a series is known to be present
 *
 * Levels are ordered: on overlap the higher level wins.
 */
enum class CoverageLevel : uint8_t {
    MISSING = 0,
    PARTIAL = 1,
    FULL = 2
};

const char* to_string(CoverageLevel level);

struct CoverageInterval {
    core::TimeRange range;
    CoverageLevel level{CoverageLevel::MISSING};

    CoverageInterval() = default;
    CoverageInterval(core::TimeRange r, CoverageLevel l) : range(r), level(l) {}

    bool operator==(const CoverageInterval& other) const {
        return range == other.range && level == other.level;
    }
};

/**
 * @brief Dashboard view of one coverage index
 */
struct CoverageSummary {
    core::SeriesKey key;
    core::Timestamp min_start{0};
    core::Timestamp max_end{0};
    core::Duration full_duration{0};
    std::vector<core::TimeRange> gaps;  // Non-FULL holes inside [min_start, max_end)
    size_t interval_count{0};
};

/**
 * @brief Known coverage of one (kind, symbol, sub-key) series
 *
 * Stores an ordered list of disjoint PARTIAL/FULL intervals. Anything not
 * stored is MISSING. Readers take a shared lock, merges an exclusive one.
 *
 * Thread-safe.
 */
class CoverageIndex {
public:
    /**
     * @brief Construct an empty index
     * @param key Series this index describes
     * @param bucket Comparison granularity; holes shorter than this next to
     *               FULL data are not reported as gaps
     * @param consolidate_threshold Interval count above which sub-bucket holes
     *               between equal-level neighbours are bridged
     * @throws core::InvalidArgumentError if bucket is not positive
     */
    CoverageIndex(core::SeriesKey key, core::Duration bucket, size_t consolidate_threshold = 50);

    /**
     * @brief Maximal sub-ranges of range that are not FULL
     *
     * An index with no FULL data inside range returns the whole range as
     * one gap, however short.
     */
    std::vector<core::TimeRange> query_gaps(const core::TimeRange& range) const;

    /**
     * @brief Record a newly confirmed extent
     *
     * Overlapping intervals are split so the index stays disjoint. On
     * overlap the higher level wins, which makes merge order-independent.
     * Merging MISSING never lowers existing knowledge and is a no-op.
     */
    void merge(const core::TimeRange& range, CoverageLevel level);

    /**
     * @brief Lowest level found anywhere inside range
     */
    CoverageLevel level_of(const core::TimeRange& range) const;

    CoverageLevel level_at(core::Timestamp ts) const;

    bool is_fully_covered(const core::TimeRange& range) const;

    std::vector<CoverageInterval> intervals() const;

    CoverageSummary summary() const;

    size_t interval_count() const;

    void clear();

    const core::SeriesKey& key() const { return key_; }
    core::Duration bucket() const { return bucket_; }

private:
    std::vector<core::TimeRange> full_complement(const core::TimeRange& range) const;
    void coalesce();
    void consolidate();

    const core::SeriesKey key_;
    const core::Duration bucket_;
    const size_t consolidate_threshold_;

    mutable std::shared_mutex mutex_;
    std::vector<CoverageInterval> intervals_;
};

/**
 * @brief Owner of every coverage index, keyed by series
 *
 * Indexes are created on first use and live as long as the registry, so
 * coverage knowledge outlives evicted pages.
 */
class CoverageRegistry {
public:
    explicit CoverageRegistry(const core::CoverageConfig& config = core::CoverageConfig::Default());

    std::shared_ptr<CoverageIndex> get_or_create(const core::SeriesKey& key);

    /**
     * @return The index, or nullptr when nothing was recorded for key
     */
    std::shared_ptr<CoverageIndex> find(const core::SeriesKey& key) const;

    std::vector<CoverageSummary> summaries() const;

    size_t size() const;

    const core::CoverageConfig& config() const { return config_; }

private:
    core::CoverageConfig config_;
    mutable std::mutex mutex_;
    std::map<core::SeriesKey, std::shared_ptr<CoverageIndex>> indexes_;
};

} // namespace cache
} // namespace mdcache
