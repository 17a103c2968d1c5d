#pragma once

#include <vector>

#include "mdcache/core/types.h"

namespace mdcache {
namespace cache {

/**
 * @brief Sorted set of disjoint half-open time ranges
 *
 * Adjacent and overlapping ranges are coalesced on insertion, so the
 * representation of a covered extent is unique. Not thread-safe; callers
 * hold the owning page's lock.
 */
class RangeSet {
public:
    RangeSet() = default;
    explicit RangeSet(const std::vector<core::TimeRange>& ranges);

    void add(const core::TimeRange& range);
    void add(const RangeSet& other);
    void subtract(const core::TimeRange& range);
    void clear() { ranges_.clear(); }

    /**
     * @brief Maximal sub-ranges of range not covered by this set
     */
    std::vector<core::TimeRange> gaps(const core::TimeRange& range) const;

    RangeSet intersect(const core::TimeRange& range) const;

    bool empty() const { return ranges_.empty(); }
    size_t size() const { return ranges_.size(); }
    const std::vector<core::TimeRange>& ranges() const { return ranges_; }

    bool operator==(const RangeSet& other) const { return ranges_ == other.ranges_; }
    bool operator!=(const RangeSet& other) const { return !(*this == other); }

private:
    std::vector<core::TimeRange> ranges_;
};

} // namespace cache
} // namespace mdcache
