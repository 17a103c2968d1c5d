#include "mdcache/cache/range_set.h"

#include <algorithm>

namespace mdcache {
namespace cache {

RangeSet::RangeSet(const std::vector<core::TimeRange>& ranges) {
    for (const auto& range : ranges) {
        add(range);
    }
}

void RangeSet::add(const core::TimeRange& range) {
    if (range.empty()) {
        return;
    }

    // First member that ends at or after range.start may touch it
    auto first = std::lower_bound(ranges_.begin(), ranges_.end(), range.start,
                                  [](const core::TimeRange& r, core::Timestamp ts) {
                                      return r.end < ts;
                                  });
    core::TimeRange merged = range;
    auto last = first;
    while (last != ranges_.end() && last->start <= merged.end) {
        merged = merged.hull(*last);
        ++last;
    }
    first = ranges_.erase(first, last);
    ranges_.insert(first, merged);
}

void RangeSet::add(const RangeSet& other) {
    for (const auto& range : other.ranges_) {
        add(range);
    }
}

void RangeSet::subtract(const core::TimeRange& range) {
    if (range.empty() || ranges_.empty()) {
        return;
    }
    std::vector<core::TimeRange> out;
    out.reserve(ranges_.size() + 1);
    for (const auto& r : ranges_) {
        if (!r.overlaps(range)) {
            out.push_back(r);
            continue;
        }
        if (r.start < range.start) {
            out.emplace_back(r.start, range.start);
        }
        if (r.end > range.end) {
            out.emplace_back(range.end, r.end);
        }
    }
    ranges_.swap(out);
}

std::vector<core::TimeRange> RangeSet::gaps(const core::TimeRange& range) const {
    std::vector<core::TimeRange> result;
    if (range.empty()) {
        return result;
    }
    core::Timestamp cursor = range.start;
    for (const auto& r : ranges_) {
        if (r.end <= cursor) {
            continue;
        }
        if (r.start >= range.end) {
            break;
        }
        if (r.start > cursor) {
            result.emplace_back(cursor, r.start);
        }
        cursor = std::max(cursor, r.end);
        if (cursor >= range.end) {
            break;
        }
    }
    if (cursor < range.end) {
        result.emplace_back(cursor, range.end);
    }
    return result;
}

RangeSet RangeSet::intersect(const core::TimeRange& range) const {
    RangeSet result;
    for (const auto& r : ranges_) {
        auto clipped = r.intersect(range);
        if (!clipped.empty()) {
            result.ranges_.push_back(clipped);
        }
    }
    return result;
}

} // namespace cache
} // namespace mdcache
