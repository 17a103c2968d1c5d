#include "mdcache/cache/coverage_index.h"

#include <algorithm>
#include <iterator>

#include "mdcache/common/logger.h"
#include "mdcache/core/error.h"

namespace mdcache {
namespace cache {

const char* to_string(CoverageLevel level) {
    switch (level) {
        case CoverageLevel::MISSING:
            return "MISSING";
        case CoverageLevel::PARTIAL:
            return "PARTIAL";
        case CoverageLevel::FULL:
            return "FULL";
    }
    return "UNKNOWN";
}

CoverageIndex::CoverageIndex(core::SeriesKey key, core::Duration bucket, size_t consolidate_threshold)
    : key_(std::move(key)), bucket_(bucket), consolidate_threshold_(consolidate_threshold) {
    if (bucket_ <= 0) {
        throw core::InvalidArgumentError("Coverage bucket must be positive");
    }
}

std::vector<core::TimeRange> CoverageIndex::full_complement(const core::TimeRange& range) const {
    std::vector<core::TimeRange> gaps;
    core::Timestamp cursor = range.start;
    for (const auto& interval : intervals_) {
        if (interval.level != CoverageLevel::FULL || interval.range.end <= cursor) {
            continue;
        }
        if (interval.range.start >= range.end) {
            break;
        }
        if (interval.range.start > cursor) {
            gaps.emplace_back(cursor, interval.range.start);
        }
        cursor = std::max(cursor, interval.range.end);
        if (cursor >= range.end) {
            break;
        }
    }
    if (cursor < range.end) {
        gaps.emplace_back(cursor, range.end);
    }
    return gaps;
}

std::vector<core::TimeRange> CoverageIndex::query_gaps(const core::TimeRange& range) const {
    if (range.empty()) {
        return {};
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);

    // Fast path: the whole query sits inside one FULL interval
    auto it = std::upper_bound(intervals_.begin(), intervals_.end(), range.start,
                               [](core::Timestamp ts, const CoverageInterval& interval) {
                                   return ts < interval.range.start;
                               });
    if (it != intervals_.begin()) {
        const auto& candidate = *std::prev(it);
        if (candidate.level == CoverageLevel::FULL && candidate.range.contains(range)) {
            return {};
        }
    }

    auto gaps = full_complement(range);
    if (gaps.size() == 1 && gaps[0] == range) {
        return gaps;
    }

    // Holes shorter than one bucket next to FULL data are satisfied,
    // wherever they sit in the query
    std::vector<core::TimeRange> result;
    result.reserve(gaps.size());
    for (const auto& gap : gaps) {
        if (gap.duration() < bucket_) {
            continue;
        }
        result.push_back(gap);
    }
    return result;
}

void CoverageIndex::merge(const core::TimeRange& range, CoverageLevel level) {
    if (range.empty() || level == CoverageLevel::MISSING) {
        return;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    std::vector<CoverageInterval> out;
    out.reserve(intervals_.size() + 3);
    core::Timestamp cursor = range.start;

    for (const auto& existing : intervals_) {
        const auto& r = existing.range;
        if (r.end <= range.start) {
            out.push_back(existing);
            continue;
        }
        if (r.start >= range.end) {
            if (cursor < range.end) {
                out.emplace_back(core::TimeRange(cursor, range.end), level);
                cursor = range.end;
            }
            out.push_back(existing);
            continue;
        }

        if (r.start < range.start) {
            out.emplace_back(core::TimeRange(r.start, range.start), existing.level);
        }
        if (cursor < r.start) {
            out.emplace_back(core::TimeRange(cursor, r.start), level);
        }
        core::TimeRange overlap = r.intersect(range);
        out.emplace_back(overlap, std::max(existing.level, level));
        cursor = overlap.end;
        if (r.end > range.end) {
            out.emplace_back(core::TimeRange(range.end, r.end), existing.level);
        }
    }
    if (cursor < range.end) {
        out.emplace_back(core::TimeRange(cursor, range.end), level);
    }

    intervals_.swap(out);
    coalesce();

    if (intervals_.size() > consolidate_threshold_) {
        const size_t before = intervals_.size();
        consolidate();
        MDCACHE_DEBUG("Consolidated coverage for {}: {} -> {} intervals",
                      key_.to_string(), before, intervals_.size());
    }
}

void CoverageIndex::coalesce() {
    if (intervals_.size() < 2) {
        return;
    }
    std::vector<CoverageInterval> out;
    out.reserve(intervals_.size());
    for (const auto& interval : intervals_) {
        if (!out.empty() && out.back().level == interval.level &&
            out.back().range.end == interval.range.start) {
            out.back().range.end = interval.range.end;
        } else {
            out.push_back(interval);
        }
    }
    intervals_.swap(out);
}

void CoverageIndex::consolidate() {
    std::vector<CoverageInterval> out;
    out.reserve(intervals_.size());
    for (const auto& interval : intervals_) {
        if (!out.empty() && out.back().level == interval.level &&
            interval.range.start - out.back().range.end < bucket_) {
            out.back().range.end = interval.range.end;
        } else {
            out.push_back(interval);
        }
    }
    intervals_.swap(out);
}

CoverageLevel CoverageIndex::level_of(const core::TimeRange& range) const {
    if (range.empty()) {
        return CoverageLevel::FULL;
    }
    std::shared_lock<std::shared_mutex> lock(mutex_);

    CoverageLevel lowest = CoverageLevel::FULL;
    core::Timestamp cursor = range.start;
    for (const auto& interval : intervals_) {
        if (interval.range.end <= cursor) {
            continue;
        }
        if (interval.range.start >= range.end) {
            break;
        }
        if (interval.range.start > cursor) {
            return CoverageLevel::MISSING;
        }
        lowest = std::min(lowest, interval.level);
        cursor = interval.range.end;
        if (cursor >= range.end) {
            break;
        }
    }
    if (cursor < range.end) {
        return CoverageLevel::MISSING;
    }
    return lowest;
}

CoverageLevel CoverageIndex::level_at(core::Timestamp ts) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& interval : intervals_) {
        if (interval.range.contains(ts)) {
            return interval.level;
        }
        if (interval.range.start > ts) {
            break;
        }
    }
    return CoverageLevel::MISSING;
}

bool CoverageIndex::is_fully_covered(const core::TimeRange& range) const {
    return query_gaps(range).empty();
}

std::vector<CoverageInterval> CoverageIndex::intervals() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return intervals_;
}

CoverageSummary CoverageIndex::summary() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    CoverageSummary summary;
    summary.key = key_;
    summary.interval_count = intervals_.size();
    if (intervals_.empty()) {
        return summary;
    }
    summary.min_start = intervals_.front().range.start;
    summary.max_end = intervals_.back().range.end;
    for (const auto& interval : intervals_) {
        if (interval.level == CoverageLevel::FULL) {
            summary.full_duration += interval.range.duration();
        }
    }
    summary.gaps = full_complement(core::TimeRange(summary.min_start, summary.max_end));
    return summary;
}

size_t CoverageIndex::interval_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return intervals_.size();
}

void CoverageIndex::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    intervals_.clear();
}

CoverageRegistry::CoverageRegistry(const core::CoverageConfig& config) : config_(config) {
    auto result = config_.validate();
    if (!result.ok()) {
        throw core::InvalidArgumentError(result.error());
    }
}

std::shared_ptr<CoverageIndex> CoverageRegistry::get_or_create(const core::SeriesKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = indexes_.find(key);
    if (it != indexes_.end()) {
        return it->second;
    }
    auto index = std::make_shared<CoverageIndex>(key, config_.bucket_for(key.kind),
                                                 config_.consolidate_threshold);
    indexes_.emplace(key, index);
    return index;
}

std::shared_ptr<CoverageIndex> CoverageRegistry::find(const core::SeriesKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = indexes_.find(key);
    return it == indexes_.end() ? nullptr : it->second;
}

std::vector<CoverageSummary> CoverageRegistry::summaries() const {
    std::vector<std::shared_ptr<CoverageIndex>> indexes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        indexes.reserve(indexes_.size());
        for (const auto& entry : indexes_) {
            indexes.push_back(entry.second);
        }
    }
    std::vector<CoverageSummary> result;
    result.reserve(indexes.size());
    for (const auto& index : indexes) {
        result.push_back(index->summary());
    }
    return result;
}

size_t CoverageRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return indexes_.size();
}

} // namespace cache
} // namespace mdcache
