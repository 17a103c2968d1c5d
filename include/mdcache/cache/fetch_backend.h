#pragma once

#include <string>
#include <vector>

#include "mdcache/cache/coverage_index.h"
#include "mdcache/core/result.h"
#include "mdcache/core/types.h"

namespace mdcache {
namespace cache {

/**
 * @brief One backend call: a single chunk of a page's fetch plan
 */
struct FetchRequest {
    std::string symbol;
    std::string sub_key;
    core::TimeRange range;
    // What the coverage index already knows about range. A backend fronting
    // a local store may serve FULL ranges without going to the network.
    CoverageLevel known_level{CoverageLevel::MISSING};
    bool refresh{false};   // Caller wants fresh data even if known
};

/**
 * @brief Source of records for one data kind (network client, local store)
 *
 * Implementations must be thread-safe: the page manager calls fetch() from
 * several worker threads at once. Failures are reported through the Result
 * code; TIMEOUT, RESOURCE_EXHAUSTED and UNAVAILABLE mark the page retryable.
 * Records outside the requested range are discarded by the caller.
 */
template<typename R>
class FetchBackend {
public:
    virtual ~FetchBackend() = default;

    virtual core::Result<std::vector<R>> fetch(const FetchRequest& request) = 0;

    virtual std::string name() const = 0;
};

} // namespace cache
} // namespace mdcache
