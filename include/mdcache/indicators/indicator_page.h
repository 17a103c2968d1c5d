#ifndef MDCACHE_INDICATORS_INDICATOR_PAGE_H_
#define MDCACHE_INDICATORS_INDICATOR_PAGE_H_

#include <memory>
#include <mutex>
#include <string>
#include <tuple>
#include <vector>

#include "mdcache/cache/page_key.h"
#include "mdcache/core/types.h"
#include "mdcache/indicators/indicator_calculator.h"

namespace mdcache {
namespace indicators {

class IndicatorPage;
class IndicatorPageManager;

/**
 * @brief Identity of a derived series: type, parameters and source page
 */
struct IndicatorKey {
    std::string type;        // Normalised upper-case type
    std::string params;      // Canonical parameter text
    std::string source_id;   // Stable id of the source candle page

    /**
     * @brief "TYPE(params)@source_id"
     */
    std::string to_string() const;

    bool operator==(const IndicatorKey& other) const {
        return type == other.type && params == other.params && source_id == other.source_id;
    }
    bool operator<(const IndicatorKey& other) const {
        return std::tie(type, params, source_id) < std::tie(other.type, other.params, other.source_id);
    }
};

/**
 * @brief Receiver of indicator page notifications, delivered on the notification thread
 */
class IndicatorListener {
public:
    virtual ~IndicatorListener() = default;

    virtual void on_state_changed(const std::shared_ptr<IndicatorPage>& page,
                                  core::PageState old_state,
                                  core::PageState new_state) = 0;

    virtual void on_data_changed(const std::shared_ptr<IndicatorPage>& page) = 0;
};

using IndicatorListenerPtr = std::shared_ptr<IndicatorListener>;

struct IndicatorSnapshot {
    std::shared_ptr<const std::vector<double>> values;
    std::shared_ptr<const std::vector<core::Timestamp>> timestamps;  // Aligned with values
    uint64_t source_version{0};
    core::PageState state{core::PageState::EMPTY};
    bool stale{false};
};

/**
 * @brief Cached indicator values derived from one candle page
 *
 * EMPTY while waiting for the source, READY once computed, ERROR when the
 * parameters are invalid, the computation failed or the source failed
 * before any value was computed. Values are aligned 1:1 with the source
 * records of the version they were computed from.
 */
class IndicatorPage : public std::enable_shared_from_this<IndicatorPage> {
public:
    IndicatorPage(IndicatorKey key, cache::PageKey source_key, IndicatorCalculatorPtr calculator,
                  IndicatorParams params);

    IndicatorPage(const IndicatorPage&) = delete;
    IndicatorPage& operator=(const IndicatorPage&) = delete;

    const IndicatorKey& key() const { return key_; }
    std::string id() const { return key_.to_string(); }

    core::PageState state() const;
    std::shared_ptr<const std::vector<double>> values() const;
    std::shared_ptr<const std::vector<core::Timestamp>> timestamps() const;
    IndicatorSnapshot snapshot() const;

    /**
     * @brief Data version of the source page the values were computed from
     */
    uint64_t source_version() const;

    /**
     * @brief True while the source is updating and the values may be outdated
     */
    bool is_stale() const;

    std::string last_error() const;
    uint64_t compute_count() const;
    size_t consumer_count() const;
    size_t listener_count() const;
    std::vector<std::string> consumers() const;
    bool is_evicted() const;

    cache::PageInfo info() const;

private:
    friend class IndicatorPageManager;

    struct Registration {
        IndicatorListenerPtr listener;
        std::string consumer;
    };

    std::vector<IndicatorListenerPtr> listeners_locked() const;

    const IndicatorKey key_;
    const cache::PageKey source_key_;
    const IndicatorCalculatorPtr calculator_;
    const IndicatorParams params_;

    mutable std::mutex mutex_;
    core::PageState state_{core::PageState::EMPTY};
    std::shared_ptr<const std::vector<double>> values_;
    std::shared_ptr<const std::vector<core::Timestamp>> timestamps_;
    uint64_t source_version_{0};
    bool computed_{false};
    bool stale_{false};
    bool params_valid_{true};
    std::string last_error_;
    uint64_t compute_count_{0};
    std::vector<Registration> registrations_;
    bool evicted_{false};
};

using IndicatorPagePtr = std::shared_ptr<IndicatorPage>;

} // namespace indicators
} // namespace mdcache

#endif // MDCACHE_INDICATORS_INDICATOR_PAGE_H_
