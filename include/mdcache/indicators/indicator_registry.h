#ifndef MDCACHE_INDICATORS_INDICATOR_REGISTRY_H_
#define MDCACHE_INDICATORS_INDICATOR_REGISTRY_H_

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "mdcache/indicators/indicator_calculator.h"

namespace mdcache {
namespace indicators {

/**
 * @brief Lookup of indicator calculators by type name
 *
 * Type names are matched case-insensitively. Thread-safe.
 */
class IndicatorRegistry {
public:
    IndicatorRegistry() = default;

    /**
     * @brief Registry holding SMA, EMA, RSI, ATR, VOLUME_DELTA and VWAP
     */
    static std::shared_ptr<IndicatorRegistry> with_builtins();

    /**
     * @return ALREADY_EXISTS if the type is taken, INVALID_ARGUMENT for null
     */
    core::Result<void> register_calculator(IndicatorCalculatorPtr calculator);

    /**
     * @return The calculator, or nullptr for an unknown type
     */
    IndicatorCalculatorPtr find(const std::string& type) const;

    std::vector<std::string> types() const;

    static std::string normalize(const std::string& type);

private:
    mutable std::mutex mutex_;
    std::map<std::string, IndicatorCalculatorPtr> calculators_;
};

} // namespace indicators
} // namespace mdcache

#endif // MDCACHE_INDICATORS_INDICATOR_REGISTRY_H_
