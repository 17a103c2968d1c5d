#ifndef MDCACHE_INDICATORS_INDICATOR_CALCULATOR_H_
#define MDCACHE_INDICATORS_INDICATOR_CALCULATOR_H_

#include <memory>
#include <string>
#include <vector>

#include "mdcache/core/records.h"
#include "mdcache/core/result.h"

namespace mdcache {
namespace indicators {

/**
 * @brief Parsed indicator parameters, e.g. "14" or "12,26,9"
 */
struct IndicatorParams {
    std::vector<double> values;

    /**
     * @brief Parses a comma-separated list of numbers; whitespace is ignored
     * @return INVALID_ARGUMENT if any element is not a number
     */
    static core::Result<IndicatorParams> parse(const std::string& text);

    /**
     * @brief Normalised text form, used in indicator keys
     */
    std::string canonical() const;

    size_t size() const { return values.size(); }
    bool empty() const { return values.empty(); }
};

/**
 * @brief Pure function from candles to one value per candle
 *
 * compute() returns exactly one value per input candle, NaN where the
 * indicator is not yet defined (warm-up). Implementations hold no state and
 * may be called concurrently.
 */
class IndicatorCalculator {
public:
    virtual ~IndicatorCalculator() = default;

    /**
     * @brief Upper-case type name, e.g. "SMA"
     */
    virtual std::string type() const = 0;

    virtual core::Result<void> validate(const IndicatorParams& params) const = 0;

    virtual core::Result<std::vector<double>> compute(const std::vector<core::Candle>& candles,
                                                      const IndicatorParams& params) const = 0;
};

using IndicatorCalculatorPtr = std::shared_ptr<const IndicatorCalculator>;

} // namespace indicators
} // namespace mdcache

#endif // MDCACHE_INDICATORS_INDICATOR_CALCULATOR_H_
