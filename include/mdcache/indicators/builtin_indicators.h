#ifndef MDCACHE_INDICATORS_BUILTIN_INDICATORS_H_
#define MDCACHE_INDICATORS_BUILTIN_INDICATORS_H_

#include "mdcache/indicators/indicator_calculator.h"

namespace mdcache {
namespace indicators {

/**
 * @brief Base for indicators taking a single positive integer period
 */
class PeriodIndicator : public IndicatorCalculator {
public:
    core::Result<void> validate(const IndicatorParams& params) const override;

protected:
    static size_t period(const IndicatorParams& params) {
        return static_cast<size_t>(params.values.front());
    }
};

/**
 * @brief Simple moving average of close
 */
class SmaIndicator : public PeriodIndicator {
public:
    std::string type() const override { return "SMA"; }
    core::Result<std::vector<double>> compute(const std::vector<core::Candle>& candles,
                                              const IndicatorParams& params) const override;
};

/**
 * @brief Exponential moving average of close, seeded with the SMA
 */
class EmaIndicator : public PeriodIndicator {
public:
    std::string type() const override { return "EMA"; }
    core::Result<std::vector<double>> compute(const std::vector<core::Candle>& candles,
                                              const IndicatorParams& params) const override;
};

/**
 * @brief Relative strength index with Wilder smoothing
 */
class RsiIndicator : public PeriodIndicator {
public:
    std::string type() const override { return "RSI"; }
    core::Result<std::vector<double>> compute(const std::vector<core::Candle>& candles,
                                              const IndicatorParams& params) const override;
};

/**
 * @brief Average true range with Wilder smoothing
 */
class AtrIndicator : public PeriodIndicator {
public:
    std::string type() const override { return "ATR"; }
    core::Result<std::vector<double>> compute(const std::vector<core::Candle>& candles,
                                              const IndicatorParams& params) const override;
};

/**
 * @brief Taker buy volume minus taker sell volume per candle
 */
class VolumeDeltaIndicator : public IndicatorCalculator {
public:
    std::string type() const override { return "VOLUME_DELTA"; }
    core::Result<void> validate(const IndicatorParams& params) const override;
    core::Result<std::vector<double>> compute(const std::vector<core::Candle>& candles,
                                              const IndicatorParams& params) const override;
};

/**
 * @brief Volume weighted average of the typical price, cumulative over the page
 */
class VwapIndicator : public IndicatorCalculator {
public:
    std::string type() const override { return "VWAP"; }
    core::Result<void> validate(const IndicatorParams& params) const override;
    core::Result<std::vector<double>> compute(const std::vector<core::Candle>& candles,
                                              const IndicatorParams& params) const override;
};

} // namespace indicators
} // namespace mdcache

#endif // MDCACHE_INDICATORS_BUILTIN_INDICATORS_H_
