#include "mdcache/indicators/builtin_indicators.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace mdcache {
namespace indicators {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

core::Result<void> expect_no_params(const std::string& type, const IndicatorParams& params) {
    if (!params.empty()) {
        return core::Result<void>::error(type + " takes no parameters, got '" + params.canonical() + "'",
                                         core::Error::Code::INVALID_ARGUMENT);
    }
    return core::Result<void>();
}

} // namespace

core::Result<void> PeriodIndicator::validate(const IndicatorParams& params) const {
    if (params.size() != 1) {
        return core::Result<void>::error(type() + " expects one period parameter",
                                         core::Error::Code::INVALID_ARGUMENT);
    }
    const double value = params.values.front();
    if (!(value >= 1.0) || value != std::floor(value) || value > 100000.0) {
        return core::Result<void>::error(type() + " period must be a positive integer, got '" +
                                             params.canonical() + "'",
                                         core::Error::Code::INVALID_ARGUMENT);
    }
    return core::Result<void>();
}

core::Result<std::vector<double>> SmaIndicator::compute(const std::vector<core::Candle>& candles,
                                                        const IndicatorParams& params) const {
    auto valid = validate(params);
    if (!valid.ok()) {
        return core::Result<std::vector<double>>(core::InvalidArgumentError(valid.error()));
    }
    const size_t n = period(params);
    std::vector<double> out(candles.size(), kNaN);
    double sum = 0.0;
    for (size_t i = 0; i < candles.size(); ++i) {
        sum += candles[i].close;
        if (i >= n) {
            sum -= candles[i - n].close;
        }
        if (i + 1 >= n) {
            out[i] = sum / static_cast<double>(n);
        }
    }
    return out;
}

core::Result<std::vector<double>> EmaIndicator::compute(const std::vector<core::Candle>& candles,
                                                        const IndicatorParams& params) const {
    auto valid = validate(params);
    if (!valid.ok()) {
        return core::Result<std::vector<double>>(core::InvalidArgumentError(valid.error()));
    }
    const size_t n = period(params);
    std::vector<double> out(candles.size(), kNaN);
    if (candles.size() < n) {
        return out;
    }
    const double alpha = 2.0 / (static_cast<double>(n) + 1.0);
    double seed = 0.0;
    for (size_t i = 0; i < n; ++i) {
        seed += candles[i].close;
    }
    double ema = seed / static_cast<double>(n);
    out[n - 1] = ema;
    for (size_t i = n; i < candles.size(); ++i) {
        ema = alpha * candles[i].close + (1.0 - alpha) * ema;
        out[i] = ema;
    }
    return out;
}

core::Result<std::vector<double>> RsiIndicator::compute(const std::vector<core::Candle>& candles,
                                                        const IndicatorParams& params) const {
    auto valid = validate(params);
    if (!valid.ok()) {
        return core::Result<std::vector<double>>(core::InvalidArgumentError(valid.error()));
    }
    const size_t n = period(params);
    std::vector<double> out(candles.size(), kNaN);
    if (candles.size() <= n) {
        return out;
    }

    auto rsi = [](double avg_gain, double avg_loss) {
        if (avg_loss == 0.0) {
            return avg_gain == 0.0 ? 50.0 : 100.0;
        }
        const double rs = avg_gain / avg_loss;
        return 100.0 - 100.0 / (1.0 + rs);
    };

    double gain = 0.0;
    double loss = 0.0;
    for (size_t i = 1; i <= n; ++i) {
        const double change = candles[i].close - candles[i - 1].close;
        gain += std::max(change, 0.0);
        loss += std::max(-change, 0.0);
    }
    double avg_gain = gain / static_cast<double>(n);
    double avg_loss = loss / static_cast<double>(n);
    out[n] = rsi(avg_gain, avg_loss);

    for (size_t i = n + 1; i < candles.size(); ++i) {
        const double change = candles[i].close - candles[i - 1].close;
        avg_gain = (avg_gain * static_cast<double>(n - 1) + std::max(change, 0.0)) / static_cast<double>(n);
        avg_loss = (avg_loss * static_cast<double>(n - 1) + std::max(-change, 0.0)) / static_cast<double>(n);
        out[i] = rsi(avg_gain, avg_loss);
    }
    return out;
}

core::Result<std::vector<double>> AtrIndicator::compute(const std::vector<core::Candle>& candles,
                                                        const IndicatorParams& params) const {
    auto valid = validate(params);
    if (!valid.ok()) {
        return core::Result<std::vector<double>>(core::InvalidArgumentError(valid.error()));
    }
    const size_t n = period(params);
    std::vector<double> out(candles.size(), kNaN);
    if (candles.size() < n) {
        return out;
    }

    auto true_range = [&candles](size_t i) {
        const auto& c = candles[i];
        if (i == 0) {
            return c.high - c.low;
        }
        const double prev_close = candles[i - 1].close;
        return std::max({c.high - c.low, std::fabs(c.high - prev_close), std::fabs(c.low - prev_close)});
    };

    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        sum += true_range(i);
    }
    double atr = sum / static_cast<double>(n);
    out[n - 1] = atr;
    for (size_t i = n; i < candles.size(); ++i) {
        atr = (atr * static_cast<double>(n - 1) + true_range(i)) / static_cast<double>(n);
        out[i] = atr;
    }
    return out;
}

core::Result<void> VolumeDeltaIndicator::validate(const IndicatorParams& params) const {
    return expect_no_params(type(), params);
}

core::Result<std::vector<double>> VolumeDeltaIndicator::compute(const std::vector<core::Candle>& candles,
                                                                const IndicatorParams& params) const {
    auto valid = validate(params);
    if (!valid.ok()) {
        return core::Result<std::vector<double>>(core::InvalidArgumentError(valid.error()));
    }
    std::vector<double> out;
    out.reserve(candles.size());
    for (const auto& candle : candles) {
        // buy - sell, where sell = volume - buy
        out.push_back(2.0 * candle.taker_buy_volume - candle.volume);
    }
    return out;
}

core::Result<void> VwapIndicator::validate(const IndicatorParams& params) const {
    return expect_no_params(type(), params);
}

core::Result<std::vector<double>> VwapIndicator::compute(const std::vector<core::Candle>& candles,
                                                         const IndicatorParams& params) const {
    auto valid = validate(params);
    if (!valid.ok()) {
        return core::Result<std::vector<double>>(core::InvalidArgumentError(valid.error()));
    }
    std::vector<double> out;
    out.reserve(candles.size());
    double price_volume = 0.0;
    double volume = 0.0;
    for (const auto& candle : candles) {
        const double typical = (candle.high + candle.low + candle.close) / 3.0;
        price_volume += typical * candle.volume;
        volume += candle.volume;
        out.push_back(volume > 0.0 ? price_volume / volume : kNaN);
    }
    return out;
}

} // namespace indicators
} // namespace mdcache
