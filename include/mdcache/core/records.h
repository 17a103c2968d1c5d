#ifndef MDCACHE_CORE_RECORDS_H_
#define MDCACHE_CORE_RECORDS_H_

#include <cstdint>

#include "mdcache/core/types.h"

namespace mdcache {
namespace core {

/**
 * @brief OHLCV candle keyed by its open time
 */
struct Candle {
    Timestamp open_time{0};
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double close{0.0};
    double volume{0.0};
    double quote_volume{0.0};
    int64_t trade_count{0};
    double taker_buy_volume{0.0};

    Timestamp timestamp() const { return open_time; }

    bool operator==(const Candle& other) const {
        return open_time == other.open_time && open == other.open && high == other.high &&
               low == other.low && close == other.close && volume == other.volume &&
               quote_volume == other.quote_volume && trade_count == other.trade_count &&
               taker_buy_volume == other.taker_buy_volume;
    }
};

/**
 * @brief Perpetual funding rate settlement
 */
struct FundingRate {
    Timestamp funding_time{0};
    double rate{0.0};
    double mark_price{0.0};

    Timestamp timestamp() const { return funding_time; }

    bool operator==(const FundingRate& other) const {
        return funding_time == other.funding_time && rate == other.rate &&
               mark_price == other.mark_price;
    }
};

/**
 * @brief Open interest sample
 */
struct OpenInterest {
    Timestamp time{0};
    double open_interest{0.0};
    double open_interest_value{0.0};

    Timestamp timestamp() const { return time; }

    bool operator==(const OpenInterest& other) const {
        return time == other.time && open_interest == other.open_interest &&
               open_interest_value == other.open_interest_value;
    }
};

/**
 * @brief Aggregated trade (trades at the same price and side within one tick)
 *
 * Keyed by trade time like every other record; two aggregated trades in the
 * same millisecond collapse to the later-fetched one.
 */
struct AggTrade {
    int64_t agg_trade_id{0};
    double price{0.0};
    double quantity{0.0};
    int64_t first_trade_id{0};
    int64_t last_trade_id{0};
    Timestamp trade_time{0};
    bool is_buyer_maker{false};

    Timestamp timestamp() const { return trade_time; }

    bool operator==(const AggTrade& other) const {
        return agg_trade_id == other.agg_trade_id && price == other.price &&
               quantity == other.quantity && first_trade_id == other.first_trade_id &&
               last_trade_id == other.last_trade_id && trade_time == other.trade_time &&
               is_buyer_maker == other.is_buyer_maker;
    }
};

/**
 * @brief Premium index kline
 */
struct PremiumIndex {
    Timestamp open_time{0};
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double close{0.0};

    Timestamp timestamp() const { return open_time; }

    bool operator==(const PremiumIndex& other) const {
        return open_time == other.open_time && open == other.open && high == other.high &&
               low == other.low && close == other.close;
    }
};

} // namespace core
} // namespace mdcache

#endif // MDCACHE_CORE_RECORDS_H_
