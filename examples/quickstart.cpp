#include "mdcache/market_data_cache.h"
#include "mdcache/common/logger.h"
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <vector>

using namespace mdcache;

namespace {

// Deterministic random walk standing in for an exchange client
class SyntheticCandleBackend : public cache::FetchBackend<core::Candle> {
public:
    core::Result<std::vector<core::Candle>> fetch(const cache::FetchRequest& request) override {
        auto step = core::parse_timeframe(request.sub_key);
        if (!step) {
            return core::Result<std::vector<core::Candle>>::error(
                "Unsupported timeframe '" + request.sub_key + "'", core::Error::Code::INVALID_ARGUMENT);
        }
        std::vector<core::Candle> candles;
        for (core::Timestamp ts = core::align_up(request.range.start, *step); ts < request.range.end;
             ts += *step) {
            const double phase = static_cast<double>(ts / *step);
            core::Candle candle;
            candle.open_time = ts;
            candle.close = 30000.0 + 500.0 * std::sin(phase / 12.0);
            candle.open = candle.close - 20.0;
            candle.high = candle.close + 60.0;
            candle.low = candle.close - 60.0;
            candle.volume = 100.0 + std::fmod(phase, 17.0);
            candle.taker_buy_volume = candle.volume * 0.55;
            candles.push_back(candle);
        }
        return candles;
    }

    std::string name() const override { return "synthetic"; }
};

} // namespace

int main() {
    common::Logger::Init();
    std::cout << "=== Market Data Cache Quick Start ===" << std::endl;

    FetchBackends backends;
    backends.candles = std::make_shared<SyntheticCandleBackend>();
    MarketDataCache cache(core::CacheConfig::Default(), backends);

    auto init_result = cache.initialize();
    if (!init_result.ok()) {
        std::cerr << "Init failed: " << init_result.error() << std::endl;
        return 1;
    }
    std::cout << "✅ Cache initialized" << std::endl;

    // One week of hourly candles ending now
    const core::Timestamp end = core::align_down(core::now_ms(), core::kHourMs);
    const core::Timestamp start = end - 7 * core::kDayMs;
    auto page = cache.candles()->request("BTCUSDT", "1h", start, end, nullptr, "quickstart");
    if (!page.ok()) {
        std::cerr << "Request failed: " << page.error() << std::endl;
        return 1;
    }
    auto rsi = cache.indicators()->subscribe("RSI", "14", page.value()->key(), nullptr, "quickstart");
    if (!rsi.ok()) {
        std::cerr << "Subscribe failed: " << rsi.error() << std::endl;
        return 1;
    }

    auto idle = cache.wait_for_idle(std::chrono::milliseconds(10000));
    if (!idle.ok()) {
        std::cerr << "Wait failed: " << idle.error() << std::endl;
        return 1;
    }
    std::cout << "✅ Loaded " << page.value()->record_count() << " candles, state "
              << core::to_string(page.value()->state()) << std::endl;

    auto values = rsi.value()->values();
    if (!values->empty()) {
        std::cout << "Latest RSI(14): " << values->back() << std::endl;
    }

    auto snapshot = cache.snapshot();
    std::cout << "\nCache snapshot:" << std::endl;
    std::cout << "  Active pages: " << snapshot.active_pages << std::endl;
    std::cout << "  Records: " << snapshot.total_records << std::endl;
    std::cout << "  Estimated memory: " << snapshot.estimated_memory_bytes << " bytes" << std::endl;
    std::cout << "  Events logged: " << snapshot.events.total_events << std::endl;
    for (const auto& info : snapshot.pages) {
        std::cout << "  " << info.id << " [" << core::to_string(info.state) << "] " << info.record_count
                  << " records, consumers " << info.consumer_count << std::endl;
    }

    cache.indicators()->release(rsi.value(), std::string("quickstart"));
    cache.candles()->release(page.value(), std::string("quickstart"));

    auto shutdown_result = cache.shutdown();
    if (!shutdown_result.ok()) {
        std::cerr << "Shutdown failed: " << shutdown_result.error() << std::endl;
        return 1;
    }
    std::cout << "✅ Cache shut down" << std::endl;
    return 0;
}
