#include "mdcache/indicators/indicator_registry.h"

#include <algorithm>
#include <cctype>

#include "mdcache/common/logger.h"
#include "mdcache/indicators/builtin_indicators.h"

namespace mdcache {
namespace indicators {

std::shared_ptr<IndicatorRegistry> IndicatorRegistry::with_builtins() {
    auto registry = std::make_shared<IndicatorRegistry>();
    const IndicatorCalculatorPtr builtins[] = {
        std::make_shared<SmaIndicator>(),
        std::make_shared<EmaIndicator>(),
        std::make_shared<RsiIndicator>(),
        std::make_shared<AtrIndicator>(),
        std::make_shared<VolumeDeltaIndicator>(),
        std::make_shared<VwapIndicator>(),
    };
    for (const auto& calculator : builtins) {
        auto result = registry->register_calculator(calculator);
        if (!result.ok()) {
            MDCACHE_ERROR("Failed to register built-in indicator {}: {}", calculator->type(),
                          result.error());
        }
    }
    return registry;
}

std::string IndicatorRegistry::normalize(const std::string& type) {
    std::string upper = type;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper;
}

core::Result<void> IndicatorRegistry::register_calculator(IndicatorCalculatorPtr calculator) {
    if (!calculator) {
        return core::Result<void>::error("Calculator must not be null",
                                         core::Error::Code::INVALID_ARGUMENT);
    }
    const std::string type = normalize(calculator->type());
    std::lock_guard<std::mutex> lock(mutex_);
    if (calculators_.count(type) > 0) {
        return core::Result<void>::error("Indicator " + type + " already registered",
                                         core::Error::Code::ALREADY_EXISTS);
    }
    calculators_.emplace(type, std::move(calculator));
    return core::Result<void>();
}

IndicatorCalculatorPtr IndicatorRegistry::find(const std::string& type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = calculators_.find(normalize(type));
    return it == calculators_.end() ? nullptr : it->second;
}

std::vector<std::string> IndicatorRegistry::types() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(calculators_.size());
    for (const auto& entry : calculators_) {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace indicators
} // namespace mdcache
