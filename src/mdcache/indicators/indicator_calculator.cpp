#include "mdcache/indicators/indicator_calculator.h"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace mdcache {
namespace indicators {

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

} // namespace

core::Result<IndicatorParams> IndicatorParams::parse(const std::string& text) {
    IndicatorParams params;
    if (trim(text).empty()) {
        return params;
    }

    std::stringstream stream(text);
    std::string token;
    while (std::getline(stream, token, ',')) {
        const std::string item = trim(token);
        if (item.empty()) {
            return core::Result<IndicatorParams>::error("Empty indicator parameter in '" + text + "'",
                                                        core::Error::Code::INVALID_ARGUMENT);
        }
        size_t consumed = 0;
        double value = 0.0;
        try {
            value = std::stod(item, &consumed);
        } catch (const std::invalid_argument&) {
            consumed = 0;
        } catch (const std::out_of_range&) {
            consumed = 0;
        }
        if (consumed != item.size() || !std::isfinite(value)) {
            return core::Result<IndicatorParams>::error("Invalid indicator parameter '" + item + "'",
                                                        core::Error::Code::INVALID_ARGUMENT);
        }
        params.values.push_back(value);
    }
    return params;
}

std::string IndicatorParams::canonical() const {
    std::ostringstream oss;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            oss << ",";
        }
        oss << values[i];
    }
    return oss.str();
}

} // namespace indicators
} // namespace mdcache
