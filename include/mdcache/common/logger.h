#ifndef MDCACHE_COMMON_LOGGER_H_
#define MDCACHE_COMMON_LOGGER_H_

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace mdcache {
namespace common {

class Logger {
public:
    static void Init();
    static void SetLevel(spdlog::level::level_enum level);
};

} // namespace common
} // namespace mdcache

// Macros for convenient logging
#define MDCACHE_TRACE(...) spdlog::trace(__VA_ARGS__)
#define MDCACHE_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define MDCACHE_INFO(...)  spdlog::info(__VA_ARGS__)
#define MDCACHE_WARN(...)  spdlog::warn(__VA_ARGS__)
#define MDCACHE_ERROR(...) spdlog::error(__VA_ARGS__)
#define MDCACHE_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // MDCACHE_COMMON_LOGGER_H_
