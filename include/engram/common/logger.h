#ifndef ENGRAM_COMMON_LOGGER_H_
#define ENGRAM_COMMON_LOGGER_H_

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace engram {
namespace common {

class Logger {
public:
    static void Init();
    static void SetLevel(spdlog::level::level_enum level);
};

} // namespace common
} // namespace engram

// Macros for convenient logging
#define ENGRAM_TRACE(...) spdlog::trace(__VA_ARGS__)
#define ENGRAM_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define ENGRAM_INFO(...)  spdlog::info(__VA_ARGS__)
#define ENGRAM_WARN(...)  spdlog::warn(__VA_ARGS__)
#define ENGRAM_ERROR(...) spdlog::error(__VA_ARGS__)
#define ENGRAM_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // ENGRAM_COMMON_LOGGER_H_
