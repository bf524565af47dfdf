#ifndef TPCH_COMMON_LOGGER_H_
#define TPCH_COMMON_LOGGER_H_

#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace tpch {
namespace common {

class Logger {
public:
    static void Init();
    static void SetLevel(spdlog::level::level_enum level);

    /**
     * @brief Set the level from its name (trace, debug, info, warn, error, off)
     * @return false if the name is not recognised; the level is left unchanged
     */
    static bool SetLevel(const std::string& name);
};

} // namespace common
} // namespace tpch

// Macros for convenient logging
#define TPCH_TRACE(...) spdlog::trace(__VA_ARGS__)
#define TPCH_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define TPCH_INFO(...)  spdlog::info(__VA_ARGS__)
#define TPCH_WARN(...)  spdlog::warn(__VA_ARGS__)
#define TPCH_ERROR(...) spdlog::error(__VA_ARGS__)
#define TPCH_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // TPCH_COMMON_LOGGER_H_
