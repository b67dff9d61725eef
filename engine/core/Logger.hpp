#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <memory>
#include <string>
#include <string_view>

namespace Wayfarer {

/**
 * @brief Logging system wrapper around spdlog
 *
 * Two named loggers are provided: the engine logger ("WAYFARER") for
 * generic machinery such as state machines and configuration, and the bot
 * logger ("BOT") for controller and mission output.
 */
class Logger {
public:
    /**
     * @brief Initialize the logging system
     * @param logFile Optional file path for logging
     * @param consoleOutput Enable console output
     */
    static void Initialize(const std::string& logFile = "",
                          bool consoleOutput = true);

    /**
     * @brief Shutdown the logging system
     */
    static void Shutdown();

    /**
     * @brief Set the minimum log level
     */
    static void SetLevel(spdlog::level::level_enum level);

    /**
     * @brief Parse a level name ("trace", "debug", "info", "warn", "error",
     *        "critical", "off"). Unknown names map to info.
     */
    [[nodiscard]] static spdlog::level::level_enum ParseLevel(std::string_view name);

    /**
     * @brief Get the engine logger
     *
     * If Initialize() has not been called yet a silent logger is created so
     * that library code can log unconditionally.
     */
    static std::shared_ptr<spdlog::logger>& GetEngineLogger();

    /**
     * @brief Get the bot logger
     */
    static std::shared_ptr<spdlog::logger>& GetBotLogger();

    [[nodiscard]] static bool IsInitialized() { return s_initialized; }

private:
    static void EnsureFallback();

    static std::shared_ptr<spdlog::logger> s_engineLogger;
    static std::shared_ptr<spdlog::logger> s_botLogger;
    static bool s_initialized;
};

} // namespace Wayfarer

// Convenience macros for engine logging
#define WAYFARER_LOG_TRACE(...)    ::Wayfarer::Logger::GetEngineLogger()->trace(__VA_ARGS__)
#define WAYFARER_LOG_DEBUG(...)    ::Wayfarer::Logger::GetEngineLogger()->debug(__VA_ARGS__)
#define WAYFARER_LOG_INFO(...)     ::Wayfarer::Logger::GetEngineLogger()->info(__VA_ARGS__)
#define WAYFARER_LOG_WARN(...)     ::Wayfarer::Logger::GetEngineLogger()->warn(__VA_ARGS__)
#define WAYFARER_LOG_ERROR(...)    ::Wayfarer::Logger::GetEngineLogger()->error(__VA_ARGS__)
#define WAYFARER_LOG_CRITICAL(...) ::Wayfarer::Logger::GetEngineLogger()->critical(__VA_ARGS__)

// Convenience macros for bot logging
#define BOT_LOG_TRACE(...)    ::Wayfarer::Logger::GetBotLogger()->trace(__VA_ARGS__)
#define BOT_LOG_DEBUG(...)    ::Wayfarer::Logger::GetBotLogger()->debug(__VA_ARGS__)
#define BOT_LOG_INFO(...)     ::Wayfarer::Logger::GetBotLogger()->info(__VA_ARGS__)
#define BOT_LOG_WARN(...)     ::Wayfarer::Logger::GetBotLogger()->warn(__VA_ARGS__)
#define BOT_LOG_ERROR(...)    ::Wayfarer::Logger::GetBotLogger()->error(__VA_ARGS__)
#define BOT_LOG_CRITICAL(...) ::Wayfarer::Logger::GetBotLogger()->critical(__VA_ARGS__)
