#include "core/Logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <vector>

namespace Wayfarer {

std::shared_ptr<spdlog::logger> Logger::s_engineLogger;
std::shared_ptr<spdlog::logger> Logger::s_botLogger;
bool Logger::s_initialized = false;

void Logger::Initialize(const std::string& logFile, bool consoleOutput) {
    if (s_initialized) {
        return;
    }

    // Replace the silent fallback loggers, if any were handed out
    if (s_engineLogger) {
        spdlog::drop(s_engineLogger->name());
    }
    if (s_botLogger) {
        spdlog::drop(s_botLogger->name());
    }

    std::vector<spdlog::sink_ptr> sinks;

    // Console sink
    if (consoleOutput) {
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_pattern("%^[%T] [%n] [%l]%$ %v");
        sinks.push_back(consoleSink);
    }

    // File sink
    if (!logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile, 5 * 1024 * 1024, 3);  // 5MB max, 3 files
        fileSink->set_pattern("[%Y-%m-%d %T.%e] [%n] [%l] %v");
        sinks.push_back(fileSink);
    }

    // Create engine logger
    s_engineLogger = std::make_shared<spdlog::logger>("WAYFARER", sinks.begin(), sinks.end());
    s_engineLogger->set_level(spdlog::level::trace);
    s_engineLogger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_engineLogger);

    // Create bot logger
    s_botLogger = std::make_shared<spdlog::logger>("BOT", sinks.begin(), sinks.end());
    s_botLogger->set_level(spdlog::level::trace);
    s_botLogger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_botLogger);

    // Set as default
    spdlog::set_default_logger(s_engineLogger);

    s_initialized = true;
}

void Logger::Shutdown() {
    if (!s_initialized) {
        return;
    }

    s_engineLogger->flush();
    s_botLogger->flush();

    spdlog::drop_all();

    s_engineLogger.reset();
    s_botLogger.reset();
    s_initialized = false;
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    EnsureFallback();
    s_engineLogger->set_level(level);
    s_botLogger->set_level(level);
}

spdlog::level::level_enum Logger::ParseLevel(std::string_view name) {
    if (name == "trace")    return spdlog::level::trace;
    if (name == "debug")    return spdlog::level::debug;
    if (name == "info")     return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error")    return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off")      return spdlog::level::off;
    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger>& Logger::GetEngineLogger() {
    EnsureFallback();
    return s_engineLogger;
}

std::shared_ptr<spdlog::logger>& Logger::GetBotLogger() {
    EnsureFallback();
    return s_botLogger;
}

void Logger::EnsureFallback() {
    if (s_engineLogger && s_botLogger) {
        return;
    }

    auto nullSink = std::make_shared<spdlog::sinks::null_sink_mt>();
    if (!s_engineLogger) {
        s_engineLogger = std::make_shared<spdlog::logger>("WAYFARER", nullSink);
    }
    if (!s_botLogger) {
        s_botLogger = std::make_shared<spdlog::logger>("BOT", nullSink);
    }
}

} // namespace Wayfarer
