#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace tether {

class Log {
public:
    static void init(const std::string& logFile = "", const std::string& level = "info");
    static void shutdown();

    /// True once init() has created the loggers.
    static bool isInitialized();

    static std::shared_ptr<spdlog::logger>& getRuntimeLogger();
    static std::shared_ptr<spdlog::logger>& getServiceLogger();

private:
    static std::shared_ptr<spdlog::logger> s_runtimeLogger;
    static std::shared_ptr<spdlog::logger> s_serviceLogger;
    static bool s_initialized;
};

} // namespace tether

// Runtime logging macros
#define LOG_TRACE(...)    ::tether::Log::getRuntimeLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)    ::tether::Log::getRuntimeLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)     ::tether::Log::getRuntimeLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)     ::tether::Log::getRuntimeLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)    ::tether::Log::getRuntimeLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::tether::Log::getRuntimeLogger()->critical(__VA_ARGS__)

// Logging macros for consuming services (audio capture, recognizers, ...)
#define SVC_LOG_TRACE(...)    ::tether::Log::getServiceLogger()->trace(__VA_ARGS__)
#define SVC_LOG_DEBUG(...)    ::tether::Log::getServiceLogger()->debug(__VA_ARGS__)
#define SVC_LOG_INFO(...)     ::tether::Log::getServiceLogger()->info(__VA_ARGS__)
#define SVC_LOG_WARN(...)     ::tether::Log::getServiceLogger()->warn(__VA_ARGS__)
#define SVC_LOG_ERROR(...)    ::tether::Log::getServiceLogger()->error(__VA_ARGS__)
#define SVC_LOG_CRITICAL(...) ::tether::Log::getServiceLogger()->critical(__VA_ARGS__)
