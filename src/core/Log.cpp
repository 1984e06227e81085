#include "core/Log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <vector>

namespace tether {

namespace {

// Components may log before the composition root ran init() (unit tests
// constructing a registry directly), so the loggers start out silent.
std::shared_ptr<spdlog::logger> makeSilentLogger(const std::string& name) {
    return std::make_shared<spdlog::logger>(
        name, std::make_shared<spdlog::sinks::null_sink_mt>());
}

spdlog::level::level_enum parseLevel(const std::string& level) {
    if (level == "trace")    return spdlog::level::trace;
    if (level == "debug")    return spdlog::level::debug;
    if (level == "info")     return spdlog::level::info;
    if (level == "warn")     return spdlog::level::warn;
    if (level == "error")    return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off")      return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace

std::shared_ptr<spdlog::logger> Log::s_runtimeLogger = makeSilentLogger("RUNTIME");
std::shared_ptr<spdlog::logger> Log::s_serviceLogger = makeSilentLogger("SERVICE");
bool Log::s_initialized = false;

void Log::init(const std::string& logFile, const std::string& level) {
    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] [t%t] %v");
    sinks.push_back(consoleSink);

    if (!logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] [t%t] %v");
        sinks.push_back(fileSink);
    }

    // Loggers are rebuilt on every init; drop any previous registration so
    // register_logger does not throw on a duplicate name.
    spdlog::drop("RUNTIME");
    spdlog::drop("SERVICE");

    s_runtimeLogger = std::make_shared<spdlog::logger>("RUNTIME", sinks.begin(), sinks.end());
    s_serviceLogger = std::make_shared<spdlog::logger>("SERVICE", sinks.begin(), sinks.end());

    auto spdLevel = parseLevel(level);
    s_runtimeLogger->set_level(spdLevel);
    s_serviceLogger->set_level(spdLevel);
    s_runtimeLogger->flush_on(spdlog::level::warn);
    s_serviceLogger->flush_on(spdlog::level::warn);

    spdlog::register_logger(s_runtimeLogger);
    spdlog::register_logger(s_serviceLogger);
    s_initialized = true;
}

void Log::shutdown() {
    if (s_initialized) {
        s_runtimeLogger->flush();
        s_serviceLogger->flush();
    }
    spdlog::shutdown();
    s_initialized = false;
}

bool Log::isInitialized() {
    return s_initialized;
}

std::shared_ptr<spdlog::logger>& Log::getRuntimeLogger() {
    return s_runtimeLogger;
}

std::shared_ptr<spdlog::logger>& Log::getServiceLogger() {
    return s_serviceLogger;
}

} // namespace tether
