#include "pulsefuse_log.h"

#include <cstdlib>
#include <mutex>
#include <string>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace pulsefuse {

namespace {

std::mutex g_logMutex;
std::shared_ptr<spdlog::logger> g_logger;

std::shared_ptr<spdlog::logger> makeDefaultLogger() {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto lg = std::make_shared<spdlog::logger>("pulsefuse", sink);
    lg->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    spdlog::level::level_enum lvl = spdlog::level::warn;
    if (const char* e = std::getenv("PULSEFUSE_LOG_LEVEL")) {
        // from_str maps unknown names to off; keep the default for those
        auto parsed = spdlog::level::from_str(e);
        if (parsed != spdlog::level::off || std::string(e) == "off") lvl = parsed;
    }
    lg->set_level(lvl);
    return lg;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (!g_logger) g_logger = makeDefaultLogger();
    return g_logger;
}

void setLogger(std::shared_ptr<spdlog::logger> lg) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_logger = std::move(lg);
}

} // namespace pulsefuse
