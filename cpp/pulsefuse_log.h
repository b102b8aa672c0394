// Shared spdlog logger for the library
#pragma once

#include <memory>
#include <spdlog/spdlog.h>

namespace pulsefuse {

// Returns the "pulsefuse" logger, creating it on first use (stderr, level from
// PULSEFUSE_LOG_LEVEL, default warn).
std::shared_ptr<spdlog::logger> logger();

// Replace the library logger; nullptr restores the default one.
void setLogger(std::shared_ptr<spdlog::logger> lg);

} // namespace pulsefuse
