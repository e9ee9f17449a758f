// Process-wide spdlog logger used by every pipeline stage
#pragma once

#include <tomexp/tomexp.hpp>

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace tomexp {

// Returns the "tomexp" logger, creating it with defaults on first use.
std::shared_ptr<spdlog::logger> Log();

// Applies level/pattern. Returns false (and leaves the logger untouched) on an unknown level.
bool ConfigureLogging(const LogConfig& cfg, std::string& err);

} // namespace tomexp
