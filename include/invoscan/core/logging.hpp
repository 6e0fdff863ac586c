#pragma once

#include <spdlog/logger.h>
#include <memory>
#include <string_view>

namespace invoscan::core {

/// Shared "invoscan" logger (stderr, colour). Created on first use; thread-safe.
std::shared_ptr<spdlog::logger> logger();

/// Set the shared logger's level from trace|debug|info|warn|error|off.
/// Returns false and leaves the level unchanged for an unknown name.
bool set_log_level(std::string_view level);

}  // namespace invoscan::core
