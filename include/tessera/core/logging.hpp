#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string_view>

namespace tessera::core {

/// Shared "tessera" logger (stderr, colour). Created on first use; stdout is
/// left to event output.
[[nodiscard]] std::shared_ptr<spdlog::logger> get_logger();

/// Set level by name: trace, debug, info, warn, error, off.
/// Returns false (level unchanged) for an unknown name.
bool set_log_level(std::string_view level);

}  // namespace tessera::core
