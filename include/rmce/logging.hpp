#pragma once

/// @file include/rmce/logging.hpp
/// @brief Shared spdlog logger for the RMCE library and CLI.
///
/// All modules log through the `"rmce"` logger (stderr, colour when attached
/// to a terminal). Library code logs per-call summaries at `debug`; the batch
/// runner logs per-symbol outcomes at `info` / `warn`.

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace rmce::log {

/// Return the process-wide `"rmce"` logger, creating it on first use.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

/// Set the level of the `"rmce"` logger from an spdlog level name
/// ("trace", "debug", "info", "warn", "error", "critical", "off").
/// Unknown names leave the level unchanged and return false.
bool set_level(std::string_view level);

} // namespace rmce::log
