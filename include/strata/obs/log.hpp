#pragma once
/**
 * @file log.hpp
 * @brief Library logger (spdlog) and its configuration.
 *
 * strata logs through one named spdlog logger. Applications may configure it
 * with init_logging(); otherwise the first logger() call creates a colored
 * stdout logger at `info`.
 */

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "strata/config/constants.hpp"

namespace strata::obs {

/// @brief Library log levels (mapped onto spdlog levels).
enum class LogLevel {
  trace,
  debug,
  info,
  warn,
  err,
  critical,
  off
};

/// @brief Parse "trace", "debug", "info", "warn"/"warning", "err"/"error",
///        "critical", "off" (case-insensitive).
std::optional<LogLevel> parse_level(std::string_view text);

/** @struct LogConfig
 *  @brief Sinks and verbosity for the library logger.
 */
struct LogConfig {
  LogLevel    level{LogLevel::info};  ///< Logger level
  bool        console{true};          ///< Colored stdout sink
  std::string file_path{};            ///< Rotating file sink when non-empty
  std::size_t file_max_bytes{strata::config::constants::LOG_FILE_MAX_BYTES};
  std::size_t file_count{strata::config::constants::LOG_FILE_COUNT};
  std::string pattern{strata::config::constants::LOG_PATTERN};
};

/**
 * @brief (Re)build the library logger from @p cfg.
 * Replaces any logger previously created by init_logging() or logger().
 */
void init_logging(const LogConfig& cfg);

/// @brief The library logger; created with defaults on first use.
/// Takes no lock once a logger exists, so decoding threads may call it freely.
std::shared_ptr<spdlog::logger> logger();

/// @brief Adjust the library logger level at runtime.
void set_level(LogLevel level);

} // namespace strata::obs
