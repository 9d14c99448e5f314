#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for decoding, logging and configuration.
 * @details These values eliminate magic numbers from the codebase. Override via
 *          the config Loader (environment) in deployments.
 */

#include <cstddef>

namespace strata::config::constants {

// =====================
// Decode defaults (eager + copying: safe under concurrency, slowest)
// =====================
inline constexpr bool DECODE_LAZY_DEFAULT    = false; ///< Decode everything at construction
inline constexpr bool DECODE_NO_COPY_DEFAULT = false; ///< Copy the input buffer into the packet

// =====================
// Logging defaults
// =====================
inline constexpr const char* LOGGER_NAME    = "strata";
inline constexpr const char* LOG_PATTERN    = "[%Y-%m-%d %H:%M:%S.%e] [%n] %^[%l]%$ %v";
inline constexpr std::size_t LOG_FILE_MAX_BYTES = 5 * 1024 * 1024; ///< 5 MiB per rotated file
inline constexpr std::size_t LOG_FILE_COUNT     = 3;               ///< Rotated files kept

// =====================
// Environment variable names read by Loader::from_env()
// =====================
inline constexpr const char* ENV_DECODE_LAZY    = "STRATA_DECODE_LAZY";
inline constexpr const char* ENV_DECODE_NO_COPY = "STRATA_DECODE_NO_COPY";
inline constexpr const char* ENV_LOG_LEVEL      = "STRATA_LOG_LEVEL";
inline constexpr const char* ENV_LOG_FILE       = "STRATA_LOG_FILE";

} // namespace strata::config::constants
