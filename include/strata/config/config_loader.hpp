#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: named defaults, optionally overridden from the environment.
 * @details All defaults reference named constants to avoid magic numbers.
 */

#include "strata/core/decode_options.hpp"
#include "strata/obs/log.hpp"

namespace strata::config {

    /** @struct StrataConfig
     *  @brief Aggregate of the settings an application hands to strata.
     */
    struct StrataConfig {
        strata::core::DecodeOptions decode; ///< Strategy + buffer ownership for new packets
        strata::obs::LogConfig      log;    ///< Library logger sinks/level
    };

    /** @class Loader
     *  @brief Source of configuration (defaults or environment).
     */
    class Loader {
    public:
        /// @brief Compiled-in defaults (eager, copying, info-level console logging).
        static StrataConfig defaults();

        /**
         * @brief Defaults overridden by STRATA_DECODE_LAZY, STRATA_DECODE_NO_COPY,
         *        STRATA_LOG_LEVEL and STRATA_LOG_FILE.
         * @details Boolean variables accept 1/0, true/false, yes/no, on/off
         *          (case-insensitive). Unrecognized values keep the default.
         */
        static StrataConfig from_env();
    };

} // namespace strata::config
