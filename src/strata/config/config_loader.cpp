/**
* @file config_loader.cpp
 * @brief Defaults + environment overrides.
 */
#include "strata/config/config_loader.hpp"
#include "strata/config/constants.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>

namespace strata::config {
    using namespace strata::config::constants;

    static std::optional<bool> parse_bool(const char* raw) {
        std::string s(raw);
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (s == "1" || s == "true"  || s == "yes" || s == "on")  return true;
        if (s == "0" || s == "false" || s == "no"  || s == "off") return false;
        return std::nullopt;
    }

    static void override_bool(const char* var, bool& field) {
        const char* raw = std::getenv(var);
        if (raw == nullptr) return;
        if (auto v = parse_bool(raw)) field = *v;
    }

    StrataConfig Loader::defaults() {
        StrataConfig rc;
        rc.decode = strata::core::DecodeOptions{}; // picks defaults from constants
        rc.log    = strata::obs::LogConfig{};      // console sink, info level
        return rc;
    }

    StrataConfig Loader::from_env() {
        StrataConfig rc = defaults();
        override_bool(ENV_DECODE_LAZY,    rc.decode.lazy);
        override_bool(ENV_DECODE_NO_COPY, rc.decode.no_copy);

        if (const char* lvl = std::getenv(ENV_LOG_LEVEL)) {
            if (auto parsed = strata::obs::parse_level(lvl)) rc.log.level = *parsed;
        }
        if (const char* file = std::getenv(ENV_LOG_FILE)) {
            rc.log.file_path = file;
        }
        return rc;
    }

} // namespace strata::config
