#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: named defaults, optionally overridden by a key = value file.
 *
 * Recognized keys (anything after '#' is a comment):
 *   safety-checks    = enabled | disabled
 *   storage-fallback = fail | empty
 *   worker-threads   = <unsigned>   (0 = hardware concurrency)
 *   log-events       = true | false
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "pinview/compat/expected.hpp"
#include "pinview/config/constants.hpp"
#include "pinview/config/modes.hpp"

namespace pinview::config {

    /** @struct RuntimeConfig
     *  @brief Aggregate of the settings a ViewBuilder and JobSystem need.
     */
    struct RuntimeConfig {
        SafetyMode      safety{constants::SAFETY_MODE_DEFAULT};                  ///< safety-checks
        StorageFallback storage_fallback{constants::STORAGE_FALLBACK_DEFAULT};   ///< Extractor mismatch policy
        std::size_t     worker_threads{constants::WORKER_THREADS_DEFAULT};       ///< Job system pool size
        bool            log_events{constants::LOG_EVENTS_DEFAULT};               ///< Print view events
    };

    /// @brief Reasons a configuration source is rejected.
    enum class ConfigError : std::uint8_t {
        FileNotFound = 1, ///< Path could not be opened
        Malformed,        ///< Line without '=' or with an empty key
        UnknownKey,       ///< Key not in the recognized set
        InvalidValue      ///< Known key, unparsable value
    };

    /// @brief Stable name for a ConfigError.
    const char* to_string(ConfigError e) noexcept;

    /** @class Loader
     *  @brief Source of runtime configuration (defaults or parsed files).
     */
    class Loader {
    public:
        /// @return RuntimeConfig populated only from constants.hpp.
        static RuntimeConfig defaults() noexcept;

        /**
         * @brief Parse configuration text; keys not present keep their defaults.
         * @param text Contents in key = value form.
         * @return Parsed config or the first error encountered.
         */
        static pinview_detail::expected<RuntimeConfig, ConfigError>
        load_from_string(std::string_view text);

        /**
         * @brief Read and parse a configuration file.
         * @param path File path.
         * @return Parsed config, FileNotFound, or a parse error.
         */
        static pinview_detail::expected<RuntimeConfig, ConfigError>
        load_from_file(const std::string& path);
    };

} // namespace pinview::config
