/**
* @file config_loader.cpp
 * @brief Loader returning named defaults, overridden by key = value text.
 */
#include "pinview/config/config_loader.hpp"
#include "pinview/config/constants.hpp"

#include <charconv>
#include <fstream>
#include <sstream>
#include <system_error>

namespace pinview::config {
    using namespace pinview::config::constants;

    namespace {

    std::string_view trim(std::string_view s) noexcept {
        const auto first = s.find_first_not_of(" \t\r");
        if (first == std::string_view::npos) return {};
        const auto last = s.find_last_not_of(" \t\r");
        return s.substr(first, last - first + 1);
    }

    bool parse_bool(std::string_view v, bool& out) noexcept {
        if (v == "true" || v == "on" || v == "yes" || v == "1")   { out = true;  return true; }
        if (v == "false" || v == "off" || v == "no" || v == "0")  { out = false; return true; }
        return false;
    }

    pinview_detail::unexpected<ConfigError> reject(ConfigError e) {
        return pinview_detail::unexpected<ConfigError>(e);
    }

    // Applies one key/value pair to cfg; unknown keys and unparsable values are rejected.
    pinview_detail::expected<void, ConfigError>
    apply(RuntimeConfig& cfg, std::string_view key, std::string_view value) {
        if (key == "safety-checks") {
            if (value == "enabled")       cfg.safety = SafetyMode::Checked;
            else if (value == "disabled") cfg.safety = SafetyMode::Unchecked;
            else return reject(ConfigError::InvalidValue);
            return {};
        }
        if (key == "storage-fallback") {
            if (value == "fail")       cfg.storage_fallback = StorageFallback::Fail;
            else if (value == "empty") cfg.storage_fallback = StorageFallback::Empty;
            else return reject(ConfigError::InvalidValue);
            return {};
        }
        if (key == "worker-threads") {
            std::size_t n = 0;
            const auto* end = value.data() + value.size();
            const auto [ptr, ec] = std::from_chars(value.data(), end, n);
            if (value.empty() || ec != std::errc{} || ptr != end) return reject(ConfigError::InvalidValue);
            cfg.worker_threads = n;
            return {};
        }
        if (key == "log-events") {
            if (!parse_bool(value, cfg.log_events)) return reject(ConfigError::InvalidValue);
            return {};
        }
        return reject(ConfigError::UnknownKey);
    }

    } // namespace

    const char* to_string(ConfigError e) noexcept {
        switch (e) {
            case ConfigError::FileNotFound: return "file_not_found";
            case ConfigError::Malformed:    return "malformed";
            case ConfigError::UnknownKey:   return "unknown_key";
            case ConfigError::InvalidValue: return "invalid_value";
        }
        return "unknown";
    }

    RuntimeConfig Loader::defaults() noexcept {
        return RuntimeConfig{}; // every field defaults from constants
    }

    pinview_detail::expected<RuntimeConfig, ConfigError>
    Loader::load_from_string(std::string_view text) {
        RuntimeConfig cfg = defaults();
        while (!text.empty()) {
            const auto nl = text.find('\n');
            std::string_view line = text.substr(0, nl);
            text = (nl == std::string_view::npos) ? std::string_view{} : text.substr(nl + 1);

            if (const auto hash = line.find('#'); hash != std::string_view::npos) {
                line = line.substr(0, hash);
            }
            line = trim(line);
            if (line.empty()) continue;

            const auto eq = line.find('=');
            if (eq == std::string_view::npos) return reject(ConfigError::Malformed);
            const auto key = trim(line.substr(0, eq));
            const auto value = trim(line.substr(eq + 1));
            if (key.empty()) return reject(ConfigError::Malformed);

            if (auto r = apply(cfg, key, value); !r) return reject(r.error());
        }
        return cfg;
    }

    pinview_detail::expected<RuntimeConfig, ConfigError>
    Loader::load_from_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) return reject(ConfigError::FileNotFound);
        std::ostringstream buf;
        buf << in.rdbuf();
        return load_from_string(buf.str());
    }

} // namespace pinview::config
