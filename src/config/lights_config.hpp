/*
 * lights_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Read-only configuration snapshot shared by every integration

**************************************************/

#ifndef PRISM_CONFIG_LIGHTS_CONFIG_HPP
#define PRISM_CONFIG_LIGHTS_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/error.hpp"

namespace prism::config {

using json = nlohmann::json;

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
    std::string level{"info"};  ///< trace, debug, info, warn, error, critical, off
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v"};

    [[nodiscard]] json toJson() const {
        return {{"level", level}, {"pattern", pattern}};
    }

    [[nodiscard]] static LoggingConfig fromJson(const json& j) {
        LoggingConfig cfg;
        cfg.level = j.value("level", cfg.level);
        cfg.pattern = j.value("pattern", cfg.pattern);
        return cfg;
    }
};

/**
 * @brief Govee LAN API configuration
 */
struct GoveeConfig {
    static constexpr std::uint16_t DEFAULT_LISTEN_PORT = 4002;
    static constexpr std::uint16_t DEFAULT_DEVICE_PORT = 4003;
    static constexpr std::uint64_t MAX_SCAN_TIMEOUT_MS = 3'600'000;

    bool enabled{false};                         ///< Gates preflight
    std::vector<std::string> addresses;          ///< Static device list (IPv4)
    std::uint64_t scanTimeoutMs{5000};           ///< Bound on every reply wait
    std::uint16_t listenPort{DEFAULT_LISTEN_PORT};  ///< Local port, 0 = ephemeral
    std::uint16_t devicePort{DEFAULT_DEVICE_PORT};  ///< Device control port

    [[nodiscard]] json toJson() const {
        return {{"enabled", enabled},
                {"addresses", addresses},
                {"scan_timeout", scanTimeoutMs},
                {"listen_port", listenPort},
                {"device_port", devicePort}};
    }

    /**
     * @brief Read the section, range-checking every number
     * @throws std::out_of_range or std::invalid_argument on a bad value
     */
    [[nodiscard]] static GoveeConfig fromJson(const json& j);
};

/**
 * @brief Process-wide configuration
 *
 * Loaded once and passed by const reference to every integration. Never
 * mutated after discovery begins.
 */
struct LightsConfig {
    LoggingConfig logging;
    GoveeConfig govee;

    [[nodiscard]] json toJson() const {
        return {{"logging", logging.toJson()}, {"govee", govee.toJson()}};
    }

    /**
     * @brief Build a configuration from JSON
     *
     * Missing sections and fields take their defaults.
     * @return ConfigError when a field has the wrong type or a number is
     *         out of range
     */
    [[nodiscard]] static auto fromJson(const json& j) -> Result<LightsConfig>;

    /**
     * @brief Parse a JSON document
     * @return ConfigError on malformed text or wrong field types
     */
    [[nodiscard]] static auto parse(const std::string& text)
        -> Result<LightsConfig>;

    /**
     * @brief Load a JSON configuration file
     * @return ConfigError if the file cannot be read or parsed
     */
    [[nodiscard]] static auto loadFromFile(const std::filesystem::path& path)
        -> Result<LightsConfig>;
};

}  // namespace prism::config

#endif  // PRISM_CONFIG_LIGHTS_CONFIG_HPP
