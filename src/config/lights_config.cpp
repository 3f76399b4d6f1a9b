/*
 * lights_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "lights_config.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

#include "logging/logger_registry.hpp"

namespace prism::config {

namespace {

// Integers only; floats, strings and values outside [min, max] throw.
auto readBounded(const json& j, const char* key, std::int64_t fallback,
                 std::int64_t min, std::int64_t max) -> std::int64_t {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto& value = j.at(key);
    if (!value.is_number_integer()) {
        throw std::invalid_argument(std::string("'") + key +
                                    "' must be an integer");
    }
    constexpr auto INT64_LIMIT =
        static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    if (value.is_number_unsigned() && value.get<std::uint64_t>() > INT64_LIMIT) {
        throw std::out_of_range(std::string("'") + key + "' is out of range");
    }
    const auto raw = value.get<std::int64_t>();
    if (raw < min || raw > max) {
        throw std::out_of_range(std::string("'") + key + "' must be within [" +
                                std::to_string(min) + ", " +
                                std::to_string(max) + "], got " +
                                std::to_string(raw));
    }
    return raw;
}

}  // namespace

GoveeConfig GoveeConfig::fromJson(const json& j) {
    constexpr std::int64_t MAX_PORT = std::numeric_limits<std::uint16_t>::max();

    GoveeConfig cfg;
    cfg.enabled = j.value("enabled", cfg.enabled);
    cfg.addresses = j.value("addresses", cfg.addresses);
    cfg.scanTimeoutMs = static_cast<std::uint64_t>(
        readBounded(j, "scan_timeout",
                    static_cast<std::int64_t>(cfg.scanTimeoutMs), 1,
                    static_cast<std::int64_t>(MAX_SCAN_TIMEOUT_MS)));
    cfg.listenPort = static_cast<std::uint16_t>(
        readBounded(j, "listen_port", cfg.listenPort, 0, MAX_PORT));
    cfg.devicePort = static_cast<std::uint16_t>(
        readBounded(j, "device_port", cfg.devicePort, 0, MAX_PORT));
    return cfg;
}

auto LightsConfig::fromJson(const json& j) -> Result<LightsConfig> {
    if (!j.is_object()) {
        return std::unexpected(
            Error::config("configuration root must be a JSON object"));
    }

    try {
        LightsConfig cfg;
        if (j.contains("logging")) {
            cfg.logging = LoggingConfig::fromJson(j.at("logging"));
        }
        if (j.contains("govee")) {
            cfg.govee = GoveeConfig::fromJson(j.at("govee"));
        }
        return cfg;
    } catch (const json::exception& e) {
        return std::unexpected(Error::config(e.what()));
    } catch (const std::logic_error& e) {
        return std::unexpected(Error::config(e.what()));
    }
}

auto LightsConfig::parse(const std::string& text) -> Result<LightsConfig> {
    auto document = json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return std::unexpected(Error::config("malformed JSON configuration"));
    }
    return fromJson(document);
}

auto LightsConfig::loadFromFile(const std::filesystem::path& path)
    -> Result<LightsConfig> {
    auto logger = logging::getLogger("config");

    std::ifstream file(path);
    if (!file.is_open()) {
        logger->error("Cannot open configuration file {}", path.string());
        return std::unexpected(
            Error::config("cannot open " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = parse(buffer.str());
    if (!result) {
        logger->error("Invalid configuration in {}: {}", path.string(),
                      result.error().describe());
        return result;
    }

    logger->debug("Loaded configuration from {}", path.string());
    return result;
}

}  // namespace prism::config
