/*
 * error.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Error taxonomy shared by every light integration

**************************************************/

#ifndef PRISM_CORE_ERROR_HPP
#define PRISM_CORE_ERROR_HPP

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace prism {

/**
 * @brief Error kinds reported by lights and integrations
 */
enum class ErrorCode : std::uint8_t {
    TransportError,  ///< bind/connect/send/receive failure
    ProtocolError,   ///< response does not parse or has the wrong shape
    ConfigError,     ///< malformed address or connection parameters
    DiscoveryError   ///< an integration cannot begin discovery
};

/**
 * @brief Convert ErrorCode to string
 */
[[nodiscard]] auto toString(ErrorCode code) -> std::string_view;

/**
 * @brief Error value carried through std::expected
 */
struct Error {
    ErrorCode code{ErrorCode::TransportError};
    std::string message;

    [[nodiscard]] static auto transport(std::string message) -> Error {
        return {ErrorCode::TransportError, std::move(message)};
    }
    [[nodiscard]] static auto protocol(std::string message) -> Error {
        return {ErrorCode::ProtocolError, std::move(message)};
    }
    [[nodiscard]] static auto config(std::string message) -> Error {
        return {ErrorCode::ConfigError, std::move(message)};
    }

    /**
     * @brief Wrap an inner error as a DiscoveryError
     * @param context What the integration was trying to do
     * @param inner The underlying failure
     */
    [[nodiscard]] static auto discovery(std::string_view context,
                                        const Error& inner) -> Error;

    /**
     * @brief Human-readable form used in log lines
     */
    [[nodiscard]] auto describe() const -> std::string;

    bool operator==(const Error&) const = default;
};

template <typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

}  // namespace prism

#endif  // PRISM_CORE_ERROR_HPP
