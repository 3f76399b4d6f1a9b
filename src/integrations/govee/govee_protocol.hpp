/*
 * govee_protocol.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Govee LAN API message types and JSON codec

Every datagram is an envelope {"msg":{"cmd":<name>,"data":<payload>}}.
The on/off flag travels as an integer 0/1, never as a JSON boolean.

**************************************************/

#ifndef PRISM_INTEGRATIONS_GOVEE_PROTOCOL_HPP
#define PRISM_INTEGRATIONS_GOVEE_PROTOCOL_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

#include "core/error.hpp"

namespace prism::govee {

using json = nlohmann::json;

struct DeviceColor {
    std::uint8_t r{0};
    std::uint8_t g{0};
    std::uint8_t b{0};

    bool operator==(const DeviceColor&) const = default;
};

/**
 * @brief Payload of a devStatus reply
 */
struct DeviceStatus {
    bool on{false};
    std::uint8_t brightness{0};
    DeviceColor color;
    std::uint32_t colorTemperatureKelvin{0};

    bool operator==(const DeviceStatus&) const = default;
};

namespace request {

struct DevStatus {
    bool operator==(const DevStatus&) const = default;
};

struct Turn {
    std::uint8_t value{0};  ///< 1 = on, 0 = off
    bool operator==(const Turn&) const = default;
};

struct Brightness {
    std::uint8_t value{0};
    bool operator==(const Brightness&) const = default;
};

struct Color {
    DeviceColor color;
    bool operator==(const Color&) const = default;
};

}  // namespace request

using Request = std::variant<request::DevStatus, request::Turn,
                             request::Brightness, request::Color>;

/**
 * @brief Placeholder for commands that get no reply
 */
struct VoidResponse {
    bool operator==(const VoidResponse&) const = default;
};

using Response = std::variant<VoidResponse, DeviceStatus>;

// Command names on the wire
inline constexpr std::string_view CMD_DEV_STATUS = "devStatus";
inline constexpr std::string_view CMD_TURN = "turn";
inline constexpr std::string_view CMD_BRIGHTNESS = "brightness";
inline constexpr std::string_view CMD_COLOR = "colorwc";

[[nodiscard]] auto commandName(const Request& request) -> std::string_view;

/**
 * @brief Whether the device answers this command
 */
[[nodiscard]] auto expectsResponse(const Request& request) -> bool;

[[nodiscard]] auto encodeRequest(const Request& request) -> std::string;

/**
 * @brief Decode a request envelope (device side of the exchange)
 * @return ProtocolError for unknown commands or malformed payloads
 */
[[nodiscard]] auto decodeRequest(std::string_view text) -> Result<Request>;

/**
 * @brief Encode a devStatus reply envelope (device side of the exchange)
 */
[[nodiscard]] auto encodeStatusResponse(const DeviceStatus& status)
    -> std::string;

/**
 * @brief Decode a reply envelope
 * @return ProtocolError when the text is not a known reply
 */
[[nodiscard]] auto decodeResponse(std::string_view text) -> Result<Response>;

// onOff wire mapping
[[nodiscard]] constexpr auto encodeOnOff(bool on) -> int { return on ? 1 : 0; }
[[nodiscard]] auto decodeOnOff(const json& value) -> Result<bool>;

}  // namespace prism::govee

#endif  // PRISM_INTEGRATIONS_GOVEE_PROTOCOL_HPP
