/*
 * light.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Vendor-neutral capability interface for a controllable light

**************************************************/

#ifndef PRISM_CORE_LIGHT_HPP
#define PRISM_CORE_LIGHT_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <utility>

#include <boost/asio/awaitable.hpp>

#include "error.hpp"

namespace prism {

/**
 * @brief Abstract light handle
 *
 * One subclass per vendor. A handle caches the last known device state.
 * Mutators are write-through: the command is sent to the device first and
 * the cache is updated to the requested value once the send succeeds, with
 * no read-back. Accessors only read the cache and never perform I/O.
 *
 * A handle is exclusively owned by whoever received it from discovery.
 */
class Light {
public:
    Light() = default;
    virtual ~Light() = default;

    // Disable copy
    Light(const Light&) = delete;
    Light& operator=(const Light&) = delete;

    // ==================== Device Operations ====================

    /**
     * @brief Query the device and replace every cached field
     * @return TransportError or ProtocolError on failure
     */
    virtual auto refreshState() -> boost::asio::awaitable<VoidResult> = 0;

    /**
     * @brief Switch the light on or off
     */
    virtual auto setOn(bool on) -> boost::asio::awaitable<VoidResult> = 0;

    /**
     * @brief Set the RGB color
     */
    virtual auto setColor(std::uint8_t red, std::uint8_t green,
                          std::uint8_t blue)
        -> boost::asio::awaitable<VoidResult> = 0;

    /**
     * @brief Set brightness, 0-100
     */
    virtual auto setBrightness(std::uint8_t brightness)
        -> boost::asio::awaitable<VoidResult> = 0;

    // ==================== Cached State ====================

    /**
     * @brief Globally unique id of the form "<vendor>::<local-id>"
     */
    [[nodiscard]] virtual auto id() const -> std::string = 0;
    [[nodiscard]] virtual auto name() const -> std::string = 0;
    [[nodiscard]] virtual auto isOn() const -> bool = 0;
    [[nodiscard]] virtual auto red() const -> std::uint8_t = 0;
    [[nodiscard]] virtual auto green() const -> std::uint8_t = 0;
    [[nodiscard]] virtual auto blue() const -> std::uint8_t = 0;
    [[nodiscard]] virtual auto brightness() const -> std::uint8_t = 0;

    /**
     * @brief Whether setColor has an observable effect on this device
     */
    [[nodiscard]] virtual auto supportsColor() const -> bool = 0;
};

using LightPtr = std::unique_ptr<Light>;
using LightList = std::vector<LightPtr>;

/**
 * @brief Build a namespaced light id
 */
[[nodiscard]] inline auto makeLightId(const std::string& vendor,
                                      const std::string& localId)
    -> std::string {
    return vendor + "::" + localId;
}

}  // namespace prism

#endif  // PRISM_CORE_LIGHT_HPP
