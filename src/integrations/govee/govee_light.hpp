/*
 * govee_light.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Govee LAN light handle

**************************************************/

#ifndef PRISM_INTEGRATIONS_GOVEE_LIGHT_HPP
#define PRISM_INTEGRATIONS_GOVEE_LIGHT_HPP

#include <cstdint>
#include <memory>
#include <string>

#include "core/light.hpp"
#include "govee_client.hpp"

namespace prism::govee {

inline constexpr const char* VENDOR_NAME = "govee";

/**
 * @brief Light reachable through the Govee LAN API
 *
 * Shares its UDP socket with every other light of the same discovery pass.
 * A handle only exists once its initial devStatus exchange succeeded; a
 * failed command afterwards leaves the cache untouched and returns the error.
 */
class GoveeLight : public Light {
public:
    /**
     * @brief Create a handle and read the device's initial state
     * @param client Shared client socket
     * @param address IPv4 address of the device, also its local id
     * @return ConfigError for an invalid address, otherwise the error of the
     *         initial devStatus exchange
     */
    static auto create(std::shared_ptr<GoveeClient> client, std::string address)
        -> boost::asio::awaitable<Result<std::unique_ptr<GoveeLight>>>;

    auto refreshState() -> boost::asio::awaitable<VoidResult> override;
    auto setOn(bool on) -> boost::asio::awaitable<VoidResult> override;
    auto setColor(std::uint8_t red, std::uint8_t green, std::uint8_t blue)
        -> boost::asio::awaitable<VoidResult> override;
    auto setBrightness(std::uint8_t brightness)
        -> boost::asio::awaitable<VoidResult> override;

    [[nodiscard]] auto id() const -> std::string override;
    [[nodiscard]] auto name() const -> std::string override;
    [[nodiscard]] auto isOn() const -> bool override { return isOn_; }
    [[nodiscard]] auto red() const -> std::uint8_t override { return color_.r; }
    [[nodiscard]] auto green() const -> std::uint8_t override {
        return color_.g;
    }
    [[nodiscard]] auto blue() const -> std::uint8_t override { return color_.b; }
    [[nodiscard]] auto brightness() const -> std::uint8_t override {
        return brightness_;
    }
    [[nodiscard]] auto supportsColor() const -> bool override { return true; }

    // Govee specific
    [[nodiscard]] auto address() const -> const std::string& { return address_; }
    [[nodiscard]] auto endpoint() const -> const udp::endpoint& {
        return endpoint_;
    }
    [[nodiscard]] auto colorTemperatureKelvin() const -> std::uint32_t {
        return colorTemperatureKelvin_;
    }

private:
    GoveeLight(std::shared_ptr<GoveeClient> client, udp::endpoint endpoint,
               std::string address);

    auto send(Request request) -> boost::asio::awaitable<VoidResult>;

    std::shared_ptr<GoveeClient> client_;
    udp::endpoint endpoint_;
    std::string address_;

    bool isOn_{false};
    std::uint8_t brightness_{0};
    DeviceColor color_;
    std::uint32_t colorTemperatureKelvin_{0};
};

}  // namespace prism::govee

#endif  // PRISM_INTEGRATIONS_GOVEE_LIGHT_HPP
