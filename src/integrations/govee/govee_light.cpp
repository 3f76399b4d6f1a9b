/*
 * govee_light.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "govee_light.hpp"

#include <utility>

#include <boost/asio/ip/address_v4.hpp>

namespace prism::govee {

namespace net = boost::asio;

GoveeLight::GoveeLight(std::shared_ptr<GoveeClient> client,
                       udp::endpoint endpoint, std::string address)
    : client_(std::move(client)),
      endpoint_(std::move(endpoint)),
      address_(std::move(address)) {}

auto GoveeLight::create(std::shared_ptr<GoveeClient> client,
                        std::string address)
    -> net::awaitable<Result<std::unique_ptr<GoveeLight>>> {
    boost::system::error_code ec;
    auto ip = net::ip::make_address_v4(address, ec);
    if (ec) {
        co_return std::unexpected(
            Error::config("'" + address + "' is not an IPv4 address"));
    }

    auto endpoint = client->deviceEndpoint(ip);
    std::unique_ptr<GoveeLight> light(
        new GoveeLight(std::move(client), endpoint, std::move(address)));

    auto refreshed = co_await light->refreshState();
    if (!refreshed) {
        co_return std::unexpected(refreshed.error());
    }
    co_return std::move(light);
}

auto GoveeLight::send(Request request) -> net::awaitable<VoidResult> {
    auto response = co_await client_->sendMessage(endpoint_, std::move(request));
    if (!response) {
        co_return std::unexpected(response.error());
    }
    co_return VoidResult{};
}

auto GoveeLight::refreshState() -> net::awaitable<VoidResult> {
    auto response =
        co_await client_->sendMessage(endpoint_, request::DevStatus{});
    if (!response) {
        co_return std::unexpected(response.error());
    }

    const auto* status = std::get_if<DeviceStatus>(&*response);
    if (status == nullptr) {
        co_return std::unexpected(
            Error::protocol("unexpected response to devStatus"));
    }

    isOn_ = status->on;
    brightness_ = status->brightness;
    color_ = status->color;
    colorTemperatureKelvin_ = status->colorTemperatureKelvin;
    co_return VoidResult{};
}

auto GoveeLight::setOn(bool on) -> net::awaitable<VoidResult> {
    auto result = co_await send(
        request::Turn{static_cast<std::uint8_t>(encodeOnOff(on))});
    if (result) {
        isOn_ = on;
    }
    co_return result;
}

auto GoveeLight::setColor(std::uint8_t red, std::uint8_t green,
                          std::uint8_t blue) -> net::awaitable<VoidResult> {
    const DeviceColor color{red, green, blue};
    auto result = co_await send(request::Color{color});
    if (result) {
        color_ = color;
    }
    co_return result;
}

auto GoveeLight::setBrightness(std::uint8_t brightness)
    -> net::awaitable<VoidResult> {
    auto result = co_await send(request::Brightness{brightness});
    if (result) {
        brightness_ = brightness;
    }
    co_return result;
}

auto GoveeLight::id() const -> std::string {
    return makeLightId(VENDOR_NAME, address_);
}

auto GoveeLight::name() const -> std::string {
    return "Govee Light (" + address_ + ")";
}

}  // namespace prism::govee
