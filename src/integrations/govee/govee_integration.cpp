/*
 * govee_integration.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "govee_integration.hpp"

#include <chrono>

#include <utility>

#include <boost/asio/this_coro.hpp>

#include "async/future_batch.hpp"
#include "govee_light.hpp"
#include "logging/logger_registry.hpp"

namespace prism::govee {

namespace net = boost::asio;

auto GoveeIntegration::name() const -> std::string { return VENDOR_NAME; }

auto GoveeIntegration::preflight(const config::LightsConfig& config) const
    -> bool {
    return config.govee.enabled;
}

auto GoveeIntegration::clientOptions(const config::GoveeConfig& config)
    -> GoveeClient::Options {
    GoveeClient::Options options;
    options.listenPort = config.listenPort;
    options.devicePort = config.devicePort;
    options.replyTimeout = std::chrono::milliseconds(config.scanTimeoutMs);
    return options;
}

auto GoveeIntegration::discover(const config::LightsConfig& config) const
    -> net::awaitable<Result<LightList>> {
    auto logger = logging::getLogger("govee");
    const auto addresses = config.govee.addresses;
    const auto options = clientOptions(config.govee);

    auto executor = co_await net::this_coro::executor;
    auto client = GoveeClient::open(executor, options);
    if (!client) {
        co_return std::unexpected(
            Error::discovery("cannot start Govee discovery", client.error()));
    }

    logger->debug("Probing {} configured Govee address(es)", addresses.size());

    async::FutureBatch<LightPtr> batch;
    for (const auto& address : addresses) {
        batch.push(connectLight(*client, address));
    }

    auto probed = co_await batch.run();

    LightList lights;
    lights.reserve(probed.size());
    for (auto& light : probed) {
        if (light) {
            lights.push_back(std::move(light));
        }
    }

    logger->info("Found {} of {} Govee light(s)", lights.size(),
                 addresses.size());
    co_return std::move(lights);
}

auto GoveeIntegration::connectLight(std::shared_ptr<GoveeClient> client,
                                    std::string address)
    -> net::awaitable<LightPtr> {
    auto light = co_await GoveeLight::create(std::move(client), address);
    if (!light) {
        logging::getLogger("govee")->warn(
            "Failed to connect to Govee light at {}: {}", address,
            light.error().describe());
        co_return nullptr;
    }
    co_return std::move(*light);
}

}  // namespace prism::govee
