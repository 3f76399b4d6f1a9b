/*
 * discoverer.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "discoverer.hpp"

#include <chrono>
#include <exception>
#include <iterator>

#include "integrations/govee/govee_integration.hpp"
#include "logging/logger_registry.hpp"

namespace prism::discovery {

namespace net = boost::asio;

Discoverer::Discoverer(const config::LightsConfig& config)
    : config_(config), logger_(logging::getLogger("discovery")) {}

void Discoverer::registerIntegration(
    std::shared_ptr<const Integration> integration) {
    if (!integration) {
        return;
    }

    const auto name = integration->name();
    if (!integration->preflight(config_)) {
        logger_->debug("Skipping {}: preflight not satisfied", name);
        return;
    }

    batch_.push(guardedDiscover(std::move(integration), config_, logger_));
    submitted_.push_back(name);
}

auto Discoverer::guardedDiscover(std::shared_ptr<const Integration> integration,
                                 const config::LightsConfig& config,
                                 std::shared_ptr<spdlog::logger> logger)
    -> net::awaitable<LightList> {
    const auto name = integration->name();
    try {
        auto result = co_await integration->discover(config);
        if (!result) {
            logger->error("Failed to discover lights for {}: {}", name,
                          result.error().describe());
            co_return LightList{};
        }
        logger->debug("{} contributed {} light(s)", name, result->size());
        co_return std::move(*result);
    } catch (const std::exception& e) {
        logger->error("Failed to discover lights for {}: {}", name, e.what());
    }
    co_return LightList{};
}

auto Discoverer::run() -> net::awaitable<LightList> {
    const auto started = std::chrono::steady_clock::now();
    logger_->info("Starting discovery across {} integration(s)",
                  submitted_.size());

    auto perIntegration = co_await batch_.run();
    submitted_.clear();

    LightList lights;
    for (auto& contribution : perIntegration) {
        lights.insert(lights.end(),
                      std::make_move_iterator(contribution.begin()),
                      std::make_move_iterator(contribution.end()));
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    logger_->info("Discovered {} light(s) in {} ms", lights.size(),
                  elapsed.count());
    co_return std::move(lights);
}

auto discoverLights(const config::LightsConfig& config)
    -> net::awaitable<LightList> {
    Discoverer discoverer(config);
    discoverer.registerIntegration<govee::GoveeIntegration>();
    co_return co_await discoverer.run();
}

}  // namespace prism::discovery
