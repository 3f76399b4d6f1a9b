/*
 * discoverer.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Concurrent, fault-isolated light discovery across integrations

**************************************************/

#ifndef PRISM_DISCOVERY_DISCOVERER_HPP
#define PRISM_DISCOVERY_DISCOVERER_HPP

#include <concepts>
#include <memory>
#include <string>
#include <vector>

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <spdlog/spdlog.h>

#include "async/future_batch.hpp"
#include "config/lights_config.hpp"
#include "core/integration.hpp"
#include "core/light.hpp"

namespace prism::discovery {

/**
 * @brief One discovery pass over a set of integrations
 *
 * Each registered integration is gated by its preflight; the ones that
 * pass are discovered concurrently. A failing integration contributes no
 * lights and a log line, and never affects the others. The result lists
 * integrations in registration order, each with its lights in the order
 * the integration reported them.
 *
 * @code
 * Discoverer discoverer(config);
 * discoverer.registerIntegration<govee::GoveeIntegration>();
 * auto lights = co_await discoverer.run();
 * @endcode
 */
class Discoverer {
public:
    /**
     * @param config Configuration snapshot; must outlive run()
     */
    explicit Discoverer(const config::LightsConfig& config);

    Discoverer(const Discoverer&) = delete;
    Discoverer& operator=(const Discoverer&) = delete;

    /**
     * @brief Register an integration by type
     */
    template <std::derived_from<Integration> I>
    void registerIntegration() {
        registerIntegration(std::make_shared<const I>());
    }

    /**
     * @brief Register an integration instance
     *
     * Calls preflight immediately. Discovery is only submitted when it
     * passes.
     */
    void registerIntegration(std::shared_ptr<const Integration> integration);

    /**
     * @brief Names of the integrations whose discovery was submitted
     */
    [[nodiscard]] auto submittedIntegrations() const
        -> const std::vector<std::string>& {
        return submitted_;
    }

    /**
     * @brief Run every submitted discovery and flatten the results
     *
     * Never fails; integrations that could not be discovered contribute
     * nothing.
     */
    auto run() -> boost::asio::awaitable<LightList>;

private:
    static auto guardedDiscover(std::shared_ptr<const Integration> integration,
                                const config::LightsConfig& config,
                                std::shared_ptr<spdlog::logger> logger)
        -> boost::asio::awaitable<LightList>;

    const config::LightsConfig& config_;
    async::FutureBatch<LightList> batch_;
    std::vector<std::string> submitted_;
    std::shared_ptr<spdlog::logger> logger_;
};

/**
 * @brief Run one discovery pass over the built-in integrations
 * @param config Configuration snapshot; must outlive the returned awaitable
 */
auto discoverLights(const config::LightsConfig& config)
    -> boost::asio::awaitable<LightList>;

}  // namespace prism::discovery

namespace prism {
using discovery::discoverLights;
}  // namespace prism

#endif  // PRISM_DISCOVERY_DISCOVERER_HPP
