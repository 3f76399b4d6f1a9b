/*
 * govee_integration.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Govee LAN API integration

**************************************************/

#ifndef PRISM_INTEGRATIONS_GOVEE_INTEGRATION_HPP
#define PRISM_INTEGRATIONS_GOVEE_INTEGRATION_HPP

#include <memory>
#include <string>

#include "config/lights_config.hpp"
#include "core/integration.hpp"
#include "govee_client.hpp"

namespace prism::govee {

/**
 * @brief Discovers Govee lights from the configured address list
 *
 * No broadcast scan: every configured address gets a handle bound to one
 * shared client socket, and is probed with devStatus concurrently with the
 * others. Addresses that fail are logged and skipped.
 */
class GoveeIntegration : public Integration {
public:
    [[nodiscard]] auto name() const -> std::string override;

    [[nodiscard]] auto preflight(const config::LightsConfig& config) const
        -> bool override;

    auto discover(const config::LightsConfig& config) const
        -> boost::asio::awaitable<Result<LightList>> override;

    /**
     * @brief Client options derived from the Govee configuration section
     */
    [[nodiscard]] static auto clientOptions(const config::GoveeConfig& config)
        -> GoveeClient::Options;

private:
    static auto connectLight(std::shared_ptr<GoveeClient> client,
                             std::string address)
        -> boost::asio::awaitable<LightPtr>;
};

}  // namespace prism::govee

#endif  // PRISM_INTEGRATIONS_GOVEE_INTEGRATION_HPP
