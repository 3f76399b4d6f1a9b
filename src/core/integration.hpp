/*
 * integration.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Vendor integration contract used by the discoverer

**************************************************/

#ifndef PRISM_CORE_INTEGRATION_HPP
#define PRISM_CORE_INTEGRATION_HPP

#include <string>

#include <utility>

#include <boost/asio/awaitable.hpp>

#include "error.hpp"
#include "light.hpp"

namespace prism::config {
struct LightsConfig;
}

namespace prism {

/**
 * @brief Abstract vendor integration
 *
 * An integration holds no state of its own; everything it needs comes from
 * the configuration snapshot passed to each call.
 */
class Integration {
public:
    Integration() = default;
    virtual ~Integration() = default;

    // Disable copy
    Integration(const Integration&) = delete;
    Integration& operator=(const Integration&) = delete;

    /**
     * @brief Vendor identifier, also used as the light id namespace
     */
    [[nodiscard]] virtual auto name() const -> std::string = 0;

    /**
     * @brief Cheap synchronous gate
     *
     * Must not perform I/O. When it returns false, discover() is never
     * called for this integration.
     */
    [[nodiscard]] virtual auto preflight(
        const config::LightsConfig& config) const -> bool = 0;

    /**
     * @brief Discover the vendor's lights
     *
     * Fails with DiscoveryError only when discovery cannot start at all.
     * Devices that cannot be reached are logged and left out of the result.
     */
    virtual auto discover(const config::LightsConfig& config) const
        -> boost::asio::awaitable<Result<LightList>> = 0;
};

}  // namespace prism

#endif  // PRISM_CORE_INTEGRATION_HPP
