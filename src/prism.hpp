/**
 * @file prism.hpp
 * @brief Main aggregated header for the prism light library.
 *
 * @par Usage Example:
 * @code
 * #include "prism.hpp"
 *
 * auto config = prism::config::LightsConfig::loadFromFile("lights.json");
 * prism::logging::initialize(config->logging);
 *
 * boost::asio::io_context ioc;
 * boost::asio::co_spawn(ioc, [&]() -> boost::asio::awaitable<void> {
 *     auto lights = co_await prism::discoverLights(*config);
 *     for (auto& light : lights) {
 *         co_await light->setOn(true);
 *     }
 * }, boost::asio::detached);
 * ioc.run();
 * @endcode
 *
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef PRISM_PRISM_HPP
#define PRISM_PRISM_HPP

#include "async/future_batch.hpp"
#include "config/lights_config.hpp"
#include "core/error.hpp"
#include "core/integration.hpp"
#include "core/light.hpp"
#include "discovery/discoverer.hpp"
#include "integrations/govee/govee_integration.hpp"
#include "integrations/govee/govee_light.hpp"
#include "logging/logger_registry.hpp"

namespace prism {

inline constexpr const char* PRISM_VERSION = "0.1.0";

}  // namespace prism

#endif  // PRISM_PRISM_HPP
