/*
 * logger_registry.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Named spdlog loggers shared by the prism modules

**************************************************/

#ifndef PRISM_LOGGING_LOGGER_REGISTRY_HPP
#define PRISM_LOGGING_LOGGER_REGISTRY_HPP

#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "config/lights_config.hpp"

namespace prism::logging {

/**
 * @brief Registry for the library's named loggers
 *
 * Every logger created here shares the same sinks (a colored stdout sink
 * by default) and the level/pattern last applied through configure().
 * Loggers are also registered with spdlog so spdlog::get(name) finds them.
 */
class LoggerRegistry {
public:
    static auto getInstance() -> LoggerRegistry&;

    LoggerRegistry(const LoggerRegistry&) = delete;
    LoggerRegistry& operator=(const LoggerRegistry&) = delete;

    /**
     * @brief Get or create a logger by name
     */
    auto getOrCreate(const std::string& name) -> std::shared_ptr<spdlog::logger>;

    /**
     * @brief Apply level and pattern to every existing and future logger
     */
    void configure(const config::LoggingConfig& config);

    /**
     * @brief Attach a sink to every existing and future logger
     */
    void addSinkToAll(const spdlog::sink_ptr& sink);

    /**
     * @brief Detach a sink previously added with addSinkToAll
     */
    void removeSinkFromAll(const spdlog::sink_ptr& sink);

    [[nodiscard]] auto level() const -> spdlog::level::level_enum;

    [[nodiscard]] auto loggerNames() const -> std::vector<std::string>;

private:
    LoggerRegistry();

    mutable std::shared_mutex mutex_;
    std::vector<spdlog::sink_ptr> sinks_;
    std::vector<std::shared_ptr<spdlog::logger>> loggers_;
    spdlog::level::level_enum level_{spdlog::level::info};
    std::string pattern_;
};

/**
 * @brief Parse a level name, falling back to info for unknown names
 */
[[nodiscard]] auto levelFromString(const std::string& name)
    -> spdlog::level::level_enum;

/**
 * @brief Shorthand for LoggerRegistry::getInstance().getOrCreate(name)
 */
auto getLogger(const std::string& name) -> std::shared_ptr<spdlog::logger>;

/**
 * @brief Shorthand for LoggerRegistry::getInstance().configure(config)
 */
void initialize(const config::LoggingConfig& config);

}  // namespace prism::logging

#endif  // PRISM_LOGGING_LOGGER_REGISTRY_HPP
