/*
 * logger_registry.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logger_registry.hpp"

#include <algorithm>
#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace prism::logging {

LoggerRegistry::LoggerRegistry()
    : pattern_(config::LoggingConfig{}.pattern) {
    sinks_.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
}

auto LoggerRegistry::getInstance() -> LoggerRegistry& {
    static LoggerRegistry instance;
    return instance;
}

auto LoggerRegistry::getOrCreate(const std::string& name)
    -> std::shared_ptr<spdlog::logger> {
    {
        std::shared_lock lock(mutex_);
        auto it = std::find_if(loggers_.begin(), loggers_.end(),
                               [&name](const auto& logger) {
                                   return logger->name() == name;
                               });
        if (it != loggers_.end()) {
            return *it;
        }
    }

    std::unique_lock lock(mutex_);
    // Another thread may have created it between the two locks.
    for (const auto& logger : loggers_) {
        if (logger->name() == name) {
            return logger;
        }
    }

    auto logger =
        std::make_shared<spdlog::logger>(name, sinks_.begin(), sinks_.end());
    logger->set_level(level_);
    logger->set_pattern(pattern_);

    if (!spdlog::get(name)) {
        spdlog::register_logger(logger);
    }
    loggers_.push_back(logger);
    return logger;
}

void LoggerRegistry::configure(const config::LoggingConfig& config) {
    std::unique_lock lock(mutex_);

    level_ = levelFromString(config.level);
    if (!config.pattern.empty()) {
        pattern_ = config.pattern;
    }

    for (const auto& logger : loggers_) {
        logger->set_level(level_);
        logger->set_pattern(pattern_);
    }
}

void LoggerRegistry::addSinkToAll(const spdlog::sink_ptr& sink) {
    std::unique_lock lock(mutex_);

    sinks_.push_back(sink);
    for (const auto& logger : loggers_) {
        logger->sinks().push_back(sink);
    }
}

void LoggerRegistry::removeSinkFromAll(const spdlog::sink_ptr& sink) {
    std::unique_lock lock(mutex_);

    auto erase = [&sink](std::vector<spdlog::sink_ptr>& sinks) {
        sinks.erase(std::remove(sinks.begin(), sinks.end(), sink), sinks.end());
    };
    erase(sinks_);
    for (const auto& logger : loggers_) {
        erase(logger->sinks());
    }
}

auto LoggerRegistry::level() const -> spdlog::level::level_enum {
    std::shared_lock lock(mutex_);
    return level_;
}

auto LoggerRegistry::loggerNames() const -> std::vector<std::string> {
    std::shared_lock lock(mutex_);

    std::vector<std::string> names;
    names.reserve(loggers_.size());
    for (const auto& logger : loggers_) {
        names.push_back(logger->name());
    }
    return names;
}

auto levelFromString(const std::string& name) -> spdlog::level::level_enum {
    if (name == "off") {
        return spdlog::level::off;
    }
    // from_str maps unknown names to off
    auto level = spdlog::level::from_str(name);
    return level == spdlog::level::off ? spdlog::level::info : level;
}

auto getLogger(const std::string& name) -> std::shared_ptr<spdlog::logger> {
    return LoggerRegistry::getInstance().getOrCreate(name);
}

void initialize(const config::LoggingConfig& config) {
    LoggerRegistry::getInstance().configure(config);
}

}  // namespace prism::logging
