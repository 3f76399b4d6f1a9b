/*
 * error.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "error.hpp"

namespace prism {

auto toString(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::TransportError: return "TransportError";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::DiscoveryError: return "DiscoveryError";
    }
    return "UnknownError";
}

auto Error::discovery(std::string_view context, const Error& inner) -> Error {
    std::string message(context);
    message += ": ";
    message += inner.describe();
    return {ErrorCode::DiscoveryError, std::move(message)};
}

auto Error::describe() const -> std::string {
    std::string text(toString(code));
    if (!message.empty()) {
        text += " (";
        text += message;
        text += ")";
    }
    return text;
}

}  // namespace prism
