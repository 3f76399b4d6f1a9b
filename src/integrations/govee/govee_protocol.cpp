/*
 * govee_protocol.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "govee_protocol.hpp"

#include <limits>
#include <stdexcept>
#include <string>

namespace prism::govee {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

auto makeEnvelope(std::string_view cmd, json data) -> std::string {
    json envelope;
    envelope["msg"] = {{"cmd", std::string(cmd)}, {"data", std::move(data)}};
    return envelope.dump();
}

auto colorToJson(const DeviceColor& color) -> json {
    return {{"r", color.r}, {"g", color.g}, {"b", color.b}};
}

// Reads an integer field that must fit in Target; throws on mismatch so the
// caller can turn it into a ProtocolError.
template <typename Target>
auto readInteger(const json& object, const char* key) -> Target {
    const auto& value = object.at(key);
    if (!value.is_number_integer()) {
        throw std::invalid_argument(std::string("field '") + key +
                                    "' is not an integer");
    }
    auto raw = value.get<std::int64_t>();
    if (raw < 0 ||
        static_cast<std::uint64_t>(raw) > std::numeric_limits<Target>::max()) {
        throw std::out_of_range(std::string("field '") + key +
                                "' is out of range");
    }
    return static_cast<Target>(raw);
}

auto colorFromJson(const json& object) -> DeviceColor {
    DeviceColor color;
    color.r = readInteger<std::uint8_t>(object, "r");
    color.g = readInteger<std::uint8_t>(object, "g");
    color.b = readInteger<std::uint8_t>(object, "b");
    return color;
}

struct Envelope {
    std::string cmd;
    json data;
};

auto parseEnvelope(std::string_view text) -> Result<Envelope> {
    auto document = json::parse(text.begin(), text.end(), nullptr, false);
    if (document.is_discarded()) {
        return std::unexpected(Error::protocol("datagram is not valid JSON"));
    }
    if (!document.is_object() || !document.contains("msg") ||
        !document["msg"].is_object()) {
        return std::unexpected(Error::protocol("missing 'msg' envelope"));
    }

    const auto& msg = document["msg"];
    if (!msg.contains("cmd") || !msg["cmd"].is_string()) {
        return std::unexpected(Error::protocol("missing 'cmd' in envelope"));
    }

    Envelope envelope;
    envelope.cmd = msg["cmd"].get<std::string>();
    envelope.data = msg.value("data", json::object());
    return envelope;
}

}  // namespace

auto commandName(const Request& request) -> std::string_view {
    return std::visit(
        Overloaded{
            [](const request::DevStatus&) { return CMD_DEV_STATUS; },
            [](const request::Turn&) { return CMD_TURN; },
            [](const request::Brightness&) { return CMD_BRIGHTNESS; },
            [](const request::Color&) { return CMD_COLOR; },
        },
        request);
}

auto expectsResponse(const Request& request) -> bool {
    return std::holds_alternative<request::DevStatus>(request);
}

auto encodeRequest(const Request& request) -> std::string {
    auto data = std::visit(
        Overloaded{
            [](const request::DevStatus&) { return json::object(); },
            [](const request::Turn& turn) {
                return json{{"value", turn.value}};
            },
            [](const request::Brightness& brightness) {
                return json{{"value", brightness.value}};
            },
            [](const request::Color& color) {
                return json{{"color", colorToJson(color.color)}};
            },
        },
        request);
    return makeEnvelope(commandName(request), std::move(data));
}

auto decodeRequest(std::string_view text) -> Result<Request> {
    auto envelope = parseEnvelope(text);
    if (!envelope) {
        return std::unexpected(envelope.error());
    }

    try {
        const auto& data = envelope->data;
        if (envelope->cmd == CMD_DEV_STATUS) {
            return request::DevStatus{};
        }
        if (envelope->cmd == CMD_TURN) {
            return request::Turn{readInteger<std::uint8_t>(data, "value")};
        }
        if (envelope->cmd == CMD_BRIGHTNESS) {
            return request::Brightness{readInteger<std::uint8_t>(data, "value")};
        }
        if (envelope->cmd == CMD_COLOR) {
            return request::Color{colorFromJson(data.at("color"))};
        }
    } catch (const std::exception& e) {
        return std::unexpected(Error::protocol(
            "bad '" + envelope->cmd + "' payload: " + e.what()));
    }

    return std::unexpected(
        Error::protocol("unknown command '" + envelope->cmd + "'"));
}

auto encodeStatusResponse(const DeviceStatus& status) -> std::string {
    json data = {{"onOff", encodeOnOff(status.on)},
                 {"brightness", status.brightness},
                 {"color", colorToJson(status.color)},
                 {"colorTemInKelvin", status.colorTemperatureKelvin}};
    return makeEnvelope(CMD_DEV_STATUS, std::move(data));
}

auto decodeOnOff(const json& value) -> Result<bool> {
    if (value.is_number_integer()) {
        auto raw = value.get<std::int64_t>();
        if (raw == 1) {
            return true;
        }
        if (raw == 0) {
            return false;
        }
    }
    return std::unexpected(
        Error::protocol("onOff must be 0 or 1, got " + value.dump()));
}

auto decodeResponse(std::string_view text) -> Result<Response> {
    auto envelope = parseEnvelope(text);
    if (!envelope) {
        return std::unexpected(envelope.error());
    }
    if (envelope->cmd != CMD_DEV_STATUS) {
        return std::unexpected(Error::protocol(
            "unexpected reply command '" + envelope->cmd + "'"));
    }

    const auto& data = envelope->data;
    if (!data.is_object() || !data.contains("onOff")) {
        return std::unexpected(Error::protocol("devStatus reply lacks onOff"));
    }

    auto on = decodeOnOff(data["onOff"]);
    if (!on) {
        return std::unexpected(on.error());
    }

    try {
        DeviceStatus status;
        status.on = *on;
        status.brightness = readInteger<std::uint8_t>(data, "brightness");
        status.color = colorFromJson(data.at("color"));
        if (data.contains("colorTemInKelvin")) {
            status.colorTemperatureKelvin =
                readInteger<std::uint32_t>(data, "colorTemInKelvin");
        }
        return status;
    } catch (const std::exception& e) {
        return std::unexpected(
            Error::protocol(std::string("bad devStatus payload: ") + e.what()));
    }
}

}  // namespace prism::govee
