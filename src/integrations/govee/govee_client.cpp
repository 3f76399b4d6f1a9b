/*
 * govee_client.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "govee_client.hpp"

#include <array>
#include <string_view>

#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "logging/logger_registry.hpp"

namespace prism::govee {

namespace net = boost::asio;

namespace {

struct ReceiveWatch {
    bool active{true};
    bool expired{false};
};

}  // namespace

auto toString(const udp::endpoint& endpoint) -> std::string {
    return endpoint.address().to_string() + ":" +
           std::to_string(endpoint.port());
}

GoveeClient::GoveeClient(const net::any_io_executor& executor, Options options)
    : socket_(executor),
      options_(options),
      logger_(logging::getLogger("govee")) {}

GoveeClient::~GoveeClient() {
    boost::system::error_code ec;
    socket_.close(ec);
    if (ec) {
        logger_->debug("Closing Govee client socket: {}", ec.message());
    }
}

auto GoveeClient::open(const net::any_io_executor& executor,
                       const Options& options)
    -> Result<std::shared_ptr<GoveeClient>> {
    std::shared_ptr<GoveeClient> client(new GoveeClient(executor, options));

    boost::system::error_code ec;
    client->socket_.open(udp::v4(), ec);
    if (ec) {
        return std::unexpected(
            Error::transport("cannot open UDP socket: " + ec.message()));
    }

    udp::endpoint local(net::ip::address_v4::any(), options.listenPort);
    client->socket_.bind(local, ec);
    if (ec) {
        return std::unexpected(Error::transport(
            "cannot bind UDP port " + std::to_string(options.listenPort) +
            ": " + ec.message()));
    }

    // Keeps the synchronous stale-datagram drain from ever blocking
    client->socket_.non_blocking(true, ec);
    if (ec) {
        return std::unexpected(Error::transport(
            "cannot make UDP socket non-blocking: " + ec.message()));
    }

    client->logger_->debug("Govee client bound to {}",
                           toString(client->localEndpoint()));
    return client;
}

auto GoveeClient::localEndpoint() const -> udp::endpoint {
    boost::system::error_code ec;
    auto endpoint = socket_.local_endpoint(ec);
    return ec ? udp::endpoint{} : endpoint;
}

auto GoveeClient::sendMessage(udp::endpoint device, Request request)
    -> net::awaitable<Result<Response>> {
    auto exchange = co_await exchangeMutex_.scopedLock();

    discardPendingDatagrams();

    const auto payload = encodeRequest(request);
    logger_->trace("-> {} {}", toString(device), payload);

    boost::system::error_code ec;
    co_await socket_.async_send_to(net::buffer(payload), device,
                                   net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        co_return std::unexpected(Error::transport(
            "send to " + toString(device) + " failed: " + ec.message()));
    }

    if (!expectsResponse(request)) {
        co_return VoidResponse{};
    }

    co_return co_await receiveReply(device);
}

void GoveeClient::discardPendingDatagrams() {
    std::array<char, RECEIVE_BUFFER_SIZE> buffer{};
    boost::system::error_code ec;

    while (socket_.available(ec) > 0 && !ec) {
        udp::endpoint sender;
        const auto size =
            socket_.receive_from(net::buffer(buffer), sender, 0, ec);
        if (ec) {
            break;
        }
        logger_->warn("Discarding stale datagram from {} ({} bytes)",
                      toString(sender), size);
    }
}

auto GoveeClient::receiveReply(const udp::endpoint& device)
    -> net::awaitable<Result<Response>> {
    std::array<char, RECEIVE_BUFFER_SIZE> buffer{};
    const auto deadline =
        std::chrono::steady_clock::now() + options_.replyTimeout;

    net::steady_timer timer(socket_.get_executor());

    for (;;) {
        // The timer cancels the pending receive when the deadline passes.
        // A watch that is no longer active belongs to a finished receive and
        // must not cancel whatever runs on the socket next.
        auto watch = std::make_shared<ReceiveWatch>();
        timer.expires_at(deadline);
        timer.async_wait(
            [self = shared_from_this(), watch](boost::system::error_code ec) {
                if (!ec && watch->active) {
                    watch->expired = true;
                    boost::system::error_code ignored;
                    self->socket_.cancel(ignored);
                }
            });

        udp::endpoint sender;
        boost::system::error_code ec;
        const auto size = co_await socket_.async_receive_from(
            net::buffer(buffer), sender,
            net::redirect_error(net::use_awaitable, ec));
        watch->active = false;
        timer.cancel();

        if (ec) {
            if (watch->expired) {
                co_return std::unexpected(Error::transport(
                    "no reply from " + toString(device) + " within " +
                    std::to_string(options_.replyTimeout.count()) + " ms"));
            }
            co_return std::unexpected(Error::transport(
                "receive from " + toString(device) + " failed: " +
                ec.message()));
        }

        if (sender.address() != device.address()) {
            logger_->warn("Dropping datagram from {} while waiting for {}",
                          toString(sender), toString(device));
            continue;
        }

        std::string_view text(buffer.data(), size);
        logger_->trace("<- {} {}", toString(sender), text);
        co_return decodeResponse(text);
    }
}

}  // namespace prism::govee
