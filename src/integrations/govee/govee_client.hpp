/*
 * govee_client.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Shared UDP client for the Govee LAN API

**************************************************/

#ifndef PRISM_INTEGRATIONS_GOVEE_CLIENT_HPP
#define PRISM_INTEGRATIONS_GOVEE_CLIENT_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/udp.hpp>
#include <spdlog/spdlog.h>

#include "async/async_mutex.hpp"
#include "core/error.hpp"
#include "govee_protocol.hpp"

namespace prism::govee {

using udp = boost::asio::ip::udp;

/**
 * @brief One UDP socket shared by every Govee light of a discovery pass
 *
 * The protocol has no correlation id: a reply is simply the next datagram
 * that arrives after a request. To keep replies from being attributed to
 * the wrong light, every exchange (send, plus receive when the command
 * has a reply) holds the client's exchange mutex, so at most one exchange
 * is in flight per socket. Datagrams from any address other than the
 * queried device are dropped.
 *
 * Must be used from a single thread or strand.
 */
class GoveeClient : public std::enable_shared_from_this<GoveeClient> {
public:
    static constexpr std::size_t RECEIVE_BUFFER_SIZE = 1024;

    struct Options {
        std::uint16_t listenPort{4002};
        std::uint16_t devicePort{4003};
        std::chrono::milliseconds replyTimeout{5000};
    };

    /**
     * @brief Bind the client socket
     * @return TransportError if the socket cannot be opened or bound
     */
    [[nodiscard]] static auto open(const boost::asio::any_io_executor& executor,
                                   const Options& options)
        -> Result<std::shared_ptr<GoveeClient>>;

    GoveeClient(const GoveeClient&) = delete;
    GoveeClient& operator=(const GoveeClient&) = delete;

    ~GoveeClient();

    /**
     * @brief Send one request and, for devStatus, wait for its reply
     *
     * Exchanges on the socket never overlap. Datagrams still queued from an
     * exchange that timed out are discarded before sending.
     * Fire-and-forget commands yield VoidResponse once the datagram is sent.
     * @return TransportError on socket failure or reply timeout,
     *         ProtocolError on an undecodable reply
     */
    auto sendMessage(udp::endpoint device, Request request)
        -> boost::asio::awaitable<Result<Response>>;

    /**
     * @brief Control endpoint for a device address
     */
    [[nodiscard]] auto deviceEndpoint(const boost::asio::ip::address& address) const
        -> udp::endpoint {
        return {address, options_.devicePort};
    }

    [[nodiscard]] auto localEndpoint() const -> udp::endpoint;

    [[nodiscard]] auto options() const noexcept -> const Options& {
        return options_;
    }

private:
    GoveeClient(const boost::asio::any_io_executor& executor, Options options);

    /// Drop replies that arrived after their exchange gave up
    void discardPendingDatagrams();

    auto receiveReply(const udp::endpoint& device)
        -> boost::asio::awaitable<Result<Response>>;

    udp::socket socket_;
    Options options_;
    async::AsyncMutex exchangeMutex_;
    std::shared_ptr<spdlog::logger> logger_;
};

/**
 * @brief "address:port" text for log lines
 */
[[nodiscard]] auto toString(const udp::endpoint& endpoint) -> std::string;

}  // namespace prism::govee

#endif  // PRISM_INTEGRATIONS_GOVEE_CLIENT_HPP
