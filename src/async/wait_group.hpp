/*
 * wait_group.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Coroutine join barrier counting outstanding operations

**************************************************/

#ifndef PRISM_ASYNC_WAIT_GROUP_HPP
#define PRISM_ASYNC_WAIT_GROUP_HPP

#include <cstddef>
#include <functional>
#include <mutex>
#include <vector>

#include <utility>

#include <boost/asio/awaitable.hpp>

namespace prism::async {

/**
 * @brief Counter of outstanding operations that coroutines can wait on
 *
 * add() before starting work, done() when each unit finishes, and
 * co_await wait() to suspend until the counter reaches zero. Every
 * suspended waiter is resumed, in arrival order.
 */
class WaitGroup {
public:
    explicit WaitGroup(std::size_t count = 0) : remaining_(count) {}

    WaitGroup(const WaitGroup&) = delete;
    WaitGroup& operator=(const WaitGroup&) = delete;

    void add(std::size_t count = 1);

    /**
     * @brief Mark one unit finished, resuming all waiters on the last one
     */
    void done();

    [[nodiscard]] auto pending() const -> std::size_t;

    /**
     * @brief Suspend until every added unit is done
     */
    auto wait() -> boost::asio::awaitable<void>;

private:
    mutable std::mutex mutex_;
    std::size_t remaining_;
    std::vector<std::function<void()>> waiters_;
};

}  // namespace prism::async

#endif  // PRISM_ASYNC_WAIT_GROUP_HPP
