/*
 * async_mutex.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "async_mutex.hpp"

#include <utility>

#include <boost/asio/async_result.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "detail/resumer.hpp"

namespace prism::async {

namespace net = boost::asio;

auto AsyncMutex::tryLock() -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    if (locked_) {
        return false;
    }
    locked_ = true;
    return true;
}

auto AsyncMutex::lock() -> net::awaitable<void> {
    if (tryLock()) {
        co_return;
    }

    co_await net::async_initiate<decltype(net::use_awaitable), void()>(
        [this](auto handler) {
            std::unique_lock<std::mutex> lock(mutex_);
            if (!locked_) {
                locked_ = true;
                lock.unlock();
                detail::resumeLater(std::move(handler));
                return;
            }
            waiters_.push_back(detail::makeResumer(std::move(handler)));
        },
        net::use_awaitable);
}

void AsyncMutex::unlock() {
    std::function<void()> next;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (waiters_.empty()) {
            locked_ = false;
            return;
        }
        // Ownership passes straight to the next waiter; locked_ stays set.
        next = std::move(waiters_.front());
        waiters_.pop_front();
    }
    next();
}

auto AsyncMutex::scopedLock() -> net::awaitable<ScopedLock> {
    co_await lock();
    co_return ScopedLock(this);
}

auto AsyncMutex::isLocked() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return locked_;
}

}  // namespace prism::async
