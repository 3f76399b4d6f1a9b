/*
 * async_mutex.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: FIFO mutex for coroutines that hold it across suspension points

**************************************************/

#ifndef PRISM_ASYNC_ASYNC_MUTEX_HPP
#define PRISM_ASYNC_ASYNC_MUTEX_HPP

#include <deque>
#include <functional>
#include <mutex>
#include <utility>

#include <boost/asio/awaitable.hpp>

namespace prism::async {

/**
 * @brief Asynchronous mutex
 *
 * lock() suspends the calling coroutine instead of blocking the thread.
 * Waiters acquire the mutex in arrival order; unlock() hands ownership
 * directly to the next waiter.
 */
class AsyncMutex {
public:
    /**
     * @brief RAII ownership of an AsyncMutex
     */
    class [[nodiscard]] ScopedLock {
    public:
        ScopedLock() = default;
        explicit ScopedLock(AsyncMutex* mutex) : mutex_(mutex) {}
        ~ScopedLock() { release(); }

        ScopedLock(ScopedLock&& other) noexcept
            : mutex_(std::exchange(other.mutex_, nullptr)) {}
        ScopedLock& operator=(ScopedLock&& other) noexcept {
            if (this != &other) {
                release();
                mutex_ = std::exchange(other.mutex_, nullptr);
            }
            return *this;
        }

        ScopedLock(const ScopedLock&) = delete;
        ScopedLock& operator=(const ScopedLock&) = delete;

        [[nodiscard]] auto ownsLock() const noexcept -> bool {
            return mutex_ != nullptr;
        }

        void release() {
            if (mutex_) {
                std::exchange(mutex_, nullptr)->unlock();
            }
        }

    private:
        AsyncMutex* mutex_{nullptr};
    };

    AsyncMutex() = default;
    AsyncMutex(const AsyncMutex&) = delete;
    AsyncMutex& operator=(const AsyncMutex&) = delete;

    auto lock() -> boost::asio::awaitable<void>;

    [[nodiscard]] auto tryLock() -> bool;

    void unlock();

    /**
     * @brief Acquire the mutex and return a guard that releases it
     */
    auto scopedLock() -> boost::asio::awaitable<ScopedLock>;

    [[nodiscard]] auto isLocked() const -> bool;

private:
    mutable std::mutex mutex_;
    bool locked_{false};
    std::deque<std::function<void()>> waiters_;
};

}  // namespace prism::async

#endif  // PRISM_ASYNC_ASYNC_MUTEX_HPP
