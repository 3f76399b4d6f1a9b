/*
 * future_batch.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Run a batch of independent coroutines concurrently and
collect every result

**************************************************/

#ifndef PRISM_ASYNC_FUTURE_BATCH_HPP
#define PRISM_ASYNC_FUTURE_BATCH_HPP

#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "wait_group.hpp"

namespace prism::async {

/**
 * @brief Concurrent fan-out/fan-in over awaitables
 *
 * Each submission must already absorb its own errors and yield a plain
 * value. run() starts every submission on the caller's executor, suspends
 * until all of them have completed, and returns the results in submission
 * order. A failing submission never cuts the wait short.
 *
 * There is no per-task timeout or cancellation. Wrap a submission in its
 * own timeout before pushing it if bounded latency is needed.
 *
 * @tparam T Result type of every submission (default-constructible)
 */
template <typename T>
class FutureBatch {
public:
    FutureBatch() = default;

    FutureBatch(const FutureBatch&) = delete;
    FutureBatch& operator=(const FutureBatch&) = delete;
    FutureBatch(FutureBatch&&) noexcept = default;
    FutureBatch& operator=(FutureBatch&&) noexcept = default;

    void push(boost::asio::awaitable<T> task) {
        tasks_.push_back(std::move(task));
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return tasks_.size();
    }

    [[nodiscard]] auto empty() const noexcept -> bool { return tasks_.empty(); }

    /**
     * @brief Run every submission and wait for all of them
     *
     * Consumes the queued submissions. If a submission throws anyway, the
     * wait still covers every other submission and the first exception is
     * rethrown afterwards.
     */
    auto run() -> boost::asio::awaitable<std::vector<T>>;

private:
    struct RunState {
        std::mutex mutex;
        std::vector<std::optional<T>> results;
        std::exception_ptr firstError;
        WaitGroup group;
    };

    std::vector<boost::asio::awaitable<T>> tasks_;
};

template <typename T>
auto FutureBatch<T>::run() -> boost::asio::awaitable<std::vector<T>> {
    auto tasks = std::move(tasks_);
    tasks_.clear();

    std::vector<T> collected;
    if (tasks.empty()) {
        co_return collected;
    }

    auto executor = co_await boost::asio::this_coro::executor;
    auto state = std::make_shared<RunState>();
    state->results.resize(tasks.size());
    state->group.add(tasks.size());

    for (std::size_t index = 0; index < tasks.size(); ++index) {
        boost::asio::co_spawn(
            executor, std::move(tasks[index]),
            [state, index](std::exception_ptr error, T value) {
                {
                    std::lock_guard<std::mutex> lock(state->mutex);
                    if (error) {
                        if (!state->firstError) {
                            state->firstError = error;
                        }
                    } else {
                        state->results[index].emplace(std::move(value));
                    }
                }
                state->group.done();
            });
    }

    co_await state->group.wait();

    if (state->firstError) {
        std::rethrow_exception(state->firstError);
    }

    collected.reserve(state->results.size());
    for (auto& result : state->results) {
        if (result) {
            collected.push_back(std::move(*result));
        }
    }
    co_return collected;
}

}  // namespace prism::async

#endif  // PRISM_ASYNC_FUTURE_BATCH_HPP
