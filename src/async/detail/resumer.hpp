/*
 * resumer.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef PRISM_ASYNC_DETAIL_RESUMER_HPP
#define PRISM_ASYNC_DETAIL_RESUMER_HPP

#include <functional>
#include <memory>
#include <utility>

#include <boost/asio/associated_executor.hpp>
#include <boost/asio/post.hpp>

namespace prism::async::detail {

/**
 * @brief Post a void() completion handler to its associated executor
 */
template <typename Handler>
void resumeLater(Handler handler) {
    auto executor = boost::asio::get_associated_executor(handler);
    boost::asio::post(executor, std::move(handler));
}

/**
 * @brief Type-erase a move-only void() completion handler
 *
 * The returned callable posts the handler to its associated executor the
 * first time it is invoked. It must be invoked at most once.
 */
template <typename Handler>
auto makeResumer(Handler handler) -> std::function<void()> {
    auto shared = std::make_shared<Handler>(std::move(handler));
    return [shared]() { resumeLater(std::move(*shared)); };
}

}  // namespace prism::async::detail

#endif  // PRISM_ASYNC_DETAIL_RESUMER_HPP
