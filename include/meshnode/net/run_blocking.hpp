#pragma once
/**
 * @file run_blocking.hpp
 * @brief Drive one awaitable to completion on a private io_context.
 * @details For callers that are not themselves coroutines (the probe tool,
 *          tests). The awaitable must bound its own duration; inside the node
 *          everything is awaited on the session strand instead.
 */

#include <exception>
#include <optional>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

namespace meshnode::net {

    /// Run @p op to completion on the calling thread; exceptions are rethrown.
    template <class T>
    T run_blocking(boost::asio::awaitable<T> op) {
        boost::asio::io_context ioc{1};
        std::optional<T> out;
        std::exception_ptr error;
        boost::asio::co_spawn(ioc, std::move(op), [&](std::exception_ptr e, T value) {
            if (e) error = e;
            else   out = std::move(value);
        });
        ioc.run();
        if (error) std::rethrow_exception(error);
        return std::move(*out);
    }

} // namespace meshnode::net
