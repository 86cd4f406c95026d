#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

namespace jobforge {

template <typename T = void> using task = boost::asio::awaitable<T>;

using boost::asio::co_spawn;
using boost::asio::use_awaitable;

/// Completion token that reports errors as a leading error_code instead of
/// throwing.
inline constexpr auto use_nothrow =
    boost::asio::as_tuple(boost::asio::use_awaitable);

} // namespace jobforge
