#ifndef TINYROUTE_TYPES
#define TINYROUTE_TYPES

#include <functional>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace tinyroute {

    // Awaitable type alias
    template<typename T = void>
    using awaitable = boost::asio::awaitable<T>;

    // Import commonly used awaitable utilities
    using boost::asio::use_awaitable;
    using boost::asio::co_spawn;
    using boost::asio::detached;

}

#endif
