#ifndef TINYROUTE_HTTP_MIDDLEWARE_HPP
#define TINYROUTE_HTTP_MIDDLEWARE_HPP

#include "../../util/types.hpp"
#include <functional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace tinyroute::http {

// Forward declarations
class context;

// Continuation into the rest of the pipeline
using next_function = std::function<tinyroute::awaitable<void>()>;

// Middleware function type
using middleware_function = std::function<tinyroute::awaitable<void>(context&, next_function)>;

// Raised when a step resumes the pipeline more than once
class pipeline_error : public std::logic_error {
public:
    explicit pipeline_error(const std::string& message) : std::logic_error(message) {}
};

// Await the continuation if there is one
tinyroute::awaitable<void> call_next(next_function next);

/**
 * Combine several middlewares into one. Each step receives a continuation running the
 * following step; the continuation of the last step is the outer one. A step calling
 * its continuation twice raises pipeline_error.
 */
middleware_function compose(std::vector<middleware_function> middlewares);

namespace detail {
    template<typename F>
    tinyroute::awaitable<void> invoke_sync(const F& handler, context& ctx) {
        handler(ctx);
        co_return;
    }
}

// Handler signatures accepted wherever a middleware is expected:
// 1. [](context& ctx, next_function next) -> awaitable<void> - may continue the pipeline
// 2. [](context& ctx) -> awaitable<void>                     - terminal coroutine handler
// 3. [](context& ctx) {}                                     - terminal synchronous handler
template<typename F>
middleware_function make_middleware(F&& handler) {
    using handler_type = std::decay_t<F>;
    if constexpr (std::is_invocable_r_v<tinyroute::awaitable<void>, const handler_type&, context&, next_function>) {
        return middleware_function(std::forward<F>(handler));
    } else if constexpr (std::is_invocable_r_v<tinyroute::awaitable<void>, const handler_type&, context&>) {
        return [handler = std::forward<F>(handler)](context& ctx, next_function) {
            return handler(ctx);
        };
    } else {
        static_assert(std::is_invocable_v<const handler_type&, context&>,
                      "handler must accept (context&, next_function) or (context&)");
        return [handler = std::forward<F>(handler)](context& ctx, next_function) {
            return detail::invoke_sync(handler, ctx);
        };
    }
}

} // namespace tinyroute::http

#endif // TINYROUTE_HTTP_MIDDLEWARE_HPP
