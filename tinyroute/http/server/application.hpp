#ifndef TINYROUTE_HTTP_APPLICATION_HPP
#define TINYROUTE_HTTP_APPLICATION_HPP

#include "context.hpp"
#include "middleware.hpp"
#include "routing/router.hpp"
#include "../../util/types.hpp"
#include <string_view>
#include <type_traits>
#include <vector>

namespace tinyroute::http {

/**
 * Ordered middleware pipeline. Steps run in the order they were added; each one decides
 * whether to continue. A request nobody answers keeps the default 404 response.
 */
class application {
public:
    application() = default;

    // Middleware, in any of the shapes accepted by make_middleware
    template<typename F>
        requires (!std::is_same_v<std::remove_cvref_t<F>, router>)
    application& use(F&& middleware) {
        return add(make_middleware(std::forward<F>(middleware)));
    }

    // Mount a router. The router is referenced, not copied, and must outlive the application
    application& use(const router& routes);
    application& use(router&& routes) = delete;

    // Run the pipeline for one request. Errors escaping the pipeline become 400 (malformed
    // URI component) or 500 responses; HEAD responses lose their body
    tinyroute::awaitable<void> handle(context& ctx) const;

    // Process a request to completion on a private io_context
    context fetch(std::string_view method, std::string_view target) const;

private:
    application& add(middleware_function middleware);

    std::vector<middleware_function> middlewares_;
    middleware_function pipeline_;
};

} // namespace tinyroute::http

#endif // TINYROUTE_HTTP_APPLICATION_HPP
