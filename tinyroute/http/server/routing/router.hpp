#ifndef TINYROUTE_HTTP_ROUTER_HPP
#define TINYROUTE_HTTP_ROUTER_HPP

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "route.hpp"
#include "route_options.hpp"
#include "../middleware.hpp"
#include "../../common/method.hpp"

namespace tinyroute::http {

/**
 * Ordered list of routes sharing the same compile options. The router is a single
 * pipeline step: a request walks the routes in registration order, and every route that
 * matches runs its handlers, which decide whether to continue to the following routes
 * and, after the last one, to the rest of the pipeline.
 *
 * Routes are registered at startup; dispatching never modifies the router.
 */
class router {
public:
    explicit router(route_options options = {});

    // Route registration methods - all return router& for chaining
    template<typename... Handlers>
    router& options(const std::string& pattern, Handlers&&... handlers) {
        return add(method::OPTIONS, pattern, {make_middleware(std::forward<Handlers>(handlers))...});
    }

    template<typename... Handlers>
    router& head(const std::string& pattern, Handlers&&... handlers) {
        return add(method::HEAD, pattern, {make_middleware(std::forward<Handlers>(handlers))...});
    }

    // GET routes also serve HEAD requests
    template<typename... Handlers>
    router& get(const std::string& pattern, Handlers&&... handlers) {
        return add(method::GET, pattern, {make_middleware(std::forward<Handlers>(handlers))...});
    }

    template<typename... Handlers>
    router& post(const std::string& pattern, Handlers&&... handlers) {
        return add(method::POST, pattern, {make_middleware(std::forward<Handlers>(handlers))...});
    }

    template<typename... Handlers>
    router& put(const std::string& pattern, Handlers&&... handlers) {
        return add(method::PUT, pattern, {make_middleware(std::forward<Handlers>(handlers))...});
    }

    template<typename... Handlers>
    router& patch(const std::string& pattern, Handlers&&... handlers) {
        return add(method::PATCH, pattern, {make_middleware(std::forward<Handlers>(handlers))...});
    }

    template<typename... Handlers>
    router& del(const std::string& pattern, Handlers&&... handlers) {  // delete is keyword
        return add(method::DELETE, pattern, {make_middleware(std::forward<Handlers>(handlers))...});
    }

    // Any method
    template<typename... Handlers>
    router& all(const std::string& pattern, Handlers&&... handlers) {
        return add(std::nullopt, pattern, {make_middleware(std::forward<Handlers>(handlers))...});
    }

    // Register a route; throws route_error on an empty handler list or a malformed pattern
    router& add(std::optional<method> http_method, const std::string& pattern,
                std::vector<middleware_function> handlers);

    // Pipeline step
    tinyroute::awaitable<void> operator()(context& ctx, next_function next) const;

    // Get all registered routes in registration order
    const std::vector<std::shared_ptr<const route>>& get_routes() const { return routes_; }

    const route_options& get_options() const { return options_; }

    // Route table, useful for API documentation
    nlohmann::json to_json() const;

private:
    route_options options_;
    std::vector<std::shared_ptr<const route>> routes_;
    middleware_function pipeline_;
};

} // namespace tinyroute::http

#endif // TINYROUTE_HTTP_ROUTER_HPP
