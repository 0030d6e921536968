#ifndef TINYROUTE_HTTP_ROUTE_HPP
#define TINYROUTE_HTTP_ROUTE_HPP

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "path_matcher.hpp"
#include "route_options.hpp"
#include "../middleware.hpp"
#include "../../common/method.hpp"
#include "../../../util/types.hpp"

namespace tinyroute::http {

// Forward declarations
class context;

/**
 * Percent-decode a raw capture. An absent or empty capture yields an empty optional, so
 * handlers see "matched nothing" and "did not match" alike. Malformed escapes throw
 * util::url::uri_error.
 */
std::optional<std::string> decode_param(const std::optional<std::string>& raw);

/**
 * A route is a pipeline step bound to a method (or any method when empty), a compiled
 * path pattern and a handler chain. It never changes after construction, so the same
 * route can serve concurrent requests.
 */
class route {
public:
    // Throws route_error when handlers is empty or the pattern cannot be compiled
    route(std::optional<method> http_method,
          const std::string& pattern,
          std::vector<middleware_function> handlers,
          const route_options& options = {});

    // Pipeline step: run the handlers on a match, otherwise continue with next
    tinyroute::awaitable<void> operator()(context& ctx, next_function next) const;

    // Check if the route applies to the given method and path
    bool matches(const std::string& request_method, const std::string& path) const;

    // Pattern as registered
    const std::string& get_pattern() const { return matcher_.get_pattern(); }

    // Empty when the route accepts any method
    const std::optional<method>& get_method() const { return method_; }

    const path_matcher& get_matcher() const { return matcher_; }

    std::size_t get_handler_count() const { return handler_count_; }

    // Description used for route listings
    nlohmann::json to_json() const;

private:
    std::optional<method> method_;
    path_matcher matcher_;
    std::size_t handler_count_;
    middleware_function handler_;
};

} // namespace tinyroute::http

#endif // TINYROUTE_HTTP_ROUTE_HPP
