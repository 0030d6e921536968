#ifndef TINYROUTE_HTTP_METHOD_HPP
#define TINYROUTE_HTTP_METHOD_HPP

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace tinyroute::http {

    // methods a route can be registered for
    enum class method {
        OPTIONS,
        HEAD,
        GET,
        POST,
        PUT,
        PATCH,
        DELETE,
        UNKNOWN
    };

    inline constexpr std::array<method, 7> registrable_methods{
        method::OPTIONS, method::HEAD, method::GET, method::POST,
        method::PUT, method::PATCH, method::DELETE
    };

    /// upper-case method name ("GET", "DELETE", ...), "UNKNOWN" otherwise
    std::string_view get_method(method http_method);

    /// case-insensitive parse of a method name
    method parse_method(std::string_view name);

    /// name used in logs and errors for a route method, "ALL" when the route accepts any method
    std::string_view get_route_method(const std::optional<method>& route_method);

    /**
     * Check whether a request method is accepted by a route method. An empty route method
     * accepts everything; otherwise the names are compared case-insensitively, and GET
     * routes also accept HEAD requests.
     */
    bool method_matches(std::string_view request_method, const std::optional<method>& route_method);

}

#endif
