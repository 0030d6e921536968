#ifndef TINYROUTE_HTTP_ROUTE_OPTIONS_HPP
#define TINYROUTE_HTTP_ROUTE_OPTIONS_HPP

#include <nlohmann/json.hpp>

namespace tinyroute::http {

// Compile options shared by every route of a router
struct route_options {
    // Case-sensitive matching. When false (default), "/Users" also matches "/users"
    bool sensitive = false;

    // Allow an optional trailing slash, so "/users" also matches "/users/"
    bool trailing = true;
};

// JSON form: {"sensitive": bool, "trailing": bool}, both keys optional
void to_json(nlohmann::json& j, const route_options& options);
void from_json(const nlohmann::json& j, route_options& options);

} // namespace tinyroute::http

#endif // TINYROUTE_HTTP_ROUTE_OPTIONS_HPP
