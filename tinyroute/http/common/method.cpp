#include "method.hpp"
#include <boost/algorithm/string/predicate.hpp>

namespace tinyroute::http {

    std::string_view get_method(method http_method) {
        switch (http_method) {
            case method::OPTIONS:
                return "OPTIONS";
            case method::HEAD:
                return "HEAD";
            case method::GET:
                return "GET";
            case method::POST:
                return "POST";
            case method::PUT:
                return "PUT";
            case method::PATCH:
                return "PATCH";
            case method::DELETE:
                return "DELETE";
            default:
                return "UNKNOWN";
        }
    }

    method parse_method(std::string_view name) {
        for (auto candidate : registrable_methods) {
            if (boost::iequals(name, get_method(candidate))) return candidate;
        }
        return method::UNKNOWN;
    }

    std::string_view get_route_method(const std::optional<method>& route_method) {
        return route_method ? get_method(*route_method) : "ALL";
    }

    bool method_matches(std::string_view request_method, const std::optional<method>& route_method) {
        if (!route_method) return true;
        if (boost::iequals(request_method, get_method(*route_method))) return true;
        if (*route_method == method::GET && boost::iequals(request_method, "HEAD")) return true;
        return false;
    }

}
