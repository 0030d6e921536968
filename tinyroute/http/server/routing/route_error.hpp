#ifndef TINYROUTE_HTTP_ROUTE_ERROR_HPP
#define TINYROUTE_HTTP_ROUTE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace tinyroute::http {

// Raised while registering routes: missing handlers, malformed patterns or options
class route_error : public std::invalid_argument {
public:
    explicit route_error(const std::string& message) : std::invalid_argument(message) {}
};

} // namespace tinyroute::http

#endif // TINYROUTE_HTTP_ROUTE_ERROR_HPP
