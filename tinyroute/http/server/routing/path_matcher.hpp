#ifndef TINYROUTE_HTTP_PATH_MATCHER_HPP
#define TINYROUTE_HTTP_PATH_MATCHER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <boost/regex.hpp>
#include "route_options.hpp"

namespace tinyroute::http {

// Route pattern syntax:
// 1. Named parameters: :param_name
//    Example: "/users/:user/devices/:device"
//    Matches one or more characters up to the next slash
//
// 2. Greedy parameters: :param_name+
//    Example: "/docs/:path+"
//    Matches the remainder of the path, slashes included, possibly nothing
//
// 3. Dot-prefixed parameters: .:param_name
//    Example: "/files/:name.:ext"
//    Like named parameters, but the capture stops at a dot too
//
// 4. Wildcard: *
//    Example: "/files/*"
//    Optionally matches the separator and anything after it. Not reported as a parameter
//
// Any other text is part of the regular expression, with literal dots escaped.

enum class parameter_kind {
    named,      // single segment
    greedy      // remainder of the path
};

struct path_parameter {
    std::string name;
    parameter_kind kind;
};

std::string_view get_parameter_kind(parameter_kind kind);

// Raw captures in declaration order; empty when the group did not participate
using path_captures = std::vector<std::pair<std::string, std::optional<std::string>>>;

class path_matcher {
public:
    explicit path_matcher(const std::string& pattern, const route_options& options = {});

    // Match a request path, returning the raw captures on success. A path too complex for
    // the regex engine is reported as no match
    std::optional<path_captures> match(const std::string& path) const;

    // Check if the matcher accepts the given path
    bool matches(const std::string& path) const;

    // Pattern as registered
    const std::string& get_pattern() const { return pattern_; }

    // Regular expression the pattern compiled to, with named groups, for diagnostics
    const std::string& get_expression() const { return expression_; }

    // Parameter schema in declaration order
    const std::vector<path_parameter>& get_parameters() const { return parameters_; }

    const route_options& get_options() const { return options_; }

private:
    std::string pattern_;
    std::string expression_;
    route_options options_;
    boost::regex regex_;
    std::vector<path_parameter> parameters_;
};

} // namespace tinyroute::http

#endif // TINYROUTE_HTTP_PATH_MATCHER_HPP
