#include "path_matcher.hpp"
#include "route_error.hpp"
#include "../../../util/logger.hpp"
#include <set>
#include <boost/algorithm/string/replace.hpp>

namespace tinyroute::http {

namespace {

    // rewriting rules, applied in this order. Greedy markers go before named ones so that
    // ":name+" is never read as ":name", and the '*' left in a greedy group is expanded by
    // the wildcard rule into "(.*)?"
    const boost::regex duplicate_slashes(R"(\/+(\/|$))");
    const boost::regex greedy_param(R"((\/?\.?):(\w+)\+)");
    const boost::regex named_param(R"((\/?\.?):(\w+))");
    const boost::regex wildcard(R"((\/?)\*)");

    const boost::regex parameter_marker(R"(:(\w+)(\+?))");

}

std::string_view get_parameter_kind(parameter_kind kind) {
    switch (kind) {
        case parameter_kind::named:
            return "named";
        case parameter_kind::greedy:
            return "greedy";
    }
    return "unknown";
}

path_matcher::path_matcher(const std::string& pattern, const route_options& options)
    : pattern_(pattern), options_(options)
{
    std::string result = boost::regex_replace(pattern, duplicate_slashes, "$1");

    // every marker becomes a named group, in declaration order
    std::set<std::string> seen;
    for (boost::sregex_iterator it(result.begin(), result.end(), parameter_marker), end; it != end; ++it) {
        std::string name = (*it)[1].str();
        if (!seen.insert(name).second) {
            throw route_error("duplicate parameter '" + name + "' in route pattern " + pattern_);
        }
        parameters_.push_back({std::move(name), (*it)[2].length() > 0 ? parameter_kind::greedy : parameter_kind::named});
    }

    result = boost::regex_replace(result, greedy_param, "($1(?<$2>*))");
    result = boost::regex_replace(result, named_param, "($1(?<$2>[^$1/]+?))");
    boost::algorithm::replace_all(result, ".", "\\.");
    result = boost::regex_replace(result, wildcard, "($1.*)?");

    if (options_.trailing) {
        result += "(?:\\/)?";
    }
    expression_ = "^" + result + "$";

    // no_mod_s: '.' never matches a newline; no_mod_m: anchors only at the ends of the path
    boost::regex::flag_type flags = boost::regex::perl | boost::regex::no_mod_s | boost::regex::no_mod_m;
    if (!options_.sensitive) flags = flags | boost::regex::icase;

    try {
        regex_.assign(expression_, flags);
    } catch (const boost::regex_error& e) {
        throw route_error("invalid route pattern " + pattern_ + ": " + e.what());
    }

    LOG_TRACE("compiled route pattern {} into {}", pattern_, expression_);
}

std::optional<path_captures> path_matcher::match(const std::string& path) const {
    boost::smatch matches;
    try {
        if (!boost::regex_match(path, matches, regex_)) {
            return std::nullopt;
        }
    } catch (const boost::regex_error& e) {
        LOG_WARNING("route pattern {} gave up matching a path of {} bytes: {}", pattern_, path.size(), e.what());
        return std::nullopt;
    }

    path_captures captures;
    captures.reserve(parameters_.size());
    for (const auto& parameter : parameters_) {
        const auto& group = matches[parameter.name];
        if (group.matched) {
            captures.emplace_back(parameter.name, group.str());
        } else {
            captures.emplace_back(parameter.name, std::nullopt);
        }
    }
    return captures;
}

bool path_matcher::matches(const std::string& path) const {
    return match(path).has_value();
}

} // namespace tinyroute::http
