#include "route.hpp"
#include "route_error.hpp"
#include "../context.hpp"
#include "../../util/url.hpp"
#include "../../../util/logger.hpp"

namespace tinyroute::http {

std::optional<std::string> decode_param(const std::optional<std::string>& raw) {
    if (!raw || raw->empty()) return std::nullopt;
    return util::url::decode_component(*raw);
}

namespace {
    // runs before the matcher is compiled, so a missing handler is reported first
    const std::string& require_handlers(const std::vector<middleware_function>& handlers,
                                        const std::optional<method>& http_method,
                                        const std::string& pattern) {
        if (handlers.empty()) {
            throw route_error("Route " + std::string(get_route_method(http_method)) + " " + pattern +
                              " must have at least one handler");
        }
        for (const auto& handler : handlers) {
            if (!handler) {
                throw route_error("Route " + std::string(get_route_method(http_method)) + " " + pattern +
                                  " has an empty handler");
            }
        }
        if (http_method && *http_method == method::UNKNOWN) {
            throw route_error("Route " + pattern + " has no valid method");
        }
        return pattern;
    }
}

route::route(std::optional<method> http_method,
             const std::string& pattern,
             std::vector<middleware_function> handlers,
             const route_options& options)
    : method_(http_method),
      matcher_(require_handlers(handlers, http_method, pattern), options),
      handler_count_(handlers.size())
{
    handler_ = handlers.size() == 1 ? std::move(handlers.front()) : compose(std::move(handlers));
}

bool route::matches(const std::string& request_method, const std::string& path) const {
    return method_matches(request_method, method_) && matcher_.matches(path);
}

tinyroute::awaitable<void> route::operator()(context& ctx, next_function next) const {
    auto& req = ctx.req();

    if (!method_matches(req.get_method(), method_)) {
        co_await call_next(std::move(next));
        co_return;
    }

    auto captures = matcher_.match(req.get_path());
    if (!captures) {
        LOG_TRACE("route {} {} does not match {}", get_route_method(method_), get_pattern(), req.get_path());
        co_await call_next(std::move(next));
        co_return;
    }

    route_params params;
    for (auto& [name, raw] : *captures) {
        params[name] = decode_param(raw);
    }

    LOG_DEBUG("Matched route: {} {}", get_route_method(method_), get_pattern());

    req.set_route_match(std::move(params), get_pattern());
    co_await handler_(ctx, std::move(next));
}

nlohmann::json route::to_json() const {
    nlohmann::json parameters = nlohmann::json::array();
    for (const auto& parameter : matcher_.get_parameters()) {
        parameters.push_back({
            {"name", parameter.name},
            {"kind", std::string(get_parameter_kind(parameter.kind))}
        });
    }
    return {
        {"method", std::string(get_route_method(method_))},
        {"pattern", get_pattern()},
        {"parameters", parameters},
        {"handlers", handler_count_}
    };
}

} // namespace tinyroute::http
