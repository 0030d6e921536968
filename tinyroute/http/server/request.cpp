#include "request.hpp"
#include "../util/url.hpp"
#include "../../util/logger.hpp"

#include <sstream>
#include <boost/algorithm/string/case_conv.hpp>

namespace tinyroute::http {

    request::request(std::string_view method, std::string_view target) :
        method_{boost::algorithm::to_upper_copy(std::string(method))}
    {
        auto query_start = target.find('?');
        if (query_start == std::string_view::npos) {
            path_ = std::string(target);
        } else {
            path_ = std::string(target.substr(0, query_start));
            query_string_ = std::string(target.substr(query_start + 1));
            util::url::parse_url_encoded_data(query_string_, query_);
        }
        if (path_.empty()) path_ = "/";
    }

    const std::string& request::operator[](const std::string& param) const {
        auto it = params_.find(param);
        if (it != params_.end() && it->second) {
            return *it->second;
        }
        LOG_TRACE("parameter not present: {}", param);
        static const std::string empty_string;
        return empty_string;
    }

    bool request::has(const std::string& param) const {
        auto it = params_.find(param);
        return it != params_.end() && it->second.has_value();
    }

    std::optional<std::string> request::param(const std::string& name) const {
        auto it = params_.find(name);
        if (it == params_.end()) return std::nullopt;
        return it->second;
    }

    const route_params& request::params() const {
        return params_;
    }

    const std::string& request::route_path() const {
        return route_path_;
    }

    void request::set_route_match(route_params params, std::string route_path) {
        params_ = std::move(params);
        route_path_ = std::move(route_path);
    }

    const std::string& request::get_method() const {
        return method_;
    }

    const std::string& request::get_path() const {
        return path_;
    }

    const std::string& request::get_query_string() const {
        return query_string_;
    }

    std::string request::query(const std::string& key) const {
        return query(key, "");
    }

    std::string request::query(const std::string& key, const std::string& default_value) const {
        auto it = query_.find(key);
        return it != query_.end() ? it->second : default_value;
    }

    std::string request::debug_parameters() const {
        std::stringstream str;
        for (const auto& [name, value] : params_) {
            str << "(" << name << ":" << (value ? *value : "<absent>") << ") ";
        }
        return str.str();
    }

}
