#ifndef TINYROUTE_HTTP_REQUEST_HPP
#define TINYROUTE_HTTP_REQUEST_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace tinyroute::http {

    /// decoded route parameters; a parameter whose capture was empty maps to an empty optional
    using route_params = std::map<std::string, std::optional<std::string>>;

    /**
     * Request side of a context. It keeps the normalized method, the path used for route
     * matching, the query string, and the parameters attached by the last route that
     * matched this request.
     */
    class request {
    public:
        request(std::string_view method, std::string_view target);

        /// get parameter, empty string when absent
        const std::string& operator[](const std::string& param) const;

        /// has parameter with a value
        bool has(const std::string& param) const;

        /// parameter value, if present
        std::optional<std::string> param(const std::string& name) const;

        const route_params& params() const;

        /// pattern of the route that matched last, empty before any match
        const std::string& route_path() const;

        /// replaces parameters and route path left by an earlier match
        void set_route_match(route_params params, std::string route_path);

        /// upper-case request method
        const std::string& get_method() const;

        /// path without the query string
        const std::string& get_path() const;

        const std::string& get_query_string() const;

        /// Get query parameter by key
        std::string query(const std::string& key) const;

        /// Get query parameter by key with default value
        std::string query(const std::string& key, const std::string& default_value) const;

        std::string debug_parameters() const;

    private:
        std::string method_;
        std::string path_;
        std::string query_string_;
        std::multimap<std::string, std::string> query_;
        route_params params_;
        std::string route_path_;
    };

}

#endif
