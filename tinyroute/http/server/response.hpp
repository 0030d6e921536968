#ifndef TINYROUTE_HTTP_RESPONSE_HPP
#define TINYROUTE_HTTP_RESPONSE_HPP

#include "../common/http_status.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <string>

namespace tinyroute::http {

// header names compare case-insensitively
struct header_less {
    bool operator()(const std::string& lhs, const std::string& rhs) const {
        return boost::algorithm::ilexicographical_compare(lhs, rhs);
    }
};

using header_map = std::map<std::string, std::string, header_less>;

class response {
public:
    response() = default;

    // Explicit status, kept even if a body is set afterwards
    void status(http_status status);
    void status(uint16_t status_code);

    // Text response
    void send(const std::string& text, const std::string& content_type = "text/plain");

    // JSON response
    void json(const nlohmann::json& data);

    // Error response
    void error(http_status status, const std::string& message = "");

    void header(const std::string& key, const std::string& value);

    bool has_header(const std::string& key) const;

    std::string get_header(const std::string& key) const;

    const header_map& get_headers() const { return headers_; }

    // Drop the body but keep the status, as done for HEAD requests
    void strip_body();

    bool has_body() const { return has_body_; }
    const std::string& get_body() const { return body_; }
    const std::string& get_content_type() const;

    int get_status_code() const { return status_code_; }
    bool is_status_explicit() const { return explicit_status_; }

private:
    int status_code_ = static_cast<int>(http_status::not_found);
    bool explicit_status_ = false;
    bool has_body_ = false;
    std::string body_;
    header_map headers_;
};

} // namespace tinyroute::http

#endif // TINYROUTE_HTTP_RESPONSE_HPP
