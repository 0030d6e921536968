#include "response.hpp"

namespace tinyroute::http {

void response::status(http_status status) {
    this->status(static_cast<uint16_t>(status));
}

void response::status(uint16_t status_code) {
    status_code_ = status_code;
    explicit_status_ = true;
}

void response::send(const std::string& text, const std::string& content_type) {
    body_ = text;
    has_body_ = true;
    header("Content-Type", content_type);
    if (!explicit_status_) {
        status_code_ = static_cast<int>(http_status::ok);
    }
}

void response::json(const nlohmann::json& data) {
    send(data.dump(), "application/json");
}

void response::error(http_status status, const std::string& message) {
    this->status(status);
    if (!message.empty()) {
        send(message, "text/plain");
    }
}

void response::header(const std::string& key, const std::string& value) {
    headers_[key] = value;
}

bool response::has_header(const std::string& key) const {
    return headers_.contains(key);
}

std::string response::get_header(const std::string& key) const {
    auto it = headers_.find(key);
    return it != headers_.end() ? it->second : "";
}

void response::strip_body() {
    body_.clear();
    has_body_ = false;
}

const std::string& response::get_content_type() const {
    static const std::string empty;
    auto it = headers_.find("Content-Type");
    return it != headers_.end() ? it->second : empty;
}

} // namespace tinyroute::http
