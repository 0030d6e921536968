#include "route_options.hpp"
#include "route_error.hpp"

namespace tinyroute::http {

namespace {
    void read_flag(const nlohmann::json& j, const char* key, bool& flag) {
        auto it = j.find(key);
        if (it == j.end()) return;
        if (!it->is_boolean()) {
            throw route_error(std::string("route option '") + key + "' must be a boolean, got " + it->dump());
        }
        flag = it->get<bool>();
    }
}

void to_json(nlohmann::json& j, const route_options& options) {
    j = nlohmann::json{
        {"sensitive", options.sensitive},
        {"trailing", options.trailing}
    };
}

void from_json(const nlohmann::json& j, route_options& options) {
    if (!j.is_object()) {
        throw route_error("route options must be a JSON object, got " + j.dump());
    }
    read_flag(j, "sensitive", options.sensitive);
    read_flag(j, "trailing", options.trailing);
}

} // namespace tinyroute::http
