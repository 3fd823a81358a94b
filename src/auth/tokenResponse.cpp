#include "auth/tokenResponse.hpp"

#include <nlohmann/json.hpp>

namespace kvs::auth {

namespace {

constexpr size_t MAX_ERROR_BODY = 300;

std::time_t epochField(const nlohmann::json& j, const std::string& key) {
    if (!j.contains(key)) return 0;
    const auto& v = j.at(key);
    if (v.is_number_integer()) return v.get<std::time_t>();
    if (v.is_string()) {
        try { return static_cast<std::time_t>(std::stoll(v.get<std::string>())); }
        catch (const std::exception&) { return 0; }
    }
    return 0;
}

}

std::optional<AccessToken> parseTokenResponse(const std::string& body) {
    const auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    AccessToken token;
    if (j.contains("access_token") && j["access_token"].is_string()) token.token = j["access_token"].get<std::string>();
    else if (j.contains("accessToken") && j["accessToken"].is_string()) token.token = j["accessToken"].get<std::string>();
    if (token.token.empty()) return std::nullopt;

    token.expires_on = epochField(j, "expires_on");
    if (token.expires_on == 0) {
        if (const auto in = epochField(j, "expires_in")) token.expires_on = std::time(nullptr) + in;
    }
    return token;
}

std::string errorFromBody(const std::string& body) {
    const auto j = nlohmann::json::parse(body, nullptr, false);
    if (!j.is_discarded() && j.is_object()) {
        if (j.contains("error_description") && j["error_description"].is_string())
            return j["error_description"].get<std::string>();
        if (j.contains("error")) {
            const auto& err = j["error"];
            if (err.is_string()) return err.get<std::string>();
            if (err.is_object() && err.contains("message") && err["message"].is_string())
                return err["message"].get<std::string>();
        }
    }
    return body.size() > MAX_ERROR_BODY ? body.substr(0, MAX_ERROR_BODY) + "..." : body;
}

}
