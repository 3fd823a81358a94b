#include "auth/ManagedIdentityCredential.hpp"
#include "auth/tokenResponse.hpp"
#include "logging/LogRegistry.hpp"

#include <cstdlib>
#include <fmt/format.h>

using namespace kvs::auth;
using namespace kvs::util;
using namespace kvs::logging;

ManagedIdentityCredential::ManagedIdentityCredential(const HttpClient& http, std::string imdsEndpoint, std::string clientId)
    : http_(http), imds_endpoint_(std::move(imdsEndpoint)), client_id_(std::move(clientId)) {}

HttpRequest ManagedIdentityCredential::buildRequest(const std::string& resource) const {
    HttpRequest req;
    const char* endpoint = std::getenv("IDENTITY_ENDPOINT");
    const char* header = std::getenv("IDENTITY_HEADER");

    if (endpoint && *endpoint && header && *header) {
        req.url = fmt::format("{}?api-version={}&resource={}", endpoint, APP_SERVICE_API_VERSION, urlEscape(resource));
        req.headers.push_back(fmt::format("X-IDENTITY-HEADER: {}", header));
    } else {
        req.url = fmt::format("{}?api-version={}&resource={}", imds_endpoint_, IMDS_API_VERSION, urlEscape(resource));
        req.headers.emplace_back("Metadata: true");
    }

    if (!client_id_.empty()) req.url += "&client_id=" + urlEscape(client_id_);
    return req;
}

TokenResult ManagedIdentityCredential::fetch(const std::string& resource) {
    const auto resp = http_.perform(buildRequest(resource));

    if (resp.curl != CURLE_OK)
        return TokenResult::Failure(fmt::format("identity endpoint unreachable: {}", curl_easy_strerror(resp.curl)));

    if (!resp.ok())
        return TokenResult::Failure(fmt::format("identity endpoint returned HTTP {}: {}", resp.http, errorFromBody(resp.body)));

    auto token = parseTokenResponse(resp.body);
    if (!token) return TokenResult::Failure("identity endpoint returned no access_token");

    LogRegistry::auth()->debug("[ManagedIdentityCredential] Acquired token for {}", resource);
    return TokenResult::Success(std::move(token));
}
