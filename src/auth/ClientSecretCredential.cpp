#include "auth/ClientSecretCredential.hpp"
#include "auth/tokenResponse.hpp"
#include "types/errors.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>

using namespace kvs::auth;
using namespace kvs::util;
using namespace kvs::logging;

ClientSecretCredential::ClientSecretCredential(const HttpClient& http, PrincipalConfig principal, CloudEnvironment cloud)
    : http_(http), principal_(std::move(principal)), cloud_(std::move(cloud)) {}

TokenResult ClientSecretCredential::probe(const std::string&) {
    if (principal_.client_id.empty())
        throw types::ConfigError("Explicit credentials are incomplete: client_id is not set "
                                 "(parameter client_id or AZURE_CLIENT_ID)");
    if (principal_.secret.empty())
        throw types::ConfigError("Explicit credentials are incomplete: secret is not set "
                                 "(parameter secret or AZURE_SECRET)");

    LogRegistry::auth()->debug("[ClientSecretCredential] Using client {} in tenant {}",
                               principal_.client_id, principal_.tenantOrDefault());
    return TokenResult::Success();
}

std::string ClientSecretCredential::tokenEndpoint() const {
    return fmt::format("https://{}/{}/oauth2/token", cloud_.authority_host, urlEscape(principal_.tenantOrDefault()));
}

std::string ClientSecretCredential::requestBody(const std::string& resource) const {
    return fmt::format("grant_type=client_credentials&client_id={}&client_secret={}&resource={}",
                       urlEscape(principal_.client_id), urlEscape(principal_.secret), urlEscape(resource));
}

TokenResult ClientSecretCredential::fetch(const std::string& resource) {
    HttpRequest req;
    req.method = "POST";
    req.url = tokenEndpoint();
    req.headers = {"Content-Type: application/x-www-form-urlencoded", "Accept: application/json"};
    req.body = requestBody(resource);

    const auto resp = http_.perform(req);

    if (resp.curl != CURLE_OK)
        return TokenResult::Failure(fmt::format("token endpoint unreachable: {}", curl_easy_strerror(resp.curl)));

    if (!resp.ok())
        return TokenResult::Failure(fmt::format("token endpoint returned HTTP {}: {}", resp.http, errorFromBody(resp.body)));

    auto token = parseTokenResponse(resp.body);
    if (!token) return TokenResult::Failure("token endpoint returned no access_token");

    LogRegistry::auth()->debug("[ClientSecretCredential] Acquired token for {}", resource);
    return TokenResult::Success(std::move(token));
}
