#include "auth/TokenCredential.hpp"
#include "types/errors.hpp"

#include <fmt/format.h>

using namespace kvs::auth;

namespace {
constexpr std::time_t EXPIRY_SKEW_SECONDS = 60;
}

bool AccessToken::expired(const std::time_t now) const {
    return expires_on != 0 && now + EXPIRY_SKEW_SECONDS >= expires_on;
}

TokenResult TokenResult::Success(std::optional<AccessToken> token) {
    return {true, std::move(token), {}};
}

TokenResult TokenResult::Failure(std::string error) {
    return {false, std::nullopt, std::move(error)};
}

TokenResult TokenCredential::probe(const std::string& resource) {
    auto result = fetch(resource);
    if (result.success && result.token) cache_[resource] = *result.token;
    return result;
}

std::string TokenCredential::getToken(const std::string& resource) {
    if (const auto it = cache_.find(resource); it != cache_.end() && !it->second.expired())
        return it->second.token;

    const auto result = fetch(resource);
    if (!result.success || !result.token || result.token->token.empty())
        throw types::AuthError(fmt::format("[{}] Failed to acquire token: {}", name(),
                                           result.error.empty() ? "empty token" : result.error));

    cache_[resource] = *result.token;
    return result.token->token;
}
