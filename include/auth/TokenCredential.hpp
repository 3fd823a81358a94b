#pragma once

#include <ctime>
#include <map>
#include <optional>
#include <string>

namespace kvs::auth {

struct AccessToken {
    std::string token;
    std::time_t expires_on{0};   // 0: unknown, treated as valid for the invocation

    [[nodiscard]] bool expired(std::time_t now = std::time(nullptr)) const;
};

// Outcome of one credential attempt. A failure carries the reason instead of throwing,
// so the resolver can move on to the next strategy.
struct TokenResult {
    bool success = false;
    std::optional<AccessToken> token;   // unset when the exchange is deferred to first use
    std::string error;

    static TokenResult Success(std::optional<AccessToken> token = std::nullopt);
    static TokenResult Failure(std::string error);

    explicit operator bool() const { return success; }
};

class TokenCredential {
public:
    virtual ~TokenCredential() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    // Attempts the credential for the given resource. Expected failures come back as
    // TokenResult::Failure; a successful token is cached for getToken().
    [[nodiscard]] virtual TokenResult probe(const std::string& resource);

    // Cached token for the resource, fetched on first use. Throws types::AuthError.
    std::string getToken(const std::string& resource);

protected:
    [[nodiscard]] virtual TokenResult fetch(const std::string& resource) = 0;

private:
    std::map<std::string, AccessToken> cache_;
};

}
