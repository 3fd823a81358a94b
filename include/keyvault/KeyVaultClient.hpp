#pragma once

#include "keyvault/SecretClient.hpp"
#include "auth/TokenCredential.hpp"
#include "util/HttpClient.hpp"

#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace kvs::keyvault {

// Key Vault secrets REST client bound to one vault. Lives for a single invocation.
class KeyVaultClient : public SecretClient {
public:
    KeyVaultClient(const util::HttpClient& http,
                   std::shared_ptr<auth::TokenCredential> credential,
                   const std::string& vaultUri,
                   std::string resource,
                   std::string apiVersion = "7.4");

    types::SecretRecord getSecret(const std::string& name, const std::string& version = {}) override;
    types::SecretRecord setSecret(const types::SecretSpec& spec) override;
    types::SecretRecord deleteSecret(const std::string& name) override;

    [[nodiscard]] const std::string& vaultUri() const override { return vault_; }

    [[nodiscard]] std::string secretUrl(const std::string& name, const std::string& version = {}) const;

    // PUT body: {value, contentType?, tags?, attributes?{nbf?, exp?}}
    static nlohmann::json setSecretBody(const types::SecretSpec& spec);

    // SecretBundle / DeletedSecretBundle -> record. Throws types::RemoteError on malformed bodies.
    static types::SecretRecord parseBundle(const std::string& body);

    // Maps a failed response to types::NotFound (404 SecretNotFound) or types::RemoteError and throws.
    [[noreturn]] static void throwForResponse(const util::HttpResponse& resp, const std::string& name);

private:
    const util::HttpClient& http_;
    std::shared_ptr<auth::TokenCredential> credential_;
    std::string vault_;
    std::string resource_;
    std::string api_version_;

    util::HttpResponse send(util::HttpRequest req, const std::string& name);
};

}
