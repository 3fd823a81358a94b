#pragma once

#include "auth/TokenCredential.hpp"
#include "auth/PrincipalConfig.hpp"
#include "auth/CloudEnvironment.hpp"
#include "util/HttpClient.hpp"

namespace kvs::auth {

// Service principal credential. probe() only checks the configuration; the token is
// exchanged through the client-credentials flow on the first vault request.
class ClientSecretCredential : public TokenCredential {
public:
    ClientSecretCredential(const util::HttpClient& http, PrincipalConfig principal, CloudEnvironment cloud);

    [[nodiscard]] std::string name() const override { return "ClientSecret"; }

    // Throws types::ConfigError when the client id or secret is missing.
    [[nodiscard]] TokenResult probe(const std::string& resource) override;

    [[nodiscard]] std::string tokenEndpoint() const;
    [[nodiscard]] std::string requestBody(const std::string& resource) const;

protected:
    [[nodiscard]] TokenResult fetch(const std::string& resource) override;

private:
    const util::HttpClient& http_;
    PrincipalConfig principal_;
    CloudEnvironment cloud_;
};

}
