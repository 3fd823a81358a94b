#pragma once

#include "auth/TokenCredential.hpp"
#include "auth/PrincipalConfig.hpp"
#include "auth/CloudEnvironment.hpp"
#include "config/Config.hpp"
#include "types/AuthSource.hpp"
#include "util/HttpClient.hpp"

#include <memory>
#include <string>
#include <vector>

namespace kvs::auth {

using CredentialPtr = std::shared_ptr<TokenCredential>;
using CredentialChain = std::vector<CredentialPtr>;

enum class Strategy { ManagedIdentity, AzureCli, ClientSecret };

std::string to_string(Strategy strategy);

class CredentialResolver {
public:
    CredentialResolver(const util::HttpClient& http, config::AuthConfig cfg, CloudEnvironment cloud);

    // Ordered strategies for an auth source:
    //   msi            -> ManagedIdentity, AzureCli, ClientSecret
    //   auto, cli      -> AzureCli, ClientSecret
    //   explicit, env, credential_file -> ClientSecret
    static std::vector<Strategy> strategiesFor(types::AuthSource source);

    [[nodiscard]] CredentialChain chainFor(types::AuthSource source, const PrincipalConfig& principal) const;

    // Builds the chain for the source and returns the first credential whose probe succeeds
    // for https://<vaultDnsSuffix>. Throws types::AuthError (or types::ConfigError).
    [[nodiscard]] CredentialPtr resolve(types::AuthSource source, const std::string& vaultDnsSuffix,
                                        const PrincipalConfig& principal) const;

    // Principal with empty fields filled from the credential file (credential_file only) and the environment.
    static PrincipalConfig effectivePrincipal(types::AuthSource source, PrincipalConfig principal);

    // First successful probe wins. Failures are collected and reported together, also when a
    // later strategy rejects its configuration with types::ConfigError.
    static CredentialPtr resolve(const CredentialChain& chain, const std::string& resource);

private:
    const util::HttpClient& http_;
    config::AuthConfig cfg_;
    CloudEnvironment cloud_;

    [[nodiscard]] CredentialPtr make(Strategy strategy, const PrincipalConfig& principal) const;
};

}
