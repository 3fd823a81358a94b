#include "auth/CredentialResolver.hpp"
#include "auth/ManagedIdentityCredential.hpp"
#include "auth/AzureCliCredential.hpp"
#include "auth/ClientSecretCredential.hpp"
#include "types/errors.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

using namespace kvs::auth;
using namespace kvs::types;
using namespace kvs::logging;

std::string kvs::auth::to_string(const Strategy strategy) {
    switch (strategy) {
        case Strategy::ManagedIdentity: return "ManagedIdentity";
        case Strategy::AzureCli: return "AzureCli";
        case Strategy::ClientSecret: return "ClientSecret";
        default: throw std::invalid_argument("Unknown Strategy enum value");
    }
}

CredentialResolver::CredentialResolver(const util::HttpClient& http, config::AuthConfig cfg, CloudEnvironment cloud)
    : http_(http), cfg_(std::move(cfg)), cloud_(std::move(cloud)) {}

std::vector<Strategy> CredentialResolver::strategiesFor(const AuthSource source) {
    switch (source) {
        case AuthSource::Msi: return {Strategy::ManagedIdentity, Strategy::AzureCli, Strategy::ClientSecret};
        case AuthSource::Auto:
        case AuthSource::Cli: return {Strategy::AzureCli, Strategy::ClientSecret};
        case AuthSource::Explicit:
        case AuthSource::Env:
        case AuthSource::CredentialFile: return {Strategy::ClientSecret};
        default: throw std::invalid_argument("Unknown AuthSource enum value");
    }
}

CredentialPtr CredentialResolver::make(const Strategy strategy, const PrincipalConfig& principal) const {
    switch (strategy) {
        case Strategy::ManagedIdentity:
            return std::make_shared<ManagedIdentityCredential>(http_, cfg_.imds_endpoint, cfg_.msi_client_id);
        case Strategy::AzureCli:
            return std::make_shared<AzureCliCredential>(cfg_.az_cli_path, principal.subscription_id);
        case Strategy::ClientSecret:
            return std::make_shared<ClientSecretCredential>(http_, principal, cloud_);
        default: throw std::invalid_argument("Unknown Strategy enum value");
    }
}

CredentialChain CredentialResolver::chainFor(const AuthSource source, const PrincipalConfig& principal) const {
    CredentialChain chain;
    for (const auto strategy : strategiesFor(source)) chain.push_back(make(strategy, principal));
    return chain;
}

PrincipalConfig CredentialResolver::effectivePrincipal(const AuthSource source, PrincipalConfig principal) {
    if (source == AuthSource::CredentialFile) {
        const auto path = defaultCredentialFilePath();
        if (!principal.fillFromCredentialFile(path))
            LogRegistry::auth()->info("[CredentialResolver] No default profile in {}", path.string());
    }
    principal.fillFromEnvironment();
    return principal;
}

CredentialPtr CredentialResolver::resolve(const AuthSource source, const std::string& vaultDnsSuffix,
                                          const PrincipalConfig& principal) const {
    LogRegistry::auth()->debug("[CredentialResolver] Resolving credentials for auth_source={}", to_string(source));
    return resolve(chainFor(source, effectivePrincipal(source, principal)), "https://" + vaultDnsSuffix);
}

CredentialPtr CredentialResolver::resolve(const CredentialChain& chain, const std::string& resource) {
    std::vector<std::string> failures;

    for (const auto& cred : chain) {
        TokenResult result;
        try {
            result = cred->probe(resource);
        } catch (const ConfigError& e) {
            if (failures.empty()) throw;
            const auto msg = fmt::format("{} (after: {})", e.what(), fmt::join(failures, "; "));
            LogRegistry::auth()->warn("[CredentialResolver] {}", msg);
            throw ConfigError(msg);
        }

        if (result) {
            LogRegistry::auth()->info("[CredentialResolver] Using {} credential", cred->name());
            return cred;
        }

        LogRegistry::auth()->info("[CredentialResolver] {} credential unavailable: {}", cred->name(), result.error);
        failures.push_back(fmt::format("{}: {}", cred->name(), result.error));
    }

    const auto msg = failures.empty()
        ? std::string("No credential strategies configured")
        : fmt::format("Failed to obtain credentials ({})", fmt::join(failures, "; "));
    LogRegistry::auth()->warn("[CredentialResolver] {}", msg);
    throw AuthError(msg);
}
