#include "module/KeyVaultSecretModule.hpp"
#include "auth/CredentialResolver.hpp"
#include "keyvault/KeyVaultClient.hpp"
#include "keyvault/SecretId.hpp"
#include "keyvault/SecretReconciler.hpp"
#include "logging/LogRegistry.hpp"
#include "util/redact.hpp"

#include <nlohmann/json.hpp>

using namespace kvs::module;
using namespace kvs::logging;

KeyVaultSecretModule::KeyVaultSecretModule(config::Config cfg, std::unique_ptr<util::HttpClient> http)
    : cfg_(std::move(cfg)), http_(std::move(http)) {
    if (!http_) http_ = std::make_unique<util::HttpClient>(cfg_.http);
}

std::unique_ptr<kvs::keyvault::SecretClient> KeyVaultSecretModule::openClient(const ModuleParams& params,
                                                                              const auth::CloudEnvironment& cloud,
                                                                              const types::AuthSource source) {
    // Token audience follows the vault host; the cloud's suffix covers bare or custom hosts
    auto suffix = keyvault::vaultDnsSuffix(params.keyvault_uri);
    if (suffix.empty()) suffix = cloud.keyvault_dns_suffix;

    const auth::CredentialResolver resolver(*http_, cfg_.auth, cloud);
    auto credential = resolver.resolve(source, suffix, params.principal);

    return std::make_unique<keyvault::KeyVaultClient>(*http_, std::move(credential), params.keyvault_uri,
                                                      "https://" + suffix, cfg_.cloud.keyvault_api_version);
}

nlohmann::json KeyVaultSecretModule::run(const ModuleParams& params) {
    LogRegistry::kvsecret()->debug("[KeyVaultSecretModule] {}", to_string(params));
    sensitive_ = params.sensitiveValues();

    const auto& cloud = auth::CloudEnvironment::byName(params.cloud_environment.value_or(cfg_.cloud.environment));
    const auto source = params.auth_source ? *params.auth_source
                                           : types::auth_source_from_string(cfg_.auth.default_source);

    auto effective = params;
    effective.principal = auth::CredentialResolver::effectivePrincipal(source, params.principal);
    sensitive_ = effective.sensitiveValues();

    const auto client = openClient(effective, cloud, source);
    const auto result = keyvault::reconcile(*client, effective.secret, effective.check_mode);

    LogRegistry::kvsecret()->info("[KeyVaultSecretModule] {} in {}: {}", effective.secret.name, client->vaultUri(),
                                  result.changed ? "changed" : "unchanged");
    return result;
}

nlohmann::json KeyVaultSecretModule::failure(const std::string& msg, const std::vector<std::string>& sensitive) {
    return {
        {"failed", true},
        {"changed", false},
        {"msg", util::scrub(msg, sensitive)}
    };
}
