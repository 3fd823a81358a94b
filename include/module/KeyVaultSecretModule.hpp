#pragma once

#include "module/ModuleParams.hpp"
#include "config/Config.hpp"
#include "keyvault/SecretClient.hpp"
#include "auth/CloudEnvironment.hpp"
#include "util/HttpClient.hpp"

#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace kvs::module {

// One invocation: resolve credentials, open the vault, reconcile, report.
class KeyVaultSecretModule {
public:
    // Without a transport, a curl-backed HttpClient is built from the http config section.
    explicit KeyVaultSecretModule(config::Config cfg, std::unique_ptr<util::HttpClient> http = nullptr);
    virtual ~KeyVaultSecretModule() = default;

    // {"changed": bool, "state": {...}}. Throws types::Error subclasses on failure.
    nlohmann::json run(const ModuleParams& params);

    // Parameter secrets plus any principal secret picked up from the environment or credential file
    [[nodiscard]] const std::vector<std::string>& sensitiveValues() const { return sensitive_; }

    // Host failure document; msg is scrubbed of the given sensitive values.
    static nlohmann::json failure(const std::string& msg, const std::vector<std::string>& sensitive = {});

protected:
    virtual std::unique_ptr<keyvault::SecretClient> openClient(const ModuleParams& params,
                                                               const auth::CloudEnvironment& cloud,
                                                               types::AuthSource source);

private:
    config::Config cfg_;
    std::unique_ptr<util::HttpClient> http_;
    std::vector<std::string> sensitive_;
};

}
