#pragma once

#include <string>

namespace kvs::auth {

struct CloudEnvironment {
    std::string name;
    std::string keyvault_dns_suffix;   // e.g. vault.azure.net
    std::string authority_host;        // AAD login endpoint, no scheme

    // Throws types::ValidationError for an unknown environment name.
    static const CloudEnvironment& byName(const std::string& name);

    [[nodiscard]] std::string keyVaultResource() const { return "https://" + keyvault_dns_suffix; }
};

}
