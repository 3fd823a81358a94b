#pragma once

#include <string>

namespace kvs::keyvault {

// Key Vault object identifier: <vault>/<collection>/<name>[/<version>]
struct SecretId {
    std::string vault;        // scheme + host, no trailing slash
    std::string collection;
    std::string name;
    std::string version;      // empty: latest

    // Throws types::ValidationError for malformed identifiers or a collection other than the expected one.
    static SecretId parse(const std::string& id, const std::string& expectedCollection = "secrets");

    [[nodiscard]] std::string id() const;
};

// Normalized vault base URI ("https://host", no trailing slash). Throws types::ValidationError.
std::string normalizeVaultUri(const std::string& uri);

// "contoso.vault.azure.net" -> "vault.azure.net"; empty when the host has no dot.
std::string vaultDnsSuffix(const std::string& vaultUri);

}
