#pragma once

#include <filesystem>
#include <string>

namespace kvs::auth {

inline constexpr const char* DEFAULT_TENANT = "common";

// Service principal settings. Parameters win; empty fields are filled from other sources.
struct PrincipalConfig {
    std::string client_id;
    std::string secret;          // sensitive
    std::string tenant;
    std::string subscription_id;

    // AZURE_CLIENT_ID, AZURE_SECRET / AZURE_CLIENT_SECRET, AZURE_TENANT / AZURE_TENANT_ID, AZURE_SUBSCRIPTION_ID
    void fillFromEnvironment();

    // INI-style profile file ([default] client_id=... secret=... tenant=... subscription_id=...).
    // Returns false when the file or the profile does not exist.
    bool fillFromCredentialFile(const std::filesystem::path& path, const std::string& profile = "default");

    [[nodiscard]] std::string tenantOrDefault() const { return tenant.empty() ? DEFAULT_TENANT : tenant; }
    [[nodiscard]] bool hasClientCredentials() const { return !client_id.empty() && !secret.empty(); }
};

// $AZURE_CREDENTIAL_FILE, else ~/.azure/credentials
std::filesystem::path defaultCredentialFilePath();

}
