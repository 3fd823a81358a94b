#pragma once

#include "auth/TokenCredential.hpp"
#include "util/HttpClient.hpp"

#include <string>

namespace kvs::auth {

// Token from the host's managed identity. App Service style IDENTITY_ENDPOINT/IDENTITY_HEADER
// take precedence over the instance metadata service.
class ManagedIdentityCredential : public TokenCredential {
public:
    static constexpr const char* IMDS_API_VERSION = "2018-02-01";
    static constexpr const char* APP_SERVICE_API_VERSION = "2019-08-01";

    ManagedIdentityCredential(const util::HttpClient& http, std::string imdsEndpoint, std::string clientId = {});

    [[nodiscard]] std::string name() const override { return "ManagedIdentity"; }

protected:
    [[nodiscard]] TokenResult fetch(const std::string& resource) override;

private:
    const util::HttpClient& http_;
    std::string imds_endpoint_;
    std::string client_id_;   // user-assigned identity, empty for system-assigned

    [[nodiscard]] util::HttpRequest buildRequest(const std::string& resource) const;
};

}
