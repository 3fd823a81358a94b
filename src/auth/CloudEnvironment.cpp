#include "auth/CloudEnvironment.hpp"
#include "types/errors.hpp"

#include <array>

using namespace kvs::auth;

namespace {

const std::array<CloudEnvironment, 3> ENVIRONMENTS = {{
    {"AzureCloud", "vault.azure.net", "login.microsoftonline.com"},
    {"AzureChinaCloud", "vault.azure.cn", "login.chinacloudapi.cn"},
    {"AzureUSGovernment", "vault.usgovcloudapi.net", "login.microsoftonline.us"},
}};

}

const CloudEnvironment& CloudEnvironment::byName(const std::string& name) {
    for (const auto& env : ENVIRONMENTS)
        if (env.name == name) return env;
    throw kvs::types::ValidationError(
        "Unknown cloud environment: " + name + " (expected AzureCloud, AzureChinaCloud or AzureUSGovernment)");
}
