#pragma once

#include "auth/PrincipalConfig.hpp"
#include "types/AuthSource.hpp"
#include "types/Secret.hpp"

#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace kvs::module {

struct ModuleParams {
    types::SecretSpec secret;
    std::string keyvault_uri;
    std::optional<types::AuthSource> auth_source;       // unset: auth.default_source from config
    std::optional<std::string> cloud_environment;       // unset: cloud.environment from config
    auth::PrincipalConfig principal;
    bool check_mode = false;

    // Values that must never reach logs or output
    [[nodiscard]] std::vector<std::string> sensitiveValues() const;
};

// Accepts a flat parameter object or {"ANSIBLE_MODULE_ARGS": {...}}. Validates choices,
// required parameters and dates up front. Throws types::ValidationError.
ModuleParams parseModuleArgs(const nlohmann::json& args);

std::string to_string(const ModuleParams& p);

}
