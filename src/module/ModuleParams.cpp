#include "module/ModuleParams.hpp"
#include "types/errors.hpp"
#include "util/timestamp.hpp"
#include "util/redact.hpp"

#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <set>

using namespace kvs::types;

namespace kvs::module {

namespace {

const std::set<std::string> SUPPORTED = {
    "secret_name", "secret_value", "secret_valid_from", "secret_expiry", "keyvault_uri", "state",
    "content_type", "tags", "auth_source", "client_id", "secret", "tenant", "subscription_id",
    "cloud_environment", "check_mode"
};

constexpr const char* HOST_PREFIX = "_ansible_";
constexpr const char* HOST_CHECK_MODE = "_ansible_check_mode";

// Strings pass through; numbers and booleans are stringified the way the host would
std::optional<std::string> optString(const nlohmann::json& args, const std::string& key) {
    if (!args.contains(key) || args[key].is_null()) return std::nullopt;
    const auto& v = args[key];
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number() || v.is_boolean()) return v.dump();
    throw ValidationError(fmt::format("argument {} is of type {} and we were unable to convert to str",
                                      key, v.type_name()));
}

std::string reqString(const nlohmann::json& args, const std::string& key) {
    auto v = optString(args, key);
    if (!v || v->empty()) throw ValidationError("missing required arguments: " + key);
    return *v;
}

bool toBool(const nlohmann::json& v, const std::string& key) {
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_string()) {
        const auto s = v.get<std::string>();
        if (s == "true" || s == "True" || s == "yes" || s == "1") return true;
        if (s == "false" || s == "False" || s == "no" || s == "0") return false;
    }
    if (v.is_number_integer()) return v.get<int>() != 0;
    throw ValidationError("argument " + key + " could not be converted to bool");
}

Tags parseTags(const nlohmann::json& v) {
    Tags tags;
    if (v.is_null()) return tags;
    if (!v.is_object()) throw ValidationError("argument tags must be a dictionary");
    for (const auto& [k, val] : v.items()) tags[k] = val.is_string() ? val.get<std::string>() : val.dump();
    return tags;
}

std::optional<std::time_t> parseDate(const nlohmann::json& args, const std::string& key) {
    const auto s = optString(args, key);
    if (!s) return std::nullopt;
    try {
        return util::parseOptionalDateTime(*s);
    } catch (const ValidationError& e) {
        throw ValidationError(fmt::format("Invalid {}: {}", key, e.what()));
    }
}

}

std::vector<std::string> ModuleParams::sensitiveValues() const {
    std::vector<std::string> out;
    if (secret.value) out.push_back(*secret.value);
    if (!principal.secret.empty()) out.push_back(principal.secret);
    return out;
}

ModuleParams parseModuleArgs(const nlohmann::json& input) {
    if (!input.is_object()) throw ValidationError("Module arguments must be a JSON object");
    const auto& args = input.contains("ANSIBLE_MODULE_ARGS") ? input["ANSIBLE_MODULE_ARGS"] : input;
    if (!args.is_object()) throw ValidationError("ANSIBLE_MODULE_ARGS must be a JSON object");

    ModuleParams p;

    std::vector<std::string> unsupported;
    for (const auto& [key, val] : args.items()) {
        if (key == HOST_CHECK_MODE) {
            p.check_mode = toBool(val, key);
            continue;
        }
        if (key.rfind(HOST_PREFIX, 0) == 0) continue;
        if (!SUPPORTED.contains(key)) unsupported.push_back(key);
    }
    if (!unsupported.empty())
        throw ValidationError(fmt::format("Unsupported parameters for (kvsecret) module: {}. Supported parameters include: {}",
                                          fmt::join(unsupported, ", "), fmt::join(SUPPORTED, ", ")));

    if (args.contains("check_mode") && !args["check_mode"].is_null())
        p.check_mode = p.check_mode || toBool(args["check_mode"], "check_mode");

    p.keyvault_uri = reqString(args, "keyvault_uri");
    p.secret.name = reqString(args, "secret_name");
    p.secret.value = optString(args, "secret_value");
    p.secret.presence = presence_from_string(optString(args, "state").value_or("present"));

    if (p.secret.presence == Presence::Present && !p.secret.value)
        throw ValidationError("state is present but all of the following are missing: secret_value");

    p.secret.content_type = optString(args, "content_type");
    if (args.contains("tags")) p.secret.tags = parseTags(args["tags"]);
    p.secret.not_before = parseDate(args, "secret_valid_from");
    p.secret.expires = parseDate(args, "secret_expiry");

    if (const auto src = optString(args, "auth_source"); src && !src->empty())
        p.auth_source = auth_source_from_string(*src);
    if (const auto env = optString(args, "cloud_environment"); env && !env->empty())
        p.cloud_environment = *env;

    p.principal.client_id = optString(args, "client_id").value_or("");
    p.principal.secret = optString(args, "secret").value_or("");
    p.principal.tenant = optString(args, "tenant").value_or("");
    p.principal.subscription_id = optString(args, "subscription_id").value_or("");

    return p;
}

std::string to_string(const ModuleParams& p) {
    return fmt::format("ModuleParams(vault: {}, {}, auth_source: {}, cloud: {}, client_id: {}, secret: {}, check_mode: {})",
                       p.keyvault_uri, types::to_string(p.secret),
                       p.auth_source ? types::to_string(*p.auth_source) : "default",
                       p.cloud_environment.value_or("default"),
                       p.principal.client_id.empty() ? "-" : p.principal.client_id,
                       p.principal.secret.empty() ? "-" : util::redact(p.principal.secret),
                       p.check_mode);
}

}
