#include "types/AuthSource.hpp"
#include "types/errors.hpp"

#include <stdexcept>
#include <unordered_map>

using namespace kvs::types;

std::string kvs::types::to_string(const AuthSource source) {
    switch (source) {
        case AuthSource::Auto: return "auto";
        case AuthSource::Cli: return "cli";
        case AuthSource::Msi: return "msi";
        case AuthSource::Explicit: return "explicit";
        case AuthSource::Env: return "env";
        case AuthSource::CredentialFile: return "credential_file";
        default: throw std::invalid_argument("Unknown AuthSource enum value");
    }
}

AuthSource kvs::types::auth_source_from_string(const std::string& str) {
    static const std::unordered_map<std::string, AuthSource> mapping = {
        {"auto", AuthSource::Auto}, {"cli", AuthSource::Cli}, {"msi", AuthSource::Msi},
        {"explicit", AuthSource::Explicit}, {"env", AuthSource::Env},
        {"credential_file", AuthSource::CredentialFile}
    };

    if (const auto it = mapping.find(str); it != mapping.end()) return it->second;
    throw ValidationError("value of auth_source must be one of: auto, cli, msi, explicit, env, credential_file, got: " + str);
}
