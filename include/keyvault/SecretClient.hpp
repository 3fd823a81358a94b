#pragma once

#include "types/Secret.hpp"

#include <string>

namespace kvs::keyvault {

// Secret operations on one vault
class SecretClient {
public:
    virtual ~SecretClient() = default;

    // Throws types::NotFound when the secret does not exist, types::RemoteError otherwise.
    virtual types::SecretRecord getSecret(const std::string& name, const std::string& version = {}) = 0;

    // Creates a new version with the desired value and its metadata.
    virtual types::SecretRecord setSecret(const types::SecretSpec& spec) = 0;

    virtual types::SecretRecord deleteSecret(const std::string& name) = 0;

    [[nodiscard]] virtual const std::string& vaultUri() const = 0;
};

}
