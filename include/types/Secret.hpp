#pragma once

#include <nlohmann/json_fwd.hpp>
#include <ctime>
#include <map>
#include <optional>
#include <string>

namespace kvs::types {

enum class Presence { Present, Absent };
enum class SecretStatus { Created, Deleted };

std::string to_string(Presence presence);
Presence presence_from_string(const std::string& str);

std::string to_string(SecretStatus status);

using Tags = std::map<std::string, std::string>;

// Desired state, built once from the invocation parameters
struct SecretSpec {
    std::string name;
    std::optional<std::string> value;       // sensitive
    std::optional<std::time_t> not_before;
    std::optional<std::time_t> expires;
    std::optional<std::string> content_type;
    Tags tags;
    Presence presence{Presence::Present};
};

// What the vault holds, or what the reconciler did to it
struct SecretRecord {
    std::string secret_id;
    std::optional<std::string> value;       // never serialized
    std::optional<std::string> content_type;
    Tags tags;
    std::optional<SecretStatus> status;

    [[nodiscard]] bool empty() const { return secret_id.empty() && !status; }
};

void to_json(nlohmann::json& j, const SecretRecord& r);

std::string to_string(const SecretSpec& s);

} // namespace kvs::types
