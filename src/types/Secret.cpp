#include "types/Secret.hpp"
#include "types/errors.hpp"
#include "util/timestamp.hpp"
#include "util/redact.hpp"

#include <nlohmann/json.hpp>
#include <fmt/format.h>

using namespace kvs::types;

std::string kvs::types::to_string(const Presence presence) {
    switch (presence) {
        case Presence::Present: return "present";
        case Presence::Absent: return "absent";
        default: throw std::invalid_argument("Unknown Presence enum value");
    }
}

Presence kvs::types::presence_from_string(const std::string& str) {
    if (str == "present") return Presence::Present;
    if (str == "absent") return Presence::Absent;
    throw ValidationError("value of state must be one of: present, absent, got: " + str);
}

std::string kvs::types::to_string(const SecretStatus status) {
    switch (status) {
        case SecretStatus::Created: return "Created";
        case SecretStatus::Deleted: return "Deleted";
        default: throw std::invalid_argument("Unknown SecretStatus enum value");
    }
}

void kvs::types::to_json(nlohmann::json& j, const SecretRecord& r) {
    j = nlohmann::json::object();
    if (!r.secret_id.empty()) j["secret_id"] = r.secret_id;
    if (r.status) j["status"] = to_string(*r.status);
}

std::string kvs::types::to_string(const SecretSpec& s) {
    const auto date = [](const std::optional<std::time_t>& t) {
        return t ? util::timestampToString(*t) : std::string("-");
    };

    return fmt::format("SecretSpec(name: {}, state: {}, value: {}, content_type: {}, tags: {}, nbf: {}, exp: {})",
                       s.name, to_string(s.presence), s.value ? util::redact(*s.value) : "-",
                       s.content_type.value_or("-"), s.tags.size(), date(s.not_before), date(s.expires));
}
