#include "keyvault/SecretReconciler.hpp"
#include "types/errors.hpp"
#include "logging/LogRegistry.hpp"

#include <nlohmann/json.hpp>
#include <optional>

using namespace kvs::types;
using namespace kvs::logging;

namespace kvs::keyvault {

void to_json(nlohmann::json& j, const ReconcileResult& r) {
    j = {
        {"changed", r.changed},
        {"state", r.record}
    };
}

ReconcileResult reconcile(SecretClient& client, const SecretSpec& spec, const bool dryRun) {
    if (spec.name.empty()) throw ValidationError("secret_name must not be empty");
    if (spec.presence == Presence::Present && !spec.value)
        throw ValidationError("state is present but all of the following are missing: secret_value");

    std::optional<SecretRecord> current;
    try {
        current = client.getSecret(spec.name);
    } catch (const NotFound&) {
        LogRegistry::kvsecret()->debug("[SecretReconciler] {} does not exist in {}", spec.name, client.vaultUri());
    }

    ReconcileResult result;
    if (current) result.record.secret_id = current->secret_id;

    if (spec.presence == Presence::Absent) result.changed = current.has_value();
    else result.changed = !current || current->value != spec.value;

    if (!result.changed) {
        LogRegistry::kvsecret()->info("[SecretReconciler] {} already {}", spec.name, to_string(spec.presence));
        return result;
    }

    const auto status = spec.presence == Presence::Present ? SecretStatus::Created : SecretStatus::Deleted;

    if (dryRun) {
        LogRegistry::kvsecret()->info("[SecretReconciler] Check mode: {} would be {}", spec.name, to_string(status));
        result.record.status = status;
        return result;
    }

    auto written = status == SecretStatus::Created ? client.setSecret(spec) : client.deleteSecret(spec.name);
    result.record.secret_id = written.secret_id;
    result.record.status = status;

    LogRegistry::kvsecret()->info("[SecretReconciler] {} {}", spec.name, to_string(status));
    LogRegistry::audit()->info("[SecretReconciler] {} secret={} vault={} id={}", to_string(status),
                               spec.name, client.vaultUri(), written.secret_id);
    return result;
}

}
