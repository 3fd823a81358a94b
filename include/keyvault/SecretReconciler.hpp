#pragma once

#include "keyvault/SecretClient.hpp"
#include "types/Secret.hpp"

#include <nlohmann/json_fwd.hpp>

namespace kvs::keyvault {

struct ReconcileResult {
    bool changed = false;
    types::SecretRecord record;   // value always cleared
};

void to_json(nlohmann::json& j, const ReconcileResult& r);

// Brings one secret to the desired presence/value with at most one read and one write.
// Only the value is compared; tags, content type and validity window never trigger an update.
ReconcileResult reconcile(SecretClient& client, const types::SecretSpec& spec, bool dryRun = false);

}
