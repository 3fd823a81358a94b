#include "keyvault/KeyVaultClient.hpp"
#include "keyvault/SecretId.hpp"
#include "types/errors.hpp"
#include "logging/LogRegistry.hpp"

#include <nlohmann/json.hpp>
#include <fmt/format.h>

using namespace kvs::keyvault;
using namespace kvs::types;
using namespace kvs::util;
using namespace kvs::logging;

namespace {
constexpr const char* SECRET_NOT_FOUND = "SecretNotFound";
}

KeyVaultClient::KeyVaultClient(const HttpClient& http,
                               std::shared_ptr<auth::TokenCredential> credential,
                               const std::string& vaultUri,
                               std::string resource,
                               std::string apiVersion)
    : http_(http),
      credential_(std::move(credential)),
      vault_(normalizeVaultUri(vaultUri)),
      resource_(std::move(resource)),
      api_version_(std::move(apiVersion)) {
    if (!credential_) throw std::invalid_argument("KeyVaultClient requires a credential");
}

std::string KeyVaultClient::secretUrl(const std::string& name, const std::string& version) const {
    auto url = vault_ + "/secrets/" + urlEscape(name);
    if (!version.empty()) url += "/" + urlEscape(version);
    return url + "?api-version=" + urlEscape(api_version_);
}

nlohmann::json KeyVaultClient::setSecretBody(const SecretSpec& spec) {
    if (!spec.value) throw ValidationError("Secret value is required to set secret " + spec.name);

    nlohmann::json body = {{"value", *spec.value}};
    if (spec.content_type) body["contentType"] = *spec.content_type;
    if (!spec.tags.empty()) body["tags"] = spec.tags;

    nlohmann::json attributes = nlohmann::json::object();
    if (spec.not_before) attributes["nbf"] = *spec.not_before;
    if (spec.expires) attributes["exp"] = *spec.expires;
    if (!attributes.empty()) body["attributes"] = attributes;

    return body;
}

SecretRecord KeyVaultClient::parseBundle(const std::string& body) {
    const auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("id") || !j["id"].is_string())
        throw RemoteError("Malformed Key Vault response: missing secret id");

    SecretRecord r;
    const auto id = j["id"].get<std::string>();
    try {
        r.secret_id = SecretId::parse(id).id();
    } catch (const ValidationError& e) {
        throw RemoteError(fmt::format("Malformed Key Vault response: {}", e.what()));
    }
    if (j.contains("value") && j["value"].is_string()) r.value = j["value"].get<std::string>();
    if (j.contains("contentType") && j["contentType"].is_string()) r.content_type = j["contentType"].get<std::string>();
    if (j.contains("tags") && j["tags"].is_object())
        for (const auto& [k, v] : j["tags"].items())
            if (v.is_string()) r.tags[k] = v.get<std::string>();
    return r;
}

void KeyVaultClient::throwForResponse(const HttpResponse& resp, const std::string& name) {
    if (resp.curl != CURLE_OK)
        throw RemoteError(fmt::format("Key Vault request failed: {}", curl_easy_strerror(resp.curl)));

    std::string code, message;
    const auto j = nlohmann::json::parse(resp.body, nullptr, false);
    if (!j.is_discarded() && j.is_object() && j.contains("error") && j["error"].is_object()) {
        const auto& err = j["error"];
        if (err.contains("code") && err["code"].is_string()) code = err["code"].get<std::string>();
        if (err.contains("message") && err["message"].is_string()) message = err["message"].get<std::string>();
    }

    if (resp.http == 404 && code == SECRET_NOT_FOUND) throw NotFound(name);

    if (message.empty()) message = fmt::format("Key Vault returned HTTP {}", resp.http);
    throw RemoteError(message, resp.http, code);
}

HttpResponse KeyVaultClient::send(HttpRequest req, const std::string& name) {
    req.headers.push_back("Authorization: Bearer " + credential_->getToken(resource_));
    req.headers.emplace_back("Accept: application/json");
    if (!req.body.empty()) req.headers.emplace_back("Content-Type: application/json");

    auto resp = http_.perform(req);
    if (!resp.ok()) throwForResponse(resp, name);
    return resp;
}

SecretRecord KeyVaultClient::getSecret(const std::string& name, const std::string& version) {
    HttpRequest req;
    req.url = secretUrl(name, version);

    try {
        const auto resp = send(std::move(req), name);
        return parseBundle(resp.body);
    } catch (const NotFound&) {
        LogRegistry::cloud()->debug("[KeyVaultClient] Secret {} not found in {}", name, vault_);
        throw;
    } catch (const RemoteError& e) {
        LogRegistry::cloud()->error("[KeyVaultClient] Failed to get secret {}: {}", name, e.what());
        throw;
    }
}

SecretRecord KeyVaultClient::setSecret(const SecretSpec& spec) {
    HttpRequest req;
    req.method = "PUT";
    req.url = secretUrl(spec.name);
    req.body = setSecretBody(spec).dump();

    try {
        const auto resp = send(std::move(req), spec.name);
        return parseBundle(resp.body);
    } catch (const RemoteError& e) {
        LogRegistry::cloud()->error("[KeyVaultClient] Failed to set secret {}: {}", spec.name, e.what());
        throw;
    }
}

SecretRecord KeyVaultClient::deleteSecret(const std::string& name) {
    HttpRequest req;
    req.method = "DELETE";
    req.url = secretUrl(name);

    try {
        const auto resp = send(std::move(req), name);
        return parseBundle(resp.body);
    } catch (const Error& e) {
        LogRegistry::cloud()->error("[KeyVaultClient] Failed to delete secret {}: {}", name, e.what());
        throw;
    }
}
