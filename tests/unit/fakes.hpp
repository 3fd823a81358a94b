#pragma once

#include "auth/TokenCredential.hpp"
#include "keyvault/SecretClient.hpp"
#include "types/errors.hpp"
#include "util/HttpClient.hpp"

#include <algorithm>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <fmt/format.h>

namespace kvs::test {

inline util::HttpResponse response(const long http, std::string body, const CURLcode curl = CURLE_OK) {
    util::HttpResponse r;
    r.curl = curl;
    r.http = http;
    r.body = std::move(body);
    return r;
}

// Replays queued responses and records every request
class FakeHttpClient : public util::HttpClient {
public:
    mutable std::vector<util::HttpRequest> requests;
    mutable std::deque<util::HttpResponse> responses;

    void enqueue(util::HttpResponse r) { responses.push_back(std::move(r)); }

    [[nodiscard]] util::HttpResponse perform(const util::HttpRequest& req) const override {
        requests.push_back(req);
        if (responses.empty()) return response(0, "", CURLE_COULDNT_CONNECT);
        auto r = responses.front();
        responses.pop_front();
        return r;
    }

    [[nodiscard]] bool hasHeader(const size_t idx, const std::string& header) const {
        const auto& h = requests.at(idx).headers;
        return std::find(h.begin(), h.end(), header) != h.end();
    }
};

class FakeCredential : public auth::TokenCredential {
public:
    FakeCredential(std::string name, auth::TokenResult result)
        : name_(std::move(name)), result_(std::move(result)) {}

    static std::shared_ptr<FakeCredential> ok(const std::string& name, const std::string& token = "tok") {
        return std::make_shared<FakeCredential>(name, auth::TokenResult::Success(auth::AccessToken{token, 0}));
    }

    static std::shared_ptr<FakeCredential> failing(const std::string& name, const std::string& error) {
        return std::make_shared<FakeCredential>(name, auth::TokenResult::Failure(error));
    }

    [[nodiscard]] std::string name() const override { return name_; }

    int fetches = 0;

protected:
    [[nodiscard]] auth::TokenResult fetch(const std::string&) override {
        ++fetches;
        return result_;
    }

private:
    std::string name_;
    auth::TokenResult result_;
};

// In-memory vault shared between a test and the clients it hands out
struct FakeVault {
    std::string uri = "https://contoso.vault.azure.net";
    std::map<std::string, types::SecretRecord> secrets;
    unsigned int reads = 0, writes = 0, versions = 0;
    std::optional<types::RemoteError> readError;
};

class FakeSecretClient : public keyvault::SecretClient {
public:
    explicit FakeSecretClient(std::shared_ptr<FakeVault> vault) : vault_(std::move(vault)) {}

    types::SecretRecord getSecret(const std::string& name, const std::string&) override {
        ++vault_->reads;
        if (vault_->readError) throw *vault_->readError;
        const auto it = vault_->secrets.find(name);
        if (it == vault_->secrets.end()) throw types::NotFound(name);
        return it->second;
    }

    types::SecretRecord setSecret(const types::SecretSpec& spec) override {
        ++vault_->writes;
        types::SecretRecord rec;
        rec.secret_id = fmt::format("{}/secrets/{}/{:032x}", vault_->uri, spec.name, ++vault_->versions);
        rec.value = spec.value;
        rec.content_type = spec.content_type;
        rec.tags = spec.tags;
        vault_->secrets[spec.name] = rec;
        return rec;
    }

    types::SecretRecord deleteSecret(const std::string& name) override {
        ++vault_->writes;
        const auto it = vault_->secrets.find(name);
        if (it == vault_->secrets.end()) throw types::NotFound(name);
        types::SecretRecord rec;
        rec.secret_id = it->second.secret_id;
        vault_->secrets.erase(it);
        return rec;
    }

    [[nodiscard]] const std::string& vaultUri() const override { return vault_->uri; }

private:
    std::shared_ptr<FakeVault> vault_;
};

}
