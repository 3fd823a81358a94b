#include "auth/PrincipalConfig.hpp"

#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <unordered_map>

using namespace kvs::auth;

namespace {

void fillFrom(std::string& field, const std::initializer_list<const char*> vars) {
    if (!field.empty()) return;
    for (const auto* var : vars) {
        if (const char* val = std::getenv(var); val && *val) {
            field = val;
            return;
        }
    }
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

void fillIfEmpty(std::string& field, const std::unordered_map<std::string, std::string>& kv, const std::string& key) {
    if (!field.empty()) return;
    if (const auto it = kv.find(key); it != kv.end()) field = it->second;
}

}

void PrincipalConfig::fillFromEnvironment() {
    fillFrom(client_id, {"AZURE_CLIENT_ID"});
    fillFrom(secret, {"AZURE_SECRET", "AZURE_CLIENT_SECRET"});
    fillFrom(tenant, {"AZURE_TENANT", "AZURE_TENANT_ID"});
    fillFrom(subscription_id, {"AZURE_SUBSCRIPTION_ID"});
}

bool PrincipalConfig::fillFromCredentialFile(const std::filesystem::path& path, const std::string& profile) {
    std::ifstream in(path);
    if (!in) return false;

    std::unordered_map<std::string, std::string> kv;
    bool inProfile = false, found = false;
    std::string line;

    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line.front() == '[' && line.back() == ']') {
            inProfile = trim(line.substr(1, line.size() - 2)) == profile;
            found = found || inProfile;
            continue;
        }

        if (!inProfile) continue;
        const auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        kv[trim(line.substr(0, eq))] = trim(line.substr(eq + 1));
    }

    if (!found) return false;

    fillIfEmpty(client_id, kv, "client_id");
    fillIfEmpty(secret, kv, "secret");
    fillIfEmpty(tenant, kv, "tenant");
    fillIfEmpty(subscription_id, kv, "subscription_id");
    return true;
}

std::filesystem::path kvs::auth::defaultCredentialFilePath() {
    if (const char* env = std::getenv("AZURE_CREDENTIAL_FILE"); env && *env) return env;
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : "") / ".azure" / "credentials";
}
