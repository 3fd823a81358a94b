#include "keyvault/SecretId.hpp"
#include "types/errors.hpp"

#include <utility>
#include <vector>

namespace kvs::keyvault {

namespace {

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= path.size()) {
        const auto slash = path.find('/', start);
        const auto end = slash == std::string::npos ? path.size() : slash;
        if (end > start) parts.push_back(path.substr(start, end - start));
        if (slash == std::string::npos) break;
        start = slash + 1;
    }
    return parts;
}

bool isLoopbackHost(const std::string& host) {
    std::string name = host;
    if (!name.empty() && name.front() == '[') name = name.substr(0, name.find(']') + 1);
    else name = name.substr(0, name.find(':'));
    return name == "localhost" || name == "127.0.0.1" || name == "[::1]";
}

// Splits "scheme://host/rest" into "scheme://host" and "rest"
std::pair<std::string, std::string> splitAuthority(const std::string& uri) {
    const auto scheme = uri.find("://");
    if (scheme == std::string::npos || scheme == 0)
        throw types::ValidationError("Invalid Key Vault URI (missing scheme): " + uri);

    const auto prefix = uri.substr(0, scheme);
    if (prefix != "https" && prefix != "http")
        throw types::ValidationError("Invalid Key Vault URI (scheme must be https): " + uri);

    const auto hostStart = scheme + 3;
    const auto slash = uri.find('/', hostStart);
    const auto host = uri.substr(hostStart, slash == std::string::npos ? std::string::npos : slash - hostStart);
    if (host.empty()) throw types::ValidationError("Invalid Key Vault URI (missing host): " + uri);

    // Bearer tokens only leave the machine over TLS
    if (prefix == "http" && !isLoopbackHost(host))
        throw types::ValidationError("Invalid Key Vault URI (http is only allowed for loopback hosts): " + uri);

    return {uri.substr(0, hostStart) + host, slash == std::string::npos ? std::string{} : uri.substr(slash + 1)};
}

}

SecretId SecretId::parse(const std::string& id, const std::string& expectedCollection) {
    const auto [vault, path] = splitAuthority(id);

    auto rest = path;
    if (const auto q = rest.find('?'); q != std::string::npos) rest.erase(q);
    const auto parts = splitPath(rest);

    if (parts.size() != 2 && parts.size() != 3)
        throw types::ValidationError("Invalid Key Vault identifier (expected <vault>/" + expectedCollection +
                                     "/<name>[/<version>]): " + id);

    if (parts[0] != expectedCollection)
        throw types::ValidationError("Invalid Key Vault identifier (collection '" + parts[0] + "', expected '" +
                                     expectedCollection + "'): " + id);

    return {vault, parts[0], parts[1], parts.size() == 3 ? parts[2] : std::string{}};
}

std::string SecretId::id() const {
    auto out = vault + "/" + collection + "/" + name;
    if (!version.empty()) out += "/" + version;
    return out;
}

std::string normalizeVaultUri(const std::string& uri) {
    const auto [vault, path] = splitAuthority(uri);
    for (const char c : path)
        if (c != '/') throw types::ValidationError("Key Vault URI must not contain a path: " + uri);
    return vault;
}

std::string vaultDnsSuffix(const std::string& vaultUri) {
    const auto vault = normalizeVaultUri(vaultUri);
    const auto host = vault.substr(vault.find("://") + 3);
    auto hostOnly = host.substr(0, host.find(':'));
    const auto dot = hostOnly.find('.');
    if (dot == std::string::npos || dot + 1 >= hostOnly.size()) return {};
    return hostOnly.substr(dot + 1);
}

}
