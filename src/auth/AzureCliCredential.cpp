#include "auth/AzureCliCredential.hpp"
#include "auth/tokenResponse.hpp"
#include "logging/LogRegistry.hpp"

#include <array>
#include <cstdio>
#include <sys/wait.h>
#include <fmt/format.h>

using namespace kvs::auth;
using namespace kvs::logging;

namespace {

std::string shellQuote(const std::string& s) {
    std::string out = "'";
    for (const char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

std::string trimOutput(const std::string& s) {
    const auto last = s.find_last_not_of(" \t\r\n");
    return last == std::string::npos ? std::string{} : s.substr(0, last + 1);
}

}

AzureCliCredential::AzureCliCredential(std::string azPath, std::string subscriptionId)
    : az_path_(std::move(azPath)), subscription_id_(std::move(subscriptionId)) {}

std::string AzureCliCredential::command(const std::string& resource) const {
    auto cmd = fmt::format("{} account get-access-token --resource {} -o json", shellQuote(az_path_), shellQuote(resource));
    if (!subscription_id_.empty()) cmd += " --subscription " + shellQuote(subscription_id_);
    return cmd;
}

int AzureCliCredential::run(const std::string& cmd, std::string& output) const {
    FILE* pipe = popen((cmd + " 2>&1").c_str(), "r");
    if (!pipe) return -1;

    std::array<char, 4096> buf{};
    size_t n;
    while ((n = fread(buf.data(), 1, buf.size(), pipe)) > 0) output.append(buf.data(), n);

    const int status = pclose(pipe);
    if (status == -1) return -1;
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

TokenResult AzureCliCredential::fetch(const std::string& resource) {
    std::string output;
    const int rc = run(command(resource), output);

    if (rc == -1) return TokenResult::Failure("could not run " + az_path_);
    if (rc != 0) return TokenResult::Failure(fmt::format("az exited with status {}: {}", rc, trimOutput(output)));

    // Warnings on stderr may precede the JSON document
    const auto brace = output.find('{');
    if (brace == std::string::npos) return TokenResult::Failure("az returned no JSON output");

    auto token = parseTokenResponse(output.substr(brace));
    if (!token) return TokenResult::Failure("az returned an unparsable token response");

    LogRegistry::auth()->debug("[AzureCliCredential] Acquired token for {}", resource);
    return TokenResult::Success(std::move(token));
}
