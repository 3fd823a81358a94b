#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"
#include "module/KeyVaultSecretModule.hpp"
#include "module/ModuleParams.hpp"
#include "types/errors.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>

using namespace kvs::config;
using namespace kvs::logging;
using namespace kvs::module;

namespace {

nlohmann::json readArgs(const std::string& path) {
    std::string raw;
    if (path == "-") {
        raw.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    } else {
        std::ifstream in(path);
        if (!in) throw kvs::types::ValidationError("Unable to open arguments file: " + path);
        raw.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    auto j = nlohmann::json::parse(raw, nullptr, false);
    if (j.is_discarded()) throw kvs::types::ValidationError("Arguments are not valid JSON");
    return j;
}

// Collected before validation so even a rejected invocation never echoes them
std::vector<std::string> sensitiveValues(const nlohmann::json& input) {
    std::vector<std::string> out;
    const auto& args = input.is_object() && input.contains("ANSIBLE_MODULE_ARGS") ? input["ANSIBLE_MODULE_ARGS"] : input;
    if (args.is_object())
        for (const auto* key : {"secret_value", "secret"}) {
            if (!args.contains(key)) continue;
            const auto& v = args[key];
            if (v.is_string()) out.push_back(v.get<std::string>());
            else if (v.is_number() || v.is_boolean()) out.push_back(v.dump());
        }

    for (const auto* var : {"AZURE_SECRET", "AZURE_CLIENT_SECRET"})
        if (const char* val = std::getenv(var); val && *val) out.emplace_back(val);
    return out;
}

}

int main(const int argc, char** argv) {
    if (argc != 2) {
        std::cerr << "usage: kvsecret <args.json | ->" << std::endl;
        return 2;
    }

    std::vector<std::string> sensitive;

    try {
        ConfigRegistry::init();
        LogRegistry::init();

        const auto input = readArgs(argv[1]);
        sensitive = sensitiveValues(input);

        const auto params = parseModuleArgs(input);
        const auto parsed = params.sensitiveValues();
        sensitive.insert(sensitive.end(), parsed.begin(), parsed.end());

        KeyVaultSecretModule secretModule(ConfigRegistry::get());
        try {
            std::cout << secretModule.run(params).dump() << std::endl;
        } catch (const std::exception&) {
            // Principal secrets read from the credential file are only known after resolution
            const auto& resolved = secretModule.sensitiveValues();
            sensitive.insert(sensitive.end(), resolved.begin(), resolved.end());
            throw;
        }

        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        const auto result = KeyVaultSecretModule::failure(e.what(), sensitive);
        if (LogRegistry::isInitialized())
            LogRegistry::kvsecret()->error("[-] {}", result["msg"].get<std::string>());
        std::cout << result.dump() << std::endl;
        return EXIT_FAILURE;
    }
}
