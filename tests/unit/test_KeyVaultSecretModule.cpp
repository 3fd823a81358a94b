#include <gtest/gtest.h>
#include "fakes.hpp"
#include "module/KeyVaultSecretModule.hpp"
#include "types/errors.hpp"

#include <algorithm>
#include <cstdlib>
#include <nlohmann/json.hpp>

using namespace kvs::module;
using namespace kvs::test;
using namespace kvs::types;
using json = nlohmann::json;

namespace {

void clearAzureEnv() {
    for (const auto* var : {"AZURE_CLIENT_ID", "AZURE_SECRET", "AZURE_CLIENT_SECRET", "AZURE_TENANT",
                            "AZURE_TENANT_ID", "AZURE_SUBSCRIPTION_ID"})
        ::unsetenv(var);
}

// Routes the module to an in-memory vault instead of resolving real credentials
class InMemoryModule : public KeyVaultSecretModule {
public:
    explicit InMemoryModule(std::shared_ptr<FakeVault> vault, kvs::config::Config cfg = {})
        : KeyVaultSecretModule(std::move(cfg)), vault_(std::move(vault)) {}

    std::string lastCloud;
    std::optional<AuthSource> lastSource;

protected:
    std::unique_ptr<kvs::keyvault::SecretClient> openClient(const ModuleParams&,
                                                            const kvs::auth::CloudEnvironment& cloud,
                                                            const AuthSource source) override {
        lastCloud = cloud.name;
        lastSource = source;
        return std::make_unique<FakeSecretClient>(vault_);
    }

private:
    std::shared_ptr<FakeVault> vault_;
};

}

class KeyVaultSecretModuleTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeVault> vault = std::make_shared<FakeVault>();
    InMemoryModule mod{vault};

    void SetUp() override { clearAzureEnv(); }
    void TearDown() override { clearAzureEnv(); }

    static ModuleParams params(const json& overrides = json::object()) {
        json args = {
            {"keyvault_uri", "https://contoso.vault.azure.net/"},
            {"secret_name", "MySecret"},
            {"secret_value", "My_Pass_Sec"}
        };
        args.update(overrides);
        return parseModuleArgs(args);
    }
};

TEST_F(KeyVaultSecretModuleTest, CreateReportsIdentifierAndStatus) {
    const auto out = mod.run(params());
    EXPECT_EQ(out["changed"], true);
    EXPECT_EQ(out["state"]["status"], "Created");
    EXPECT_EQ(out["state"]["secret_id"].get<std::string>().rfind("https://contoso.vault.azure.net/secrets/MySecret/", 0), 0u);
    EXPECT_EQ(out.dump().find("My_Pass_Sec"), std::string::npos);
}

TEST_F(KeyVaultSecretModuleTest, DefaultsComeFromConfig) {
    (void)mod.run(params());
    EXPECT_EQ(mod.lastCloud, "AzureCloud");
    EXPECT_EQ(mod.lastSource, AuthSource::Auto);

    (void)mod.run(params({{"auth_source", "msi"}, {"cloud_environment", "AzureChinaCloud"}}));
    EXPECT_EQ(mod.lastCloud, "AzureChinaCloud");
    EXPECT_EQ(mod.lastSource, AuthSource::Msi);
}

TEST_F(KeyVaultSecretModuleTest, CheckModeLeavesVaultUntouched) {
    const auto out = mod.run(params({{"_ansible_check_mode", true}}));
    EXPECT_EQ(out["changed"], true);
    EXPECT_EQ(out["state"]["status"], "Created");
    EXPECT_TRUE(vault->secrets.empty());
}

TEST_F(KeyVaultSecretModuleTest, AbsentSecretStaysAbsent) {
    const auto out = mod.run(params({{"state", "absent"}}));
    EXPECT_EQ(out, (json{{"changed", false}, {"state", json::object()}}));
}

TEST_F(KeyVaultSecretModuleTest, UnknownCloudFailsBeforeAnyRemoteCall) {
    EXPECT_THROW((void)mod.run(params({{"cloud_environment", "Mars"}})), ValidationError);
    EXPECT_EQ(vault->reads, 0u);
}

TEST_F(KeyVaultSecretModuleTest, FailureDocumentIsScrubbed) {
    const auto out = KeyVaultSecretModule::failure("bad secret My_Pass_Sec rejected", {"My_Pass_Sec"});
    EXPECT_EQ(out["failed"], true);
    EXPECT_EQ(out["changed"], false);
    EXPECT_EQ(out["msg"].get<std::string>().find("My_Pass_Sec"), std::string::npos);
}

TEST_F(KeyVaultSecretModuleTest, ExplicitAuthSourceIgnoresConfiguredDefault) {
    kvs::config::Config cfg;
    cfg.auth.default_source = "managed";
    InMemoryModule custom{vault, cfg};

    EXPECT_NO_THROW((void)custom.run(params({{"auth_source", "msi"}})));
    EXPECT_EQ(custom.lastSource, AuthSource::Msi);

    EXPECT_THROW((void)custom.run(params()), ValidationError);
}

TEST_F(KeyVaultSecretModuleTest, SensitiveValuesCoverResolvedPrincipal) {
    ::setenv("AZURE_SECRET", "env-sp-secret", 1);

    (void)mod.run(params({{"auth_source", "explicit"}, {"client_id", "app-id"}, {"secret_value", 12345}}));

    const auto& sensitive = mod.sensitiveValues();
    EXPECT_NE(std::find(sensitive.begin(), sensitive.end(), "env-sp-secret"), sensitive.end());
    EXPECT_NE(std::find(sensitive.begin(), sensitive.end(), "12345"), sensitive.end());
}

// Production client wiring over a scripted transport
class KeyVaultSecretModuleWiringTest : public ::testing::Test {
protected:
    FakeHttpClient* http = nullptr;
    std::unique_ptr<KeyVaultSecretModule> mod;

    void SetUp() override {
        clearAzureEnv();
        auto transport = std::make_unique<FakeHttpClient>();
        http = transport.get();
        mod = std::make_unique<KeyVaultSecretModule>(kvs::config::Config{}, std::move(transport));
    }

    void TearDown() override { clearAzureEnv(); }

    static json args(const std::string& vaultUri) {
        return {
            {"keyvault_uri", vaultUri},
            {"secret_name", "MySecret"},
            {"secret_value", "My_Pass_Sec"},
            {"auth_source", "explicit"},
            {"client_id", "app-id"},
            {"secret", "sp-secret"}
        };
    }

    void scriptCreate(const std::string& vault) const {
        http->enqueue(response(200, R"({"access_token":"aad-token","expires_in":3599})"));
        http->enqueue(response(404, R"({"error":{"code":"SecretNotFound","message":"not found"}})"));
        http->enqueue(response(200, json{{"id", vault + "/secrets/MySecret/0a1b2c"}}.dump()));
    }
};

TEST_F(KeyVaultSecretModuleWiringTest, TokenAudienceFollowsVaultHost) {
    scriptCreate("https://contoso.vault.azure.net");
    const auto out = mod->run(parseModuleArgs(args("https://contoso.vault.azure.net/")));

    EXPECT_EQ(out["state"]["secret_id"], "https://contoso.vault.azure.net/secrets/MySecret/0a1b2c");
    EXPECT_EQ(out["state"]["status"], "Created");

    ASSERT_EQ(http->requests.size(), 3u);
    EXPECT_EQ(http->requests[0].url, "https://login.microsoftonline.com/common/oauth2/token");
    EXPECT_NE(http->requests[0].body.find("resource=https%3A%2F%2Fvault.azure.net"), std::string::npos);
    EXPECT_EQ(http->requests[1].url, "https://contoso.vault.azure.net/secrets/MySecret?api-version=7.4");
    EXPECT_TRUE(http->hasHeader(1, "Authorization: Bearer aad-token"));
    EXPECT_EQ(http->requests[2].method, "PUT");
    EXPECT_TRUE(http->hasHeader(2, "Authorization: Bearer aad-token"));
}

TEST_F(KeyVaultSecretModuleWiringTest, BareHostFallsBackToCloudSuffix) {
    scriptCreate("http://localhost:8443");
    auto a = args("http://localhost:8443");
    a["cloud_environment"] = "AzureChinaCloud";
    (void)mod->run(parseModuleArgs(a));

    ASSERT_EQ(http->requests.size(), 3u);
    EXPECT_EQ(http->requests[0].url, "https://login.chinacloudapi.cn/common/oauth2/token");
    EXPECT_NE(http->requests[0].body.find("resource=https%3A%2F%2Fvault.azure.cn"), std::string::npos);
    EXPECT_EQ(http->requests[1].url, "http://localhost:8443/secrets/MySecret?api-version=7.4");
}
