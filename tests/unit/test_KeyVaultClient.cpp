#include <gtest/gtest.h>
#include "fakes.hpp"
#include "keyvault/KeyVaultClient.hpp"
#include "types/errors.hpp"

#include <nlohmann/json.hpp>

using namespace kvs::keyvault;
using namespace kvs::test;
using namespace kvs::types;
using json = nlohmann::json;

class KeyVaultClientTest : public ::testing::Test {
protected:
    FakeHttpClient http;
    std::shared_ptr<FakeCredential> credential = FakeCredential::ok("Fake", "tok");
    KeyVaultClient client{http, credential, "https://contoso.vault.azure.net/", "https://vault.azure.net"};

    static std::string bundle(const std::string& name, const std::string& value, const std::string& version = "v1") {
        return json{
            {"id", "https://contoso.vault.azure.net/secrets/" + name + "/" + version},
            {"value", value},
            {"contentType", "password"},
            {"tags", {{"env", "prod"}}},
            {"attributes", {{"enabled", true}, {"created", 1705276800}}}
        }.dump();
    }
};

TEST_F(KeyVaultClientTest, GetSecretLatestVersion) {
    http.enqueue(response(200, bundle("MySecret", "My_Pass_Sec")));

    const auto rec = client.getSecret("MySecret");
    EXPECT_EQ(rec.secret_id, "https://contoso.vault.azure.net/secrets/MySecret/v1");
    EXPECT_EQ(rec.value, "My_Pass_Sec");
    EXPECT_EQ(rec.content_type, "password");
    EXPECT_EQ(rec.tags.at("env"), "prod");
    EXPECT_FALSE(rec.status.has_value());

    ASSERT_EQ(http.requests.size(), 1u);
    EXPECT_EQ(http.requests[0].method, "GET");
    EXPECT_EQ(http.requests[0].url, "https://contoso.vault.azure.net/secrets/MySecret?api-version=7.4");
    EXPECT_TRUE(http.hasHeader(0, "Authorization: Bearer tok"));
}

TEST_F(KeyVaultClientTest, GetSecretSpecificVersion) {
    http.enqueue(response(200, bundle("MySecret", "old", "abc")));
    (void)client.getSecret("MySecret", "abc");
    EXPECT_EQ(http.requests[0].url, "https://contoso.vault.azure.net/secrets/MySecret/abc?api-version=7.4");
}

TEST_F(KeyVaultClientTest, SecretNotFoundMapsToNotFound) {
    http.enqueue(response(404, R"({"error":{"code":"SecretNotFound","message":"A secret with (name/id) MySecret was not found in this key vault."}})"));
    EXPECT_THROW((void)client.getSecret("MySecret"), NotFound);
}

TEST_F(KeyVaultClientTest, Other404IsRemoteError) {
    http.enqueue(response(404, "<html>Not Found</html>"));
    try {
        (void)client.getSecret("MySecret");
        FAIL() << "expected RemoteError";
    } catch (const RemoteError& e) {
        EXPECT_EQ(e.httpStatus(), 404);
        EXPECT_TRUE(e.code().empty());
    }
}

TEST_F(KeyVaultClientTest, ServerMessageIsKeptVerbatim) {
    const std::string message = "The user, group or application 'appid=1234' does not have secrets get permission on key vault 'contoso'.";
    http.enqueue(response(403, json{{"error", {{"code", "Forbidden"}, {"message", message}}}}.dump()));
    try {
        (void)client.getSecret("MySecret");
        FAIL() << "expected RemoteError";
    } catch (const RemoteError& e) {
        EXPECT_EQ(std::string(e.what()), message);
        EXPECT_EQ(e.httpStatus(), 403);
        EXPECT_EQ(e.code(), "Forbidden");
    }
}

TEST_F(KeyVaultClientTest, TransportFailureIsRemoteError) {
    try {
        (void)client.getSecret("MySecret");   // nothing queued: connection refused
        FAIL() << "expected RemoteError";
    } catch (const RemoteError& e) {
        EXPECT_EQ(e.httpStatus(), 0);
    }
}

TEST_F(KeyVaultClientTest, SetSecretSendsValueAndMetadata) {
    SecretSpec spec;
    spec.name = "MySecret";
    spec.value = "My_Pass_Sec";
    spec.content_type = "password";
    spec.tags = {{"env", "prod"}};
    spec.not_before = 1705276800;
    spec.expires = 1736899200;

    http.enqueue(response(200, bundle("MySecret", "My_Pass_Sec", "v2")));
    const auto rec = client.setSecret(spec);
    EXPECT_EQ(rec.secret_id, "https://contoso.vault.azure.net/secrets/MySecret/v2");

    const auto& req = http.requests.at(0);
    EXPECT_EQ(req.method, "PUT");
    EXPECT_EQ(req.url, "https://contoso.vault.azure.net/secrets/MySecret?api-version=7.4");
    EXPECT_TRUE(http.hasHeader(0, "Content-Type: application/json"));

    const auto body = json::parse(req.body);
    EXPECT_EQ(body["value"], "My_Pass_Sec");
    EXPECT_EQ(body["contentType"], "password");
    EXPECT_EQ(body["tags"]["env"], "prod");
    EXPECT_EQ(body["attributes"]["nbf"], 1705276800);
    EXPECT_EQ(body["attributes"]["exp"], 1736899200);
}

TEST_F(KeyVaultClientTest, MinimalSetBodyCarriesOnlyValue) {
    SecretSpec spec;
    spec.name = "MySecret";
    spec.value = "v";
    EXPECT_EQ(KeyVaultClient::setSecretBody(spec), (json{{"value", "v"}}));

    spec.value.reset();
    EXPECT_THROW((void)KeyVaultClient::setSecretBody(spec), ValidationError);
}

TEST_F(KeyVaultClientTest, DeleteSecretReturnsIdentifier) {
    http.enqueue(response(200, json{
        {"recoveryId", "https://contoso.vault.azure.net/deletedsecrets/MySecret"},
        {"id", "https://contoso.vault.azure.net/secrets/MySecret/v2"},
        {"scheduledPurgeDate", 1713052800}
    }.dump()));

    const auto rec = client.deleteSecret("MySecret");
    EXPECT_EQ(rec.secret_id, "https://contoso.vault.azure.net/secrets/MySecret/v2");
    EXPECT_FALSE(rec.value.has_value());
    EXPECT_EQ(http.requests.at(0).method, "DELETE");
}

TEST_F(KeyVaultClientTest, MalformedBundleIsRemoteError) {
    EXPECT_THROW((void)KeyVaultClient::parseBundle("{}"), RemoteError);
    EXPECT_THROW((void)KeyVaultClient::parseBundle("not json"), RemoteError);
}

TEST_F(KeyVaultClientTest, BundleIdMustBeSecretIdentifier) {
    EXPECT_THROW((void)KeyVaultClient::parseBundle(R"({"id":"not a url"})"), RemoteError);
    EXPECT_THROW((void)KeyVaultClient::parseBundle(R"({"id":"https://contoso.vault.azure.net/keys/MyKey/1"})"), RemoteError);

    const auto rec = KeyVaultClient::parseBundle(R"({"id":"https://contoso.vault.azure.net/secrets/MySecret/v1?x=1"})");
    EXPECT_EQ(rec.secret_id, "https://contoso.vault.azure.net/secrets/MySecret/v1");
}

TEST_F(KeyVaultClientTest, TokenAcquiredOncePerInvocation) {
    http.enqueue(response(200, bundle("MySecret", "a")));
    http.enqueue(response(200, bundle("MySecret", "b", "v2")));

    (void)client.getSecret("MySecret");
    SecretSpec spec;
    spec.name = "MySecret";
    spec.value = "b";
    (void)client.setSecret(spec);

    EXPECT_EQ(credential->fetches, 1);
    EXPECT_TRUE(http.hasHeader(1, "Authorization: Bearer tok"));
}

TEST_F(KeyVaultClientTest, NamesAreEscapedAndVaultNormalized) {
    EXPECT_EQ(client.vaultUri(), "https://contoso.vault.azure.net");
    EXPECT_EQ(client.secretUrl("a b"), "https://contoso.vault.azure.net/secrets/a%20b?api-version=7.4");
    EXPECT_THROW(KeyVaultClient(http, credential, "contoso", "https://vault.azure.net"), ValidationError);
}
