#pragma once

#include "auth/TokenCredential.hpp"

#include <string>

namespace kvs::auth {

// Reuses the local `az login` session via `az account get-access-token`.
class AzureCliCredential : public TokenCredential {
public:
    explicit AzureCliCredential(std::string azPath = "az", std::string subscriptionId = {});

    [[nodiscard]] std::string name() const override { return "AzureCli"; }

    [[nodiscard]] std::string command(const std::string& resource) const;

protected:
    [[nodiscard]] TokenResult fetch(const std::string& resource) override;

    // Runs the command, capturing stdout and stderr. Returns the exit status, -1 if it could not start.
    virtual int run(const std::string& cmd, std::string& output) const;

private:
    std::string az_path_;
    std::string subscription_id_;
};

}
