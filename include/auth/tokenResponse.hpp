#pragma once

#include "auth/TokenCredential.hpp"

#include <optional>
#include <string>

namespace kvs::auth {

// AAD / managed identity token body: access_token plus expires_on (epoch, string or number)
// or expires_in (seconds). Returns nullopt for unparsable bodies or a missing token.
std::optional<AccessToken> parseTokenResponse(const std::string& body);

// Human readable reason from an OAuth error body; falls back to a truncated raw body.
std::string errorFromBody(const std::string& body);

}
