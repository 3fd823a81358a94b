#pragma once

#include <string>

namespace kvs::types {

enum class AuthSource { Auto, Cli, Msi, Explicit, Env, CredentialFile };

std::string to_string(AuthSource source);
AuthSource auth_source_from_string(const std::string& str);

}
