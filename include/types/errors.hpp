#pragma once

#include <stdexcept>
#include <string>

namespace kvs::types {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

// Secret absent from the vault. Expected; the reconciler turns it into the create path.
class NotFound : public Error {
public:
    explicit NotFound(const std::string& name)
        : Error("Secret not found: " + name), name_(name) {}

    [[nodiscard]] const std::string& name() const { return name_; }

private:
    std::string name_;
};

// No credential strategy produced a usable token.
class AuthError : public Error {
public:
    explicit AuthError(const std::string& msg) : Error(msg) {}
};

// Explicit principal credentials are incomplete.
class ConfigError : public AuthError {
public:
    explicit ConfigError(const std::string& msg) : AuthError(msg) {}
};

class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& msg) : Error(msg) {}
};

// Any other failure talking to Key Vault or the token endpoints. The message is the server's, verbatim.
class RemoteError : public Error {
public:
    RemoteError(const std::string& msg, const long httpStatus = 0, std::string code = {})
        : Error(msg), http_status_(httpStatus), code_(std::move(code)) {}

    [[nodiscard]] long httpStatus() const { return http_status_; }
    [[nodiscard]] const std::string& code() const { return code_; }

private:
    long http_status_;
    std::string code_;
};

}
