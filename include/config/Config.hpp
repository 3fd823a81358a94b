#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace kvs::config {

constexpr static const char* DEFAULT_CONFIG_PATH = "/etc/kvsecret/config.yaml";
constexpr static const char* CONFIG_PATH_ENV = "KVSECRET_CONFIG";

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum kvsecret = spdlog::level::info;   // Invocation start/finish, changed/unchanged
    spdlog::level::level_enum auth     = spdlog::level::warn;   // Credential chain fall-through
    spdlog::level::level_enum cloud    = spdlog::level::warn;   // Key Vault errors
    spdlog::level::level_enum http     = spdlog::level::warn;   // Transport failures
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::warn;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;   // empty: console (stderr) only
    LogLevelsConfig levels;
};

struct HttpConfig {
    unsigned int connect_timeout_seconds = 10;
    unsigned int timeout_seconds = 30;
    std::string user_agent = "kvsecret/1.0";
};

struct CloudConfig {
    std::string environment = "AzureCloud";
    std::string keyvault_api_version = "7.4";
};

struct AuthConfig {
    std::string default_source = "auto";
    std::string az_cli_path = "az";
    std::string imds_endpoint = "http://169.254.169.254/metadata/identity/oauth2/token";
    std::string msi_client_id;
};

struct Config {
    LoggingConfig logging;
    HttpConfig http;
    CloudConfig cloud;
    AuthConfig auth;
};

Config loadConfig(const std::filesystem::path& path);
std::filesystem::path resolveConfigPath();

} // namespace kvs::config
