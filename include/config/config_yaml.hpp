#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace kvs::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["kvsecret"] = to_std_string(spdlog::level::to_string_view(rhs.kvsecret));
        node["auth"]     = to_std_string(spdlog::level::to_string_view(rhs.auth));
        node["cloud"]    = to_std_string(spdlog::level::to_string_view(rhs.cloud));
        node["http"]     = to_std_string(spdlog::level::to_string_view(rhs.http));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.kvsecret = spdlog::level::from_str(node["kvsecret"].as<std::string>("info"));
        rhs.auth = spdlog::level::from_str(node["auth"].as<std::string>("warn"));
        rhs.cloud = spdlog::level::from_str(node["cloud"].as<std::string>("warn"));
        rhs.http = spdlog::level::from_str(node["http"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("warn"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("info"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<HttpConfig> {
    static Node encode(const HttpConfig& rhs) {
        Node node;
        node["connect_timeout_seconds"] = rhs.connect_timeout_seconds;
        node["timeout_seconds"] = rhs.timeout_seconds;
        node["user_agent"] = rhs.user_agent;
        return node;
    }

    static bool decode(const Node& node, HttpConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.connect_timeout_seconds = node["connect_timeout_seconds"].as<unsigned int>(10);
        rhs.timeout_seconds = node["timeout_seconds"].as<unsigned int>(30);
        rhs.user_agent = node["user_agent"].as<std::string>("kvsecret/1.0");
        return true;
    }
};

template<>
struct convert<CloudConfig> {
    static Node encode(const CloudConfig& rhs) {
        Node node;
        node["environment"] = rhs.environment;
        node["keyvault_api_version"] = rhs.keyvault_api_version;
        return node;
    }

    static bool decode(const Node& node, CloudConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.environment = node["environment"].as<std::string>("AzureCloud");
        rhs.keyvault_api_version = node["keyvault_api_version"].as<std::string>("7.4");
        return true;
    }
};

template<>
struct convert<AuthConfig> {
    static Node encode(const AuthConfig& rhs) {
        Node node;
        node["default_source"] = rhs.default_source;
        node["az_cli_path"] = rhs.az_cli_path;
        node["imds_endpoint"] = rhs.imds_endpoint;
        node["msi_client_id"] = rhs.msi_client_id;
        return node;
    }

    static bool decode(const Node& node, AuthConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.default_source = node["default_source"].as<std::string>("auto");
        rhs.az_cli_path = node["az_cli_path"].as<std::string>("az");
        rhs.imds_endpoint = node["imds_endpoint"].as<std::string>(
            "http://169.254.169.254/metadata/identity/oauth2/token");
        rhs.msi_client_id = node["msi_client_id"].as<std::string>("");
        return true;
    }
};

}
