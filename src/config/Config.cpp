#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <cstdlib>
#include <yaml-cpp/yaml.h>

namespace kvs::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    if (auto node = root["http"]) YAML::convert<HttpConfig>::decode(node, cfg.http);
    if (auto node = root["cloud"]) YAML::convert<CloudConfig>::decode(node, cfg.cloud);
    if (auto node = root["auth"]) YAML::convert<AuthConfig>::decode(node, cfg.auth);

    return cfg;
}

std::filesystem::path resolveConfigPath() {
    if (const char* env = std::getenv(CONFIG_PATH_ENV); env && *env) return env;
    return DEFAULT_CONFIG_PATH;
}

} // namespace kvs::config
