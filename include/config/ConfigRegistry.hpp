#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>

namespace kvs::config {

class ConfigRegistry {
public:
    // Loads the YAML file once. A missing file leaves the built-in defaults in place.
    static void init(const std::filesystem::path& path = resolveConfigPath());
    static void init(Config config);

    static const Config& get();

    [[nodiscard]] static bool isInitialized();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace kvs::config
