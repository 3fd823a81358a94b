#include "logging/LogRegistry.hpp"
#include "config/ConfigRegistry.hpp"

#include <spdlog/sinks/null_sink.h>

#include <filesystem>
#include <vector>

namespace kvs::logging {

void LogRegistry::init() {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    const auto& cnf = config::ConfigRegistry::get().logging;

    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> shared_sinks = { console_sink_ };

    log_dir_ = cnf.log_dir;
    const bool fileLogging = !log_dir_.empty();

    if (fileLogging) {
        namespace fs = std::filesystem;
        if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

        main_log_path_  = log_dir_ / "kvsecret.log";
        audit_log_path_ = log_dir_ / "audit.log";

        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            main_log_path_.string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cnf.levels.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
        shared_sinks.push_back(main_file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, shared_sinks.begin(), shared_sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("kvsecret", sub_levels.kvsecret);
    makeLogger("auth",     sub_levels.auth);
    makeLogger("cloud",    sub_levels.cloud);
    makeLogger("http",     sub_levels.http);

    // audit: file-only sink (append); discarded when no log_dir is configured
    {
        spdlog::sink_ptr sink;
        if (fileLogging) {
            audit_file_sink_ = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                audit_log_path_.string(), /*truncate=*/false);
            sink = audit_file_sink_;
        } else {
            sink = std::make_shared<spdlog::sinks::null_sink_mt>();
        }
        const auto logger = std::make_shared<spdlog::logger>("audit", sink);
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        spdlog::register_logger(logger);
    }

    initialized_ = true;
    get("kvsecret")->debug("[LogRegistry] Initialized");
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool LogRegistry::isInitialized() { return initialized_; }

} // namespace kvs::logging
