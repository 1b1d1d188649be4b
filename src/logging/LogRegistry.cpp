#include "logging/LogRegistry.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>

namespace mg::logging {

void LogRegistry::init(const LoggingOptions& options) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    // console (stderr keeps stdout for the preview report and file lists)
    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(options.console_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    auto makeLogger = [&](const std::string& name) {
        const auto logger = std::make_shared<spdlog::logger>(name, console_sink_);
        logger->set_level(spdlog::level::debug);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    makeLogger("mirrorguard");
    makeLogger("config");
    makeLogger("fs");
    makeLogger("safety");
    makeLogger("preview");
    makeLogger("backup");
    makeLogger("priv");
    makeLogger("sync");
    makeLogger("pkg");

    initialized_ = true;

    if (options.run_log_path) openRunLog(*options.run_log_path);

    get("mirrorguard")->debug("[LogRegistry] Initialized");
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

void LogRegistry::openRunLog(const std::filesystem::path& path) {
    if (run_logger_) {
        run_logger_->flush();
        spdlog::drop("run");
        run_logger_.reset();
    }

    namespace fs = std::filesystem;
    if (path.has_parent_path() && !fs::exists(path.parent_path())) fs::create_directories(path.parent_path());

    // audit-style: file-only sink (append), raw message per line
    const auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), /*truncate=*/false);
    sink->set_pattern("%v");
    run_logger_ = std::make_shared<spdlog::logger>("run", sink);
    run_logger_->set_level(spdlog::level::info);
    run_logger_->flush_on(spdlog::level::info);
    spdlog::register_logger(run_logger_);
}

void LogRegistry::writeRunRecord(const nlohmann::json& record) {
    if (!run_logger_) return;
    run_logger_->info(record.dump());
}

void LogRegistry::setConsoleLevel(const spdlog::level::level_enum level) {
    if (console_sink_) console_sink_->set_level(level);
}

}
