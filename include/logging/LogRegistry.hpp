#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <nlohmann/json_fwd.hpp>

namespace mg::logging {

struct LoggingOptions {
    spdlog::level::level_enum console_level = spdlog::level::info;
    std::optional<std::filesystem::path> run_log_path;   // structured run log, append-only
};

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const LoggingOptions& options = {});

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> mirrorguard() { return get("mirrorguard"); }
    static std::shared_ptr<spdlog::logger> config()      { return get("config"); }
    static std::shared_ptr<spdlog::logger> fs()          { return get("fs"); }
    static std::shared_ptr<spdlog::logger> safety()      { return get("safety"); }
    static std::shared_ptr<spdlog::logger> preview()     { return get("preview"); }
    static std::shared_ptr<spdlog::logger> backup()      { return get("backup"); }
    static std::shared_ptr<spdlog::logger> priv()        { return get("priv"); }
    static std::shared_ptr<spdlog::logger> sync()        { return get("sync"); }
    static std::shared_ptr<spdlog::logger> pkg()         { return get("pkg"); }

    [[nodiscard]] static bool isInitialized();

    // Appends one JSON line to the run log; no-op when no run log is configured
    static void writeRunRecord(const nlohmann::json& record);

    // Attach (or move) the run log after init, e.g. once the config file has been read
    static void openRunLog(const std::filesystem::path& path);

    static void setConsoleLevel(spdlog::level::level_enum level);

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::logger> run_logger_;
};

}
