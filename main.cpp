// CLI
#include "cli/Args.hpp"

// Runtime
#include "runtime/App.hpp"
#include "concurrency/CancelToken.hpp"
#include "process/Runner.hpp"
#include "ui/Prompter.hpp"

// Config
#include "config/Config.hpp"
#include "config/Resolver.hpp"
#include "types/SyncError.hpp"
#include "logging/LogRegistry.hpp"

// Libraries
#include <fmt/core.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>

using namespace mg::cli;
using namespace mg::config;
using namespace mg::concurrency;
using namespace mg::logging;
using namespace mg::types;

namespace fs = std::filesystem;

namespace {

std::optional<ConfigLayer> loadFileLayer(const Invocation& inv) {
    if (inv.config_path) {
        if (!fs::exists(*inv.config_path))
            throw SyncError(ErrorKind::InvalidConfig, "Config file not found: " + inv.config_path->string());
        return loadConfigFile(*inv.config_path);
    }

    const auto path = defaultConfigPath();
    if (fs::exists(path)) return loadConfigFile(path);

    // First run: leave a commented template behind, except in dry-run
    if (!inv.overrides.dry_run.value_or(false)) writeDefaultConfig(path);
    return std::nullopt;
}

}

int main(const int argc, char** argv) {
    try {
        const auto inv = interpret(parseArgs(argc, argv));
        if (inv.help) {
            fmt::print("{}", usage());
            return EXIT_SUCCESS;
        }
        if (inv.version) {
            fmt::print("{}\n", versionLine());
            return EXIT_SUCCESS;
        }

        LogRegistry::init({.console_level = inv.overrides.verbose.value_or(false) ? spdlog::level::debug
                                                                                   : spdlog::level::info});

        const auto config = resolve(loadFileLayer(inv), inv.overrides);
        if (config.verbose) LogRegistry::setConsoleLevel(spdlog::level::debug);
        if (config.log_path) LogRegistry::openRunLog(*config.log_path);

        CancelToken cancel;
        CancelToken::bindSignals(cancel);

        mg::ui::TerminalPrompter prompter(std::cin, std::cout);
        mg::process::ForkExecRunner runner;

        mg::runtime::App app(config, prompter, runner, cancel);
        return app.run();
    } catch (const SyncError& e) {
        if (LogRegistry::isInitialized()) LogRegistry::mirrorguard()->error("[-] {}", e.what());
        else fmt::print(stderr, "Error: {}\n", e.what());
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        if (LogRegistry::isInitialized()) LogRegistry::mirrorguard()->error("[-] Failed: {}", e.what());
        else fmt::print(stderr, "Error: {}\n", e.what());
        return EXIT_FAILURE;
    }
}
