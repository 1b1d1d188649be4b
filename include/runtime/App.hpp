#pragma once

#include "config/Config.hpp"
#include "concurrency/CancelToken.hpp"
#include "priv/PrivilegeBroker.hpp"
#include "types/SyncRequest.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace mg::ui {
class Prompter;
}

namespace mg::process {
class Runner;
}

namespace mg::pkg {
class ToolProvisioner;
}

namespace mg::paths {
class PathResolver;
}

namespace mg::sync {
struct Outcome;
}

namespace mg::runtime {

// Host facing collaborators; unset members are detected or built from the defaults
struct Environment {
    std::optional<priv::PrivilegeContext> privileges;
    std::shared_ptr<pkg::ToolProvisioner> provisioner;
    std::filesystem::path backup_root;
};

// One invocation: resolve paths, validate, pick and provision the backend, run the executor
class App {
public:
    App(config::EffectiveConfig config,
        ui::Prompter& prompter,
        process::Runner& runner,
        concurrency::CancelToken cancel,
        Environment env = {},
        std::ostream& out = std::cout);

    // Process exit status: 0 success or deliberate exit, 1 error, 130 interrupted
    int run();

    [[nodiscard]] const nlohmann::json& runRecord() const { return record_; }

private:
    config::EffectiveConfig config_;
    ui::Prompter& prompter_;
    process::Runner& runner_;
    concurrency::CancelToken cancel_;
    Environment env_;
    std::ostream& out_;
    nlohmann::json record_;

    int execute();

    std::filesystem::path resolveDirectory(const paths::PathResolver& resolver, const std::string& role,
                                           const std::optional<std::string>& configured, bool allowMissing) const;
    std::filesystem::path resolveDestination(const paths::PathResolver& resolver, const std::filesystem::path& src) const;
    types::Backend chooseBackend() const;
    void ensureTool(types::Backend backend, priv::PrivilegeBroker& broker);

    void recordOutcome(const sync::Outcome& outcome);
    int finish(int exitCode, const std::string& status, const std::string& error = {});
};

}
