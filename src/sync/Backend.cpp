#include "sync/Backend.hpp"
#include "sync/backends/Plain.hpp"
#include "sync/backends/Rsync.hpp"
#include "sync/backends/Rclone.hpp"
#include "process/Runner.hpp"
#include "logging/LogRegistry.hpp"

using namespace mg::sync;
using namespace mg::process;
using namespace mg::logging;

int Backend::execute(const types::SyncRequest& req, priv::PrivilegeBroker&, Runner& runner) const {
    return runAll(commands(req), runner);
}

int Backend::runAll(const std::vector<Command>& cmds, Runner& runner) {
    for (const auto& cmd : cmds) cmd.validate();

    for (const auto& cmd : cmds) {
        LogRegistry::sync()->info("[Backend] Running: {}", cmd.display());
        if (const int rc = runner.run(cmd); rc != 0) return rc;
    }
    return 0;
}

std::unique_ptr<Backend> mg::sync::makeBackend(const types::Backend kind) {
    switch (kind) {
    case types::Backend::Plain: return std::make_unique<backends::Plain>();
    case types::Backend::DeltaTool: return std::make_unique<backends::Rsync>();
    case types::Backend::CloudSync: return std::make_unique<backends::Rclone>();
    }
    return std::make_unique<backends::Plain>();
}
