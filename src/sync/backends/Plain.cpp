#include "sync/backends/Plain.hpp"
#include "priv/PrivilegeBroker.hpp"
#include "logging/LogRegistry.hpp"

using namespace mg::sync::backends;
using namespace mg::types;
using namespace mg::process;
using namespace mg::logging;

std::vector<std::string> CpOptions::toArgs() const {
    std::vector<std::string> out;
    if (archive) out.emplace_back("-a");
    out.insert(out.end(), extra.begin(), extra.end());
    return out;
}

std::vector<Command> Plain::commands(const SyncRequest& req) const {
    const CpOptions opts{.archive = true, .extra = req.extra_args};

    Command cp("cp");
    cp.args(opts.toArgs())
      .endOfOptions()
      .operand(req.source_path.string() + "/.")
      .operand(req.destination_path.string() + "/");
    cp.validate();
    return {cp};
}

int Plain::execute(const SyncRequest& req, priv::PrivilegeBroker& broker, Runner& runner) const {
    // Built and validated before anything is removed
    const auto cmds = commands(req);

    if (clearsDestination(kind(), req.mode)) {
        LogRegistry::sync()->info("[Plain] Clearing {} before copy", req.destination_path.string());
        broker.perform({priv::PrivilegedAction::Kind::ClearDirectory, req.destination_path});
    }

    return runAll(cmds, runner);
}
