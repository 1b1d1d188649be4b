#include "sync/backends/Rsync.hpp"

using namespace mg::sync::backends;
using namespace mg::types;
using namespace mg::process;

std::vector<std::string> RsyncOptions::toArgs() const {
    std::vector<std::string> out;
    if (archive && hard_links) out.emplace_back("-aH");
    else if (archive) out.emplace_back("-a");
    else if (hard_links) out.emplace_back("-H");
    if (delete_extraneous) out.emplace_back("--delete");
    if (progress) out.emplace_back("--info=progress2");
    out.insert(out.end(), extra.begin(), extra.end());
    return out;
}

std::vector<Command> Rsync::commands(const SyncRequest& req) const {
    const RsyncOptions opts{
        .delete_extraneous = req.mode == Mode::Mirror,
        .extra = req.extra_args
    };

    // Trailing slash on the source copies its contents, not the directory itself
    Command rsync("rsync");
    rsync.args(opts.toArgs())
         .endOfOptions()
         .operand(req.source_path.string() + "/")
         .operand(req.destination_path.string() + "/");
    rsync.validate();
    return {rsync};
}
