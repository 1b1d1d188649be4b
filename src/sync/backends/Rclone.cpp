#include "sync/backends/Rclone.hpp"

using namespace mg::sync::backends;
using namespace mg::types;
using namespace mg::process;

std::vector<std::string> RcloneOptions::toArgs() const {
    std::vector<std::string> out;
    out.emplace_back(verb == Verb::Sync ? "sync" : "copy");
    if (progress) out.emplace_back("--progress");
    if (copy_links) out.emplace_back("--copy-links");
    if (local_no_check_updated) out.emplace_back("--local-no-check-updated");
    out.insert(out.end(), extra.begin(), extra.end());
    return out;
}

std::vector<Command> Rclone::commands(const SyncRequest& req) const {
    const RcloneOptions opts{
        .verb = req.mode == Mode::Mirror ? RcloneOptions::Verb::Sync : RcloneOptions::Verb::Copy,
        .extra = req.extra_args
    };

    Command rclone("rclone");
    rclone.args(opts.toArgs())
          .endOfOptions()
          .operand(req.source_path)
          .operand(req.destination_path);
    rclone.validate();
    return {rclone};
}
