#pragma once

#include "sync/Backend.hpp"

#include <string>
#include <vector>

namespace mg::sync::backends {

struct RsyncOptions {
    bool archive = true;             // -a
    bool hard_links = true;          // -H
    bool delete_extraneous = false;  // --delete, mirror mode only
    bool progress = true;            // --info=progress2
    std::vector<std::string> extra;

    [[nodiscard]] std::vector<std::string> toArgs() const;
};

// rsync; mirror mode deletes destination files missing from the source
class Rsync : public Backend {
public:
    [[nodiscard]] types::Backend kind() const override { return types::Backend::DeltaTool; }

    [[nodiscard]] std::vector<process::Command> commands(const types::SyncRequest& req) const override;
};

}
