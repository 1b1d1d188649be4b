#pragma once

#include "sync/Backend.hpp"

#include <string>
#include <vector>

namespace mg::sync::backends {

struct RcloneOptions {
    enum class Verb { Sync, Copy };

    Verb verb = Verb::Sync;
    bool progress = true;
    bool copy_links = true;               // follow symlinks on the local source
    bool local_no_check_updated = true;   // tolerate files changing during the upload
    std::vector<std::string> extra;

    [[nodiscard]] std::vector<std::string> toArgs() const;
};

class Rclone : public Backend {
public:
    [[nodiscard]] types::Backend kind() const override { return types::Backend::CloudSync; }

    [[nodiscard]] std::vector<process::Command> commands(const types::SyncRequest& req) const override;
};

}
