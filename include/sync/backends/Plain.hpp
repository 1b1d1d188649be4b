#pragma once

#include "sync/Backend.hpp"

#include <string>
#include <vector>

namespace mg::sync::backends {

struct CpOptions {
    bool archive = true;    // -a: recursive, keep modes/times/links
    std::vector<std::string> extra;

    [[nodiscard]] std::vector<std::string> toArgs() const;
};

// cp; in mirror mode the destination is emptied first (hidden entries included)
class Plain : public Backend {
public:
    [[nodiscard]] types::Backend kind() const override { return types::Backend::Plain; }

    [[nodiscard]] std::vector<process::Command> commands(const types::SyncRequest& req) const override;

    int execute(const types::SyncRequest& req, priv::PrivilegeBroker& broker, process::Runner& runner) const override;
};

}
