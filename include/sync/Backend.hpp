#pragma once

#include "process/Command.hpp"
#include "types/SyncRequest.hpp"

#include <memory>
#include <vector>

namespace mg::priv {
class PrivilegeBroker;
}

namespace mg::process {
class Runner;
}

namespace mg::sync {

class Backend {
public:
    virtual ~Backend() = default;

    [[nodiscard]] virtual types::Backend kind() const = 0;

    // Transfer commands for the request, validated, in execution order
    [[nodiscard]] virtual std::vector<process::Command> commands(const types::SyncRequest& req) const = 0;

    // Runs the transfer unprivileged; returns the first nonzero exit status or 0
    virtual int execute(const types::SyncRequest& req, priv::PrivilegeBroker& broker, process::Runner& runner) const;

protected:
    // Validates every command before the first one runs
    static int runAll(const std::vector<process::Command>& cmds, process::Runner& runner);
};

std::unique_ptr<Backend> makeBackend(types::Backend kind);

}
