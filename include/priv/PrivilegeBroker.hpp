#pragma once

#include "process/Runner.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mg::priv {

struct PrivilegeContext {
    bool has_root{false};
    std::optional<std::vector<std::string>> elevation_command;   // e.g. {"sudo"} or {"doas"}
    bool elevation_available{false};

    // Probes euid and $PATH for sudo, then doas. `noSudo` disables elevation entirely.
    static PrivilegeContext detect(bool noSudo);
};

struct PrivilegedAction {
    enum class Kind { CreateDirectory, ClearDirectory };

    Kind kind{Kind::CreateDirectory};
    std::filesystem::path path;

    [[nodiscard]] std::string describe() const;
};

class PrivilegeBroker {
public:
    using WritableProbe = std::function<bool(const std::filesystem::path&)>;

    PrivilegeBroker(PrivilegeContext ctx, process::Runner& runner, WritableProbe writable = {});

    // True when the action's target is not writable by the current user
    [[nodiscard]] bool requiresElevation(const PrivilegedAction& action) const;

    // Performs the action unprivileged when possible, otherwise through the elevation
    // wrapper. Throws SyncError(ElevationUnavailable) when elevation is needed but absent.
    void perform(const PrivilegedAction& action);

    // Runs an arbitrary command elevated (package installs). Direct when already root.
    int runElevated(const process::Command& cmd);

private:
    PrivilegeContext ctx_;
    process::Runner& runner_;
    WritableProbe writable_;
    bool credentialsValidated_{false};

    void performDirect(const PrivilegedAction& action) const;
    void performElevated(const PrivilegedAction& action);
    void ensureCredentials();
    [[nodiscard]] process::Command elevated(const process::Command& cmd) const;
};

}
