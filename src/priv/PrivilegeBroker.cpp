#include "priv/PrivilegeBroker.hpp"
#include "types/SyncError.hpp"
#include "util/files.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/core.h>
#include <unistd.h>

using namespace mg::priv;
using namespace mg::process;
using namespace mg::types;
using namespace mg::logging;

namespace fs = std::filesystem;

PrivilegeContext PrivilegeContext::detect(const bool noSudo) {
    PrivilegeContext ctx;
    ctx.has_root = ::geteuid() == 0;
    if (ctx.has_root || noSudo) return ctx;

    for (const auto* helper : {"sudo", "doas"}) {
        if (util::findExecutable(helper)) {
            ctx.elevation_command = std::vector<std::string>{helper};
            ctx.elevation_available = true;
            break;
        }
    }
    return ctx;
}

std::string PrivilegedAction::describe() const {
    switch (kind) {
    case Kind::CreateDirectory: return "create directory " + path.string();
    case Kind::ClearDirectory: return "clear directory " + path.string();
    }
    return path.string();
}

PrivilegeBroker::PrivilegeBroker(PrivilegeContext ctx, Runner& runner, WritableProbe writable)
    : ctx_(std::move(ctx)), runner_(runner),
      writable_(writable ? std::move(writable) : WritableProbe(util::isWritable)) {}

bool PrivilegeBroker::requiresElevation(const PrivilegedAction& action) const {
    if (ctx_.has_root) return false;
    switch (action.kind) {
    case PrivilegedAction::Kind::CreateDirectory:
        return !writable_(util::nearestExistingAncestor(action.path));
    case PrivilegedAction::Kind::ClearDirectory:
        return !writable_(action.path);
    }
    return true;
}

void PrivilegeBroker::perform(const PrivilegedAction& action) {
    if (!requiresElevation(action)) {
        performDirect(action);
        return;
    }
    performElevated(action);
}

void PrivilegeBroker::performDirect(const PrivilegedAction& action) const {
    LogRegistry::priv()->debug("[PrivilegeBroker] {} (unprivileged)", action.describe());

    std::error_code ec;
    switch (action.kind) {
    case PrivilegedAction::Kind::CreateDirectory:
        fs::create_directories(action.path, ec);
        if (ec) throw fs::filesystem_error("Cannot " + action.describe(), action.path, ec);
        return;
    case PrivilegedAction::Kind::ClearDirectory:
        // Hidden entries included; the directory itself stays
        for (const auto& entry : fs::directory_iterator(action.path)) {
            fs::remove_all(entry.path(), ec);
            if (ec) throw fs::filesystem_error("Cannot clear " + action.path.string(), entry.path(), ec);
        }
        return;
    }
}

void PrivilegeBroker::performElevated(const PrivilegedAction& action) {
    if (!ctx_.elevation_available || !ctx_.elevation_command)
        throw SyncError(ErrorKind::ElevationUnavailable,
                        fmt::format("Cannot {} (no permission and no sudo/doas)", action.describe()));

    Command cmd = action.kind == PrivilegedAction::Kind::CreateDirectory
        ? Command("mkdir").arg("-p").endOfOptions().operand(action.path)
        : Command("find").operand(action.path).arg("-mindepth").arg("1").arg("-delete");

    ensureCredentials();
    LogRegistry::priv()->info("[PrivilegeBroker] Elevating to {}", action.describe());

    if (const int rc = runner_.run(elevated(cmd)); rc != 0)
        throw SyncError(ErrorKind::ElevationUnavailable,
                        fmt::format("Elevated attempt to {} failed with status {}", action.describe(), rc));
}

int PrivilegeBroker::runElevated(const Command& cmd) {
    if (ctx_.has_root) return runner_.run(cmd);
    if (!ctx_.elevation_available || !ctx_.elevation_command)
        throw SyncError(ErrorKind::ElevationUnavailable,
                        "Cannot run '" + cmd.display() + "' without root (no sudo/doas)");
    ensureCredentials();
    return runner_.run(elevated(cmd));
}

void PrivilegeBroker::ensureCredentials() {
    // sudo caches credentials per tty; prompt once up front instead of mid-operation
    if (credentialsValidated_ || !ctx_.elevation_command || ctx_.elevation_command->front() != "sudo") return;

    if (const int rc = runner_.run(Command("sudo").arg("-v")); rc != 0)
        throw SyncError(ErrorKind::ElevationUnavailable, "sudo authentication failed or was declined");
    credentialsValidated_ = true;
}

Command PrivilegeBroker::elevated(const Command& cmd) const {
    return cmd.wrappedWith(*ctx_.elevation_command);
}
