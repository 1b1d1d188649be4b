#include "pkg/PackageManager.hpp"
#include "priv/PrivilegeBroker.hpp"
#include "process/Runner.hpp"
#include "ui/Prompter.hpp"
#include "util/files.hpp"
#include "logging/LogRegistry.hpp"

using namespace mg::pkg;
using namespace mg::types;
using namespace mg::process;
using namespace mg::logging;

std::optional<PackageManager> PackageManager::detect() {
    const std::vector<PackageManager> known = {
        {"apt-get", {"apt-get", "update", "-qq"}, {"env", "DEBIAN_FRONTEND=noninteractive", "apt-get", "install", "-y"}},
        {"apt", {"apt", "update", "-qq"}, {"env", "DEBIAN_FRONTEND=noninteractive", "apt", "install", "-y"}},
        {"dnf", {"dnf", "-y", "makecache"}, {"dnf", "-y", "install"}},
        {"yum", {"yum", "-y", "makecache"}, {"yum", "-y", "install"}},
        {"zypper", {"zypper", "--non-interactive", "refresh"}, {"zypper", "--non-interactive", "install", "--no-confirm"}},
        {"pacman", {"pacman", "-Sy", "--noconfirm"}, {"pacman", "-S", "--noconfirm", "--needed"}},
        {"apk", {}, {"apk", "add", "--no-cache"}},
        {"brew", {"brew", "update"}, {"brew", "install"}, false},
    };

    for (const auto& pm : known)
        if (util::findExecutable(pm.name)) return pm;
    return std::nullopt;
}

std::string mg::pkg::packageFor(const Backend backend) {
    switch (backend) {
    case Backend::Plain: return "coreutils";
    case Backend::DeltaTool: return "rsync";
    case Backend::CloudSync: return "rclone";
    }
    return toolName(backend);
}

SystemToolProvisioner::SystemToolProvisioner(priv::PrivilegeBroker& broker, Runner& runner, ui::Prompter& prompter)
    : broker_(broker), runner_(runner), prompter_(prompter), manager_(PackageManager::detect()) {
    if (manager_) LogRegistry::pkg()->debug("[Provisioner] Package manager: {}", manager_->name);
}

bool SystemToolProvisioner::isPresent(const Backend backend) const {
    return util::findExecutable(toolName(backend)).has_value();
}

bool SystemToolProvisioner::install(const Backend backend) {
    if (!manager_) {
        LogRegistry::pkg()->error("[Provisioner] Cannot install packages automatically (no package manager found)");
        return false;
    }

    updateOnce();

    auto argv = manager_->install;
    argv.push_back(packageFor(backend));
    LogRegistry::pkg()->info("[Provisioner] Installing {} with {}", packageFor(backend), manager_->name);

    if (const int rc = runManagerCommand(argv); rc != 0) {
        LogRegistry::pkg()->error("[Provisioner] {} exited with status {}", manager_->name, rc);
        return false;
    }
    return isPresent(backend);
}

void SystemToolProvisioner::updateOnce() {
    if (updated_ || manager_->update.empty()) return;
    updated_ = true;

    if (!ui::confirmOrThrow(prompter_, "Update package lists now?", true)) return;
    if (const int rc = runManagerCommand(manager_->update); rc != 0)
        LogRegistry::pkg()->warn("[Provisioner] Package list update exited with status {}", rc);
}

int SystemToolProvisioner::runManagerCommand(const std::vector<std::string>& argv) {
    Command cmd(argv.front());
    cmd.args(std::vector<std::string>(argv.begin() + 1, argv.end()));
    return manager_->needs_root ? broker_.runElevated(cmd) : runner_.run(cmd);
}
