#pragma once

#include "types/SyncRequest.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mg::priv {
class PrivilegeBroker;
}

namespace mg::process {
class Runner;
}

namespace mg::ui {
class Prompter;
}

namespace mg::pkg {

// "is tool X present" / "install tool X"
class ToolProvisioner {
public:
    virtual ~ToolProvisioner() = default;

    [[nodiscard]] virtual bool isPresent(types::Backend backend) const = 0;

    // Returns true once the tool is installed
    virtual bool install(types::Backend backend) = 0;
};

struct PackageManager {
    std::string name;
    std::vector<std::string> update;    // empty when the manager refreshes during install
    std::vector<std::string> install;   // package names are appended
    bool needs_root{true};

    // First of apt-get, apt, dnf, yum, zypper, pacman, apk, brew found in $PATH
    static std::optional<PackageManager> detect();
};

std::string packageFor(types::Backend backend);

class SystemToolProvisioner : public ToolProvisioner {
public:
    SystemToolProvisioner(priv::PrivilegeBroker& broker, process::Runner& runner, ui::Prompter& prompter);

    [[nodiscard]] bool isPresent(types::Backend backend) const override;
    bool install(types::Backend backend) override;

private:
    priv::PrivilegeBroker& broker_;
    process::Runner& runner_;
    ui::Prompter& prompter_;
    std::optional<PackageManager> manager_;
    bool updated_{false};

    void updateOnce();
    int runManagerCommand(const std::vector<std::string>& argv);
};

}
