#pragma once

#include <filesystem>
#include <string>

namespace mg::ui {
class Prompter;
}

namespace mg::priv {
class PrivilegeBroker;
}

namespace mg::paths {

class PathResolver {
public:
    PathResolver(ui::Prompter& prompter, priv::PrivilegeBroker& broker, bool dryRun);

    // Absolute, symlink-collapsed path of an existing directory. A missing directory is
    // accepted only with `allowMissing` and comes back as its intended path (existing
    // ancestors symlink-resolved); nothing is created here. Throws SyncError(PathNotFound).
    std::filesystem::path resolve(const std::string& input, bool allowMissing) const;

    // Creates `dir` after the operator confirms, unless it already exists. In dry-run the
    // path is returned untouched. Declining throws SyncError(PathNotFound).
    std::filesystem::path materialize(const std::filesystem::path& dir) const;

private:
    ui::Prompter& prompter_;
    priv::PrivilegeBroker& broker_;
    bool dryRun_;
};

// Absolute form with the existing ancestors symlink-resolved; the missing tail stays lexical
std::filesystem::path intendedPath(const std::filesystem::path& p);

// Lexical absolute form without touching the filesystem
std::filesystem::path absoluteNormal(const std::filesystem::path& p);

}
