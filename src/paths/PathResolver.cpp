#include "paths/PathResolver.hpp"
#include "priv/PrivilegeBroker.hpp"
#include "types/SyncError.hpp"
#include "ui/Prompter.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/core.h>

using namespace mg::paths;
using namespace mg::types;
using namespace mg::logging;

namespace fs = std::filesystem;

PathResolver::PathResolver(ui::Prompter& prompter, priv::PrivilegeBroker& broker, const bool dryRun)
    : prompter_(prompter), broker_(broker), dryRun_(dryRun) {}

fs::path PathResolver::resolve(const std::string& input, const bool allowMissing) const {
    if (input.empty()) throw SyncError(ErrorKind::PathNotFound, "No directory given");

    std::error_code ec;
    const auto status = fs::status(input, ec);

    if (fs::is_directory(status)) return fs::canonical(input);

    if (fs::exists(status))
        throw SyncError(ErrorKind::PathNotFound, fmt::format("Not a directory: {}", input));

    if (!allowMissing)
        throw SyncError(ErrorKind::PathNotFound, fmt::format("This directory doesn't exist: {}", input));

    const auto intended = intendedPath(input);
    if (dryRun_)
        LogRegistry::fs()->info("[PathResolver] DRY-RUN: {} does not exist and will not be created; "
                                "using intended path {} for preview", input, intended.string());
    return intended;
}

fs::path PathResolver::materialize(const fs::path& dir) const {
    std::error_code ec;
    if (fs::is_directory(dir, ec)) return fs::canonical(dir);
    if (dryRun_) return dir;

    if (!ui::confirmOrThrow(prompter_, fmt::format("Directory {} doesn't exist. Create it?", dir.string()), true))
        throw SyncError(ErrorKind::PathNotFound,
                        fmt::format("Directory {} doesn't exist and was not created", dir.string()));

    broker_.perform({priv::PrivilegedAction::Kind::CreateDirectory, dir});
    LogRegistry::fs()->info("[PathResolver] Created directory {}", dir.string());
    return fs::canonical(dir);
}

fs::path mg::paths::intendedPath(const fs::path& p) {
    auto out = fs::weakly_canonical(fs::absolute(p));
    if (out.has_relative_path() && !out.has_filename()) out = out.parent_path();
    return out;
}

fs::path mg::paths::absoluteNormal(const fs::path& p) {
    auto out = fs::absolute(p).lexically_normal();
    // "/a/b/" normalizes with an empty filename; drop it
    if (out.has_relative_path() && !out.has_filename()) out = out.parent_path();
    return out;
}
