#include "safety/SafetyValidator.hpp"
#include "paths/PathResolver.hpp"
#include "ui/Prompter.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <fmt/core.h>

using namespace mg::safety;
using namespace mg::types;
using namespace mg::logging;

namespace fs = std::filesystem;

namespace {
std::vector<fs::path> segments(const fs::path& p) {
    std::vector<fs::path> out;
    for (const auto& part : mg::paths::absoluteNormal(p))
        if (!part.empty()) out.push_back(part);
    return out;
}
}

bool mg::safety::isPathPrefix(const fs::path& ancestor, const fs::path& descendant) {
    const auto a = segments(ancestor);
    const auto d = segments(descendant);
    if (a.size() >= d.size()) return false;
    return std::equal(a.begin(), a.end(), d.begin());
}

bool mg::safety::isSensitiveArea(const fs::path& dst) {
    const auto parts = segments(dst);
    // parts[0] is the root directory "/"
    if (parts.size() != 2) return false;
    const auto name = parts[1].string();
    return std::ranges::find(SENSITIVE_DIRS, std::string_view(name)) != SENSITIVE_DIRS.end();
}

std::optional<Violation> mg::safety::checkStructuralRules(const fs::path& src, const fs::path& dst) {
    // Missing tails stay lexical; existing ancestors cannot hide behind a symlink
    const auto s = mg::paths::intendedPath(src);
    const auto d = mg::paths::intendedPath(dst);

    if (s == d)
        return Violation{ErrorKind::SamePath, "Source and destination are the same: " + s.string()};

    if (d == d.root_path())
        return Violation{ErrorKind::RootDestination, "Destination path is '/'"};

    if (isPathPrefix(s, d) || isPathPrefix(d, s))
        return Violation{ErrorKind::NestedPaths,
                         fmt::format("Source and destination are nested: {} / {}", s.string(), d.string())};

    return std::nullopt;
}

SafetyValidator::SafetyValidator(ui::Prompter& prompter) : prompter_(prompter) {}

void SafetyValidator::validate(const fs::path& src, const fs::path& dst) const {
    if (const auto v = checkStructuralRules(src, dst)) {
        LogRegistry::safety()->error("[SafetyValidator] {}", v->message);
        throw SyncError(v->kind, v->message + ". Aborting.");
    }

    if (!isSensitiveArea(dst)) return;

    LogRegistry::safety()->warn("[SafetyValidator] Destination is a sensitive directory: {}", dst.string());
    for (const auto* question : {"Do you want to continue?", "Are you absolutely sure?"}) {
        if (!ui::confirmOrThrow(prompter_, question, false))
            throw SyncError(ErrorKind::SensitiveAreaDeclined,
                            "Aborted: operator declined sensitive destination " + dst.string());
    }
}
