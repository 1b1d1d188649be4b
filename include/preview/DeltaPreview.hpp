#pragma once

#include "types/FileRecord.hpp"
#include "types/SyncRequest.hpp"

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace mg::preview {

// Regular files under `root` (recursive, hidden included) sorted by relative path.
// Symlinks are skipped unless `followLinks`, which counts their targets instead.
// Read-only; nothing under `root` is touched.
std::vector<types::FileRecord> enumerate(const std::filesystem::path& root, bool followLinks = false);

// lstat (stat when `followLinks`) of a single entry; nullopt when missing or not a regular file
std::optional<types::FileRecord> statRegular(const std::filesystem::path& file, const std::string& relative,
                                             bool followLinks = false);

// Size differs, or mtime differs at whole-second granularity
[[nodiscard]] bool differs(const types::FileRecord& src, const types::FileRecord& dst);

class DeltaPreviewEngine {
public:
    // Transfer set for the request: all source files for a clearing run, otherwise only new
    // or changed files. A missing destination counts as empty.
    [[nodiscard]] types::DeltaSet compute(const types::SyncRequest& request) const;

    static void printSummary(std::ostream& out, const types::DeltaSet& delta);

    // One relative path per line
    static std::string transferList(const types::DeltaSet& delta);
};

}
