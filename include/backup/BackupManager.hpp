#pragma once

#include "types/BackupRecord.hpp"

#include <filesystem>
#include <string>

namespace mg::process {
class Runner;
}

namespace mg::backup {

class BackupManager {
public:
    // Backups land in `tempRoot`, fs::temp_directory_path() when empty
    explicit BackupManager(process::Runner& runner, std::filesystem::path tempRoot = {});

    // Copies the destination's contents, attributes preserved, into a fresh uniquely named
    // directory and flushes it to disk. A missing destination yields a record with no
    // backup_path. Any failure throws SyncError(BackupFailed).
    types::BackupRecord snapshot(const std::filesystem::path& destination) const;

    // <tempRoot>/<basename>.<timestamp>.<suffix>, not yet created
    [[nodiscard]] std::filesystem::path candidatePath(const std::filesystem::path& destination) const;

    [[nodiscard]] const std::filesystem::path& tempRoot() const { return tempRoot_; }

private:
    process::Runner& runner_;
    std::filesystem::path tempRoot_;

    [[nodiscard]] std::filesystem::path createUniqueDirectory(const std::filesystem::path& destination) const;
};

}
