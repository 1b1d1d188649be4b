#include "backup/BackupManager.hpp"
#include "process/Runner.hpp"
#include "types/SyncError.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/core.h>

#include <cerrno>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <unistd.h>

using namespace mg::backup;
using namespace mg::types;
using namespace mg::process;
using namespace mg::logging;

namespace fs = std::filesystem;

namespace {
constexpr int MAX_NAME_ATTEMPTS = 16;

void flushToDisk(const fs::path& dir) {
    const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0)
        throw SyncError(ErrorKind::BackupFailed,
                        fmt::format("Backup {} is not readable: {}", dir.string(), std::strerror(errno)));
    const int rc = ::syncfs(fd);
    const int err = errno;
    ::close(fd);
    if (rc != 0)
        throw SyncError(ErrorKind::BackupFailed,
                        fmt::format("Failed to flush backup {}: {}", dir.string(), std::strerror(err)));
}
}

BackupManager::BackupManager(Runner& runner, fs::path tempRoot)
    : runner_(runner), tempRoot_(tempRoot.empty() ? fs::temp_directory_path() : std::move(tempRoot)) {}

fs::path BackupManager::candidatePath(const fs::path& destination) const {
    auto base = destination.filename().string();
    if (base.empty()) base = destination.parent_path().filename().string();
    if (base.empty()) base = "root";
    return tempRoot_ / fmt::format("{}.{}.{}", base, util::getCompactTimestamp(), util::generate_random_suffix(6));
}

fs::path BackupManager::createUniqueDirectory(const fs::path& destination) const {
    std::error_code ec;
    for (int attempt = 0; attempt < MAX_NAME_ATTEMPTS; ++attempt) {
        const auto candidate = candidatePath(destination);
        // create_directory reports false without error when the name is taken
        if (fs::create_directory(candidate, ec)) {
            fs::permissions(candidate, fs::perms::owner_all, fs::perm_options::replace, ec);
            if (ec) LogRegistry::backup()->warn("[BackupManager] Could not restrict {}: {}", candidate.string(), ec.message());
            return candidate;
        }
        if (ec)
            throw SyncError(ErrorKind::BackupFailed,
                            fmt::format("Cannot create backup directory {}: {}", candidate.string(), ec.message()));
    }
    throw SyncError(ErrorKind::BackupFailed, "Could not find a free backup directory name under " + tempRoot_.string());
}

BackupRecord BackupManager::snapshot(const fs::path& destination) const {
    BackupRecord record;
    record.origin_path = destination;

    std::error_code ec;
    if (!fs::exists(fs::symlink_status(destination, ec))) {
        LogRegistry::backup()->info("[BackupManager] {} does not exist yet, nothing to back up", destination.string());
        return record;
    }

    const auto backupPath = createUniqueDirectory(destination);

    // cp -a keeps modes, owners (when permitted), timestamps, links and hidden entries
    Command cmd("cp");
    cmd.arg("-a").endOfOptions().operand(destination.string() + "/.").operand(backupPath.string() + "/");

    int rc = 0;
    try {
        rc = runner_.run(cmd);
    } catch (const std::exception& e) {
        throw SyncError(ErrorKind::BackupFailed, fmt::format("Backup of {} failed: {}", destination.string(), e.what()));
    }

    if (rc != 0) {
        LogRegistry::backup()->error("[BackupManager] cp exited with {} while backing up {}; partial copy left at {}",
                                     rc, destination.string(), backupPath.string());
        throw SyncError(ErrorKind::BackupFailed,
                        fmt::format("Backup of {} failed (cp exit status {}); the sync will not run",
                                    destination.string(), rc));
    }

    // cp -a copied the destination's own mode onto the backup root; keep it private in the shared temp dir
    std::error_code permEc;
    fs::permissions(backupPath, fs::perms::owner_all, fs::perm_options::replace, permEc);
    if (permEc) LogRegistry::backup()->warn("[BackupManager] Could not restrict {}: {}", backupPath.string(), permEc.message());

    flushToDisk(backupPath);

    record.backup_path = backupPath;
    record.created_at = std::time(nullptr);
    LogRegistry::backup()->info("[BackupManager] Backed up {} to {}", destination.string(), backupPath.string());
    return record;
}
