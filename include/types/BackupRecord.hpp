#pragma once

#include <ctime>
#include <filesystem>
#include <string>

namespace mg::types {

struct BackupRecord {
    static constexpr const auto* NONE = "(none)";

    std::filesystem::path origin_path, backup_path;
    std::time_t created_at{};

    [[nodiscard]] bool exists() const { return !backup_path.empty(); }
    [[nodiscard]] std::string location() const { return exists() ? backup_path.string() : NONE; }
};

}
