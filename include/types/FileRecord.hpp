#pragma once

#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

namespace mg::types {

struct FileRecord {
    std::string relative_path;      // '/' separated, rooted at the walked tree
    std::uintmax_t size_bytes{};
    std::time_t mtime_epoch{};      // whole seconds

    bool operator==(const FileRecord&) const = default;
};

struct DeltaSet {
    std::vector<FileRecord> source_files;
    std::vector<FileRecord> transfer_files;
    bool clearing{false};

    [[nodiscard]] std::uintmax_t sourceBytes() const;
    [[nodiscard]] std::uintmax_t transferBytes() const;
};

}
