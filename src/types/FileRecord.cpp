#include "types/FileRecord.hpp"

#include <numeric>

using namespace mg::types;

namespace {
std::uintmax_t sumBytes(const std::vector<FileRecord>& files) {
    return std::accumulate(files.begin(), files.end(), std::uintmax_t{0},
                           [](const std::uintmax_t acc, const FileRecord& f) { return acc + f.size_bytes; });
}
}

std::uintmax_t DeltaSet::sourceBytes() const { return sumBytes(source_files); }

std::uintmax_t DeltaSet::transferBytes() const { return sumBytes(transfer_files); }
