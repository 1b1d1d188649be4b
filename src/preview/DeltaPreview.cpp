#include "preview/DeltaPreview.hpp"
#include "util/cmdLineHelpers.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <fmt/ostream.h>
#include <sys/stat.h>

using namespace mg::preview;
using namespace mg::types;
using namespace mg::logging;

namespace fs = std::filesystem;

std::optional<FileRecord> mg::preview::statRegular(const fs::path& file, const std::string& relative,
                                                   const bool followLinks) {
    struct stat st{};
    const int rc = followLinks ? ::stat(file.c_str(), &st) : ::lstat(file.c_str(), &st);
    if (rc != 0 || !S_ISREG(st.st_mode)) return std::nullopt;
    return FileRecord{relative, static_cast<std::uintmax_t>(st.st_size), st.st_mtime};
}

std::vector<FileRecord> mg::preview::enumerate(const fs::path& root, const bool followLinks) {
    std::vector<FileRecord> files;

    std::error_code ec;
    if (!fs::is_directory(root, ec)) return files;

    const auto options = followLinks ? fs::directory_options::follow_directory_symlink : fs::directory_options::none;
    for (fs::recursive_directory_iterator it(root, options), end; it != end; ++it) {
        // Dangling links have no regular target and are skipped either way
        const auto type = followLinks ? it->status(ec).type() : it->symlink_status(ec).type();
        if (type != fs::file_type::regular) continue;

        const auto relative = it->path().lexically_relative(root).generic_string();
        if (auto rec = statRegular(it->path(), relative, followLinks)) files.push_back(std::move(*rec));
        else LogRegistry::preview()->warn("[DeltaPreview] File vanished during scan: {}", it->path().string());
    }

    std::ranges::sort(files, {}, &FileRecord::relative_path);
    return files;
}

bool mg::preview::differs(const FileRecord& src, const FileRecord& dst) {
    return src.size_bytes != dst.size_bytes || src.mtime_epoch != dst.mtime_epoch;
}

DeltaSet DeltaPreviewEngine::compute(const SyncRequest& request) const {
    DeltaSet delta;
    delta.source_files = enumerate(request.source_path, followsSourceLinks(request.backend));
    delta.clearing = clearsDestination(request.backend, request.mode);

    std::error_code ec;
    const bool destinationExists = fs::exists(request.destination_path, ec);

    if (delta.clearing || !destinationExists) {
        delta.transfer_files = delta.source_files;
    } else {
        for (const auto& src : delta.source_files) {
            const auto dst = statRegular(request.destination_path / src.relative_path, src.relative_path);
            if (!dst || differs(src, *dst)) delta.transfer_files.push_back(src);
        }
    }

    LogRegistry::preview()->debug("[DeltaPreview] {} source files, {} to transfer ({})",
                                  delta.source_files.size(), delta.transfer_files.size(),
                                  delta.clearing ? "full copy" : "size+mtime delta");
    return delta;
}

void DeltaPreviewEngine::printSummary(std::ostream& out, const DeltaSet& delta) {
    const auto srcBytes = delta.sourceBytes();
    const auto xferBytes = delta.transferBytes();

    fmt::print(out, "\nPreview - {}\n", delta.clearing ? "full copy from source" : "delta (size+mtime)");
    fmt::print(out, "Source files:   {}\n", delta.source_files.size());
    fmt::print(out, "Source size:    {} ({} bytes)\n", util::human_bytes(srcBytes), srcBytes);
    fmt::print(out, "Will transfer:  {}\n", delta.transfer_files.size());
    fmt::print(out, "Transfer size:  {} ({} bytes)\n", util::human_bytes(xferBytes), xferBytes);
    out.flush();
}

std::string DeltaPreviewEngine::transferList(const DeltaSet& delta) {
    std::string out;
    for (const auto& f : delta.transfer_files) {
        out += f.relative_path;
        out += '\n';
    }
    return out;
}
