#include "types/SyncRequest.hpp"

#include <boost/algorithm/string.hpp>

using namespace mg::types;

bool mg::types::clearsDestination(const Backend backend, const Mode mode) {
    return backend == Backend::Plain && mode == Mode::Mirror;
}

bool mg::types::followsSourceLinks(const Backend backend) {
    return backend == Backend::CloudSync;
}

std::string mg::types::to_string(const Mode mode) {
    switch (mode) {
    case Mode::Mirror: return "mirror";
    case Mode::Copy: return "copy";
    }
    return "unknown";
}

std::string mg::types::to_string(const Backend backend) {
    switch (backend) {
    case Backend::Plain: return "plain";
    case Backend::DeltaTool: return "delta";
    case Backend::CloudSync: return "cloud";
    }
    return "unknown";
}

std::string mg::types::toolName(const Backend backend) {
    switch (backend) {
    case Backend::Plain: return "cp";
    case Backend::DeltaTool: return "rsync";
    case Backend::CloudSync: return "rclone";
    }
    return "cp";
}

std::optional<Mode> mg::types::parseMode(const std::string& str) {
    const auto s = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(str));
    if (s == "mirror" || s == "sync") return Mode::Mirror;
    if (s == "copy") return Mode::Copy;
    return std::nullopt;
}

std::optional<Backend> mg::types::parseBackend(const std::string& str) {
    const auto s = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(str));
    if (s == "cp" || s == "plain" || s == "standard" || s == "1") return Backend::Plain;
    if (s == "rsync" || s == "delta" || s == "2") return Backend::DeltaTool;
    if (s == "rclone" || s == "cloud" || s == "3") return Backend::CloudSync;
    return std::nullopt;
}
