#include "util/files.hpp"

#include <boost/algorithm/string.hpp>

#include <cstdlib>
#include <random>
#include <unistd.h>

namespace fs = std::filesystem;

std::string mg::util::generate_random_suffix(const size_t length) {
    static constexpr char charset[] =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<> dist(0, sizeof(charset) - 2);

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) result += charset[dist(rng)];
    return result;
}

std::optional<fs::path> mg::util::findExecutable(const std::string& name) {
    if (name.empty()) return std::nullopt;

    if (name.find('/') != std::string::npos) {
        if (::access(name.c_str(), X_OK) == 0) return fs::path(name);
        return std::nullopt;
    }

    const char* envPath = std::getenv("PATH");
    if (!envPath) return std::nullopt;

    std::vector<std::string> dirs;
    boost::split(dirs, std::string(envPath), boost::is_any_of(":"));
    for (const auto& dir : dirs) {
        if (dir.empty()) continue;
        const fs::path candidate = fs::path(dir) / name;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) return candidate;
    }
    return std::nullopt;
}

bool mg::util::isWritable(const fs::path& path) {
    return ::access(path.c_str(), W_OK) == 0;
}

fs::path mg::util::nearestExistingAncestor(const fs::path& path) {
    fs::path current = fs::absolute(path).lexically_normal();
    std::error_code ec;
    while (!fs::exists(current, ec)) {
        if (!current.has_parent_path() || current.parent_path() == current) break;
        current = current.parent_path();
    }
    return current;
}

std::vector<std::string> mg::util::splitArgs(const std::string& str) {
    std::vector<std::string> out;
    const auto trimmed = boost::algorithm::trim_copy(str);
    if (trimmed.empty()) return out;
    boost::split(out, trimmed, boost::is_any_of(" \t"), boost::token_compress_on);
    return out;
}
