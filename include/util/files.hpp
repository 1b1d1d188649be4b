#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mg::util {

std::string generate_random_suffix(size_t length = 8);

// Look up an executable in $PATH (or `name` itself when it contains a '/')
std::optional<std::filesystem::path> findExecutable(const std::string& name);

[[nodiscard]] bool isWritable(const std::filesystem::path& path);

// Walks up from `path` to the first component that exists on disk
std::filesystem::path nearestExistingAncestor(const std::filesystem::path& path);

// Whitespace split with no quoting or expansion; used for per-backend extra flags
std::vector<std::string> splitArgs(const std::string& str);

}
