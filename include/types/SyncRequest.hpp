#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mg::types {

enum class Mode { Mirror, Copy };

// Plain = cp (+ rm in mirror mode), DeltaTool = rsync, CloudSync = rclone
enum class Backend { Plain, DeltaTool, CloudSync };

struct SyncRequest {
    std::filesystem::path source_path, destination_path;
    Mode mode{Mode::Mirror};
    Backend backend{Backend::Plain};
    std::vector<std::string> extra_args;
};

// A clearing run empties the destination before copying the whole source
[[nodiscard]] bool clearsDestination(Backend backend, Mode mode);

// rclone runs with --copy-links, so symlinks in the source arrive as regular files
[[nodiscard]] bool followsSourceLinks(Backend backend);

std::string to_string(Mode mode);
std::string to_string(Backend backend);

// Tool binary a backend runs ("cp", "rsync", "rclone")
std::string toolName(Backend backend);

std::optional<Mode> parseMode(const std::string& str);

// Accepts tool names (cp, rsync, rclone) and the backend aliases (plain, delta, cloud)
std::optional<Backend> parseBackend(const std::string& str);

}
