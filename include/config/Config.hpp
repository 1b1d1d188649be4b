#pragma once

#include "types/SyncRequest.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mg::config {

// Step names accepted in `skip`
constexpr const auto* SKIP_PREVIEW = "preview";
constexpr const auto* SKIP_BACKUP = "backup";
constexpr const auto* SKIP_SAFETY = "safety";

// One source of settings (config file or command line). Unset fields defer to lower layers.
struct ConfigLayer {
    std::optional<types::Backend> tool;
    std::optional<types::Mode> mode;
    std::optional<std::filesystem::path> log_path;
    std::set<std::string> skip;
    std::optional<bool> dry_run, no_sudo, verbose;
    std::optional<std::string> src, dst;
    std::map<types::Backend, std::vector<std::string>> extra_args;
};

struct EffectiveConfig {
    std::optional<types::Backend> tool;        // unset: ask the operator
    types::Mode mode = types::Mode::Mirror;
    std::optional<std::filesystem::path> log_path;
    std::set<std::string> skip;
    bool dry_run = false;
    bool no_sudo = false;
    bool verbose = false;
    std::optional<std::string> src, dst;       // unset: ask the operator
    std::map<types::Backend, std::vector<std::string>> extra_args;

    [[nodiscard]] bool skips(const std::string& step) const { return skip.contains(step); }
    [[nodiscard]] std::vector<std::string> extraArgsFor(types::Backend backend) const;
};

// Parses key=value text; `origin` only labels error messages
ConfigLayer parseConfig(const std::string& text, const std::string& origin = "<config>");

ConfigLayer loadConfigFile(const std::filesystem::path& path);

// $XDG_CONFIG_HOME/mirrorguard/config, else ~/.config/mirrorguard/config
std::filesystem::path defaultConfigPath();

// Writes the commented template with mode 0600; returns false if the file already exists
bool writeDefaultConfig(const std::filesystem::path& path);

[[nodiscard]] std::optional<bool> parseBool(const std::string& value);

std::set<std::string> parseSkipList(const std::string& value);

} // namespace mg::config
