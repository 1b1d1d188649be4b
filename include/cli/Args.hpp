#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mg::cli {

inline constexpr const auto* PROGRAM_NAME = "mirrorguard";
inline constexpr const auto* VERSION = "1.0.0";

struct FlagKV {
    std::string key;                    // canonical long name without dashes
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;
};

// Accepts --flag, --flag value, --flag=value and the short aliases. Throws
// SyncError(InvalidArgument) on unknown flags, missing values or stray positionals.
CommandCall parseArgs(int argc, const char* const argv[]);

std::optional<std::string> optVal(const CommandCall& c, const std::string& key);
[[nodiscard]] bool hasFlag(const CommandCall& c, const std::string& key);

struct Invocation {
    bool help{false};
    bool version{false};
    std::optional<std::filesystem::path> config_path;
    config::ConfigLayer overrides;      // highest precedence layer
};

Invocation interpret(const CommandCall& call);

std::string usage();
std::string versionLine();

}
