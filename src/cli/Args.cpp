#include "cli/Args.hpp"
#include "types/SyncError.hpp"
#include "util/files.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <string_view>

using namespace mg::cli;
using namespace mg::types;
using namespace mg::config;

namespace {

struct FlagSpec {
    std::string_view name;
    char shortName;
    bool takesValue;
};

constexpr std::array<FlagSpec, 16> FLAGS = {{
    {"help", 'h', false},
    {"version", 0, false},
    {"dry-run", 0, false},
    {"config", 0, true},
    {"tool", 't', true},
    {"src", 's', true},
    {"dst", 'd', true},
    {"skip", 0, true},
    {"copy", 0, false},
    {"no-sudo", 0, false},
    {"no-backup", 0, false},
    {"log", 0, true},
    {"verbose", 'v', false},
    {"cp-args", 0, true},
    {"rsync-args", 0, true},
    {"rclone-args", 0, true},
}};

const FlagSpec* lookupLong(const std::string_view name) {
    const auto it = std::ranges::find_if(FLAGS, [&](const FlagSpec& f) { return f.name == name; });
    return it == FLAGS.end() ? nullptr : &*it;
}

const FlagSpec* lookupShort(const char c) {
    const auto it = std::ranges::find_if(FLAGS, [&](const FlagSpec& f) { return f.shortName != 0 && f.shortName == c; });
    return it == FLAGS.end() ? nullptr : &*it;
}

// Upsert a flag (last wins)
void setOpt(CommandCall& c, const std::string& key, const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

SyncError badArg(const std::string& msg) {
    return SyncError(ErrorKind::InvalidArgument, fmt::format("{} (see --help)", msg));
}

}

CommandCall mg::cli::parseArgs(const int argc, const char* const argv[]) {
    CommandCall call;
    call.name = argc > 0 ? argv[0] : PROGRAM_NAME;

    for (int i = 1; i < argc; ++i) {
        const std::string token = argv[i];

        const FlagSpec* flag = nullptr;
        std::optional<std::string> inlineValue;

        if (token.starts_with("--") && token.size() > 2) {
            auto name = token.substr(2);
            if (const auto eq = name.find('='); eq != std::string::npos) {
                inlineValue = name.substr(eq + 1);
                name.resize(eq);
            }
            flag = lookupLong(name);
            if (!flag) throw badArg(fmt::format("Unknown option '--{}'", name));
        } else if (token.size() == 2 && token[0] == '-' && token[1] != '-') {
            flag = lookupShort(token[1]);
            if (!flag) throw badArg(fmt::format("Unknown option '{}'", token));
        } else {
            call.positionals.push_back(token);
            continue;
        }

        const std::string key(flag->name);
        if (!flag->takesValue) {
            if (inlineValue) throw badArg(fmt::format("Option '--{}' does not take a value", key));
            setOpt(call, key, std::nullopt);
            continue;
        }

        if (inlineValue) {
            setOpt(call, key, inlineValue);
        } else if (i + 1 < argc) {
            setOpt(call, key, std::string(argv[++i]));
        } else {
            throw badArg(fmt::format("Option '--{}' requires a value", key));
        }
    }

    if (!call.positionals.empty())
        throw badArg(fmt::format("Unexpected argument '{}'", call.positionals.front()));

    return call;
}

std::optional<std::string> mg::cli::optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return v.value_or(std::string{});
    return std::nullopt;
}

bool mg::cli::hasFlag(const CommandCall& c, const std::string& key) {
    return std::ranges::any_of(c.options, [&](const FlagKV& kv) { return kv.key == key; });
}

Invocation mg::cli::interpret(const CommandCall& call) {
    Invocation inv;
    inv.help = hasFlag(call, "help");
    inv.version = hasFlag(call, "version");
    if (inv.help || inv.version) return inv;

    auto& o = inv.overrides;

    if (const auto v = optVal(call, "config")) {
        if (v->empty()) throw badArg("--config needs a file path");
        inv.config_path = *v;
    }

    if (const auto v = optVal(call, "tool")) {
        o.tool = parseBackend(*v);
        if (!o.tool) throw badArg(fmt::format("Unknown tool '{}': expected cp, rsync or rclone", *v));
    }

    if (const auto v = optVal(call, "src")) o.src = *v;
    if (const auto v = optVal(call, "dst")) o.dst = *v;
    if (const auto v = optVal(call, "log")) o.log_path = *v;

    if (const auto v = optVal(call, "skip")) {
        try {
            o.skip = parseSkipList(*v);
        } catch (const SyncError& e) {
            throw badArg(fmt::format("--skip: {}", e.what()));
        }
    }

    if (hasFlag(call, "no-backup")) o.skip.insert(SKIP_BACKUP);
    if (hasFlag(call, "copy")) o.mode = Mode::Copy;
    if (hasFlag(call, "dry-run")) o.dry_run = true;
    if (hasFlag(call, "no-sudo")) o.no_sudo = true;
    if (hasFlag(call, "verbose")) o.verbose = true;

    if (const auto v = optVal(call, "cp-args")) o.extra_args[Backend::Plain] = util::splitArgs(*v);
    if (const auto v = optVal(call, "rsync-args")) o.extra_args[Backend::DeltaTool] = util::splitArgs(*v);
    if (const auto v = optVal(call, "rclone-args")) o.extra_args[Backend::CloudSync] = util::splitArgs(*v);

    return inv;
}

std::string mg::cli::usage() {
    return fmt::format(R"(Usage: {0} [OPTIONS]

Mirror or copy one directory onto another with a preview, a backup of the
destination and guard rails against destructive mistakes.

Options:
  -h, --help            Show this help and exit.
      --version         Print version and exit.
      --dry-run         Preview only: nothing is created, modified, deleted or installed.
      --config FILE     Read settings from FILE instead of the default config file.
  -t, --tool TOOL       Backend: cp | rsync | rclone.
  -s, --src DIR         Source directory.
  -d, --dst DIR         Destination directory.
      --skip STEPS      Comma separated steps to skip: preview, backup.
      --copy            Copy into the destination without deleting extra files.
      --no-sudo         Never escalate privileges.
      --no-backup       Do not back up the destination (same as --skip backup).
      --log FILE        Append a JSON record of the run to FILE.
  -v, --verbose         Debug logging.
      --cp-args ARGS    Extra flags for cp (whitespace separated).
      --rsync-args ARGS Extra flags for rsync.
      --rclone-args ARGS
                        Extra flags for rclone.

Answer q at any prompt to exit. Exit status: 0 success, 1 error, 130 interrupted.
Default config: $XDG_CONFIG_HOME/{0}/config (~/.config/{0}/config)
)", PROGRAM_NAME);
}

std::string mg::cli::versionLine() {
    return fmt::format("{} {}", PROGRAM_NAME, VERSION);
}
