#include "config/Config.hpp"
#include "types/SyncError.hpp"
#include "util/files.hpp"
#include "logging/LogRegistry.hpp"

#include <boost/algorithm/string.hpp>
#include <fmt/core.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace mg::config;
using namespace mg::types;
using namespace mg::logging;

namespace fs = std::filesystem;

namespace {

constexpr const auto* CONFIG_TEMPLATE = R"(# mirrorguard configuration
# key=value per line; '#' starts a comment. Command line options override these.

# Backend: cp | rsync | rclone (unset: ask every run)
#tool=rsync

# mirror (destination matches source) or copy (keep destination-only files)
#mode=mirror

# Append one JSON line per run to this file
#log=/var/log/mirrorguard.log

# Comma separated steps to skip: preview, backup
#skip=

#dry_run=false
#no_sudo=false
#verbose=false

#src=
#dst=

# Extra flags per backend, whitespace separated (no shell quoting)
#cp_args=
#rsync_args=--exclude=.cache
#rclone_args=
)";

SyncError invalidAt(const std::string& origin, const size_t line, const std::string& what) {
    return SyncError(ErrorKind::InvalidConfig, fmt::format("{}:{}: {}", origin, line, what));
}

std::optional<Backend> extraArgsKey(const std::string& key) {
    if (key == "cp_args") return Backend::Plain;
    if (key == "rsync_args") return Backend::DeltaTool;
    if (key == "rclone_args") return Backend::CloudSync;
    return std::nullopt;
}

}

std::vector<std::string> EffectiveConfig::extraArgsFor(const Backend backend) const {
    if (const auto it = extra_args.find(backend); it != extra_args.end()) return it->second;
    return {};
}

std::optional<bool> mg::config::parseBool(const std::string& value) {
    const auto v = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return std::nullopt;
}

std::set<std::string> mg::config::parseSkipList(const std::string& value) {
    std::vector<std::string> parts;
    boost::split(parts, value, boost::is_any_of(","));

    std::set<std::string> out;
    for (auto& p : parts) {
        boost::algorithm::trim(p);
        boost::algorithm::to_lower(p);
        if (p.empty()) continue;
        if (p != SKIP_PREVIEW && p != SKIP_BACKUP && p != SKIP_SAFETY)
            throw SyncError(ErrorKind::InvalidConfig, "Unknown step in skip list: " + p);
        out.insert(p);
    }
    return out;
}

ConfigLayer mg::config::parseConfig(const std::string& text, const std::string& origin) {
    ConfigLayer layer;
    std::istringstream in(text);
    std::string raw;
    size_t lineNo = 0;

    while (std::getline(in, raw)) {
        ++lineNo;
        auto line = boost::algorithm::trim_copy(raw);
        if (line.empty() || line[0] == '#') continue;

        const auto eq = line.find('=');
        if (eq == std::string::npos) throw invalidAt(origin, lineNo, "expected key=value");

        auto key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(line.substr(0, eq)));
        auto value = boost::algorithm::trim_copy(line.substr(eq + 1));
        if (key.empty()) throw invalidAt(origin, lineNo, "empty key");

        // Values may be quoted to keep surrounding whitespace
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front())
            value = value.substr(1, value.size() - 2);

        const auto boolOf = [&](const std::string& k) {
            const auto b = parseBool(value);
            if (!b) throw invalidAt(origin, lineNo, fmt::format("'{}' expects a boolean, got '{}'", k, value));
            return *b;
        };

        if (key == "tool") {
            if (value.empty()) continue;
            layer.tool = parseBackend(value);
            if (!layer.tool) throw invalidAt(origin, lineNo, "unknown tool: " + value);
        } else if (key == "mode") {
            if (value.empty()) continue;
            layer.mode = parseMode(value);
            if (!layer.mode) throw invalidAt(origin, lineNo, "unknown mode: " + value);
        } else if (key == "log") {
            if (!value.empty()) layer.log_path = fs::path(value);
        } else if (key == "skip") {
            try {
                for (const auto& s : parseSkipList(value)) layer.skip.insert(s);
            } catch (const SyncError& e) {
                throw invalidAt(origin, lineNo, e.what());
            }
        } else if (key == "dry_run") {
            layer.dry_run = boolOf(key);
        } else if (key == "no_sudo") {
            layer.no_sudo = boolOf(key);
        } else if (key == "verbose") {
            layer.verbose = boolOf(key);
        } else if (key == "src") {
            if (!value.empty()) layer.src = value;
        } else if (key == "dst") {
            if (!value.empty()) layer.dst = value;
        } else if (const auto backend = extraArgsKey(key)) {
            layer.extra_args[*backend] = util::splitArgs(value);
        } else {
            LogRegistry::config()->warn("[Config] {}:{}: ignoring unknown key '{}'", origin, lineNo, key);
        }
    }

    return layer;
}

ConfigLayer mg::config::loadConfigFile(const fs::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) throw SyncError(ErrorKind::InvalidConfig, "Failed to open config file: " + path.string());

    std::stringstream buffer;
    buffer << in.rdbuf();
    LogRegistry::config()->debug("[Config] Loaded {}", path.string());
    return parseConfig(buffer.str(), path.string());
}

fs::path mg::config::defaultConfigPath() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        return fs::path(xdg) / "mirrorguard" / "config";
    if (const char* home = std::getenv("HOME"); home && *home)
        return fs::path(home) / ".config" / "mirrorguard" / "config";
    return fs::current_path() / ".mirrorguard.conf";
}

bool mg::config::writeDefaultConfig(const fs::path& path) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());

    // O_EXCL + 0600 so the file is never visible with looser permissions
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0) {
        if (errno == EEXIST) return false;
        throw SyncError(ErrorKind::InvalidConfig,
                        fmt::format("Failed to create config file {}: {}", path.string(), std::strerror(errno)));
    }

    const std::string content = CONFIG_TEMPLATE;
    const char* data = content.data();
    size_t written = 0;
    while (written < content.size()) {
        const ssize_t n = ::write(fd, data + written, content.size() - written);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            ::close(fd);
            throw SyncError(ErrorKind::InvalidConfig, "Failed to write config file: " + path.string());
        }
        written += static_cast<size_t>(n);
    }
    ::close(fd);

    LogRegistry::config()->info("[Config] Created default config at {}", path.string());
    return true;
}
