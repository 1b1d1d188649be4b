#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "config/Resolver.hpp"
#include "types/SyncError.hpp"
#include "TestHelpers.hpp"

#include <sys/stat.h>

namespace fs = std::filesystem;
using namespace mg::config;
using namespace mg::types;
using mg::test::TempDir;

TEST(ConfigParseTest, ReadsAllKeys) {
    const auto layer = parseConfig(R"(
# comment
tool = rsync
mode=copy
log=/var/log/mg.log
skip=preview, backup
dry_run=yes
no_sudo=off
verbose=1
src="/srv/data"
dst=/mnt/backup
rsync_args=--exclude=.cache   -z
)");

    ASSERT_TRUE(layer.tool);
    EXPECT_EQ(*layer.tool, Backend::DeltaTool);
    EXPECT_EQ(layer.mode, Mode::Copy);
    EXPECT_EQ(layer.log_path, fs::path("/var/log/mg.log"));
    EXPECT_EQ(layer.skip, (std::set<std::string>{"preview", "backup"}));
    EXPECT_EQ(layer.dry_run, true);
    EXPECT_EQ(layer.no_sudo, false);
    EXPECT_EQ(layer.verbose, true);
    EXPECT_EQ(layer.src, "/srv/data");
    EXPECT_EQ(layer.dst, "/mnt/backup");
    EXPECT_EQ(layer.extra_args.at(Backend::DeltaTool), (std::vector<std::string>{"--exclude=.cache", "-z"}));
}

TEST(ConfigParseTest, ToolAliasesAreAccepted) {
    EXPECT_EQ(parseConfig("tool=plain").tool, Backend::Plain);
    EXPECT_EQ(parseConfig("tool=cloud").tool, Backend::CloudSync);
    EXPECT_EQ(parseConfig("tool=cp").tool, Backend::Plain);
}

TEST(ConfigParseTest, EmptyValuesLeaveKeysUnset) {
    const auto layer = parseConfig("tool=\nsrc=\nskip=\n");
    EXPECT_FALSE(layer.tool);
    EXPECT_FALSE(layer.src);
    EXPECT_TRUE(layer.skip.empty());
}

TEST(ConfigParseTest, MalformedLineReportsLineNumber) {
    try {
        parseConfig("tool=rsync\n\njust some words\n", "cfg");
        FAIL() << "expected InvalidConfig";
    } catch (const SyncError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidConfig);
        EXPECT_NE(std::string(e.what()).find("cfg:3"), std::string::npos);
    }
}

TEST(ConfigParseTest, BadValuesAreRejected) {
    EXPECT_THROW(parseConfig("tool=robocopy"), SyncError);
    EXPECT_THROW(parseConfig("dry_run=maybe"), SyncError);
    EXPECT_THROW(parseConfig("skip=preview,everything"), SyncError);
    EXPECT_THROW(parseConfig("mode=sideways"), SyncError);
}

TEST(ConfigParseTest, UnknownKeysAreIgnored) {
    EXPECT_NO_THROW(parseConfig("colour=blue\n"));
}

TEST(ConfigParseTest, BooleanSpellings) {
    for (const auto* t : {"true", "YES", "on", "1"}) EXPECT_EQ(parseBool(t), true) << t;
    for (const auto* f : {"false", "no", "Off", "0"}) EXPECT_EQ(parseBool(f), false) << f;
    EXPECT_FALSE(parseBool("2"));
}

TEST(ConfigResolveTest, CommandLineBeatsFileBeatsDefaults) {
    ConfigLayer file;
    file.tool = Backend::DeltaTool;
    file.src = "/from/file";
    file.dst = "/to/file";
    file.no_sudo = true;

    ConfigLayer cli;
    cli.tool = Backend::CloudSync;
    cli.dst = "/to/cli";

    const auto cfg = resolve(file, cli);
    EXPECT_EQ(cfg.tool, Backend::CloudSync);
    EXPECT_EQ(cfg.src, "/from/file");
    EXPECT_EQ(cfg.dst, "/to/cli");
    EXPECT_TRUE(cfg.no_sudo);
    EXPECT_FALSE(cfg.dry_run);
    EXPECT_EQ(cfg.mode, Mode::Mirror);
}

TEST(ConfigResolveTest, DefaultsWithoutAnyLayer) {
    const auto cfg = resolve(std::nullopt, ConfigLayer{});
    EXPECT_FALSE(cfg.tool);
    EXPECT_FALSE(cfg.log_path);
    EXPECT_TRUE(cfg.skip.empty());
    EXPECT_FALSE(cfg.dry_run);
    EXPECT_FALSE(cfg.no_sudo);
    EXPECT_FALSE(cfg.verbose);
    EXPECT_TRUE(cfg.extraArgsFor(Backend::Plain).empty());
}

TEST(ConfigResolveTest, SkipIsUnionedAndSafetyIsDropped) {
    ConfigLayer file;
    file.skip = {"preview", "safety"};
    ConfigLayer cli;
    cli.skip = {"backup"};

    const auto cfg = resolve(file, cli);
    EXPECT_TRUE(cfg.skips(SKIP_PREVIEW));
    EXPECT_TRUE(cfg.skips(SKIP_BACKUP));
    EXPECT_FALSE(cfg.skips(SKIP_SAFETY));
}

TEST(ConfigFileTest, TemplateIsCreatedPrivateAndParses) {
    TempDir tmp;
    const auto path = tmp / "nested" / "config";

    ASSERT_TRUE(writeDefaultConfig(path));
    EXPECT_FALSE(writeDefaultConfig(path));

    struct stat st{};
    ASSERT_EQ(::stat(path.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);

    const auto layer = loadConfigFile(path);
    EXPECT_FALSE(layer.tool);
    EXPECT_TRUE(layer.skip.empty());
}

TEST(ConfigFileTest, MissingFileIsInvalidConfig) {
    TempDir tmp;
    try {
        loadConfigFile(tmp / "absent");
        FAIL() << "expected InvalidConfig";
    } catch (const SyncError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidConfig);
    }
}
