#include <gtest/gtest.h>
#include "paths/PathResolver.hpp"
#include "priv/PrivilegeBroker.hpp"
#include "types/SyncError.hpp"
#include "concurrency/CancelToken.hpp"
#include "TestHelpers.hpp"

namespace fs = std::filesystem;
using namespace mg::paths;
using namespace mg::priv;
using namespace mg::types;
using namespace mg::test;
using mg::ui::Answer;

class PathResolverTest : public ::testing::Test {
protected:
    TempDir tmp;
    FakePrompter prompter;
    RecordingRunner runner;
    PrivilegeBroker broker{PrivilegeContext{}, runner, [](const fs::path&) { return true; }};
};

TEST_F(PathResolverTest, ExistingDirectoryResolvesToCanonicalForm) {
    fs::create_directories(tmp / "a" / "b");
    const PathResolver resolver(prompter, broker, false);
    const auto out = resolver.resolve((tmp / "a" / "b" / ".." / "b" / "").string(), false);
    EXPECT_EQ(out, fs::canonical(tmp / "a" / "b"));
}

TEST_F(PathResolverTest, SymlinkIsCollapsed) {
    fs::create_directories(tmp / "real");
    fs::create_directory_symlink(tmp / "real", tmp / "link");
    const PathResolver resolver(prompter, broker, false);
    EXPECT_EQ(resolver.resolve((tmp / "link").string(), false), fs::canonical(tmp / "real"));
}

TEST_F(PathResolverTest, RegularFileIsNotADirectory) {
    writeFile(tmp / "file.txt", 3);
    const PathResolver resolver(prompter, broker, false);
    try {
        resolver.resolve((tmp / "file.txt").string(), true);
        FAIL() << "expected PathNotFound";
    } catch (const SyncError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::PathNotFound);
    }
    EXPECT_EQ(prompter.asked(), 0u);
}

TEST_F(PathResolverTest, MissingWithoutCreationFails) {
    const PathResolver resolver(prompter, broker, false);
    EXPECT_THROW(resolver.resolve((tmp / "missing").string(), false), SyncError);
    EXPECT_EQ(prompter.asked(), 0u);
}

TEST_F(PathResolverTest, MissingIsOnlyLocatedNotCreated) {
    const PathResolver resolver(prompter, broker, false);
    const auto out = resolver.resolve((tmp / "new" / "nested").string(), true);
    EXPECT_FALSE(fs::exists(tmp / "new"));
    EXPECT_EQ(out, fs::canonical(tmp.path()) / "new" / "nested");
    EXPECT_EQ(prompter.asked(), 0u);
}

TEST_F(PathResolverTest, MissingLeafUnderSymlinkResolvesThroughTheLink) {
    fs::create_directories(tmp / "src");
    fs::create_directory_symlink(tmp / "src", tmp / "link");
    const PathResolver resolver(prompter, broker, true);
    const auto out = resolver.resolve((tmp / "link" / "new").string(), true);
    EXPECT_EQ(out, fs::canonical(tmp / "src") / "new");
    EXPECT_FALSE(fs::exists(tmp / "src" / "new"));
}

TEST_F(PathResolverTest, MaterializeCreatesAfterConfirmation) {
    prompter.confirms = {Answer::Yes};
    const PathResolver resolver(prompter, broker, false);
    const auto intended = resolver.resolve((tmp / "new" / "nested").string(), true);
    const auto out = resolver.materialize(intended);
    EXPECT_TRUE(fs::is_directory(tmp / "new" / "nested"));
    EXPECT_EQ(out, fs::canonical(tmp / "new" / "nested"));
    EXPECT_TRUE(runner.ran.empty());
}

TEST_F(PathResolverTest, MaterializeLeavesExistingDirectoryAlone) {
    fs::create_directories(tmp / "here");
    const PathResolver resolver(prompter, broker, false);
    EXPECT_EQ(resolver.materialize(tmp / "here"), fs::canonical(tmp / "here"));
    EXPECT_EQ(prompter.asked(), 0u);
}

TEST_F(PathResolverTest, DeclinedCreationIsPathNotFound) {
    prompter.confirms = {Answer::No};
    const PathResolver resolver(prompter, broker, false);
    try {
        resolver.materialize(resolver.resolve((tmp / "new").string(), true));
        FAIL() << "expected PathNotFound";
    } catch (const SyncError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::PathNotFound);
    }
    EXPECT_FALSE(fs::exists(tmp / "new"));
}

TEST_F(PathResolverTest, QuitAtCreationPromptIsCancellation) {
    prompter.confirms = {Answer::Cancelled};
    const PathResolver resolver(prompter, broker, false);
    EXPECT_THROW(resolver.materialize(tmp / "new"), mg::concurrency::Cancelled);
    EXPECT_FALSE(fs::exists(tmp / "new"));
}

TEST_F(PathResolverTest, DryRunNeverCreates) {
    const PathResolver resolver(prompter, broker, true);
    const auto out = resolver.materialize(resolver.resolve((tmp / "planned" / "").string(), true));
    EXPECT_FALSE(fs::exists(tmp / "planned"));
    EXPECT_EQ(out, fs::canonical(tmp.path()) / "planned");
    EXPECT_EQ(prompter.asked(), 0u);
}

TEST(AbsoluteNormalTest, StripsTrailingSlashAndDotSegments) {
    EXPECT_EQ(absoluteNormal("/srv/data/"), fs::path("/srv/data"));
    EXPECT_EQ(absoluteNormal("/srv/./x/../data"), fs::path("/srv/data"));
    EXPECT_EQ(absoluteNormal("/"), fs::path("/"));
}
