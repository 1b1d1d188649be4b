#include <gtest/gtest.h>
#include "runtime/App.hpp"
#include "pkg/PackageManager.hpp"
#include "TestHelpers.hpp"

#include <set>
#include <sstream>

namespace fs = std::filesystem;
using namespace mg::runtime;
using namespace mg::types;
using namespace mg::test;
using mg::concurrency::CancelToken;
using mg::ui::Answer;

namespace {
class FakeProvisioner : public mg::pkg::ToolProvisioner {
public:
    std::set<Backend> present;
    bool installSucceeds{true};
    std::vector<Backend> installed;

    [[nodiscard]] bool isPresent(const Backend b) const override { return present.contains(b); }
    bool install(const Backend b) override {
        installed.push_back(b);
        if (installSucceeds) present.insert(b);
        return installSucceeds;
    }
};
}

class AppTest : public ::testing::Test {
protected:
    TempDir tmp;
    FakePrompter prompter;
    RecordingRunner runner;
    CancelToken cancel;
    std::ostringstream out;
    std::shared_ptr<FakeProvisioner> provisioner = std::make_shared<FakeProvisioner>();
    mg::config::EffectiveConfig config;

    void SetUp() override {
        writeFile(tmp / "src" / "a.txt", 10);
        fs::create_directories(tmp / "dst");
        fs::create_directories(tmp / "backups");
        provisioner->present = {Backend::Plain, Backend::DeltaTool, Backend::CloudSync};
    }

    [[nodiscard]] Environment env() const {
        return Environment{
            .privileges = mg::priv::PrivilegeContext{},
            .provisioner = provisioner,
            .backup_root = tmp / "backups"
        };
    }

    int run() {
        App app(config, prompter, runner, cancel, env(), out);
        const int rc = app.run();
        record = app.runRecord();
        return rc;
    }

    nlohmann::json record;
};

TEST_F(AppTest, RootDestinationTouchesNothing) {
    config.src = (tmp / "src").string();
    config.dst = "/";
    config.tool = Backend::Plain;

    EXPECT_EQ(run(), 1);
    EXPECT_EQ(record["error_kind"], "RootDestination");
    EXPECT_NE(out.str().find("Nothing was changed"), std::string::npos);
    EXPECT_TRUE(runner.ran.empty());
    EXPECT_EQ(prompter.asked(), 0u);
}

TEST_F(AppTest, NestedMissingDestinationIsRejectedBeforeCreation) {
    config.src = (tmp / "src").string();
    config.dst = (tmp / "src" / "inner").string();
    config.tool = Backend::Plain;

    EXPECT_EQ(run(), 1);
    EXPECT_EQ(record["error_kind"], "NestedPaths");
    EXPECT_FALSE(fs::exists(tmp / "src" / "inner"));
    EXPECT_EQ(prompter.asked(), 0u);
    EXPECT_TRUE(runner.ran.empty());
}

TEST_F(AppTest, MissingDestinationIsCreatedAfterValidation) {
    config.src = (tmp / "src").string();
    config.dst = (tmp / "fresh").string();
    config.tool = Backend::DeltaTool;
    config.skip = {"preview", "backup"};
    prompter.confirms = {Answer::Yes, Answer::Yes};   // create, proceed

    EXPECT_EQ(run(), 0);
    EXPECT_TRUE(fs::is_directory(tmp / "fresh"));
    EXPECT_EQ(record["destination"], fs::canonical(tmp / "fresh").string());
}

TEST_F(AppTest, DecliningSensitiveDestinationExitsWithError) {
    config.src = (tmp / "src").string();
    config.dst = "/etc";
    config.tool = Backend::DeltaTool;
    prompter.confirms = {Answer::Yes, Answer::No};

    EXPECT_EQ(run(), 1);
    EXPECT_EQ(prompter.asked(), 2u);
    EXPECT_TRUE(runner.ran.empty());
}

TEST_F(AppTest, TypedPathsAreRequestedAgainUntilValid) {
    config.tool = Backend::DeltaTool;
    config.skip = {"preview", "backup"};
    prompter.lines = {(tmp / "nope").string(), (tmp / "src").string(), (tmp / "dst").string()};
    prompter.confirms = {Answer::Yes};     // proceed

    EXPECT_EQ(run(), 0);
    ASSERT_EQ(runner.ran.size(), 1u);
    EXPECT_EQ(runner.ran[0].program(), "rsync");
    EXPECT_EQ(record["status"], "done");
    EXPECT_EQ(record["backend"], "rsync");
}

TEST_F(AppTest, BackendMenuDefaultsToPlainCopy) {
    config.src = (tmp / "src").string();
    config.dst = (tmp / "dst").string();
    config.mode = Mode::Copy;
    config.skip = {"preview", "backup"};
    prompter.lines = {std::string{}};
    prompter.confirms = {Answer::Yes};

    EXPECT_EQ(run(), 0);
    ASSERT_EQ(runner.ran.size(), 1u);
    EXPECT_EQ(runner.ran[0].program(), "cp");
}

TEST_F(AppTest, QuitAtPathPromptExitsZero) {
    prompter.lines = {std::nullopt};
    EXPECT_EQ(run(), 0);
    EXPECT_EQ(record["status"], "quit");
}

TEST_F(AppTest, MissingToolThatIsNotInstalledIsBackendUnavailable) {
    provisioner->present = {Backend::Plain};
    config.src = (tmp / "src").string();
    config.dst = (tmp / "dst").string();
    config.tool = Backend::CloudSync;
    prompter.confirms = {Answer::No};   // do not install

    EXPECT_EQ(run(), 1);
    EXPECT_EQ(record["error_kind"], "BackendUnavailable");
    EXPECT_TRUE(provisioner->installed.empty());
}

TEST_F(AppTest, MissingToolIsInstalledOnRequest) {
    provisioner->present = {Backend::Plain};
    config.src = (tmp / "src").string();
    config.dst = (tmp / "dst").string();
    config.tool = Backend::CloudSync;
    config.skip = {"preview", "backup"};
    prompter.confirms = {Answer::Yes, Answer::Yes};   // install, proceed

    EXPECT_EQ(run(), 0);
    ASSERT_EQ(provisioner->installed.size(), 1u);
    EXPECT_EQ(runner.ran.back().program(), "rclone");
}

TEST_F(AppTest, DryRunNeverInstallsOrCreates) {
    provisioner->present = {};
    config.dry_run = true;
    config.src = (tmp / "src").string();
    config.dst = (tmp / "planned").string();
    config.tool = Backend::DeltaTool;
    prompter.confirms = {Answer::No};   // file list

    EXPECT_EQ(run(), 0);
    EXPECT_TRUE(provisioner->installed.empty());
    EXPECT_FALSE(fs::exists(tmp / "planned"));
    EXPECT_EQ(record["transfer_files"], 1);
    EXPECT_TRUE(runner.ran.empty());
}

TEST_F(AppTest, InterruptBeforeStartExits130) {
    config.src = (tmp / "src").string();
    config.dst = (tmp / "dst").string();
    config.tool = Backend::DeltaTool;
    cancel.cancel();

    EXPECT_EQ(run(), 130);
    EXPECT_TRUE(runner.ran.empty());
}
