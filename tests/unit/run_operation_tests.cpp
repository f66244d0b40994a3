#include <gtest/gtest.h>
#include "core/run_operation.hpp"
#include "test_helpers.hpp"
#include <filesystem>

using namespace remoteops::core;
using remoteops::test::TempDir;
using remoteops::test::write_file;

namespace fs = std::filesystem;

// ============================================================================
// Test Fixtures
// ============================================================================

class RunOperationTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<TempDir>("remoteops_run");
        config_.tokens = {"secret"};
        config_.allowed_dirs = {dir_->str()};
        config_.allowed_file_patterns = {"*.sh", "*.zip", "*.SH"};
        config_.log_requests = true;

        authority_ = std::make_unique<TokenAuthority>(config_.tokens);
        policy_ = std::make_unique<PathPolicy>(config_.allowed_dirs, config_.allowed_file_patterns);
        operation_ = std::make_unique<RunOperation>(config_, *authority_, *policy_);
    }

    std::string script(const std::string& name, const std::string& body, bool executable = true) {
        std::string path = dir_->file(name);
        write_file(path, "#!/bin/sh\n" + body);
        if (executable) {
            fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace);
        }
        return path;
    }

    Outcome run(const std::string& path, const std::string& token = "secret") {
        RunRequest req;
        req.path = path;
        req.client_ip = "192.168.1.20";
        return operation_->run(token, req);
    }

    std::unique_ptr<TempDir> dir_;
    ServiceConfig config_;
    std::unique_ptr<TokenAuthority> authority_;
    std::unique_ptr<PathPolicy> policy_;
    std::unique_ptr<RunOperation> operation_;
};

// ============================================================================
// Tests
// ============================================================================

TEST_F(RunOperationTest, SuccessfulScriptRelaysOutput) {
    std::string path = script("hello.sh", "echo hello\necho warn >&2\n");

    Outcome outcome = run(path);
    EXPECT_EQ(outcome.status, 200);
    EXPECT_EQ(outcome.body["success"], true);
    EXPECT_EQ(outcome.body["stdout"], "hello\n");
    EXPECT_EQ(outcome.body["stderr"], "warn\n");
}

TEST_F(RunOperationTest, NonZeroExitIs500WithStderr) {
    std::string path = script("fail.sh", "echo broken >&2\nexit 3\n");

    Outcome outcome = run(path);
    EXPECT_EQ(outcome.status, 500);
    std::string error = outcome.body["error"];
    EXPECT_NE(error.find("exit code 3"), std::string::npos);
    EXPECT_NE(error.find("broken"), std::string::npos);
}

TEST_F(RunOperationTest, NonExecutableScriptIs500) {
    std::string path = script("plain.sh", "echo never\n", false);
    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);

    Outcome outcome = run(path);
    EXPECT_EQ(outcome.status, 500);
    EXPECT_TRUE(outcome.body.contains("error"));
}

TEST_F(RunOperationTest, MissingScriptIs500) {
    EXPECT_EQ(run(dir_->file("absent.sh")).status, 500);
}

TEST_F(RunOperationTest, WrongExtensionIs400) {
    write_file(dir_->file("a.zip"), "zip");

    Outcome outcome = run(dir_->file("a.zip"));
    EXPECT_EQ(outcome.status, 400);
    EXPECT_EQ(outcome.body["error"], "Wrong file type");
}

TEST_F(RunOperationTest, NameWithoutExtensionIsWrongType) {
    std::string path = script("noext", "echo x\n");
    EXPECT_EQ(run(path).status, 400);
}

TEST_F(RunOperationTest, ExtensionCheckIgnoresCase) {
    std::string path = script("UPPER.SH", "echo upper\n");
    Outcome outcome = run(path);
    EXPECT_EQ(outcome.status, 200);
    EXPECT_EQ(outcome.body["stdout"], "upper\n");
}

TEST_F(RunOperationTest, PatternFilterAppliesBeforeExtensionCheck) {
    std::string path = script("job.cmd", "echo x\n");
    EXPECT_EQ(run(path).status, 403);
}

TEST_F(RunOperationTest, OutsidePathIsForbidden) {
    TempDir outside("remoteops_run_outside");
    std::string path = outside.file("evil.sh");
    write_file(path, "#!/bin/sh\ntouch " + outside.file("ran") + "\n");
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace);

    EXPECT_EQ(run(path).status, 403);
    EXPECT_FALSE(fs::exists(outside.file("ran")));
}

TEST_F(RunOperationTest, BadTokenIsOpaqueNotFound) {
    std::string marker = dir_->file("ran");
    std::string path = script("touch.sh", "touch " + marker + "\n");

    Outcome outcome = run(path, "guess");
    EXPECT_EQ(outcome.status, 404);
    EXPECT_FALSE(outcome.has_body());
    EXPECT_FALSE(fs::exists(marker));
}

TEST(RunExtensionTest, RecognizesScriptExtensions) {
    EXPECT_TRUE(RunOperation::has_runnable_extension("/x/a.sh"));
    EXPECT_TRUE(RunOperation::has_runnable_extension("/x/a.BAT"));
    EXPECT_TRUE(RunOperation::has_runnable_extension("/x/a.Cmd"));
    EXPECT_FALSE(RunOperation::has_runnable_extension("/x/a.exe"));
    EXPECT_FALSE(RunOperation::has_runnable_extension("/x/a.sh.txt"));
    EXPECT_FALSE(RunOperation::has_runnable_extension("/x/sh"));
}
