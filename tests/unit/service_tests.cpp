#include <gtest/gtest.h>
#include "core/service.hpp"
#include "test_helpers.hpp"
#include <httplib.h>
#include <atomic>
#include <filesystem>
#include <thread>

using namespace remoteops;
using namespace remoteops::core;
using test::TempDir;
using test::write_file;

namespace fs = std::filesystem;

namespace {

class CountingFetcher : public runtime::Fetcher {
public:
    explicit CountingFetcher(std::atomic<int>& calls) : calls_(calls) {}

    runtime::FetchResult fetch(const std::string& /*url*/) override {
        calls_++;
        runtime::FetchResult result;
        result.success = true;
        result.body = std::string(2048, 'z');
        return result;
    }

private:
    std::atomic<int>& calls_;
};

// Send one request and return the status code (0 on transport failure)
int status_of(uint16_t port, const std::string& method, const std::string& target,
              const std::string& body) {
    httplib::Client cli("127.0.0.1", port);
    cli.set_read_timeout(5, 0);

    httplib::Result res = method == "DELETE"
        ? cli.Delete(target, body, "application/json")
        : cli.Post(target, body, "application/json");
    return res ? res->status : 0;
}

} // namespace

// ============================================================================
// Test Fixtures
// ============================================================================

class ServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<TempDir>("remoteops_service");

        ServiceConfig config;
        config.host = "127.0.0.1";
        config.port = 0;
        config.tokens = {"service-token"};
        config.allowed_dirs = {dir_->str()};
        config.allowed_file_patterns = {"*.zip", "*.7z"};
        config.log_created_files = true;

        service_ = std::make_unique<Service>(config, std::make_unique<CountingFetcher>(fetches_));
        ASSERT_TRUE(service_->init());
        loop_ = std::thread([this]() { service_->run(); });
    }

    void TearDown() override {
        service_->shutdown();
        if (loop_.joinable()) {
            loop_.join();
        }
        service_.reset();
    }

    int request(const std::string& method, const std::string& route, const nlohmann::json& body,
                const std::string& token = "service-token") {
        return status_of(service_->port(), method, route + "?token=" + token, body.dump());
    }

    std::unique_ptr<TempDir> dir_;
    std::atomic<int> fetches_{0};
    std::unique_ptr<Service> service_;
    std::thread loop_;
};

// ============================================================================
// Tests
// ============================================================================

TEST_F(ServiceTest, DownloadCreatesDirectoryAndFile) {
    std::string target = dir_->file("incoming/archive.zip");
    EXPECT_EQ(request("POST", "/download", {{"url", "https://example.com/a"}, {"path", target}}), 201);
    EXPECT_EQ(fs::file_size(target), 2048u);
}

TEST_F(ServiceTest, DownloadOutsideAllowedDirectoryNeverFetches) {
    EXPECT_EQ(request("POST", "/download", {{"url", "https://example.com/a"}, {"path", "/etc/passwd"}}), 403);
    EXPECT_EQ(fetches_.load(), 0);
}

TEST_F(ServiceTest, GlobDeleteWithoutMatchesKeepsDirectory) {
    fs::create_directories(dir_->file("empty"));
    EXPECT_EQ(request("DELETE", "/delete", {{"path", dir_->file("empty")}, {"pattern", "*.{zip,7z}"}}), 200);
    EXPECT_TRUE(fs::is_directory(dir_->file("empty")));
}

TEST_F(ServiceTest, RunningAnArchiveIsWrongType) {
    write_file(dir_->file("a.zip"), "zip");
    EXPECT_EQ(request("POST", "/run", {{"path", dir_->file("a.zip")}}), 400);
}

TEST_F(ServiceTest, BadTokenLooksLikeMissingRoute) {
    EXPECT_EQ(request("POST", "/run", {{"path", dir_->file("a.zip")}}, "nope"), 404);
    EXPECT_EQ(request("POST", "/nothing-here", nlohmann::json::object()), 404);
}
