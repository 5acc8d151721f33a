#include "clone_worker.hpp"
#include "test_helpers.hpp"
#include <chrono>
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <thread>

namespace fs = std::filesystem;

namespace pnav {
namespace {

TEST(RepositoryNameTest, DerivesDirectoryFromUrl) {
    EXPECT_EQ(repository_name("https://github.com/acme/tool.git"), "tool");
    EXPECT_EQ(repository_name("https://github.com/acme/tool"), "tool");
    EXPECT_EQ(repository_name("git@github.com:acme/tool.git"), "tool");
    EXPECT_EQ(repository_name("acme/tool"), "tool");
    EXPECT_EQ(repository_name("https://gitlab.example.com/group/sub/repo/"), "repo");
}

TEST(RepositoryNameTest, FallsBackForEmptyNames) {
    EXPECT_EQ(repository_name(""), "new-project");
    EXPECT_EQ(repository_name("https://host/.git"), "new-project");
}

TEST(CloneWorkerTest, DeliversResultOnce) {
    test::TempDir tmp;
    test::FakeGitClient git;
    CloneWorker worker(&git);

    ASSERT_TRUE(worker.start("https://github.com/acme/tool.git", tmp.make_dir("java").string()));
    worker.wait();

    auto result = worker.poll();
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->success);
    EXPECT_EQ(result->project_path, (tmp.path() / "java" / "tool").string());
    EXPECT_TRUE(fs::is_directory(result->project_path));

    EXPECT_FALSE(worker.poll().has_value());
    EXPECT_FALSE(worker.is_busy());
}

TEST(CloneWorkerTest, RejectsSecondCloneWhileBusy) {
    test::TempDir tmp;
    test::FakeGitClient git;
    git.block();
    CloneWorker worker(&git);

    ASSERT_TRUE(worker.start("acme/one", tmp.path().string()));
    ASSERT_TRUE(git.wait_for_calls(1));
    EXPECT_TRUE(worker.is_busy());
    EXPECT_FALSE(worker.start("acme/two", tmp.path().string()));
    EXPECT_FALSE(worker.poll().has_value());

    git.release();
    worker.wait();
    EXPECT_EQ(git.clone_calls(), 1);
    EXPECT_TRUE(worker.poll().has_value());

    // Free again once the result is in
    EXPECT_TRUE(worker.start("acme/two", tmp.path().string()));
    worker.wait();
    EXPECT_EQ(git.clone_calls(), 2);
}

TEST(CloneWorkerTest, WaitingForRunningCloneIsLogged) {
    auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(32);
    auto previous = spdlog::default_logger();
    spdlog::set_default_logger(std::make_shared<spdlog::logger>("clone_worker_test", sink));

    test::TempDir tmp;
    test::FakeGitClient git;
    git.block();
    CloneWorker worker(&git);
    ASSERT_TRUE(worker.start("acme/slow", tmp.path().string()));
    ASSERT_TRUE(git.wait_for_calls(1));

    std::thread releaser([&git] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        git.release();
    });
    worker.wait();
    releaser.join();

    spdlog::set_default_logger(previous);

    bool logged = false;
    for (const auto& line : sink->last_formatted()) {
        if (line.find("Waiting for clone to finish") != std::string::npos) logged = true;
    }
    EXPECT_TRUE(logged);
    EXPECT_TRUE(worker.poll().has_value());
}

TEST(CloneWorkerTest, FailureIsReported) {
    test::TempDir tmp;
    test::FakeGitClient git;
    git.clone_error = "repository not found";
    CloneWorker worker(&git);

    worker.start("acme/missing", tmp.path().string());
    worker.wait();

    auto result = worker.poll();
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->success);
    EXPECT_EQ(result->error_message, "repository not found");
}

TEST(CloneWorkerTest, ExceptionBecomesFailure) {
    test::TempDir tmp;
    test::FakeGitClient git;
    git.throw_on_clone = true;
    CloneWorker worker(&git);

    worker.start("acme/broken", tmp.path().string());
    worker.wait();

    auto result = worker.poll();
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->success);
    EXPECT_EQ(result->error_message, "clone exploded");
}

} // namespace
} // namespace pnav
