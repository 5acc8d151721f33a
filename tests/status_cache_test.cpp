#include "status_cache.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <thread>

namespace pnav {
namespace {

using namespace std::chrono_literals;

// Poll until count results arrived or the deadline passed
std::vector<StatusUpdate> collect(StatusCache& cache, size_t count, std::chrono::milliseconds timeout = 5s) {
    std::vector<StatusUpdate> all;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (all.size() < count && std::chrono::steady_clock::now() < deadline) {
        for (auto& update : cache.poll()) {
            all.push_back(std::move(update));
        }
        std::this_thread::sleep_for(5ms);
    }
    return all;
}

TEST(StatusCacheTest, DuplicateRequestsComputeOnce) {
    test::FakeGitClient git;
    git.block();

    StatusCache cache(&git, 2);
    cache.start();

    EXPECT_TRUE(cache.request("/dev/java/A"));
    ASSERT_TRUE(git.wait_for_calls(1));
    EXPECT_FALSE(cache.request("/dev/java/A"));
    EXPECT_TRUE(cache.is_pending("/dev/java/A"));

    git.release();
    auto results = collect(cache, 1);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].first, "/dev/java/A");
    EXPECT_TRUE(results[0].second.available);
    EXPECT_EQ(results[0].second.branch, std::optional<std::string>("main"));

    // Already computed: no new work until invalidated
    EXPECT_FALSE(cache.request("/dev/java/A"));
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(git.status_calls(), 1);
    EXPECT_TRUE(cache.poll().empty());
}

TEST(StatusCacheTest, PollNeverBlocksOnWorkers) {
    test::FakeGitClient git;
    git.block();

    StatusCache cache(&git, 1);
    cache.start();
    cache.request("/dev/slow");
    ASSERT_TRUE(git.wait_for_calls(1));

    const auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(cache.poll().empty());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    EXPECT_EQ(cache.pending_count(), 1u);

    git.release();
    EXPECT_EQ(collect(cache, 1).size(), 1u);
    EXPECT_EQ(cache.pending_count(), 0u);
}

TEST(StatusCacheTest, FailureBecomesUnavailable) {
    test::FakeGitClient git;
    git.status_result = GitQueryResult{false, std::nullopt, false, "not a git repository"};

    StatusCache cache(&git);
    cache.start();
    cache.request("/tmp/plain");

    auto results = collect(cache, 1);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_FALSE(results[0].second.available);
}

TEST(StatusCacheTest, ThrowingClientBecomesUnavailable) {
    test::FakeGitClient git;
    git.throw_on_status = true;

    StatusCache cache(&git);
    cache.start();
    cache.request("/tmp/broken");

    auto results = collect(cache, 1);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_FALSE(results[0].second.available);
}

TEST(StatusCacheTest, InvalidateAllowsRecompute) {
    test::FakeGitClient git;
    StatusCache cache(&git);
    cache.start();

    cache.request("/dev/a");
    ASSERT_EQ(collect(cache, 1).size(), 1u);

    git.status_result.dirty = true;
    cache.invalidate("/dev/a");
    EXPECT_TRUE(cache.request("/dev/a"));

    auto results = collect(cache, 1);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results[0].second.dirty);
    EXPECT_EQ(git.status_calls(), 2);
}

TEST(StatusCacheTest, InvalidateWhilePendingDropsStateAfterCompletion) {
    test::FakeGitClient git;
    git.block();

    StatusCache cache(&git, 1);
    cache.start();
    cache.request("/dev/a");
    ASSERT_TRUE(git.wait_for_calls(1));

    cache.invalidate("/dev/a");
    EXPECT_FALSE(cache.request("/dev/a"));

    git.release();
    ASSERT_EQ(collect(cache, 1).size(), 1u);

    // Worker releases the path just after publishing the result
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (cache.is_pending("/dev/a") && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_TRUE(cache.request("/dev/a"));
    EXPECT_EQ(collect(cache, 1).size(), 1u);
}

TEST(StatusCacheTest, WorkersRunConcurrently) {
    test::FakeGitClient git;
    git.block();

    StatusCache cache(&git, 3);
    cache.start();
    cache.request("/dev/a");
    cache.request("/dev/b");
    cache.request("/dev/c");

    // All three are inside query_status at once
    EXPECT_TRUE(git.wait_for_calls(3));
    git.release();
    EXPECT_EQ(collect(cache, 3).size(), 3u);
}

TEST(StatusCacheTest, ConcurrencyIsBoundedByWorkerCount) {
    test::FakeGitClient git;
    git.block();

    StatusCache cache(&git, 2);
    cache.start();
    cache.request("/dev/a");
    cache.request("/dev/b");
    cache.request("/dev/c");

    ASSERT_TRUE(git.wait_for_calls(2));
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(git.status_calls(), 2);
    EXPECT_EQ(cache.pending_count(), 3u);

    git.release();
    EXPECT_EQ(collect(cache, 3).size(), 3u);
    EXPECT_EQ(git.status_calls(), 3);
}

TEST(StatusCacheTest, StopJoinsWorkersAndIsIdempotent) {
    test::FakeGitClient git;
    StatusCache cache(&git);
    cache.start();
    cache.request("/dev/a");
    cache.stop();
    cache.stop();
    SUCCEED();
}

} // namespace
} // namespace pnav
