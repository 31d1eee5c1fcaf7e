/**
 * @file test_upload_executor.cpp
 * @brief Unit tests for upload executors
 */

#include <gtest/gtest.h>

#include "pipedream/adapters/upload_executor.h"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

namespace pipedream::adapters::test {

class AsyncUploadExecutorTest : public ::testing::Test {
protected:
    async_upload_executor executor_;
};

TEST_F(AsyncUploadExecutorTest, RunsSubmittedTask) {
    std::atomic<int> counter{0};

    auto done = executor_.submit([&counter] { ++counter; });
    done.get();

    EXPECT_EQ(counter.load(), 1);
    EXPECT_EQ(executor_.pending_tasks(), 0u);
}

TEST_F(AsyncUploadExecutorTest, RunsTasksConcurrently) {
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.push_back(executor_.submit([&counter] { ++counter; }));
    }
    for (auto& f : futures) {
        f.get();
    }

    EXPECT_EQ(counter.load(), 8);
}

TEST_F(AsyncUploadExecutorTest, ExceptionReachesFuture) {
    auto failed = executor_.submit([] { throw std::runtime_error("boom"); });

    EXPECT_THROW(failed.get(), std::runtime_error);
    EXPECT_EQ(executor_.pending_tasks(), 0u);
}

TEST_F(AsyncUploadExecutorTest, ReportsRunning) {
    EXPECT_TRUE(executor_.is_running());
    EXPECT_GE(executor_.worker_count(), 1u);
}

TEST(UploadExecutorFactoryTest, CreatesWorkingExecutor) {
    auto executor = upload_executor_factory::create(2);
    ASSERT_NE(executor, nullptr);
    EXPECT_TRUE(executor->is_running());

    std::atomic<bool> ran{false};
    executor->submit([&ran] { ran = true; }).get();
    EXPECT_TRUE(ran.load());
}

TEST(UploadExecutorFactoryTest, RunningTaskOutlivesExecutor) {
    auto executor = upload_executor_factory::create(1);
    std::atomic<bool> started{false};
    std::atomic<bool> finished{false};

    auto done = executor->submit([&started, &finished] {
        started = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        finished = true;
    });
    while (!started.load()) {
        std::this_thread::yield();
    }
    executor.reset();

    EXPECT_NO_THROW(done.get());
    EXPECT_TRUE(finished.load());
}

TEST(UploadExecutorFactoryTest, SharedExecutorIsReused) {
    EXPECT_EQ(upload_executor_factory::shared(), upload_executor_factory::shared());
}

}  // namespace pipedream::adapters::test
