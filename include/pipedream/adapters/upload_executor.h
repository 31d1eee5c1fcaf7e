/**
 * @file upload_executor.h
 * @brief Background execution of upload tasks
 * @version 0.1.0
 *
 * Each multipart upload runs as one background task. This adapter runs
 * those tasks on thread_system's thread_pool when it is integrated and
 * falls back to std::async otherwise.
 */

#ifndef PIPEDREAM_ADAPTERS_UPLOAD_EXECUTOR_H
#define PIPEDREAM_ADAPTERS_UPLOAD_EXECUTOR_H

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace pipedream::adapters {

/**
 * @brief Interface for running upload tasks in the background
 */
class upload_executor_interface {
public:
    virtual ~upload_executor_interface() = default;

    /**
     * @brief Submit a task for execution
     * @param task The task to execute
     * @return Future for the task completion
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Get the number of worker threads
     */
    [[nodiscard]] virtual size_t worker_count() const = 0;

    /**
     * @brief Check if the executor accepts tasks
     */
    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Number of submitted tasks that have not finished
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Executor backed by thread_system::thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_upload_executor : public upload_executor_interface {
public:
    /**
     * @brief Construct with an existing thread_pool
     * @param pool Shared pointer to thread_system's thread_pool
     * @param pool_name Name for identification in logs
     * @param worker_count Number of workers in the pool (for reporting)
     */
    explicit thread_system_upload_executor(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "pipedream_upload_pool",
        size_t worker_count = 0);

    ~thread_system_upload_executor() override;

    thread_system_upload_executor(const thread_system_upload_executor&) = delete;
    thread_system_upload_executor& operator=(const thread_system_upload_executor&) = delete;

    /**
     * @brief Create a started pool with @p worker_count workers
     * @param worker_count Number of worker threads (0 = hardware concurrency)
     */
    [[nodiscard]] static std::shared_ptr<thread_system_upload_executor> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "pipedream_upload_pool");

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

    [[nodiscard]] std::shared_ptr<kcenon::thread::thread_pool> underlying_pool() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback executor using std::async
 *
 * Every task gets its own thread; there is no queue.
 */
class async_upload_executor : public upload_executor_interface {
public:
    async_upload_executor();
    ~async_upload_executor() override;

    async_upload_executor(const async_upload_executor&) = delete;
    async_upload_executor& operator=(const async_upload_executor&) = delete;

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

private:
    std::shared_ptr<std::atomic<size_t>> active_tasks_;
};

/**
 * @brief Selects the best available executor
 *
 * 1. thread_system_upload_executor (when KCENON_WITH_THREAD_SYSTEM)
 * 2. async_upload_executor (fallback)
 */
class upload_executor_factory {
public:
    [[nodiscard]] static std::shared_ptr<upload_executor_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "pipedream_upload_pool");

    /**
     * @brief Process-wide executor shared by uploads that were not given one
     */
    [[nodiscard]] static std::shared_ptr<upload_executor_interface> shared();

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace pipedream::adapters

#endif  // PIPEDREAM_ADAPTERS_UPLOAD_EXECUTOR_H
