/**
 * @file upload_executor.cpp
 * @brief Background executor implementations for pipedream
 */

#include "pipedream/adapters/upload_executor.h"

#include <system_error>
#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace pipedream::adapters {

// ============================================================================
// thread_system_upload_executor implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Job that runs an upload task on a thread_system worker
 */
class upload_job : public kcenon::thread::job {
public:
    explicit upload_job(std::function<void()> func)
        : job("pipedream_upload"), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> kcenon::common::VoidResult override {
        if (func_) {
            func_();
        }
        return kcenon::common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_upload_executor::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    std::shared_ptr<std::atomic<size_t>> active_tasks =
        std::make_shared<std::atomic<size_t>>(0);
};

thread_system_upload_executor::thread_system_upload_executor(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_upload_executor::~thread_system_upload_executor() = default;

std::shared_ptr<thread_system_upload_executor>
thread_system_upload_executor::create_default(size_t worker_count,
                                              const std::string& pool_name) {
    if (worker_count == 0) {
        worker_count = std::thread::hardware_concurrency();
        if (worker_count == 0) {
            worker_count = 4;
        }
    }

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);

    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }

    pool->start();

    return std::make_shared<thread_system_upload_executor>(std::move(pool), pool_name,
                                                           worker_count);
}

std::future<void> thread_system_upload_executor::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto active = pimpl_->active_tasks;
    active->fetch_add(1, std::memory_order_relaxed);
    auto wrapped_task = [task = std::move(task), promise, active]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
        active->fetch_sub(1, std::memory_order_relaxed);
    };

    auto enqueue_result =
        pimpl_->pool->enqueue(std::make_unique<upload_job>(std::move(wrapped_task)));
    if (!enqueue_result.is_ok()) {
        active->fetch_sub(1, std::memory_order_relaxed);
        throw std::system_error(
            std::make_error_code(std::errc::resource_unavailable_try_again),
            "failed to enqueue upload job");
    }
    return future;
}

size_t thread_system_upload_executor::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_upload_executor::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_upload_executor::pending_tasks() const {
    return pimpl_->active_tasks->load(std::memory_order_relaxed);
}

std::shared_ptr<kcenon::thread::thread_pool>
thread_system_upload_executor::underlying_pool() const {
    return pimpl_->pool;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_upload_executor implementation
// ============================================================================

async_upload_executor::async_upload_executor()
    : active_tasks_(std::make_shared<std::atomic<size_t>>(0)) {}

async_upload_executor::~async_upload_executor() = default;

std::future<void> async_upload_executor::submit(std::function<void()> task) {
    active_tasks_->fetch_add(1, std::memory_order_relaxed);

    return std::async(std::launch::async,
                      [active = active_tasks_, task = std::move(task)]() {
                          try {
                              task();
                          } catch (...) {
                              active->fetch_sub(1, std::memory_order_relaxed);
                              throw;
                          }
                          active->fetch_sub(1, std::memory_order_relaxed);
                      });
}

size_t async_upload_executor::worker_count() const {
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

bool async_upload_executor::is_running() const { return true; }

size_t async_upload_executor::pending_tasks() const {
    return active_tasks_->load(std::memory_order_relaxed);
}

// ============================================================================
// upload_executor_factory implementation
// ============================================================================

std::shared_ptr<upload_executor_interface> upload_executor_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_upload_executor::create_default(worker_count, pool_name);
#else
    (void)worker_count;
    (void)pool_name;
    return std::make_shared<async_upload_executor>();
#endif
}

std::shared_ptr<upload_executor_interface> upload_executor_factory::shared() {
    static std::shared_ptr<upload_executor_interface> instance = create();
    return instance;
}

}  // namespace pipedream::adapters
