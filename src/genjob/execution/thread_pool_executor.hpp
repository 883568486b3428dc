/**
 * @file thread_pool_executor.hpp
 * @brief ThreadPoolExecutor running tasks on a fixed set of worker threads.
 */
#pragma once
#include "genjob/execution/executor.hpp"
#include <deque>

namespace genjob
{

/**
 * @brief Executor backed by a fixed pool of worker threads.
 *
 * @details
 * submit_all() enqueues one call per task and returns immediately. Workers
 * take calls in FIFO order. A call whose future was cancelled before a
 * worker picked it up is dropped without running.
 *
 * @par Lifetime
 * Workers are started by the constructor. shutdown() (also run by the
 * destructor) stops accepting work, cancels every queued call and joins the
 * workers; calls already running complete normally.
 *
 * @par Thread Safety
 * - All public members may be called from any thread.
 * - shutdown() must not be called from a worker thread (i.e. from inside a
 *   work function).
 */
class ThreadPoolExecutor : public Executor
{
public:
    explicit ThreadPoolExecutor(ExecutorConfig config = {});
    ~ThreadPoolExecutor() override;

    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;

    std::vector<Submission> submit_all(
        const WorkFunction& fn, const std::vector<Task>& tasks) override;

    void request_stop() override;

    /**
     * @brief Stop the pool and join all workers. Idempotent.
     */
    void shutdown();

    size_t worker_count() const noexcept
    {
        return m_workers.size();
    }

    size_t queue_size() const;

private:
    struct QueuedCall
    {
        WorkFunction fn;
        SlotValue input;
        TaskFuturePtr future;
    };

    void worker_loop(size_t worker_idx);

    mutable std::mutex m_queue_mutex;
    std::condition_variable m_call_available;
    std::deque<QueuedCall> m_queue;

    std::mutex m_shutdown_mutex;
    std::vector<std::thread> m_workers;
};

/**
 * @brief Factory function to create a ThreadPoolExecutor.
 */
inline std::shared_ptr<ThreadPoolExecutor> make_thread_pool_executor(
    ExecutorConfig config = {})
{
    return std::make_shared<ThreadPoolExecutor>(std::move(config));
}

} // namespace genjob
