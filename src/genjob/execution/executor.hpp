/**
 * @file executor.hpp
 * @brief IExecutor interface, ExecutorConfig and the default awaiter.
 */
#pragma once
#include "genjob/common/common.hpp"
#include "genjob/execution/task.hpp"
#include "genjob/execution/task_future.hpp"

namespace genjob
{

/**
 * @brief Configuration for executor behavior.
 */
struct ExecutorConfig
{
    /**
     * @brief Number of worker threads.
     * @details 0 means use std::thread::hardware_concurrency().
     *          Ignored by SingleThreadedExecutor.
     */
    size_t thread_count{1};
};

/**
 * @brief How many of the given futures to wait for, and for how long.
 */
struct WaitLimits
{
    /**
     * @brief Sentinel count meaning "every given future".
     */
    static constexpr size_t all = std::numeric_limits<size_t>::max();

    size_t count{all};

    /**
     * @brief Maximum time to wait; nullopt waits without bound.
     */
    std::optional<std::chrono::milliseconds> timeout{};
};

/**
 * @brief One submitted task: the slots it fills and the handle to its outcome.
 */
struct Submission
{
    std::vector<SlotIdx> slots;
    TaskFuturePtr future;
};

/**
 * @brief Waits for some of the given futures to complete.
 *
 * @details
 * Returns the subset of `futures` known to be complete when the wait ends,
 * in the order they were given. The wait ends as soon as
 * `min(limits.count, futures.size())` of them are complete, or when
 * `limits.timeout` elapses. Futures that are already complete count
 * immediately.
 */
using Awaiter = std::function<std::vector<TaskFuturePtr>(
    const std::vector<TaskFuturePtr>& futures, const WaitLimits& limits)>;

/**
 * @brief Interface for task executors.
 *
 * @details
 * IExecutor is the boundary between a Job and whatever actually runs work:
 * the calling thread, a thread pool, or a remote service.
 *
 * @par Thread Safety
 * - submit_all() may be called from any thread.
 * - The Awaiter returned by get_awaiter() may be called from any thread.
 */
class IExecutor
{
public:
    virtual ~IExecutor() = default;

    /**
     * @brief Submit a batch of tasks.
     * @param fn The work function applied to each task's input.
     * @param tasks The tasks to run.
     * @return One Submission per task, in the order of `tasks`.
     */
    virtual std::vector<Submission> submit_all(
        const WorkFunction& fn, const std::vector<Task>& tasks) = 0;

    /**
     * @brief Get the function used to wait for this executor's futures.
     */
    virtual Awaiter get_awaiter() = 0;
};

/**
 * @brief Base class for Executor implementations.
 *
 * @details
 * Provides common functionality for executors including:
 * - Stop request handling
 * - Running one task against its future
 * - The default FutureWaiter-based awaiter
 */
class Executor : public IExecutor
{
public:
    explicit Executor(ExecutorConfig config);
    virtual ~Executor() = default;

    Awaiter get_awaiter() override;

    /**
     * @brief Request graceful stop; no new tasks are accepted afterwards.
     */
    virtual void request_stop();

    bool stop_requested() const noexcept;

    const ExecutorConfig& config() const noexcept
    {
        return m_config;
    }

    /**
     * @brief Wait for some of `futures` to complete.
     * @see Awaiter for the contract.
     */
    static std::vector<TaskFuturePtr> wait_for_futures(
        const std::vector<TaskFuturePtr>& futures, const WaitLimits& limits);

protected:
    /**
     * @brief Run `fn` on `input` and complete `future` with the outcome.
     * @details Does nothing if the future was cancelled before it started.
     */
    static void run_task(
        const WorkFunction& fn, const SlotValue& input, TaskFuture& future);

    ExecutorConfig m_config;
    std::atomic<bool> m_stop_requested{false};
};

} // namespace genjob
