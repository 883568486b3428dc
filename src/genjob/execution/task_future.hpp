/**
 * @file task_future.hpp
 * @brief TaskFuture, the handle to one submitted task, and FutureWaiter.
 */
#pragma once
#include "genjob/common/common.hpp"
#include "genjob/common/slot_value.hpp"

namespace genjob
{

class TaskFuture;
class FutureWaiter;

using TaskFuturePtr = std::shared_ptr<TaskFuture>;
using FutureWaiterPtr = std::shared_ptr<FutureWaiter>;

/**
 * @brief Execution state of a submitted task.
 *
 * @details
 * Transitions: Pending -> Running -> {Succeeded, Failed}, or
 * Pending -> Cancelled. Terminal states never change.
 */
enum class FutureState
{
    Pending,
    Running,
    Succeeded,
    Failed,
    Cancelled
};

/**
 * @brief Completion listener shared by several futures.
 *
 * @details
 * A FutureWaiter counts the completions of the futures it is attached to and
 * lets one thread block until a number of them have completed. It is the
 * building block of Executor::wait_for_futures().
 *
 * @par Thread Safety
 * - notify_completion() may be called from any thread.
 * - wait() is intended for the single thread that created the waiter.
 */
class FutureWaiter
{
public:
    /**
     * @brief Called by a future after it reached a terminal state.
     */
    void notify_completion() noexcept;

    /**
     * @brief Block until `target` completions were counted or `deadline` passes.
     * @param target Number of completions to wait for.
     * @param deadline Absolute deadline, or nullopt to wait without bound.
     * @return True if the target was reached.
     */
    bool wait(size_t target,
              std::optional<std::chrono::steady_clock::time_point> deadline);

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    size_t m_completed{0};
};

/**
 * @brief Handle to one task's in-flight or completed outcome.
 *
 * @details
 * A TaskFuture is created by an executor for each submitted task. The
 * executor drives it through try_begin() and set_outputs() or
 * set_exception(); consumers observe it through done(), state() and result(),
 * and may request cancellation with cancel().
 *
 * @par Cancellation
 * Cancellation is best-effort: only a task that has not started yet can be
 * cancelled. A running task always completes normally.
 *
 * @par Thread Safety
 * - All public members may be called from any thread.
 * - Attached FutureWaiters are notified without holding the future's lock.
 */
class TaskFuture
{
public:
    TaskFuture() = default;

    // Non-copyable, non-movable
    TaskFuture(const TaskFuture&) = delete;
    TaskFuture(TaskFuture&&) = delete;
    TaskFuture& operator=(const TaskFuture&) = delete;
    TaskFuture& operator=(TaskFuture&&) = delete;

    /**
     * @brief Request cancellation.
     * @return True if the future is cancelled after the call (including when
     *         it already was), false if the task is running or complete.
     */
    bool cancel();

    /**
     * @brief Check whether the future reached a terminal state.
     */
    bool done() const;

    bool cancelled() const;

    FutureState state() const;

    /**
     * @brief Wait for and retrieve the task outputs.
     * @param timeout Maximum time to wait; zero checks once without blocking.
     * @return The outputs of the work function.
     * @throws TaskCancelledError if the future was cancelled.
     * @throws TaskTimeoutError if the future is not complete within `timeout`.
     * @throws Whatever the work function threw, if the task failed.
     */
    std::vector<SlotValue> result(
        std::chrono::nanoseconds timeout = std::chrono::nanoseconds{0}) const;

    /**
     * @brief Attach a completion listener.
     * @return False if the future is already complete; the waiter is then not
     *         attached and will not be notified.
     */
    bool add_waiter(const FutureWaiterPtr& waiter);

    /**
     * @brief Detach a listener previously attached with add_waiter().
     */
    void remove_waiter(const FutureWaiterPtr& waiter);

    // ---- Producer side (executors) ----

    /**
     * @brief Transition Pending -> Running.
     * @return False if the future was cancelled; the task must then not run.
     */
    bool try_begin();

    /**
     * @brief Complete the future successfully.
     * @pre state() == Running
     */
    void set_outputs(std::vector<SlotValue> outputs);

    /**
     * @brief Complete the future with a failure.
     * @pre state() == Running
     */
    void set_exception(std::exception_ptr error);

private:
    /**
     * @brief Move to a terminal state and notify listeners.
     * @param lock Lock on m_mutex; released before listeners are notified.
     */
    void complete(std::unique_lock<std::mutex>& lock, FutureState terminal);

    static bool is_terminal(FutureState state) noexcept
    {
        return state == FutureState::Succeeded ||
               state == FutureState::Failed ||
               state == FutureState::Cancelled;
    }

    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
    FutureState m_state{FutureState::Pending};
    std::vector<SlotValue> m_outputs;
    std::exception_ptr m_exception{};
    std::vector<FutureWaiterPtr> m_waiters;
};

} // namespace genjob
