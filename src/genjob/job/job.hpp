/**
 * @file job.hpp
 * @brief Job, a self-driving generational task scheduler.
 */
#pragma once
#include "genjob/common/common.hpp"
#include "genjob/common/slot_value.hpp"
#include "genjob/execution/executor.hpp"
#include "genjob/job/context.hpp"

namespace genjob
{

class Job;
class JobWaiter;

using JobPtr = std::shared_ptr<Job>;

/**
 * @brief Maximum time to block; nullopt blocks without bound.
 */
using Timeout = std::optional<std::chrono::milliseconds>;

/**
 * @brief Lifecycle state of a Job.
 *
 * @details
 * Transitions: Pending -> Running -> {Finished, Cancelled}. Nothing leaves
 * Finished or Cancelled.
 */
enum class JobState
{
    Pending,
    Running,
    Finished,
    Cancelled
};

const char* to_string(JobState state) noexcept;

/**
 * @brief Outcome of Job::cancel().
 */
enum class CancelOutcome
{
    /// The job was already Finished or Cancelled; nothing to do.
    AlreadyTerminal,
    /// The job was Running and is now Cancelled.
    CancellationIssued,
    /// The job was never started; the call had no effect.
    NotStarted
};

/**
 * @brief Configuration for a Job.
 */
struct JobConfig
{
    /**
     * @brief Human-readable name used in log lines.
     * @details Empty means "job-<id>".
     */
    std::string name;
};

/**
 * @brief Counters describing a job's progress so far.
 */
struct JobStats
{
    size_t generations{0};
    size_t tasks_submitted{0};
    size_t tasks_succeeded{0};
    size_t tasks_failed{0};
    size_t tasks_cancelled{0};

    /**
     * @brief Error messages of failed tasks, in the order they were handled.
     */
    std::vector<std::string> error_messages;

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const;
};

/**
 * @brief One generational computation run.
 *
 * @details
 * A Job repeatedly asks its IContext for a batch of tasks, submits the batch
 * to the context's executor, waits for some of the futures accumulated so far,
 * and scatters completed outputs into a results buffer addressed by slot id. The
 * filled slots are fed back to the context to decide the next batch. The run
 * ends when the context returns no tasks (Finished) or when the job is
 * cancelled (Cancelled).
 *
 * @par Results buffer
 * - One entry per slot declared by any submitted task; unfilled slots hold an
 *   empty SlotValue.
 * - A slot is written at most once, by the task that declared it, when that
 *   task's future is observed complete. Order therefore follows the slot ids
 *   the context assigned, not completion order.
 * - A task that fails leaves its slots empty; the failure is logged and
 *   counted in stats() but does not stop the run.
 *
 * @par Thread Safety
 * - All public members may be called from any thread.
 * - One mutex guards all mutable state. The worker holds it only for short
 *   bookkeeping sections, never while waiting on futures or calling the
 *   context.
 *
 * @par Ownership
 * - Jobs are always owned through JobPtr (see make_job()).
 * - Destroying a job whose worker is still running cancels it and joins the
 *   worker.
 */
class Job : public std::enable_shared_from_this<Job>
{
public:
    using Id = std::uint64_t;

    /**
     * @throws std::invalid_argument if `context` is null.
     */
    explicit Job(ContextPtr context, JobConfig config = {});
    ~Job();

    // Non-copyable, non-movable
    Job(const Job&) = delete;
    Job(Job&&) = delete;
    Job& operator=(const Job&) = delete;
    Job& operator=(Job&&) = delete;

    /**
     * @brief Launch the worker thread.
     * @throws JobError with JobErrorCode::AlreadyStarted unless the job is
     *         Pending; the job is left unchanged.
     */
    Job& start();

    /**
     * @brief Cancel a running job.
     *
     * @details
     * A Running job becomes Cancelled, every known future is asked to cancel,
     * and threads blocked in result() are woken. The worker stops before the
     * next generation.
     *
     * @note Cancelling a Pending job does nothing and returns
     *       CancelOutcome::NotStarted; the job stays Pending and never reaches
     *       a terminal state unless started later.
     */
    CancelOutcome cancel();

    bool cancelled() const;
    bool running() const;

    /**
     * @brief True for both Finished and Cancelled.
     */
    bool done() const;

    JobState state() const;

    /**
     * @brief Wait for the job to end and get its results.
     * @param timeout Maximum time to wait; nullopt waits without bound, zero
     *        checks once without blocking.
     * @return The full results buffer of a Finished job.
     * @throws JobError with JobErrorCode::Cancelled if the job was cancelled.
     * @throws JobError with JobErrorCode::TimedOut if the job did not end in time.
     */
    std::vector<SlotValue> result(Timeout timeout = std::nullopt) const;

    /**
     * @brief Block until the worker thread has exited.
     * @details Returns immediately for a job that was never started.
     */
    void join();

    Id id() const noexcept
    {
        return m_id;
    }

    const std::string& name() const noexcept
    {
        return m_name;
    }

    const ContextPtr& context() const noexcept
    {
        return m_context;
    }

    /**
     * @brief Number of tasks submitted so far.
     */
    size_t offset() const;

    JobStats stats() const;

private:
    friend class JobWaiter;

    /**
     * @brief State guarded by m_mutex.
     */
    struct SharedState
    {
        JobState state{JobState::Pending};
        size_t offset{0};

        // Parallel vectors, one entry per submitted task.
        std::vector<std::vector<SlotIdx>> slot_groups;
        std::vector<TaskFuturePtr> futures;
        std::vector<bool> handled;

        std::vector<SlotValue> results;
        std::vector<std::shared_ptr<JobWaiter>> waiters;
        JobStats stats;
    };

    void process();
    void run_generations();

    /**
     * @brief Record a submitted batch.
     * @details Every declared slot is checked and the results buffer grown
     *          before anything else changes. On failure the batch's futures
     *          are cancelled and the shared state is left as it was.
     * @return The new offset.
     * @throws std::invalid_argument if a slot id cannot index a buffer.
     */
    size_t record_submissions(std::vector<Submission> submissions);

    /**
     * @brief Every future submitted so far, handled or not, in submission order.
     */
    std::vector<TaskFuturePtr> accumulated_futures() const;

    /**
     * @brief Scatter the outputs of newly completed futures into the results buffer.
     * @details Futures handled earlier and futures that are not done are skipped.
     * @return Feedback built from every slot filled so far.
     */
    Feedback handle_completed(
        const std::vector<TaskFuturePtr>& accumulated,
        const std::vector<TaskFuturePtr>& completed);

    // Require m_mutex.
    void scatter_locked(size_t task_idx, std::vector<SlotValue> outputs);
    void record_failure_locked(size_t task_idx, const std::string& message);
    void abort_locked(const std::string& message);
    Feedback feedback_locked() const;
    bool is_terminal_locked() const noexcept
    {
        return m_shared.state == JobState::Finished ||
               m_shared.state == JobState::Cancelled;
    }

    /**
     * @brief Enter a terminal state and notify waiters.
     */
    void finish();

    const Id m_id;
    const std::string m_name;
    const ContextPtr m_context;

    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
    SharedState m_shared;

    std::mutex m_join_mutex;
    std::thread m_worker;
};

/**
 * @brief Create a Pending job.
 */
inline JobPtr make_job(ContextPtr context, JobConfig config = {})
{
    return std::make_shared<Job>(std::move(context), std::move(config));
}

} // namespace genjob
