/**
 * @file first_completed.hpp
 * @brief Wait for the first of several jobs to reach a terminal state.
 */
#pragma once
#include "genjob/common/common.hpp"
#include "genjob/job/job.hpp"

namespace genjob
{

/**
 * @brief Block until at least one of `jobs` is Finished or Cancelled.
 *
 * @details
 * If some jobs are already terminal, returns them immediately. Otherwise
 * waits up to `timeout` and returns every job that reached a terminal state
 * while the call was waiting. Several jobs may be returned when they end in
 * the same window; an empty vector means the timeout elapsed.
 *
 * Job locks are always taken in ascending Job::id() order, so concurrent
 * calls over overlapping job sets cannot deadlock. Duplicate entries in
 * `jobs` are ignored.
 *
 * @throws std::invalid_argument if `jobs` contains a null pointer.
 */
std::vector<JobPtr> first_completed(
    const std::vector<JobPtr>& jobs, Timeout timeout = std::nullopt);

/**
 * @brief One-shot trigger shared by the jobs of one first_completed() call.
 *
 * @details
 * Each job holds the waiter while the call runs and hands itself to
 * add_result() when its worker ends. The first add_result() releases wait();
 * later ones keep accumulating.
 *
 * @par Thread Safety
 * - add_result() may be called from any thread.
 */
class JobWaiter
{
public:
    void add_result(JobPtr job);

    /**
     * @brief Block until triggered or until `timeout` elapses.
     * @return True if triggered.
     */
    bool wait(Timeout timeout);

    /**
     * @brief Jobs reported so far, in the order they ended.
     */
    std::vector<JobPtr> finished_jobs() const;

private:
    friend std::vector<JobPtr> first_completed(const std::vector<JobPtr>&, Timeout);

    // Access to Job internals. Callers must hold the job's lock where noted.
    static std::mutex& mutex_of(Job& job) noexcept
    {
        return job.m_mutex;
    }
    static bool is_terminal_locked(const Job& job) noexcept
    {
        return job.is_terminal_locked();
    }
    static void install_locked(Job& job, const std::shared_ptr<JobWaiter>& waiter);
    static void remove(Job& job, const std::shared_ptr<JobWaiter>& waiter);

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_triggered{false};
    std::vector<JobPtr> m_finished_jobs;
};

} // namespace genjob
