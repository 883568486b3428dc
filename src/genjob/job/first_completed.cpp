#include "genjob/job/first_completed.hpp"

namespace genjob
{

void JobWaiter::add_result(JobPtr job)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_finished_jobs.push_back(std::move(job));
        m_triggered = true;
    }
    m_cv.notify_all();
}

bool JobWaiter::wait(Timeout timeout)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    auto triggered = [this] { return m_triggered; };
    if (!timeout)
    {
        m_cv.wait(lock, triggered);
        return true;
    }
    return m_cv.wait_for(lock, *timeout, triggered);
}

std::vector<JobPtr> JobWaiter::finished_jobs() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_finished_jobs;
}

void JobWaiter::install_locked(Job& job, const std::shared_ptr<JobWaiter>& waiter)
{
    job.m_shared.waiters.push_back(waiter);
}

void JobWaiter::remove(Job& job, const std::shared_ptr<JobWaiter>& waiter)
{
    std::lock_guard<std::mutex> lock(job.m_mutex);
    auto& waiters = job.m_shared.waiters;
    auto it = std::find(waiters.begin(), waiters.end(), waiter);
    if (it != waiters.end())
    {
        waiters.erase(it);
    }
}

std::vector<JobPtr> first_completed(const std::vector<JobPtr>& jobs, Timeout timeout)
{
    std::vector<JobPtr> ordered = jobs;
    if (std::any_of(ordered.begin(), ordered.end(),
                    [](const JobPtr& job) { return !job; }))
    {
        throw std::invalid_argument("first_completed: null job");
    }
    std::sort(ordered.begin(), ordered.end(),
        [](const JobPtr& a, const JobPtr& b) { return a->id() < b->id(); });
    ordered.erase(
        std::unique(ordered.begin(), ordered.end(),
            [](const JobPtr& a, const JobPtr& b) { return a->id() == b->id(); }),
        ordered.end());

    auto waiter = std::make_shared<JobWaiter>();
    {
        std::vector<std::unique_lock<std::mutex>> locks;
        locks.reserve(ordered.size());
        for (const auto& job : ordered)
        {
            locks.emplace_back(JobWaiter::mutex_of(*job));
        }

        std::vector<JobPtr> done;
        for (const auto& job : ordered)
        {
            if (JobWaiter::is_terminal_locked(*job))
            {
                done.push_back(job);
            }
        }
        if (!done.empty())
        {
            return done;
        }

        for (const auto& job : ordered)
        {
            JobWaiter::install_locked(*job, waiter);
        }
    }

    waiter->wait(timeout);

    for (const auto& job : ordered)
    {
        JobWaiter::remove(*job, waiter);
    }
    return waiter->finished_jobs();
}

} // namespace genjob
