#include "genjob/job/job.hpp"
#include "genjob/common/genjob_exceptions.hpp"
#include "genjob/common/logger.hpp"
#include "genjob/job/first_completed.hpp"
#include <unordered_map>

namespace genjob
{

namespace
{

std::atomic<Job::Id> g_next_job_id{1};

std::string make_job_name(const JobConfig& config, Job::Id id)
{
    if (!config.name.empty())
    {
        return config.name;
    }
    return "job-" + std::to_string(id);
}

} // namespace

const char* to_string(JobState state) noexcept
{
    switch (state)
    {
        case JobState::Pending: return "Pending";
        case JobState::Running: return "Running";
        case JobState::Finished: return "Finished";
        case JobState::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

std::string JobStats::summary() const
{
    std::string result = "generations=" + std::to_string(generations);
    result += ", submitted=" + std::to_string(tasks_submitted);
    result += ", succeeded=" + std::to_string(tasks_succeeded);
    result += ", failed=" + std::to_string(tasks_failed);
    result += ", cancelled=" + std::to_string(tasks_cancelled);
    return result;
}

Job::Job(ContextPtr context, JobConfig config)
    : m_id{g_next_job_id.fetch_add(1, std::memory_order_relaxed)}
    , m_name{make_job_name(config, m_id)}
    , m_context{std::move(context)}
{
    if (!m_context)
    {
        throw std::invalid_argument("Job: context must not be null");
    }
}

Job::~Job()
{
    if (!m_worker.joinable())
    {
        return;
    }
    if (m_worker.get_id() == std::this_thread::get_id())
    {
        // The worker released the last reference while finishing.
        m_worker.detach();
        return;
    }
    cancel();
    m_worker.join();
}

Job& Job::start()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_shared.state != JobState::Pending)
    {
        throw JobError(JobErrorCode::AlreadyStarted,
            "Job " + m_name + " is already " + to_string(m_shared.state));
    }

    // The worker blocks on m_mutex until the state below is visible.
    m_worker = std::thread(&Job::process, this);
    m_shared.state = JobState::Running;
    return *this;
}

CancelOutcome Job::cancel()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    switch (m_shared.state)
    {
        case JobState::Finished:
        case JobState::Cancelled:
            return CancelOutcome::AlreadyTerminal;
        case JobState::Pending:
            GENJOB_LOG_DEBUG("Job " + m_name + " cancelled before start; ignored");
            return CancelOutcome::NotStarted;
        case JobState::Running:
            break;
    }

    m_shared.state = JobState::Cancelled;
    for (const auto& future : m_shared.futures)
    {
        future->cancel();
    }
    m_cv.notify_all();
    GENJOB_LOG_DEBUG("Job " + m_name + " cancelled");
    return CancelOutcome::CancellationIssued;
}

bool Job::cancelled() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_shared.state == JobState::Cancelled;
}

bool Job::running() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_shared.state == JobState::Running;
}

bool Job::done() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return is_terminal_locked();
}

JobState Job::state() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_shared.state;
}

std::vector<SlotValue> Job::result(Timeout timeout) const
{
    std::unique_lock<std::mutex> lock(m_mutex);
    auto terminal = [this] { return is_terminal_locked(); };
    if (!terminal())
    {
        if (timeout)
        {
            m_cv.wait_for(lock, *timeout, terminal);
        }
        else
        {
            m_cv.wait(lock, terminal);
        }
    }

    if (m_shared.state == JobState::Cancelled)
    {
        throw JobError(JobErrorCode::Cancelled, "Job " + m_name + " was cancelled");
    }
    if (m_shared.state == JobState::Finished)
    {
        return m_shared.results;
    }
    throw JobError(JobErrorCode::TimedOut,
        "Job " + m_name + " did not finish within the timeout");
}

void Job::join()
{
    std::lock_guard<std::mutex> join_lock(m_join_mutex);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shared.state == JobState::Pending)
        {
            return;
        }
    }
    if (m_worker.joinable())
    {
        m_worker.join();
    }
}

size_t Job::offset() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_shared.offset;
}

JobStats Job::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_shared.stats;
}

void Job::process()
{
    set_thread_name(m_name);
    GENJOB_LOG_DEBUG("Job " + m_name + " started");

    try
    {
        run_generations();
    }
    catch (const std::exception& e)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        abort_locked(e.what());
    }
    catch (...)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        abort_locked("unknown exception");
    }

    finish();
    clear_thread_name();
}

void Job::run_generations()
{
    WorkFunction fn = m_context->function();
    std::shared_ptr<IExecutor> executor = m_context->executor();
    if (!fn || !executor)
    {
        throw std::invalid_argument("context provided no work function or executor");
    }
    Awaiter awaiter = executor->get_awaiter();

    Feedback feedback;
    std::vector<Task> tasks = m_context->next_tasks(feedback, 0);

    while (running() && !tasks.empty())
    {
        std::vector<Submission> submissions = executor->submit_all(fn, tasks);
        if (submissions.size() != tasks.size())
        {
            throw std::runtime_error("executor returned " +
                std::to_string(submissions.size()) + " submissions for " +
                std::to_string(tasks.size()) + " tasks");
        }
        size_t offset = record_submissions(std::move(submissions));

        WaitLimits limits = m_context->wait_policy(feedback, offset);
        std::vector<TaskFuturePtr> accumulated = accumulated_futures();
        std::vector<TaskFuturePtr> completed = awaiter(accumulated, limits);
        feedback = handle_completed(accumulated, completed);

        tasks = m_context->next_tasks(feedback, offset);
    }
}

size_t Job::record_submissions(std::vector<Submission> submissions)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    try
    {
        size_t needed = m_shared.results.size();
        const size_t max_slots = m_shared.results.max_size();
        for (const auto& submission : submissions)
        {
            for (SlotIdx slot : submission.slots)
            {
                if (slot >= max_slots)
                {
                    throw std::invalid_argument("slot id " + std::to_string(slot) +
                        " exceeds the results buffer limit");
                }
                needed = std::max(needed, slot + 1);
            }
        }
        m_shared.results.resize(needed);
    }
    catch (...)
    {
        for (const auto& submission : submissions)
        {
            submission.future->cancel();
        }
        throw;
    }

    m_shared.offset += submissions.size();
    m_shared.stats.generations += 1;
    m_shared.stats.tasks_submitted += submissions.size();

    for (auto& submission : submissions)
    {
        // A batch that lands after cancel() must not keep running.
        if (m_shared.state == JobState::Cancelled)
        {
            submission.future->cancel();
        }
        m_shared.slot_groups.push_back(std::move(submission.slots));
        m_shared.futures.push_back(std::move(submission.future));
        m_shared.handled.push_back(false);
    }

    GENJOB_LOG_TRACE("Job " + m_name + " submitted generation " +
        std::to_string(m_shared.stats.generations) + ", offset " +
        std::to_string(m_shared.offset));
    return m_shared.offset;
}

std::vector<TaskFuturePtr> Job::accumulated_futures() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_shared.futures;
}

Feedback Job::handle_completed(
    const std::vector<TaskFuturePtr>& accumulated,
    const std::vector<TaskFuturePtr>& completed)
{
    std::unordered_map<const TaskFuture*, size_t> index_of;
    for (size_t i = 0; i < accumulated.size(); ++i)
    {
        index_of.emplace(accumulated[i].get(), i);
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& future : completed)
    {
        auto it = index_of.find(future.get());
        if (it == index_of.end() || m_shared.handled[it->second] || !future->done())
        {
            continue;
        }
        size_t task_idx = it->second;
        m_shared.handled[task_idx] = true;

        // Checked under the same lock as the scatter, so no output lands
        // after cancel() returned.
        if (m_shared.state != JobState::Running)
        {
            continue;
        }

        try
        {
            scatter_locked(task_idx, future->result());
        }
        catch (const TaskCancelledError&)
        {
            m_shared.stats.tasks_cancelled += 1;
        }
        catch (const std::exception& e)
        {
            record_failure_locked(task_idx, e.what());
        }
        catch (...)
        {
            record_failure_locked(task_idx, "unknown exception");
        }
    }
    return feedback_locked();
}

void Job::scatter_locked(size_t task_idx, std::vector<SlotValue> outputs)
{
    const auto& slots = m_shared.slot_groups[task_idx];
    if (outputs.size() != slots.size())
    {
        record_failure_locked(task_idx, "produced " + std::to_string(outputs.size()) +
            " outputs for " + std::to_string(slots.size()) + " slots");
        return;
    }

    for (size_t j = 0; j < slots.size(); ++j)
    {
        SlotValue& target = m_shared.results[slots[j]];
        if (target.has_value())
        {
            GENJOB_LOG_WARN("Job " + m_name + ": task " + std::to_string(task_idx) +
                " tried to overwrite slot " + std::to_string(slots[j]));
            continue;
        }
        target = std::move(outputs[j]);
    }
    m_shared.stats.tasks_succeeded += 1;
}

void Job::record_failure_locked(size_t task_idx, const std::string& message)
{
    m_shared.stats.tasks_failed += 1;
    m_shared.stats.error_messages.push_back(
        "task " + std::to_string(task_idx) + ": " + message);
    GENJOB_LOG_ERROR("Job " + m_name + ": task " + std::to_string(task_idx) +
        " failed: " + message);
}

void Job::abort_locked(const std::string& message)
{
    GENJOB_LOG_ERROR("Job " + m_name + " aborted: " + message);
    m_shared.stats.error_messages.push_back("job: " + message);
    if (m_shared.state != JobState::Running)
    {
        return;
    }
    m_shared.state = JobState::Cancelled;
    for (const auto& future : m_shared.futures)
    {
        future->cancel();
    }
}

Feedback Job::feedback_locked() const
{
    Feedback feedback;
    for (SlotIdx slot = 0; slot < m_shared.results.size(); ++slot)
    {
        if (m_shared.results[slot].has_value())
        {
            feedback.push_back(FeedbackEntry{slot, m_shared.results[slot]});
        }
    }
    return feedback;
}

void Job::finish()
{
    // Null only while the destructor runs; no waiter can be registered then
    // because first_completed() holds a JobPtr for every job it waits on.
    JobPtr self = weak_from_this().lock();

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_shared.state == JobState::Running)
    {
        m_shared.state = JobState::Finished;
    }
    if (self)
    {
        for (const auto& waiter : m_shared.waiters)
        {
            waiter->add_result(self);
        }
    }
    m_cv.notify_all();

    GENJOB_LOG_DEBUG("Job " + m_name + " " + to_string(m_shared.state) +
        " (" + m_shared.stats.summary() + ")");
}

} // namespace genjob
