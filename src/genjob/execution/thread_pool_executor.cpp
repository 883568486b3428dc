#include "genjob/execution/thread_pool_executor.hpp"
#include "genjob/common/logger.hpp"

namespace genjob
{

ThreadPoolExecutor::ThreadPoolExecutor(ExecutorConfig config)
    : Executor(std::move(config))
{
    size_t count = m_config.thread_count;
    if (count == 0)
    {
        count = std::max<size_t>(1, std::thread::hardware_concurrency());
    }

    try
    {
        m_workers.reserve(count);
        for (size_t i = 0; i < count; ++i)
        {
            m_workers.emplace_back(&ThreadPoolExecutor::worker_loop, this, i);
        }
    }
    catch (...)
    {
        shutdown();
        throw;
    }

    GENJOB_LOG_DEBUG("Thread pool started with " + std::to_string(count) + " workers");
}

ThreadPoolExecutor::~ThreadPoolExecutor()
{
    shutdown();
}

std::vector<Submission> ThreadPoolExecutor::submit_all(
    const WorkFunction& fn, const std::vector<Task>& tasks)
{
    std::vector<Submission> submissions;
    submissions.reserve(tasks.size());
    for (const auto& task : tasks)
    {
        submissions.push_back(Submission{task.slots, std::make_shared<TaskFuture>()});
    }

    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        if (!stop_requested())
        {
            for (size_t i = 0; i < tasks.size(); ++i)
            {
                m_queue.push_back(QueuedCall{fn, tasks[i].input, submissions[i].future});
            }
        }
    }

    if (stop_requested())
    {
        // Calls that did make it into the queue were cancelled by request_stop().
        for (auto& submission : submissions)
        {
            submission.future->cancel();
        }
        return submissions;
    }

    m_call_available.notify_all();
    return submissions;
}

void ThreadPoolExecutor::request_stop()
{
    std::deque<QueuedCall> abandoned;
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        Executor::request_stop();
        abandoned.swap(m_queue);
    }
    m_call_available.notify_all();

    for (auto& call : abandoned)
    {
        call.future->cancel();
    }
    if (!abandoned.empty())
    {
        GENJOB_LOG_DEBUG("Thread pool cancelled " + std::to_string(abandoned.size()) +
                         " queued calls");
    }
}

void ThreadPoolExecutor::shutdown()
{
    std::lock_guard<std::mutex> lock(m_shutdown_mutex);
    request_stop();

    for (auto& worker : m_workers)
    {
        if (worker.joinable())
        {
            worker.join();
        }
    }
}

size_t ThreadPoolExecutor::queue_size() const
{
    std::lock_guard<std::mutex> lock(m_queue_mutex);
    return m_queue.size();
}

void ThreadPoolExecutor::worker_loop(size_t worker_idx)
{
    set_thread_name("pool-" + std::to_string(worker_idx));

    while (true)
    {
        QueuedCall call;
        {
            std::unique_lock<std::mutex> lock(m_queue_mutex);
            m_call_available.wait(lock, [this] {
                return !m_queue.empty() || stop_requested();
            });
            if (stop_requested())
            {
                break;
            }
            call = std::move(m_queue.front());
            m_queue.pop_front();
        }

        // Failures of the work function are captured in the future.
        run_task(call.fn, call.input, *call.future);
    }

    clear_thread_name();
}

} // namespace genjob
