#include "genjob/execution/executor.hpp"

namespace genjob
{

Executor::Executor(ExecutorConfig config)
    : m_config{std::move(config)}
{}

Awaiter Executor::get_awaiter()
{
    return &Executor::wait_for_futures;
}

void Executor::request_stop()
{
    m_stop_requested.store(true, std::memory_order_release);
}

bool Executor::stop_requested() const noexcept
{
    return m_stop_requested.load(std::memory_order_acquire);
}

std::vector<TaskFuturePtr> Executor::wait_for_futures(
    const std::vector<TaskFuturePtr>& futures, const WaitLimits& limits)
{
    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (limits.timeout)
    {
        deadline = std::chrono::steady_clock::now() + *limits.timeout;
    }

    size_t target = std::min(limits.count, futures.size());
    if (target > 0)
    {
        // A future that is complete at attach time counts immediately and is
        // not attached; every attached one notifies exactly once.
        auto waiter = std::make_shared<FutureWaiter>();
        size_t already_done = 0;
        std::vector<TaskFuturePtr> attached;
        attached.reserve(futures.size());
        for (const auto& future : futures)
        {
            if (future->add_waiter(waiter))
            {
                attached.push_back(future);
            }
            else
            {
                ++already_done;
            }
        }

        if (already_done < target)
        {
            waiter->wait(target - already_done, deadline);
        }

        for (const auto& future : attached)
        {
            future->remove_waiter(waiter);
        }
    }

    std::vector<TaskFuturePtr> completed;
    for (const auto& future : futures)
    {
        if (future->done())
        {
            completed.push_back(future);
        }
    }
    return completed;
}

void Executor::run_task(
    const WorkFunction& fn, const SlotValue& input, TaskFuture& future)
{
    if (!future.try_begin())
    {
        return;
    }

    std::vector<SlotValue> outputs;
    try
    {
        outputs = fn(input);
    }
    catch (...)
    {
        future.set_exception(std::current_exception());
        return;
    }
    future.set_outputs(std::move(outputs));
}

} // namespace genjob
