#include "genjob/execution/task_future.hpp"
#include "genjob/common/genjob_exceptions.hpp"

namespace genjob
{

void FutureWaiter::notify_completion() noexcept
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_completed;
    }
    m_cv.notify_all();
}

bool FutureWaiter::wait(
    size_t target,
    std::optional<std::chrono::steady_clock::time_point> deadline)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    auto reached = [this, target] { return m_completed >= target; };
    if (!deadline)
    {
        m_cv.wait(lock, reached);
        return true;
    }
    return m_cv.wait_until(lock, *deadline, reached);
}

bool TaskFuture::cancel()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_state == FutureState::Cancelled)
    {
        return true;
    }
    if (m_state != FutureState::Pending)
    {
        return false;
    }
    complete(lock, FutureState::Cancelled);
    return true;
}

bool TaskFuture::done() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return is_terminal(m_state);
}

bool TaskFuture::cancelled() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state == FutureState::Cancelled;
}

FutureState TaskFuture::state() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

std::vector<SlotValue> TaskFuture::result(std::chrono::nanoseconds timeout) const
{
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!is_terminal(m_state) && timeout > std::chrono::nanoseconds{0})
    {
        m_cv.wait_for(lock, timeout, [this] { return is_terminal(m_state); });
    }

    switch (m_state)
    {
        case FutureState::Succeeded:
            return m_outputs;
        case FutureState::Failed:
            std::rethrow_exception(m_exception);
        case FutureState::Cancelled:
            throw TaskCancelledError{};
        case FutureState::Pending:
        case FutureState::Running:
            break;
    }
    throw TaskTimeoutError{};
}

bool TaskFuture::add_waiter(const FutureWaiterPtr& waiter)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (is_terminal(m_state))
    {
        return false;
    }
    m_waiters.push_back(waiter);
    return true;
}

void TaskFuture::remove_waiter(const FutureWaiterPtr& waiter)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::find(m_waiters.begin(), m_waiters.end(), waiter);
    if (it != m_waiters.end())
    {
        m_waiters.erase(it);
    }
}

bool TaskFuture::try_begin()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state != FutureState::Pending)
    {
        return false;
    }
    m_state = FutureState::Running;
    return true;
}

void TaskFuture::set_outputs(std::vector<SlotValue> outputs)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_state != FutureState::Running)
    {
        throw std::logic_error("TaskFuture::set_outputs: future is not running");
    }
    m_outputs = std::move(outputs);
    complete(lock, FutureState::Succeeded);
}

void TaskFuture::set_exception(std::exception_ptr error)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_state != FutureState::Running)
    {
        throw std::logic_error("TaskFuture::set_exception: future is not running");
    }
    m_exception = std::move(error);
    complete(lock, FutureState::Failed);
}

void TaskFuture::complete(std::unique_lock<std::mutex>& lock, FutureState terminal)
{
    m_state = terminal;
    std::vector<FutureWaiterPtr> waiters;
    waiters.swap(m_waiters);
    lock.unlock();

    m_cv.notify_all();
    for (const auto& waiter : waiters)
    {
        waiter->notify_completion();
    }
}

} // namespace genjob
