#include "genjob/job/context.hpp"

namespace genjob
{

CallbackContext::CallbackContext(ContextCallbacks callbacks)
    : m_callbacks{std::move(callbacks)}
{
    if (!m_callbacks.next_tasks)
    {
        throw std::invalid_argument("CallbackContext: next_tasks is required");
    }
    if (!m_callbacks.function)
    {
        throw std::invalid_argument("CallbackContext: function is required");
    }
    if (!m_callbacks.executor)
    {
        throw std::invalid_argument("CallbackContext: executor is required");
    }
}

std::vector<Task> CallbackContext::next_tasks(const Feedback& feedback, size_t offset)
{
    return m_callbacks.next_tasks(feedback, offset);
}

WaitLimits CallbackContext::wait_policy(const Feedback& feedback, size_t offset)
{
    if (!m_callbacks.wait_policy)
    {
        return WaitLimits{};
    }
    return m_callbacks.wait_policy(feedback, offset);
}

WorkFunction CallbackContext::function()
{
    return m_callbacks.function;
}

std::shared_ptr<IExecutor> CallbackContext::executor()
{
    return m_callbacks.executor;
}

} // namespace genjob
