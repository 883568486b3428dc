/**
 * @file context.hpp
 * @brief IContext, the policy collaborator that drives a Job.
 */
#pragma once
#include "genjob/common/common.hpp"
#include "genjob/common/slot_value.hpp"
#include "genjob/execution/executor.hpp"
#include "genjob/execution/task.hpp"

namespace genjob
{

/**
 * @brief One filled result slot as seen by a policy.
 */
struct FeedbackEntry
{
    SlotIdx slot;
    SlotValue value;
};

/**
 * @brief Every result slot filled so far, in ascending slot order.
 */
using Feedback = std::vector<FeedbackEntry>;

/**
 * @brief Policy collaborator deciding what a Job runs and how long it waits.
 *
 * @details
 * A Job never produces tasks or wait thresholds itself; it asks its context
 * once per generation. `offset` is the number of tasks the job submitted so
 * far across all generations.
 *
 * @par Thread Safety
 * - All members are called from the job's worker thread only, never while
 *   the job's lock is held.
 * - A context shared by several jobs must synchronize itself.
 */
class IContext
{
public:
    virtual ~IContext() = default;

    /**
     * @brief Produce the next batch of tasks.
     * @return The tasks to submit; an empty vector ends the job.
     */
    virtual std::vector<Task> next_tasks(const Feedback& feedback, size_t offset) = 0;

    /**
     * @brief Decide how many of the accumulated futures to wait for, and for how long.
     */
    virtual WaitLimits wait_policy(const Feedback& feedback, size_t offset) = 0;

    virtual WorkFunction function() = 0;

    virtual std::shared_ptr<IExecutor> executor() = 0;
};

using ContextPtr = std::shared_ptr<IContext>;

/**
 * @brief Callbacks assembled into a CallbackContext.
 */
struct ContextCallbacks
{
    std::function<std::vector<Task>(const Feedback&, size_t)> next_tasks;
    std::function<WaitLimits(const Feedback&, size_t)> wait_policy;
    WorkFunction function;
    std::shared_ptr<IExecutor> executor;
};

/**
 * @brief IContext built from plain callables.
 *
 * @details
 * A missing `wait_policy` waits for every accumulated future without a
 * timeout.
 */
class CallbackContext : public IContext
{
public:
    /**
     * @throws std::invalid_argument if next_tasks, function or executor is missing.
     */
    explicit CallbackContext(ContextCallbacks callbacks);

    std::vector<Task> next_tasks(const Feedback& feedback, size_t offset) override;
    WaitLimits wait_policy(const Feedback& feedback, size_t offset) override;
    WorkFunction function() override;
    std::shared_ptr<IExecutor> executor() override;

private:
    ContextCallbacks m_callbacks;
};

/**
 * @brief Factory function to create a CallbackContext.
 */
inline ContextPtr make_callback_context(ContextCallbacks callbacks)
{
    return std::make_shared<CallbackContext>(std::move(callbacks));
}

} // namespace genjob
