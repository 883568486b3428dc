/**
 * @file single_threaded_executor.hpp
 * @brief SingleThreadedExecutor for sequential, inline task execution.
 */
#pragma once
#include "genjob/execution/executor.hpp"

namespace genjob
{

/**
 * @brief Inline executor for debugging and testing.
 *
 * @details
 * Runs every task of a batch inside submit_all(), in submission order, on
 * the calling thread. All returned futures are complete. Useful for:
 * - Debugging job policies without thread complexity
 * - Deterministic tests
 *
 * @par Thread Safety
 * - submit_all() may be called from several threads; batches then run
 *   concurrently, each on its caller's thread.
 * - request_stop() can be called from any thread; later batches are
 *   returned with cancelled futures.
 */
class SingleThreadedExecutor : public Executor
{
public:
    /**
     * @brief Construct a single-threaded executor.
     * @param config Configuration (thread_count ignored).
     */
    explicit SingleThreadedExecutor(ExecutorConfig config = {});

    std::vector<Submission> submit_all(
        const WorkFunction& fn, const std::vector<Task>& tasks) override;
};

/**
 * @brief Factory function to create a SingleThreadedExecutor.
 */
inline std::shared_ptr<SingleThreadedExecutor> make_single_threaded_executor(
    ExecutorConfig config = {})
{
    return std::make_shared<SingleThreadedExecutor>(std::move(config));
}

} // namespace genjob
