#include "genjob/execution/single_threaded_executor.hpp"

namespace genjob
{

SingleThreadedExecutor::SingleThreadedExecutor(ExecutorConfig config)
    : Executor(std::move(config))
{}

std::vector<Submission> SingleThreadedExecutor::submit_all(
    const WorkFunction& fn, const std::vector<Task>& tasks)
{
    std::vector<Submission> submissions;
    submissions.reserve(tasks.size());

    for (const auto& task : tasks)
    {
        auto future = std::make_shared<TaskFuture>();
        if (stop_requested())
        {
            future->cancel();
        }
        else
        {
            run_task(fn, task.input, *future);
        }
        submissions.push_back(Submission{task.slots, std::move(future)});
    }

    return submissions;
}

} // namespace genjob
