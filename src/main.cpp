#include "genjob/common/logger.hpp"
#include "genjob/common/slot_value.inline.hpp"
#include "genjob/execution/thread_pool_executor.hpp"
#include "genjob/job/context.hpp"
#include "genjob/job/job.hpp"
#include <cstdlib>
#include <iostream>
#include <stdexcept>

using namespace genjob;

int main(int argc, char** argv)
{
    try
    {
        std::cout << "\n\n====== genjob ======\n" << std::flush;

        // Squares 0..7 in generations of two tasks each.
        constexpr size_t task_limit = 8;
        constexpr size_t batch_size = 2;

        ContextCallbacks callbacks;
        callbacks.executor = make_thread_pool_executor(ExecutorConfig{4});
        callbacks.function = [](const SlotValue& input) {
            int x = input.as<int>();
            return std::vector<SlotValue>{SlotValue::of(x * x)};
        };
        callbacks.next_tasks = [=](const Feedback&, size_t offset) {
            std::vector<Task> tasks;
            for (size_t i = offset; i < std::min(offset + batch_size, task_limit); ++i)
            {
                tasks.push_back(make_task(i, SlotValue::of(static_cast<int>(i))));
            }
            return tasks;
        };

        JobPtr job = make_job(make_callback_context(std::move(callbacks)));
        job->start();
        std::vector<SlotValue> results = job->result();
        job->join();

        for (size_t slot = 0; slot < results.size(); ++slot)
        {
            std::cout << "slot " << slot << ": ";
            if (const int* value = results[slot].try_as<int>())
            {
                std::cout << *value;
            }
            else
            {
                std::cout << "<empty>";
            }
            std::cout << "\n";
        }
        std::cout << job->stats().summary() << "\n";

        std::cout << "\n\n====== normal exit ======\n" << std::flush;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        std::cout << "\n\n====== abnormal exit ======\n" << std::flush;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
