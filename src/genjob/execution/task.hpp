/**
 * @file task.hpp
 * @brief Task and WorkFunction, the units handed to executors.
 */
#pragma once
#include "genjob/common/common.hpp"
#include "genjob/common/slot_value.hpp"

namespace genjob
{

/**
 * @brief Type alias for result slot positions.
 *
 * @details
 * `SlotIdx` identifies one position in a job's results buffer. Slot ids are
 * absolute across all generations of a job.
 */
using SlotIdx = size_t;

/**
 * @brief The unit of work run by an executor.
 *
 * @details
 * The work function receives one SlotValue input and returns one SlotValue
 * per destination slot of the task, in the order the task declares them.
 * It may throw; the exception is captured in the task's future.
 */
using WorkFunction = std::function<std::vector<SlotValue>(const SlotValue& input)>;

/**
 * @brief One unit of work together with the result slots it fills.
 *
 * @details
 * `slots[j]` receives output `j` of the work function when the task
 * succeeds. A task may declare any number of slots, including none.
 */
struct Task
{
    std::vector<SlotIdx> slots;
    SlotValue input;
};

/**
 * @brief Convenience factory for a single-slot task.
 */
inline Task make_task(SlotIdx slot, SlotValue input)
{
    return Task{std::vector<SlotIdx>{slot}, std::move(input)};
}

} // namespace genjob
