#include <gtest/gtest.h>
#include "genjob/common/slot_value.inline.hpp"
#include "genjob/execution/single_threaded_executor.hpp"
#include "genjob/execution/thread_pool_executor.hpp"
#include <atomic>

using namespace genjob;
using namespace std::chrono_literals;

// =============================================================================
// Test Fixture
// =============================================================================

class ExecutorTests : public ::testing::Test
{
protected:
    static WorkFunction doubler()
    {
        return [](const SlotValue& input) {
            return std::vector<SlotValue>{SlotValue::of(input.as<int>() * 2)};
        };
    }

    static std::vector<Task> make_tasks(int count)
    {
        std::vector<Task> tasks;
        for (int i = 0; i < count; ++i)
        {
            tasks.push_back(make_task(static_cast<SlotIdx>(i), SlotValue::of(i)));
        }
        return tasks;
    }

    static TaskFuturePtr pending_future()
    {
        return std::make_shared<TaskFuture>();
    }

    static TaskFuturePtr completed_future()
    {
        auto future = std::make_shared<TaskFuture>();
        future->try_begin();
        future->set_outputs({});
        return future;
    }
};

// =============================================================================
// SingleThreadedExecutor Tests
// =============================================================================

TEST_F(ExecutorTests, SingleThreaded_RunsInlineInOrder)
{
    auto executor = make_single_threaded_executor();
    std::vector<int> order;
    WorkFunction fn = [&order](const SlotValue& input) {
        order.push_back(input.as<int>());
        return std::vector<SlotValue>{SlotValue::of(input.as<int>())};
    };

    auto submissions = executor->submit_all(fn, make_tasks(3));

    ASSERT_EQ(submissions.size(), 3u);
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2}));
    for (size_t i = 0; i < submissions.size(); ++i)
    {
        EXPECT_EQ(submissions[i].slots, (std::vector<SlotIdx>{i}));
        EXPECT_TRUE(submissions[i].future->done());
    }
}

TEST_F(ExecutorTests, SingleThreaded_CapturesTaskException)
{
    auto executor = make_single_threaded_executor();
    WorkFunction fn = [](const SlotValue&) -> std::vector<SlotValue> {
        throw std::runtime_error("task failed");
    };

    auto submissions = executor->submit_all(fn, make_tasks(1));
    ASSERT_EQ(submissions.size(), 1u);
    EXPECT_EQ(submissions[0].future->state(), FutureState::Failed);
    EXPECT_THROW((void)submissions[0].future->result(), std::runtime_error);
}

TEST_F(ExecutorTests, SingleThreaded_AfterStop_ReturnsCancelledFutures)
{
    auto executor = make_single_threaded_executor();
    executor->request_stop();
    EXPECT_TRUE(executor->stop_requested());

    auto submissions = executor->submit_all(doubler(), make_tasks(2));
    ASSERT_EQ(submissions.size(), 2u);
    EXPECT_TRUE(submissions[0].future->cancelled());
    EXPECT_TRUE(submissions[1].future->cancelled());
}

// =============================================================================
// wait_for_futures Tests
// =============================================================================

TEST_F(ExecutorTests, WaitForFutures_CountAlreadySatisfied_ReturnsAtOnce)
{
    auto done = completed_future();
    auto pending = pending_future();

    auto completed = Executor::wait_for_futures({pending, done}, WaitLimits{1, std::nullopt});
    ASSERT_EQ(completed.size(), 1u);
    EXPECT_EQ(completed[0], done);
}

TEST_F(ExecutorTests, WaitForFutures_TimeoutWithNothingComplete_ReturnsEmpty)
{
    auto completed = Executor::wait_for_futures(
        {pending_future(), pending_future()}, WaitLimits{WaitLimits::all, 10ms});
    EXPECT_TRUE(completed.empty());
}

TEST_F(ExecutorTests, WaitForFutures_ZeroCount_DoesNotWait)
{
    auto done = completed_future();
    auto completed = Executor::wait_for_futures(
        {pending_future(), done}, WaitLimits{0, std::nullopt});
    ASSERT_EQ(completed.size(), 1u);
    EXPECT_EQ(completed[0], done);
}

TEST_F(ExecutorTests, WaitForFutures_WaitsForLateCompletion)
{
    auto late = pending_future();
    late->try_begin();
    std::thread producer([late] {
        std::this_thread::sleep_for(5ms);
        late->set_outputs({});
    });

    auto completed = Executor::wait_for_futures({late}, WaitLimits{});
    producer.join();
    ASSERT_EQ(completed.size(), 1u);
    EXPECT_EQ(completed[0], late);
}

TEST_F(ExecutorTests, WaitForFutures_PreservesInputOrder)
{
    auto a = completed_future();
    auto b = completed_future();
    auto c = completed_future();
    auto completed = Executor::wait_for_futures({c, a, b}, WaitLimits{});
    EXPECT_EQ(completed, (std::vector<TaskFuturePtr>{c, a, b}));
}

// =============================================================================
// ThreadPoolExecutor Tests
// =============================================================================

TEST_F(ExecutorTests, ThreadPool_RunsAllTasks)
{
    auto executor = make_thread_pool_executor(ExecutorConfig{3});
    EXPECT_EQ(executor->worker_count(), 3u);

    auto submissions = executor->submit_all(doubler(), make_tasks(10));
    std::vector<TaskFuturePtr> futures;
    for (const auto& submission : submissions)
    {
        futures.push_back(submission.future);
    }

    auto completed = executor->get_awaiter()(futures, WaitLimits{});
    ASSERT_EQ(completed.size(), 10u);
    for (int i = 0; i < 10; ++i)
    {
        EXPECT_EQ(futures[i]->result()[0].as<int>(), i * 2);
    }
}

TEST_F(ExecutorTests, ThreadPool_ZeroThreadCount_UsesHardwareConcurrency)
{
    auto executor = make_thread_pool_executor(ExecutorConfig{0});
    EXPECT_GE(executor->worker_count(), 1u);
}

TEST_F(ExecutorTests, ThreadPool_ShutdownCancelsQueuedCalls)
{
    auto executor = make_thread_pool_executor(ExecutorConfig{1});

    std::mutex mutex;
    std::condition_variable cv;
    bool release = false;
    std::atomic<bool> blocker_started{false};
    WorkFunction blocker = [&](const SlotValue&) {
        blocker_started = true;
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait_for(lock, 5s, [&] { return release; });
        return std::vector<SlotValue>{};
    };

    auto first = executor->submit_all(blocker, make_tasks(1));
    while (!blocker_started)
    {
        std::this_thread::yield();
    }
    auto queued = executor->submit_all(doubler(), make_tasks(2));
    EXPECT_EQ(executor->queue_size(), 2u);

    std::thread stopper([&] { executor->shutdown(); });
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!queued[1].future->cancelled() && std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::yield();
    }
    {
        std::lock_guard<std::mutex> lock(mutex);
        release = true;
    }
    cv.notify_all();
    stopper.join();

    EXPECT_TRUE(queued[0].future->cancelled());
    EXPECT_TRUE(queued[1].future->cancelled());
    EXPECT_EQ(first[0].future->state(), FutureState::Succeeded);
}

TEST_F(ExecutorTests, ThreadPool_SubmitAfterShutdown_ReturnsCancelledFutures)
{
    auto executor = make_thread_pool_executor(ExecutorConfig{2});
    executor->shutdown();

    auto submissions = executor->submit_all(doubler(), make_tasks(2));
    ASSERT_EQ(submissions.size(), 2u);
    EXPECT_TRUE(submissions[0].future->cancelled());
    EXPECT_TRUE(submissions[1].future->cancelled());
}
