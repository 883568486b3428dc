#include <gtest/gtest.h>
#include "genjob/job/first_completed.hpp"
#include "job_test_support.hpp"
#include <future>

using namespace genjob;
using namespace genjob_test;

// =============================================================================
// Test Fixture
// =============================================================================

class FirstCompletedTests : public ::testing::Test
{
protected:
    static bool contains(const std::vector<JobPtr>& jobs, const JobPtr& job)
    {
        return std::find(jobs.begin(), jobs.end(), job) != jobs.end();
    }
};

// =============================================================================
// JobWaiter Tests
// =============================================================================

TEST_F(FirstCompletedTests, JobWaiter_TimesOutWhenNotTriggered)
{
    JobWaiter waiter;
    EXPECT_FALSE(waiter.wait(5ms));
    EXPECT_TRUE(waiter.finished_jobs().empty());
}

TEST_F(FirstCompletedTests, JobWaiter_AccumulatesResults)
{
    JobWaiter waiter;
    auto a = make_empty_job();
    auto b = make_empty_job();
    waiter.add_result(a);
    waiter.add_result(b);

    EXPECT_TRUE(waiter.wait(0ms));
    EXPECT_EQ(waiter.finished_jobs(), (std::vector<JobPtr>{a, b}));
}

// =============================================================================
// first_completed Tests
// =============================================================================

TEST_F(FirstCompletedTests, OneAlreadyTerminal_ReturnsOnlyThatJob)
{
    auto gate = std::make_shared<Gate>();
    auto finished = make_empty_job();
    finished->start();
    finished->join();

    auto running = make_gated_job(gate);
    running->start();
    auto pending = make_empty_job();

    auto start_time = std::chrono::steady_clock::now();
    auto done = first_completed({running, finished, pending}, 2000ms);
    auto elapsed = std::chrono::steady_clock::now() - start_time;

    ASSERT_EQ(done.size(), 1u);
    EXPECT_EQ(done[0], finished);
    EXPECT_LT(elapsed, 1000ms);

    gate->open();
    running->join();
}

TEST_F(FirstCompletedTests, NoneTerminal_ReturnsJobThatFinishes)
{
    auto gate_a = std::make_shared<Gate>();
    auto gate_b = std::make_shared<Gate>();
    auto a = make_gated_job(gate_a);
    auto b = make_gated_job(gate_b);
    a->start();
    b->start();

    std::thread opener([&] {
        std::this_thread::sleep_for(10ms);
        gate_a->open();
    });

    auto done = first_completed({a, b});
    opener.join();

    EXPECT_TRUE(contains(done, a));
    EXPECT_FALSE(contains(done, b));
    EXPECT_TRUE(a->done());

    gate_b->open();
    b->join();
    a->join();
}

TEST_F(FirstCompletedTests, CancelledJob_CountsAsCompleted)
{
    auto gate = std::make_shared<Gate>();
    auto job = make_gated_job(gate);
    job->start();

    std::thread canceller([&] {
        std::this_thread::sleep_for(10ms);
        job->cancel();
        gate->open();
    });

    auto done = first_completed({job}, 5000ms);
    canceller.join();

    ASSERT_EQ(done.size(), 1u);
    EXPECT_EQ(done[0], job);
    EXPECT_TRUE(job->cancelled());
    job->join();
}

TEST_F(FirstCompletedTests, Timeout_ReturnsEmpty)
{
    auto gate = std::make_shared<Gate>();
    auto a = make_gated_job(gate);
    auto b = make_empty_job();
    a->start();

    auto done = first_completed({a, b}, 20ms);
    EXPECT_TRUE(done.empty());

    gate->open();
    a->join();

    // The waiter was removed: a later call sees the finished job directly.
    done = first_completed({a, b}, 0ms);
    ASSERT_EQ(done.size(), 1u);
    EXPECT_EQ(done[0], a);
}

TEST_F(FirstCompletedTests, DuplicateJobs_ReportedOnce)
{
    auto job = make_empty_job();
    job->start();
    job->join();

    auto done = first_completed({job, job, job});
    ASSERT_EQ(done.size(), 1u);
    EXPECT_EQ(done[0], job);
}

TEST_F(FirstCompletedTests, EmptyInput_TimesOutWithEmptyResult)
{
    auto done = first_completed({}, 1ms);
    EXPECT_TRUE(done.empty());
}

TEST_F(FirstCompletedTests, NullJob_Throws)
{
    EXPECT_THROW(first_completed({make_empty_job(), nullptr}, 0ms), std::invalid_argument);
}

TEST_F(FirstCompletedTests, ConcurrentOverlappingCalls_DoNotDeadlock)
{
    for (int round = 0; round < 20; ++round)
    {
        auto gate = std::make_shared<Gate>();
        auto blocked_gate = std::make_shared<Gate>();
        auto a = make_gated_job(blocked_gate);
        auto b = make_gated_job(gate);
        auto c = make_gated_job(blocked_gate);
        a->start();
        b->start();
        c->start();

        auto forward = std::async(std::launch::async, [&] {
            return first_completed({a, b, c}, 5000ms);
        });
        auto backward = std::async(std::launch::async, [&] {
            return first_completed({c, b, a}, 5000ms);
        });

        std::this_thread::sleep_for(1ms);
        gate->open();

        auto forward_done = forward.get();
        auto backward_done = backward.get();
        EXPECT_TRUE(contains(forward_done, b));
        EXPECT_TRUE(contains(backward_done, b));
        EXPECT_FALSE(contains(forward_done, a));
        EXPECT_FALSE(contains(backward_done, c));

        blocked_gate->open();
        a->join();
        b->join();
        c->join();
    }
}
