/**
 * @file genjob_exceptions.hpp
 */
#pragma once
#include "genjob/common/common.hpp"

namespace genjob
{

/**
 * @brief Error codes for Job operations that fail toward the caller.
 *
 * @details
 * Only job-level conditions are reported through these codes. A failure of an
 * individual task is absorbed by the job that submitted it.
 */
enum class JobErrorCode
{
    AlreadyStarted,
    Cancelled,
    TimedOut
};

/**
 * @brief Get a stable name for a JobErrorCode.
 */
inline const char* to_string(JobErrorCode code) noexcept
{
    switch (code)
    {
        case JobErrorCode::AlreadyStarted: return "AlreadyStarted";
        case JobErrorCode::Cancelled: return "Cancelled";
        case JobErrorCode::TimedOut: return "TimedOut";
    }
    return "Unknown";
}

/**
 * @brief Exception class for Job errors.
 *
 * @details
 * `JobError` is thrown by `Job::start()` when the job is not pending, and by
 * `Job::result()` when the job was cancelled or did not reach a terminal
 * state in time. The job itself is left unchanged by the failing call.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class JobError : public std::exception
{
public:
    /**
     * @brief Construct a JobError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    JobError(JobErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     */
    JobErrorCode code() const noexcept
    {
        return m_code;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    JobErrorCode m_code;
    std::string m_message;
};

/**
 * @brief Thrown by TaskFuture::result() for a future that was cancelled.
 *
 * @details
 * Jobs treat this as the expected outcome of their own cancellation and never
 * report it as a task failure.
 */
class TaskCancelledError : public std::runtime_error
{
public:
    TaskCancelledError()
        : std::runtime_error("task was cancelled")
    {}
};

/**
 * @brief Thrown by TaskFuture::result() when the task is not complete in time.
 */
class TaskTimeoutError : public std::runtime_error
{
public:
    TaskTimeoutError()
        : std::runtime_error("task did not complete within the timeout")
    {}
};

} // namespace genjob
