#pragma once

#include <stdexcept>

namespace bgtask {

inline namespace v1 {

//! Exception that indicates that a task is cancelled; the task body was not executed.
//! Passed to the continuation of the task instead of running the task.
struct task_cancelled : std::runtime_error {
    task_cancelled() noexcept
        : std::runtime_error("task cancelled") {}
};

/**
 * @brief      Exception that indicates that a computation was interrupted.
 *
 * Thrown by @ref cancellation_token::throw_if_interrupted() whenever somebody requested the
 * interruption of the running computation. If the owning task was cancelled, this is an expected
 * outcome and it is not reported as an error.
 *
 * @see cancellation_token, async_task::cancel()
 */
struct task_interrupted : std::runtime_error {
    task_interrupted() noexcept
        : std::runtime_error("task interrupted") {}
};

} // namespace v1

} // namespace bgtask
