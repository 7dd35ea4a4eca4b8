#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace bgtask {

inline namespace v1 {

/**
 * @brief      Exception thrown when an operation is not valid in the current state of a task
 *
 * Thrown by @ref async_task::execute() if the task is not in the pending state, and by the hook
 * setters of @ref async_task if the task was already started. This indicates a programming error;
 * a task can be executed only once.
 */
struct invalid_task_state : std::logic_error {
    explicit invalid_task_state(const std::string& what)
        : std::logic_error(what) {}
};

/**
 * @brief      Exception reported when the computation of a task fails
 *
 * The completion observer of an @ref async_task receives this exception whenever the computation
 * of the task throws. The original exception can be obtained with @ref cause().
 */
class task_execution_error : public std::runtime_error {
public:
    explicit task_execution_error(std::exception_ptr cause);

    //! The exception thrown by the computation
    std::exception_ptr cause() const noexcept { return cause_; }

    //! Throws the exception thrown by the computation
    [[noreturn]] void rethrow_cause() const { std::rethrow_exception(cause_); }

private:
    std::exception_ptr cause_;
};

} // namespace v1
} // namespace bgtask
