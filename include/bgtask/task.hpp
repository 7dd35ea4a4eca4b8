#pragma once

#include "task_control.hpp"

#include <functional>
#include <exception>
#include <cassert>
#include <utility>

namespace bgtask {

inline namespace v1 {

/**
 * A function type that is compatible with a task.
 *
 * This function takes no arguments and returns nothing. It represents generic *work*.
 *
 * A bgtask @ref task is essentially a wrapper over a `task_function`.
 *
 * @see task
 */
using task_function = std::function<void()>;

/**
 * @brief Type of continuation function to be called after a task is executed
 *
 * The continuation receives an empty `exception_ptr` if the task completed successfully, the
 * exception thrown by the task body if the body failed, or a @ref task_cancelled exception if the
 * body was not executed because the task was cancelled.
 *
 * @see task
 */
using task_continuation_function = std::function<void(std::exception_ptr)>;

/**
 * @brief      A task. Core abstraction for representing an independent unit of work.
 *
 * A task can be enqueued into an *executor* and executed at a later time. That is, this represents
 * work that can be scheduled. This is the unit that executors move around; the user-facing
 * @ref async_task wraps its computation into one of these.
 *
 * The library prefers to move tasks around instead of using shared references to the task. After
 * a task is passed to an executor, the task cannot be modified.
 *
 * It is assumed that a task can only be executed once.
 *
 * A task is a triplet of a `task_function`, an optional @ref task_control and an optional
 * continuation. The control offers a way of cancelling the task before it starts and a place for
 * reporting exceptions. The continuation is called regardless of how the task completes: after a
 * successful execution, after the task throws, or instead of the body if the task is cancelled.
 *
 * @see task_function, task_continuation_function, task_control
 */
class task {
public:
    /**
     * @brief      Default constructor
     *
     * Brings the task into a valid state. The task has no action to be executed.
     */
    task() = default;

    /**
     * @brief      Constructs a new task given a functor, a control and a continuation
     *
     * @param      ftor  The functor to be called when executing task.
     * @param      tc    The task_control object associated with the task.
     * @param      cont  The functor to be called when the task is finished.
     *
     * @tparam     F     The type of the functor. Must be compatible with `task_function`.
     * @tparam     CF    The type of the continuation functor. Must be compatible with
     *                   `task_continuation_function`.
     *
     * When the task will be executed, the given functor will be called. This typically happens on
     * a different thread than this constructor is called.
     */
    template <typename F, typename CF>
    task(F ftor, task_control tc, CF cont)
        : fun_(std::move(ftor))
        , cont_fun_(std::move(cont))
        , task_control_(std::move(tc)) {
        assert(fun_);
    }
    //! @overload
    template <typename F>
    explicit task(F ftor)
        : fun_(std::move(ftor)) {
        assert(fun_);
    }
    //! @overload
    template <typename F>
    task(F ftor, task_control tc)
        : fun_(std::move(ftor))
        , task_control_(std::move(tc)) {
        assert(fun_);
    }

    ~task() = default;

    task(task&&) = default;
    task& operator=(task&&) = default;
    task(const task&) = default;
    task& operator=(const task&) = default;

    //! Indicates if a valid functor is set into the tasks, i.e., if there is anything to execute
    explicit operator bool() const noexcept { return static_cast<bool>(fun_); }

    /**
     * @brief      Function call operator; performs the action stored in the task.
     *
     * This is called by the execution engine whenever the task is ready to be executed. It calls
     * the functor stored in the task, and then the continuation (if any) with the outcome.
     *
     * If there is no continuation, any exception thrown by the functor is propagated to the
     * caller. If there is a continuation, the exception is passed to it; if the continuation
     * throws, that exception is propagated.
     *
     * Use @ref detail::execute_task() instead of calling this directly; that one ensures that
     * the exceptions are properly reported.
     */
    void operator()();

    /**
     * @brief      Called instead of the function call operator to signal that the task is cancelled
     *
     * Calls the continuation (if any) with a @ref task_cancelled exception. The task function is
     * not executed.
     */
    void cancelled();

    //! Gets the task control object associated with this task (may be empty)
    const task_control& get_task_control() const noexcept { return task_control_; }

private:
    //! The function to be called.
    task_function fun_;
    //! The continuation to be called after the task is complete, or when the task is cancelled
    task_continuation_function cont_fun_;
    //! The control object for this task; used for cancellation and reporting exceptions
    task_control task_control_;
};

} // namespace v1

namespace detail {

/**
 * @brief      Executes the given task, handling cancellation and exceptions
 *
 * @param      t     The task to be executed
 *
 * This is the entry point that all the executors use to run tasks. While the task runs, its control
 * object is the one returned by @ref task_control::current_task_control(). If the control object
 * was cancelled, the task body is skipped, and the continuation is called with a @ref
 * task_cancelled exception. Any exception escaping the task is given to the exception handler of
 * the control object, or logged if there is no handler.
 */
void execute_task(task& t) noexcept;

/**
 * @brief      Signals the given task that it will never be executed
 *
 * @param      t     The task that is dropped
 *
 * Calls the continuation of the task with a @ref task_cancelled exception. Exceptions are handled
 * in the same way as in @ref execute_task().
 */
void cancel_task(task& t) noexcept;

} // namespace detail

} // namespace bgtask
