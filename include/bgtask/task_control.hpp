#pragma once

#include "except_fun_type.hpp"

#include <exception>
#include <memory>

namespace bgtask {

inline namespace v1 {
class task_control;
} // namespace v1

namespace detail {
struct task_control_impl;

//! Structure used by the execution engine to interact with task_control objects
struct task_control_access {
    //! Called when a task (or its continuation) throws an exception
    static void on_task_exception(const task_control& tc, std::exception_ptr ex) noexcept;
    //! Called by the engine just before executing a task, to publish its control on this thread.
    //! Returns the previously published control, to be restored afterwards.
    static task_control exchange_current(task_control tc) noexcept;
};

} // namespace detail

inline namespace v1 {

//! Class used to control the lifetime of a task: cancellation, interruption and error reporting.
//!
//! Tasks can point to one task_control object; copies of a task_control share the same state.
//!
//! Scenario 1: cancellation
//!     - user can tell a task_control object to cancel the tasks
//!     - any tasks that use this task_control object will not be executed anymore
//!     - in-progress tasks can check from time to time whether the task is canceled
//!
//! Scenario 2: interruption
//!     - on top of cancellation, the user can request the interruption of in-progress tasks
//!     - the in-progress task decides when (and if) to observe the request
//!
//! Scenario 3: error reporting
//!     - exceptions escaping tasks are passed to the exception handler of the control
//!     - if no handler is set, the exception is logged
class task_control {
public:
    //! Creates an empty task_control; no operations can be called on it
    task_control();
    ~task_control();

    task_control(const task_control&) = default;
    task_control(task_control&&) = default;
    task_control& operator=(const task_control&) = default;
    task_control& operator=(task_control&&) = default;

    //! Creates a valid task_control object
    static task_control create();

    //! Checks if this is a valid task control object
    explicit operator bool() const { return static_cast<bool>(impl_); }

    //! Set the function to be called whenever an exception is thrown by a task.
    //! Cannot be called in parallel with the execution of the tasks using this object.
    void set_exception_handler(except_fun_t except_fun);

    //! Cancels the execution of the current tasks, and any tasks that will be enqueued from now on.
    void cancel();

    //! Checks if the tasks overseen by this object are canceled
    bool is_cancelled() const;

    //! Asks the in-progress tasks to stop as soon as possible. Implies cancel().
    void request_interrupt();

    //! Checks if somebody asked the tasks overseen by this object to stop.
    bool is_interrupt_requested() const;

    //! Returns the task_control object for the current executing task.
    //! This uses TLS to get the task_control from the current thread.
    //! Returns an empty task_control if no task is running (but then, are you calling this from
    //! within a task?)
    static task_control current_task_control();

    //! To be called from within the execution of a task to check if the current task should be
    //! canceled or not.
    //! Returns false if this is called outside of an executing task.
    static bool is_current_task_cancelled();

    friend bool operator==(const task_control& l, const task_control& r) {
        return l.impl_ == r.impl_;
    }
    friend bool operator!=(const task_control& l, const task_control& r) { return !(l == r); }

private:
    //! Implementation detail of a task control object
    std::shared_ptr<detail::task_control_impl> impl_;

    friend detail::task_control_access;
};

} // namespace v1

} // namespace bgtask
