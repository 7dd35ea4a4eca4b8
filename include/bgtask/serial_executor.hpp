#pragma once

#include "task.hpp"
#include "any_executor.hpp"

#include <memory>

namespace bgtask {

inline namespace v1 {

/**
 * @brief      Executor type that allows only one task to be executed at a given time.
 *
 * If the main purpose of other executors is to define where and when tasks will be executed, the
 * purpose of this executor is to introduce constrains between the tasks enqueued into it.
 *
 * Given *N* tasks to be executed, the serial executor ensures that there are no two tasks executed
 * in parallel. If a task starts executing all other tasks enqueued into the serial executor are put
 * on hold. As soon as one task is completed (including its continuation) the next task starts.
 *
 * As this executor doesn't know how to execute tasks, it relies on a base executor to do that.
 * Whenever a task is enqueued and the serial executor is idle, a *drain* task is sent to the base
 * executor. The drain task executes the waiting tasks one after another, and returns as soon as
 * there are no more waiting tasks. This way, the serial executor occupies a worker thread only
 * while it has work to do, and it never blocks threads.
 *
 * The base executor must execute the tasks asynchronously; it is called while the internal lock of
 * the serial executor is held.
 *
 * Copies of a serial executor share the same waiting queue; they are equivalent.
 *
 * **Guarantees**:
 *  - no more than 1 task is executed at once.
 *  - the tasks are executed in the order in which they are enqueued.
 *  - a failing or cancelled task does not prevent the next tasks from being executed.
 *
 * @see        any_executor, pool_executor, default_serial_executor()
 */
class serial_executor {
public:
    /**
     * @brief      Constructor
     *
     * @param      base_executor  Executor to be used to execute the drain tasks
     *
     * If `base_executor` is not given, a @ref pool_executor on the global thread pool will be used.
     */
    explicit serial_executor(any_executor base_executor = {});

    /**
     * @brief Executes the given task in the context of the serial executor
     *
     * @param t The task to be executed
     *
     * If there are no tasks in the serial executor, a drain task is given to the base executor. If
     * the base executor rejects it, the exception is propagated to the caller, and the given task
     * is dropped without being executed. If there are already other tasks in the serial executor,
     * the given task is placed at the end of the waiting list.
     */
    void execute(task t) const;

    //! @overload
    template <typename F>
    void execute(F&& f) const {
        execute(task{std::forward<F>(f)});
    }

    //! Returns the number of tasks that are waiting to be executed (not counting the running one)
    int num_pending() const;

    //! Returns true if a drain task is active (executing tasks, or about to)
    bool is_active() const;

    friend inline bool operator==(const serial_executor& l, const serial_executor& r) {
        return l.impl_ == r.impl_;
    }
    friend inline bool operator!=(const serial_executor& l, const serial_executor& r) {
        return !(l == r);
    }

private:
    struct impl;

    //! The implementation object of this serial executor.
    //! We need this to be shared pointer for lifetime issue, but also to be able to copy the
    //! serial executor easily.
    std::shared_ptr<impl> impl_;
};

} // namespace v1
} // namespace bgtask
