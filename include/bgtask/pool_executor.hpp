#pragma once

#include "task.hpp"
#include "thread_pool.hpp"
#include "detail/library_data.hpp"

#include <utility>

namespace bgtask {

inline namespace v1 {

/**
 * @brief Executor that sends the tasks directly to a thread pool.
 *
 * This is the "maximum parallelism" strategy: the tasks are executed in parallel, as long as there
 * are workers available in the pool. No ordering between the tasks is guaranteed.
 *
 * A default-constructed object uses the global thread pool; the pool is looked up each time a task
 * is executed, so the executor remains valid after the library is shut down and re-initialized.
 * Alternatively, the executor can be bound to a user-created @ref thread_pool; that pool must
 * outlive the executor.
 *
 * If the pool cannot accept the task, @ref executor_saturated is thrown to the caller of
 * `execute()`.
 *
 * Two executor objects are equivalent if they refer to the same pool.
 *
 * @see thread_pool, serial_executor, use_pool_executor()
 */
struct pool_executor {
    //! Creates an executor that uses the global thread pool
    pool_executor() = default;

    //! Creates an executor that uses the given thread pool
    explicit pool_executor(thread_pool& pool)
        : pool_(&pool) {}

    void execute(task t) const {
        thread_pool& pool = pool_ ? *pool_ : detail::get_global_pool();
        pool.enqueue(std::move(t));
    }

    template <typename F>
    void execute(F&& f) const {
        execute(task{std::forward<F>(f)});
    }

    friend inline bool operator==(pool_executor l, pool_executor r) { return l.pool_ == r.pool_; }
    friend inline bool operator!=(pool_executor l, pool_executor r) { return !(l == r); }

private:
    //! The pool to be used; null means the global pool
    thread_pool* pool_{nullptr};
};

} // namespace v1
} // namespace bgtask
