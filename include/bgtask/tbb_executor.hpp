#pragma once

#if BGTASK_USE_TBB || DOXYGEN_BUILD

#include <tbb/task_arena.h>

#include "task.hpp"
#include "profiling.hpp"

#include <memory>
#include <utility>

namespace bgtask {
inline namespace v1 {

/**
 * @brief Executor that sends tasks to TBB
 *
 * The tasks are enqueued in a TBB task arena, and executed by the TBB worker threads. This is an
 * alternative to @ref pool_executor for applications that already use TBB; it can also be used as
 * the base executor of a @ref serial_executor.
 *
 * The executor takes as constructor parameter the priority of the arena in which the tasks are
 * enqueued. Copies of the executor share the same arena.
 *
 * The arena never rejects tasks; cancellation and error reporting are handled through the @ref
 * task_control of the tasks, as with the other executors.
 *
 * Two executor objects are equivalent if they use the same arena.
 *
 * @see pool_executor, serial_executor
 */
struct tbb_executor {

    //! The priority of the arena in which the tasks are enqueued
    enum priority {
        prio_high,   //! High-priority tasks
        prio_normal, //! Tasks with normal priority
        prio_low,    //! Tasks with low priority
    };

    explicit tbb_executor(priority prio = prio_normal)
        : arena_(std::make_shared<tbb::task_arena>(
                  tbb::task_arena::automatic, 1, to_tbb_priority(prio))) {}

    void execute(task t) const {
        BGTASK_PROFILING_SCOPE_N("enqueue");
        arena_->enqueue([t = std::move(t)]() mutable {
            BGTASK_PROFILING_SCOPE_N("TBB execute");
            detail::execute_task(t);
        });
    }

    template <typename F>
    void execute(F&& f) const {
        execute(task{std::forward<F>(f)});
    }

    friend inline bool operator==(const tbb_executor& l, const tbb_executor& r) {
        return l.arena_ == r.arena_;
    }
    friend inline bool operator!=(const tbb_executor& l, const tbb_executor& r) {
        return !(l == r);
    }

private:
    //! The arena in which we enqueue the tasks
    std::shared_ptr<tbb::task_arena> arena_;

    static tbb::task_arena::priority to_tbb_priority(priority prio) {
        switch (prio) {
        case prio_high:
            return tbb::task_arena::priority::high;
        case prio_low:
            return tbb::task_arena::priority::low;
        default:
            return tbb::task_arena::priority::normal;
        }
    }
};

} // namespace v1
} // namespace bgtask

#endif
