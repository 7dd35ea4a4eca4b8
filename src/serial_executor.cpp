#include "bgtask/serial_executor.hpp"
#include "bgtask/pool_executor.hpp"
#include "bgtask/profiling.hpp"

#include <deque>
#include <mutex>

namespace bgtask {

inline namespace v1 {

//! The implementation details of a serial executor
struct serial_executor::impl : std::enable_shared_from_this<impl> {
    //! The base executor used to actually execute the drain tasks
    any_executor base_executor_;
    //! Protects the queue of tasks and the active flag
    mutable std::mutex bottleneck_;
    //! The queue of tasks that wait to be executed
    std::deque<task> waiting_tasks_;
    //! True while a drain task is given to the base executor
    bool active_{false};

    explicit impl(any_executor base_executor)
        : base_executor_(std::move(base_executor)) {
        if (!base_executor_)
            base_executor_ = pool_executor{};
    }

    //! Adds a new task to this serial executor
    void enqueue(task&& t) {
        BGTASK_PROFILING_FUNCTION();
        std::lock_guard<std::mutex> lock{bottleneck_};
        waiting_tasks_.push_back(std::move(t));
        if (active_)
            return;

        // Nobody is draining the queue; start a drain task in the base executor
        try {
            base_executor_.execute(make_drain_task());
        } catch (...) {
            // The queue was empty before; just take our task out again
            waiting_tasks_.pop_back();
            throw;
        }
        active_ = true;
    }

    //! Called by the base executor; executes the waiting tasks, one at a time, until the queue is
    //! empty.
    void drain() {
        BGTASK_PROFILING_FUNCTION();
        while (true) {
            task t;
            {
                std::lock_guard<std::mutex> lock{bottleneck_};
                if (waiting_tasks_.empty()) {
                    active_ = false;
                    return;
                }
                t = std::move(waiting_tasks_.front());
                waiting_tasks_.pop_front();
            }
            BGTASK_PROFILING_SCOPE_N("serial task");
            detail::execute_task(t);
        }
    }

    //! Called if the drain task will never run; we cancel the tasks that wait on it
    void drain_cancelled() {
        std::deque<task> dropped;
        {
            std::lock_guard<std::mutex> lock{bottleneck_};
            dropped.swap(waiting_tasks_);
            active_ = false;
        }
        for (auto& t : dropped)
            detail::cancel_task(t);
    }

    //! Creates the task that drains our queue.
    task make_drain_task() {
        auto f = [p_this = shared_from_this()]() { p_this->drain(); };
        auto cont = [p_this = shared_from_this()](std::exception_ptr ex) {
            // The drain function doesn't throw; we only get here with an exception if the base
            // executor dropped the drain task
            if (ex)
                p_this->drain_cancelled();
        };
        return task{std::move(f), {}, std::move(cont)};
    }
};

serial_executor::serial_executor(any_executor base_executor)
    : impl_(std::make_shared<impl>(std::move(base_executor))) {}

void serial_executor::execute(task t) const { impl_->enqueue(std::move(t)); }

int serial_executor::num_pending() const {
    std::lock_guard<std::mutex> lock{impl_->bottleneck_};
    return static_cast<int>(impl_->waiting_tasks_.size());
}

bool serial_executor::is_active() const {
    std::lock_guard<std::mutex> lock{impl_->bottleneck_};
    return impl_->active_;
}

} // namespace v1
} // namespace bgtask
