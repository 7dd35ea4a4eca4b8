#include "bgtask/task_control.hpp"
#include "bgtask/log.hpp"

#include <atomic>
#include <cassert>
#include <functional>

namespace bgtask {

namespace detail {

//! The data for a task_control object. Can be shared between multiple task_control values.
//! Also the tasks have a shared reference to this one. This means that it will be destroyed when
//! all the task_control and all its tasks are destructed.
struct task_control_impl {
    //! Set to true whenever we want to cancel all the tasks with a task_control
    std::atomic<bool> is_cancelled_{false};

    //! Set to true whenever we want the running tasks to stop early
    std::atomic<bool> is_interrupt_requested_{false};

    //! The except function to be called whenever an exception occurs on the corresponding tasks
    except_fun_t except_fun_;
};

//! TLS value with the control of the task currently executing on this thread
thread_local task_control g_current_control{};

void task_control_access::on_task_exception(
        const task_control& tc, std::exception_ptr ex) noexcept {
    if (tc.impl_ && tc.impl_->except_fun_) {
        try {
            tc.impl_->except_fun_(ex);
            return;
        } catch (const std::exception& e) {
            BGTASK_LOG(log_level::error, "exception handler failed: {}", e.what());
        } catch (...) {
            BGTASK_LOG(log_level::error, "exception handler failed with an unknown exception");
        }
    }

    // Nobody handled the exception; make sure it doesn't go unnoticed
    try {
        std::rethrow_exception(ex);
    } catch (const std::exception& e) {
        BGTASK_LOG(log_level::error, "unhandled exception in task: {}", e.what());
    } catch (...) {
        BGTASK_LOG(log_level::error, "unhandled unknown exception in task");
    }
}

task_control task_control_access::exchange_current(task_control tc) noexcept {
    std::swap(tc, g_current_control);
    return tc;
}

} // namespace detail

inline namespace v1 {

task_control::task_control()
    : impl_() {}
task_control::~task_control() {}

task_control task_control::create() {
    task_control res;
    res.impl_ = std::make_shared<detail::task_control_impl>();
    return res;
}

void task_control::set_exception_handler(except_fun_t except_fun) {
    assert(impl_);
    impl_->except_fun_ = std::move(except_fun);
}

void task_control::cancel() {
    assert(impl_);
    impl_->is_cancelled_.store(true, std::memory_order_release);
}

bool task_control::is_cancelled() const {
    assert(impl_);
    return impl_->is_cancelled_.load(std::memory_order_acquire);
}

void task_control::request_interrupt() {
    assert(impl_);
    impl_->is_cancelled_.store(true, std::memory_order_release);
    impl_->is_interrupt_requested_.store(true, std::memory_order_release);
}

bool task_control::is_interrupt_requested() const {
    assert(impl_);
    return impl_->is_interrupt_requested_.load(std::memory_order_acquire);
}

task_control task_control::current_task_control() { return detail::g_current_control; }

bool task_control::is_current_task_cancelled() {
    const auto& tc = detail::g_current_control;
    return tc && tc.is_cancelled();
}

} // namespace v1

} // namespace bgtask
