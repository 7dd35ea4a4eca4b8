#include "bgtask/task.hpp"
#include "bgtask/task_cancelled.hpp"

namespace bgtask {
namespace detail {

namespace {

//! Publishes the control of the running task on the current thread, for the scope of this object
struct current_control_scope {
    explicit current_control_scope(const task_control& tc)
        : prev_(task_control_access::exchange_current(tc)) {}
    ~current_control_scope() { task_control_access::exchange_current(std::move(prev_)); }

    current_control_scope(const current_control_scope&) = delete;
    current_control_scope& operator=(const current_control_scope&) = delete;

private:
    task_control prev_;
};

} // namespace

void execute_task(task& t) noexcept {
    const auto& tc = t.get_task_control();
    current_control_scope scope{tc};

    try {
        // If the task is canceled, don't execute the body
        if (tc && tc.is_cancelled())
            t.cancelled();
        else
            t();
    } catch (...) {
        task_control_access::on_task_exception(tc, std::current_exception());
    }
}

void cancel_task(task& t) noexcept {
    try {
        t.cancelled();
    } catch (...) {
        task_control_access::on_task_exception(t.get_task_control(), std::current_exception());
    }
}

} // namespace detail

inline namespace v1 {

void task::operator()() {
    std::exception_ptr ex;
    try {
        fun_();
    } catch (...) {
        ex = std::current_exception();
    }
    if (cont_fun_)
        cont_fun_(std::move(ex));
    else if (ex)
        std::rethrow_exception(ex);
}

void task::cancelled() {
    if (cont_fun_)
        cont_fun_(std::make_exception_ptr(task_cancelled{}));
}

} // namespace v1

} // namespace bgtask
