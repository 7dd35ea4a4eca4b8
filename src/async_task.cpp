#include "bgtask/async_task.hpp"
#include "bgtask/default_executor.hpp"
#include "bgtask/log.hpp"
#include "bgtask/profiling.hpp"
#include "bgtask/task_cancelled.hpp"

#include <string>

namespace bgtask {

namespace {

std::string describe(const std::exception_ptr& ex) {
    if (!ex)
        return "no exception";
    try {
        std::rethrow_exception(ex);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

} // namespace

inline namespace v1 {

task_execution_error::task_execution_error(std::exception_ptr cause)
    : std::runtime_error("error while executing the task computation: " + describe(cause))
    , cause_(std::move(cause)) {}

const char* to_string(task_status status) noexcept {
    switch (status) {
    case task_status::pending:
        return "pending";
    case task_status::running:
        return "running";
    case task_status::finished:
        return "finished";
    }
    return "unknown";
}

} // namespace v1

namespace detail {

task_core::task_core(any_executor executor)
    : control_(task_control::create())
    , executor_(std::move(executor)) {}

task_core::~task_core() = default;

void task_core::check_pending() const {
    if (status() != task_status::pending)
        throw invalid_task_state("cannot change the hooks of a task that was already started");
}

void task_core::set_pre_execute(std::function<void()> f) {
    check_pending();
    pre_execute_ = std::move(f);
}

void task_core::set_error_handler(except_fun_t f) {
    check_pending();
    control_.set_exception_handler(std::move(f));
}

void task_core::begin_execute() {
    auto expected = task_status::pending;
    if (!status_.compare_exchange_strong(expected, task_status::running, std::memory_order_acq_rel))
        throw invalid_task_state(expected == task_status::running
                                         ? "cannot execute task: the task is already running"
                                         : "cannot execute task: the task is already finished "
                                           "(a task can be executed only once)");
}

void task_core::dispatch() {
    BGTASK_PROFILING_FUNCTION();
    try {
        if (pre_execute_)
            pre_execute_();
        any_executor executor = executor_ ? executor_ : default_executor();
        executor.execute(make_job());
    } catch (...) {
        abort_execute();
        throw;
    }
}

void task_core::abort_execute() noexcept {
    BGTASK_LOG(log_level::debug, "task could not be started; marking it as finished");
    seal_job();
    status_.store(task_status::finished, std::memory_order_release);
}

bool task_core::cancel(bool may_interrupt_if_running) noexcept {
    cancelled_.store(true, std::memory_order_release);

    int state = job_state_.load(std::memory_order_acquire);
    while (state == job_fresh || state == job_running) {
        if (job_state_.compare_exchange_weak(state, job_cancelled, std::memory_order_acq_rel)) {
            if (may_interrupt_if_running && state == job_running)
                control_.request_interrupt();
            else
                control_.cancel();
            return true;
        }
    }
    return false;
}

task task_core::make_job() {
    auto self = shared_from_this();
    auto f = [self]() { self->run_job(); };
    auto cont = [self](std::exception_ptr ex) { self->complete(std::move(ex)); };
    return task{std::move(f), control_, std::move(cont)};
}

void task_core::run_job() noexcept {
    BGTASK_PROFILING_FUNCTION();
    int expected = job_fresh;
    if (!job_state_.compare_exchange_strong(expected, job_running, std::memory_order_acq_rel))
        return; // cancelled before starting

    run_computation(cancellation_token{control_});

    expected = job_running;
    job_state_.compare_exchange_strong(expected, job_completed, std::memory_order_acq_rel);
}

void task_core::complete(std::exception_ptr ex) noexcept {
    // The job may have been dropped without running
    seal_job();
    try {
        if (ex)
            std::rethrow_exception(ex);
        finish_computation();
    } catch (const task_cancelled&) {
        BGTASK_LOG(log_level::debug, "task cancelled before starting its computation");
    } catch (...) {
        task_control_access::on_task_exception(control_, std::current_exception());
    }
    // Nothing touches the task after this point
    status_.store(task_status::finished, std::memory_order_release);
}

void task_core::seal_job() noexcept {
    int state = job_state_.load(std::memory_order_acquire);
    while (state == job_fresh || state == job_running) {
        if (job_state_.compare_exchange_weak(state, job_completed, std::memory_order_acq_rel))
            return;
    }
}

void task_core::finish_computation() {
    auto err = computation_error();
    if (err) {
        try {
            std::rethrow_exception(err);
        } catch (const task_interrupted&) {
            if (!is_cancelled())
                throw task_execution_error(err);
            BGTASK_LOG(log_level::warning, "task computation interrupted after cancellation");
            return;
        } catch (...) {
            throw task_execution_error(err);
        }
    }

    if (!is_cancelled())
        deliver_result();
}

} // namespace detail
} // namespace bgtask
