#pragma once

#include "any_executor.hpp"
#include "cancellation_token.hpp"
#include "except_fun_type.hpp"
#include "task.hpp"
#include "task_control.hpp"
#include "task_errors.hpp"

#include <atomic>
#include <cassert>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>

namespace bgtask {

inline namespace v1 {

//! The lifecycle states of an @ref async_task. A task moves only forward through these states.
enum class task_status {
    pending,  //!< Created, not yet executed
    running,  //!< execute() was called; the computation is queued, running, or being completed
    finished, //!< Completed; the task is inert
};

//! Returns the printable name of the task status
const char* to_string(task_status status) noexcept;

} // namespace v1

namespace detail {

/**
 * @brief      The type-independent part of an async_task.
 *
 * Holds the lifecycle state machine, the cancellation flag, the pre-execute hook and the logic of
 * turning the computation into a job that is submitted to an executor. The derived class holds the
 * parameters, the computation, the result and the post-execute hook.
 *
 * Always owned through a shared_ptr: the submitted job keeps the object alive until the job is
 * completed, even if the user drops the @ref async_task object.
 */
class task_core : public std::enable_shared_from_this<task_core> {
public:
    explicit task_core(any_executor executor);
    virtual ~task_core();

    task_core(const task_core&) = delete;
    task_core& operator=(const task_core&) = delete;
    task_core(task_core&&) = delete;
    task_core& operator=(task_core&&) = delete;

    task_status status() const noexcept { return status_.load(std::memory_order_acquire); }
    bool is_cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    bool cancel(bool may_interrupt_if_running) noexcept;

    void set_pre_execute(std::function<void()> f);
    void set_error_handler(except_fun_t f);

    //! Throws invalid_task_state if the task was already started
    void check_pending() const;

    //! Atomically moves the task from pending to running; throws invalid_task_state if the task is
    //! not pending.
    void begin_execute();
    //! Runs the pre-execute hook, and submits the job. On failure, the task is finished, and the
    //! exception is propagated.
    void dispatch();
    //! Called if the execution cannot continue after begin_execute(); finishes the task.
    void abort_execute() noexcept;

protected:
    //! Runs the computation, and stores its outcome (value or exception)
    virtual void run_computation(const cancellation_token& tok) noexcept = 0;
    //! Returns the exception thrown by the computation, if any
    virtual std::exception_ptr computation_error() const noexcept = 0;
    //! Gives the result of the computation to the post-execute hook
    virtual void deliver_result() = 0;

private:
    //! The state of the underlying job; decides whether cancel() succeeds
    enum job_state {
        job_fresh,     //!< Not started
        job_running,   //!< The computation is running
        job_completed, //!< The computation is complete
        job_cancelled, //!< Cancelled before completing
    };

    //! The lifecycle status, as seen by the users
    std::atomic<task_status> status_{task_status::pending};
    //! Set by cancel(); suppresses the post-execute hook
    std::atomic<bool> cancelled_{false};
    //! The state of the job
    std::atomic<int> job_state_{job_fresh};
    //! Gives the cancellation token to the computation, and receives the exceptions of the job
    task_control control_;
    //! The executor given at construction; if empty, the default executor is used
    any_executor executor_;
    //! Hook called on the thread that calls execute(), before submitting the job
    std::function<void()> pre_execute_;

    //! Creates the job to be submitted to the executor
    task make_job();
    //! The body of the job
    void run_job() noexcept;
    //! The continuation of the job; completes the task
    void complete(std::exception_ptr ex) noexcept;
    //! Marks the job as completed unless it was cancelled; a later cancel() returns false
    void seal_job() noexcept;
    //! Inspects the outcome of the computation and calls the post-execute hook if needed
    void finish_computation();
};

//! Single-assignment container for the result of a computation
template <typename R>
struct result_slot {
    std::optional<R> value_;
    std::exception_ptr error_;

    template <typename F>
    void fill(F&& f) noexcept {
        assert(!value_ && !error_);
        try {
            value_.emplace(std::forward<F>(f)());
        } catch (...) {
            error_ = std::current_exception();
        }
    }

    bool has_value() const noexcept { return value_.has_value(); }
};

template <>
struct result_slot<void> {
    bool has_value_{false};
    std::exception_ptr error_;

    template <typename F>
    void fill(F&& f) noexcept {
        assert(!has_value_ && !error_);
        try {
            std::forward<F>(f)();
            has_value_ = true;
        } catch (...) {
            error_ = std::current_exception();
        }
    }

    bool has_value() const noexcept { return has_value_; }
};

//! The type of the post-execute hook for the given result type
template <typename R>
struct post_execute_hook {
    using type = std::function<void(R)>;
};
template <>
struct post_execute_hook<void> {
    using type = std::function<void()>;
};

//! The state of an async_task with the given result and parameter types
template <typename Result, typename... Params>
class async_task_state final : public task_core {
public:
    using computation_fun = std::function<Result(const cancellation_token&, const Params&...)>;
    using post_execute_fun = typename post_execute_hook<Result>::type;

    async_task_state(computation_fun computation, any_executor executor)
        : task_core(std::move(executor))
        , computation_(std::move(computation)) {}

    //! The parameters of the computation; set once, before the job is submitted
    std::optional<std::tuple<Params...>> params_;
    //! Hook called with the result of the computation, unless the task is cancelled
    post_execute_fun post_execute_;

protected:
    void run_computation(const cancellation_token& tok) noexcept override {
        assert(params_);
        slot_.fill([this, &tok]() -> Result {
            return std::apply(
                    [this, &tok](const Params&... ps) -> Result { return computation_(tok, ps...); },
                    *params_);
        });
    }

    std::exception_ptr computation_error() const noexcept override { return slot_.error_; }

    void deliver_result() override {
        if (!slot_.has_value() || !post_execute_)
            return;
        if constexpr (std::is_void_v<Result>)
            post_execute_();
        else
            post_execute_(std::move(*slot_.value_));
    }

private:
    //! The user-supplied computation
    computation_fun computation_;
    //! The outcome of the computation
    result_slot<Result> slot_;
};

} // namespace detail

inline namespace v1 {

/**
 * @brief      A unit of asynchronous work that produces one result.
 *
 * @tparam     Result  The type of the value produced by the computation; can be `void`
 * @tparam     Params  The types of the parameters given to the computation
 *
 * An async_task wraps a computation (a function from the parameters to a result) and executes it
 * once, in the background, on an executor. The caller can be notified before the computation is
 * submitted (pre-execute hook, called on the thread that calls @ref execute()) and when the
 * computation completes (post-execute hook, called on the worker thread with the result).
 *
 * The task has a strict lifecycle: pending, running, finished (see @ref task_status). A task can be
 * executed only once; after it finishes, it is inert and needs to be discarded.
 *
 * The computation may optionally take a @ref cancellation_token as its first parameter. If it does,
 * it can observe cancellation and interruption requests and stop early.
 *
 * If no executor is given at construction, the task uses @ref default_executor() at the time
 * @ref execute() is called; that is, by default, the tasks are executed one at a time, in the order
 * in which they are executed, by @ref default_serial_executor().
 *
 * Example:
 * @code{.cpp}
 *      bgtask::async_task<int, int> t{[](int x) { return x * 2; }};
 *      t.on_pre_execute([] { show_spinner(); });
 *      t.on_post_execute([](int res) { show_result(res); });
 *      t.execute(21); // show_result(42) is called when the computation completes
 * @endcode
 *
 * Errors:
 *  - calling @ref execute() twice throws @ref invalid_task_state
 *  - if the executor rejects the task, @ref execute() throws (e.g., @ref executor_saturated)
 *  - if the computation throws, a @ref task_execution_error that carries the original exception is
 *    given to the error handler (see @ref on_error()); by default, it is logged
 *  - if the computation throws @ref task_interrupted after the task was cancelled, the event is
 *    logged, and not treated as an error
 *
 * @see task_status, cancellation_token, default_executor(), serial_executor, pool_executor
 */
template <typename Result, typename... Params>
class async_task {
    using state_type = detail::async_task_state<Result, Params...>;

public:
    //! The type of the value produced by the computation
    using result_type = Result;
    //! The type of the function called after the computation completes
    using post_execute_fun = typename state_type::post_execute_fun;

    /**
     * @brief      Constructs a task, in the pending state
     *
     * @param      computation  The computation to be executed
     * @param      executor     The executor used to run the computation; optional
     *
     * The computation can be called as `computation(tok, params...)`, with `tok` being a @ref
     * cancellation_token, or as `computation(params...)`.
     */
    template <typename F,
            typename = std::enable_if_t<!std::is_same<std::decay_t<F>, async_task>::value>>
    explicit async_task(F computation, any_executor executor = {})
        : state_(std::make_shared<state_type>(
                  wrap_computation(std::move(computation)), std::move(executor))) {}

    async_task(async_task&&) noexcept = default;
    async_task& operator=(async_task&&) noexcept = default;
    async_task(const async_task&) = delete;
    async_task& operator=(const async_task&) = delete;

    //! Sets the function called on the thread calling @ref execute(), before the computation is
    //! submitted. Throws @ref invalid_task_state if the task is not pending.
    async_task& on_pre_execute(std::function<void()> f) {
        state_->set_pre_execute(std::move(f));
        return *this;
    }

    //! Sets the function that receives the result of the computation, unless the task is
    //! cancelled. Throws @ref invalid_task_state if the task is not pending.
    async_task& on_post_execute(post_execute_fun f) {
        state_->check_pending();
        state_->post_execute_ = std::move(f);
        return *this;
    }

    //! Sets the function that receives the errors of the task: @ref task_execution_error for the
    //! failures of the computation, or the exceptions thrown by the post-execute hook. Throws @ref
    //! invalid_task_state if the task is not pending.
    async_task& on_error(except_fun_t f) {
        state_->set_error_handler(std::move(f));
        return *this;
    }

    /**
     * @brief      Starts the task
     *
     * @param      params  The parameters to be passed to the computation
     *
     * Moves the task to the running state, calls the pre-execute hook on the current thread, then
     * submits the computation to the executor. Returns without waiting for the computation.
     *
     * Throws @ref invalid_task_state if the task is not pending. If the pre-execute hook throws,
     * or the executor rejects the computation, the task is finished, and the exception is
     * propagated.
     */
    void execute(Params... params) {
        state_->begin_execute();
        try {
            state_->params_.emplace(std::move(params)...);
        } catch (...) {
            state_->abort_execute();
            throw;
        }
        state_->dispatch();
    }

    /**
     * @brief      Cancels the task
     *
     * @param      may_interrupt_if_running  If true, and the computation is running, the
     *                                       computation is asked to stop
     *
     * @return     True if this call marked the computation as cancelled; false if the computation
     *             was already complete or already cancelled.
     *
     * After this call, the post-execute hook is not called anymore. A computation that did not
     * start will not be started; a computation that is running is not stopped, unless it observes
     * its @ref cancellation_token. In all cases, the task still reaches the finished state.
     *
     * Can be called at any time, multiple times, from any thread.
     */
    bool cancel(bool may_interrupt_if_running) noexcept {
        return state_->cancel(may_interrupt_if_running);
    }

    //! Returns the current status of the task
    task_status status() const noexcept { return state_->status(); }

    //! Returns true if @ref cancel() was called
    bool is_cancelled() const noexcept { return state_->is_cancelled(); }

private:
    std::shared_ptr<state_type> state_;

    template <typename F>
    static typename state_type::computation_fun wrap_computation(F&& f) {
        using fun_type = std::decay_t<F>;
        if constexpr (std::is_invocable_v<fun_type&, const cancellation_token&, const Params&...>) {
            return std::forward<F>(f);
        } else {
            static_assert(std::is_invocable_v<fun_type&, const Params&...>,
                    "the computation needs to be callable with the task parameters");
            return [f = std::forward<F>(f)](const cancellation_token&, const Params&... ps) mutable
                   -> Result { return f(ps...); };
        }
    }
};

} // namespace v1
} // namespace bgtask
