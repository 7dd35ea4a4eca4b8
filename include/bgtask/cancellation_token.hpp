#pragma once

#include "task_control.hpp"
#include "task_cancelled.hpp"

namespace bgtask {

inline namespace v1 {

/**
 * @brief      Read-only view of the cancellation state of a running computation.
 *
 * A token is passed to every @ref async_task computation that accepts one. Cancellation in bgtask
 * is cooperative: nobody stops a computation from the outside. Long-running computations are
 * expected to poll the token and stop early, releasing whatever resources they hold.
 *
 * Example:
 * @code{.cpp}
 *      bgtask::async_task<int, int> t{[](const bgtask::cancellation_token& tok, int n) {
 *          int sum = 0;
 *          for (int i = 0; i < n; i++) {
 *              tok.throw_if_interrupted();
 *              sum += i;
 *          }
 *          return sum;
 *      }};
 * @endcode
 *
 * @see async_task::cancel(), task_interrupted
 */
class cancellation_token {
public:
    //! Creates a token that is never cancelled
    cancellation_token() = default;

    //! Creates a token that observes the given control object
    explicit cancellation_token(task_control tc)
        : control_(std::move(tc)) {}

    //! Checks if the owning task was cancelled
    bool is_cancelled() const { return control_ && control_.is_cancelled(); }

    //! Checks if the owning task was asked to stop its in-progress computation
    bool is_interrupt_requested() const { return control_ && control_.is_interrupt_requested(); }

    //! Throws @ref task_interrupted if an interruption was requested
    void throw_if_interrupted() const {
        if (is_interrupt_requested())
            throw task_interrupted{};
    }

private:
    task_control control_;
};

} // namespace v1

} // namespace bgtask
