#pragma once

#include "task_countdown.hpp"

#include <bgtask/any_executor.hpp>
#include <bgtask/task.hpp>

#include <atomic>
#include <thread>
#include <chrono>

using namespace std::chrono_literals;

//! Enqueue N tasks in the executor, and wait for them to be executed (continuations included).
//! Returns false on timeout.
inline bool enqueue_and_wait(bgtask::any_executor e, bgtask::task_function f, int num_tasks = 10,
        std::chrono::milliseconds timeout = 1000ms) {
    task_countdown tc{num_tasks};
    for (int i = 0; i < num_tasks; i++)
        e.execute(bgtask::task{f, {}, [&tc](std::exception_ptr) { tc.task_finished(); }});
    return tc.wait_for_all(timeout);
}

//! Waits until the predicate becomes true; returns false on timeout
template <typename Pred>
inline bool bounded_wait(Pred pred, std::chrono::milliseconds timeout = 1000ms) {
    auto end = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < end) {
        if (pred())
            return true;
        std::this_thread::sleep_for(200us);
    }
    return pred();
}

//! A latch that keeps tasks blocked until the test releases them
struct gate {
    void open() { open_.store(true); }
    //! Blocks the calling thread until the gate is open (bounded, to avoid hanging the tests)
    bool wait(std::chrono::milliseconds timeout = 3000ms) const {
        return bounded_wait([this] { return open_.load(); }, timeout);
    }

private:
    std::atomic<bool> open_{false};
};
