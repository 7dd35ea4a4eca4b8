#pragma once

#include "task.hpp"
#include "init.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

namespace bgtask {

namespace detail {
struct pool_data;
}

inline namespace v1 {

//! Exception thrown when an executor refuses to accept a task
struct task_rejected : std::runtime_error {
    explicit task_rejected(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief      Exception thrown when a thread pool cannot accept any more tasks
 *
 * Thrown when all the threads of the pool are busy, the maximum number of threads was reached, and
 * the queue of the pool is full. The pool never blocks the submitter and never drops tasks.
 */
struct executor_saturated : task_rejected {
    executor_saturated()
        : task_rejected("thread pool is saturated") {}
};

/**
 * @brief      A bounded pool of worker threads.
 *
 * The pool keeps between `core_pool_size` and `max_pool_size` worker threads, and a FIFO queue of
 * tasks that wait for a free worker. When a task is enqueued:
 *  - if there are fewer than `core_pool_size` workers, a new worker is started for the task;
 *  - otherwise, if the queue is not full, the task is added to the queue;
 *  - otherwise, if there are fewer than `max_pool_size` workers, a new worker is started;
 *  - otherwise, @ref executor_saturated is thrown.
 *
 * The workers above `core_pool_size` exit after being idle for the `keep_alive` duration.
 *
 * The process-wide pool, used by @ref pool_executor and, indirectly, by the default @ref
 * serial_executor, is an object of this type created with the library configuration (see @ref
 * init()). Users can create additional pools with their own configuration.
 *
 * @see init_data, pool_executor, serial_executor
 */
class thread_pool {
public:
    /**
     * @brief      Constructs a new thread pool
     *
     * @param      config  The configuration of the pool; the zero values are replaced by defaults
     *
     * Throws `std::invalid_argument` if the configuration is not valid. No thread is started until
     * the first task is enqueued.
     */
    explicit thread_pool(const init_data& config = {});

    //! Destructor. Shuts down the pool (see @ref shutdown()). Never throws; if called from one of
    //! the workers of the pool, the pool is leaked instead.
    ~thread_pool();

    thread_pool(const thread_pool&) = delete;
    thread_pool& operator=(const thread_pool&) = delete;
    thread_pool(thread_pool&&) = delete;
    thread_pool& operator=(thread_pool&&) = delete;

    /**
     * @brief      Enqueues a task to be executed on one of the worker threads
     *
     * @param      t     The task to be executed
     *
     * Throws @ref executor_saturated if the pool cannot accept the task, and @ref task_rejected if
     * the pool was shut down. If this throws, the task is not executed, and its continuation is not
     * called.
     */
    void enqueue(task t);

    /**
     * @brief      Stops the pool
     *
     * All the tasks that wait in the queue are cancelled: they are not executed, but their
     * continuations are called with a @ref task_cancelled exception. Then, this waits for the
     * running tasks to complete, and joins all the worker threads. After this call, no new tasks
     * can be enqueued.
     *
     * Calling this multiple times is allowed. Must not be called from a worker of this pool.
     */
    void shutdown();

    //! Returns true if the current thread is one of the workers of this pool
    bool running_in_this_thread() const noexcept;

    //! The number of workers that are kept alive even when idle
    int core_pool_size() const noexcept;
    //! The maximum number of workers of this pool
    int max_pool_size() const noexcept;
    //! The maximum number of tasks waiting in the queue
    int queue_capacity() const noexcept;
    //! How long an excess worker waits for new work before exiting
    std::chrono::milliseconds keep_alive() const noexcept;

    //! The current number of worker threads
    int num_workers() const;
    //! The number of tasks waiting in the queue
    int num_queued() const;
    //! The largest number of workers that this pool ever had at once
    int largest_pool_size() const;

private:
    //! The implementation data; use pimpl idiom.
    std::unique_ptr<detail::pool_data> impl_;
};

} // namespace v1
} // namespace bgtask
