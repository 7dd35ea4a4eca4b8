#pragma once

#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>

namespace bgtask {

inline namespace v1 {

/**
 * @brief      Configuration data for the bgtask library
 *
 * Store here all the parameters needed to be passed to bgtask when initializing. Any parameters
 * that are left unfilled will have reasonable defaults in bgtask.
 *
 * The same structure is used to configure standalone @ref thread_pool objects.
 *
 * The defaults are tuned for computation-heavy tasks: on a system with *N* processors a pool of
 * *N+1* threads usually gives the best utilization.
 */
struct init_data {
    //! The number of threads that are kept alive in the pool; 0 = num cores + 1
    int core_pool_size_{0};
    //! The maximum number of threads in the pool; 0 = 2 * num cores + 1
    int max_pool_size_{0};
    //! The number of tasks that can wait in the pool queue before the pool grows beyond its core
    //! size (and, ultimately, rejects tasks)
    int queue_capacity_{128};
    //! How long an idle worker above the core size waits for work before exiting
    std::chrono::milliseconds keep_alive_{1000};
    //! The worker threads are named "<prefix> #<idx>"
    std::string thread_name_prefix_{"bgtask"};
    //! Function to be called at the start of each thread.
    //! Use this if you want to do things like setting thread priority, affinity, etc.
    std::function<void()> worker_start_fun_;
};

/**
 * @brief      Initializes the bgtask library.
 *
 * @param      config  The configuration to be passed to the library; optional.
 *
 * This will create the global thread pool, with the given parameters. If the library is already
 * initialized this will throw an @ref already_initialized exception. If the configuration is
 * invalid, this throws `std::invalid_argument`.
 *
 * If this is not explicitly called the library will be initialized with default settings the first
 * time that a task needs to be executed on the global thread pool. After initialization, the
 * configuration cannot be changed until @ref shutdown() is called.
 *
 * @see        shutdown(), is_initialized(), already_initialized
 */
void init(const init_data& config = {});

/**
 * @brief      Exception thrown when attempting to initialize the library more than once.
 *
 * Thrown when manually initializing after the library was already initialized, either automatically
 * or by explicitly calling @ref init().
 *
 * @see init(), is_initialized()
 */
struct already_initialized : std::runtime_error {
    already_initialized()
        : runtime_error("already initialized") {}
};

/**
 * @brief      Determines if the library is initialized.
 *
 * @return     True if initialized, False otherwise.
 */
bool is_initialized();

/**
 * @brief      Shuts down the bgtask library.
 *
 * This stops the global thread pool: the tasks that are waiting in its queue are cancelled, and
 * the call waits for the running tasks to complete. In general, the library is shut down
 * automatically at the end of the program, so this is not necessarily needed. However, we might
 * want to call this in unit tests to ensure that the library is in a clean state for the next test.
 *
 * Throws std::logic_error if called from within a task running on the global thread pool; in that
 * case the library stays initialized.
 */
void shutdown();

} // namespace v1
} // namespace bgtask
