#include "bgtask/init.hpp"
#include "bgtask/thread_pool.hpp"
#include "bgtask/log.hpp"
#include "bgtask/detail/library_data.hpp"

#include <atomic>
#include <cstdlib>
#include <mutex>
#include <stdexcept>

namespace bgtask {
namespace detail {

//! The global thread pool; null if the library is not initialized
static std::atomic<thread_pool*> g_global_pool{nullptr};

//! Serializes the initialization and the shutdown of the library
static std::mutex g_init_bottleneck;

//! Set after we register the atexit handler; we need to do it only once
static bool g_atexit_registered{false};

//! Called to shutdown the library. Throws std::logic_error if called from a worker of the global
//! pool; the library stays initialized in that case.
static void do_shutdown() {
    thread_pool* pool{nullptr};
    {
        std::lock_guard<std::mutex> lock{g_init_bottleneck};
        pool = g_global_pool.load(std::memory_order_acquire);
        if (pool && pool->running_in_this_thread())
            throw std::logic_error("cannot shut down the library from a worker of the global pool");
        g_global_pool.store(nullptr, std::memory_order_release);
    }
    delete pool;
}

//! The atexit handler
static void do_shutdown_at_exit() {
    try {
        do_shutdown();
    } catch (const std::logic_error& e) {
        BGTASK_LOG(log_level::error, "cannot shut down at exit: {}", e.what());
    }
}

//! Actually initializes the library; must be called with g_init_bottleneck locked
static thread_pool* do_init(const init_data* config) {
    static const init_data default_config;
    if (!config)
        config = &default_config;
    auto pool = new thread_pool(*config);
    g_global_pool.store(pool, std::memory_order_release);
    BGTASK_LOG(log_level::debug, "global thread pool created: core={}, max={}, queue={}",
            pool->core_pool_size(), pool->max_pool_size(), pool->queue_capacity());
    if (!g_atexit_registered) {
        std::atexit(&do_shutdown_at_exit);
        g_atexit_registered = true;
    }
    return pool;
}

thread_pool& get_global_pool(const init_data* config) {
    auto p = g_global_pool.load(std::memory_order_acquire);
    if (!p) {
        std::lock_guard<std::mutex> lock{g_init_bottleneck};
        p = g_global_pool.load(std::memory_order_acquire);
        if (!p)
            p = do_init(config);
    }
    return *p;
}

} // namespace detail

inline namespace v1 {

void init(const init_data& config) {
    std::lock_guard<std::mutex> lock{detail::g_init_bottleneck};
    if (detail::g_global_pool.load(std::memory_order_acquire))
        throw already_initialized();
    detail::do_init(&config);
}

bool is_initialized() { return detail::g_global_pool.load(std::memory_order_acquire) != nullptr; }

void shutdown() { detail::do_shutdown(); }

} // namespace v1

} // namespace bgtask
