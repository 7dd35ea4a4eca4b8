#include "bgtask/thread_pool.hpp"
#include "bgtask/log.hpp"
#include "bgtask/profiling.hpp"
#include "bgtask/detail/platform.hpp"

#include <fmt/format.h>

#if BGTASK_USE_PTHREADS
#include <pthread.h>
#endif

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace bgtask {
namespace detail {

namespace {

//! The number of processors that we can use; never zero
int num_processors() {
    auto n = static_cast<int>(std::thread::hardware_concurrency());
    return n > 0 ? n : 1;
}

//! Fills in the defaults, and checks the validity of the configuration
init_data make_pool_config(const init_data& config) {
    init_data res = config;
    const int n = num_processors();
    if (res.core_pool_size_ == 0)
        res.core_pool_size_ = n + 1;
    if (res.max_pool_size_ == 0)
        res.max_pool_size_ = std::max(2 * n + 1, res.core_pool_size_);

    if (res.core_pool_size_ < 1)
        throw std::invalid_argument("core pool size must be positive");
    if (res.max_pool_size_ < res.core_pool_size_)
        throw std::invalid_argument("max pool size cannot be smaller than the core pool size");
    if (res.queue_capacity_ < 0)
        throw std::invalid_argument("queue capacity cannot be negative");
    if (res.keep_alive_.count() < 0)
        throw std::invalid_argument("keep alive time cannot be negative");
    return res;
}

//! Sets the name of the current thread, as seen by the OS tools and the profiler
void set_current_thread_name(const std::string& name) {
#if BGTASK_PLATFORM_LINUX && BGTASK_USE_PTHREADS
    // Linux limits the thread names to 15 characters
    pthread_setname_np(pthread_self(), name.substr(0, 15).c_str());
#elif BGTASK_PLATFORM_APPLE && BGTASK_USE_PTHREADS
    pthread_setname_np(name.c_str());
#endif
    BGTASK_PROFILING_SETTHREADNAME(name.c_str());
}

} // namespace

//! TLS pointer to the pool owning the current worker thread
thread_local const pool_data* g_current_pool{nullptr};

//! The implementation of a thread_pool
struct pool_data {
    //! The configuration of the pool, with the defaults filled in
    const init_data config_;

    //! Protects all the data below
    mutable std::mutex bottleneck_;
    //! Signaled when new tasks are added in the queue, or when stopping
    std::condition_variable has_work_;
    //! Signaled when the last worker retires
    std::condition_variable workers_done_;

    //! The tasks waiting for a worker
    std::deque<task> queue_;
    //! The running worker threads, by their index
    std::unordered_map<int, std::thread> workers_;
    //! The threads that exited the worker loop and that need to be joined
    std::vector<std::thread> retired_;
    //! The index of the next worker thread that we create
    int next_worker_idx_{1};
    //! The maximum value of workers_.size()
    int largest_pool_size_{0};
    //! Set when shutting down; no new tasks are accepted
    bool stopping_{false};

    explicit pool_data(const init_data& config)
        : config_(make_pool_config(config)) {
        BGTASK_PROFILING_INIT();
    }

    void enqueue(task&& t) {
        BGTASK_PROFILING_FUNCTION();
        std::vector<std::thread> to_join;
        {
            std::unique_lock<std::mutex> lock{bottleneck_};
            to_join.swap(retired_);

            if (stopping_) {
                lock.unlock();
                join_all(to_join);
                BGTASK_LOG(log_level::debug, "task rejected; thread pool is shut down");
                throw task_rejected("thread pool is shut down");
            }

            const int num_workers = static_cast<int>(workers_.size());
            if (num_workers < config_.core_pool_size_) {
                start_worker(std::move(t));
            } else if (static_cast<int>(queue_.size()) < config_.queue_capacity_) {
                queue_.push_back(std::move(t));
                BGTASK_PROFILING_PLOT("bgtask queued tasks", int64_t(queue_.size()));
                lock.unlock();
                has_work_.notify_one();
            } else if (num_workers < config_.max_pool_size_) {
                start_worker(std::move(t));
            } else {
                lock.unlock();
                join_all(to_join);
                BGTASK_LOG(log_level::debug, "task rejected; thread pool is saturated ({} workers, "
                                             "{} queued tasks)",
                        num_workers, config_.queue_capacity_);
                throw executor_saturated();
            }
        }
        join_all(to_join);
    }

    void shutdown() {
        BGTASK_PROFILING_FUNCTION();
        if (g_current_pool == this)
            throw std::logic_error("cannot shut down a thread pool from one of its workers");

        std::deque<task> dropped;
        {
            std::lock_guard<std::mutex> lock{bottleneck_};
            stopping_ = true;
            dropped.swap(queue_);
        }
        has_work_.notify_all();

        // The tasks that didn't get the chance to run are cancelled
        if (!dropped.empty())
            BGTASK_LOG(log_level::info, "thread pool shutting down; cancelling {} queued tasks",
                    dropped.size());
        for (auto& t : dropped)
            cancel_task(t);
        dropped.clear();

        // Wait for all the workers to exit
        std::vector<std::thread> to_join;
        {
            std::unique_lock<std::mutex> lock{bottleneck_};
            workers_done_.wait(lock, [this] { return workers_.empty(); });
            to_join.swap(retired_);
        }
        join_all(to_join);
    }

    int num_workers() const {
        std::lock_guard<std::mutex> lock{bottleneck_};
        return static_cast<int>(workers_.size());
    }

    int num_queued() const {
        std::lock_guard<std::mutex> lock{bottleneck_};
        return static_cast<int>(queue_.size());
    }

    int largest_pool_size() const {
        std::lock_guard<std::mutex> lock{bottleneck_};
        return largest_pool_size_;
    }

private:
    //! Starts a new worker thread, that will execute the given task first.
    //! Must be called with the lock held.
    void start_worker(task&& first) {
        int idx = next_worker_idx_++;
        auto thread_fun = [this, idx, first = std::move(first)]() mutable {
            worker_run(idx, std::move(first));
        };
        workers_.emplace(idx, std::thread{std::move(thread_fun)});
        largest_pool_size_ = std::max(largest_pool_size_, static_cast<int>(workers_.size()));
        BGTASK_PROFILING_PLOT("bgtask workers", int64_t(workers_.size()));
    }

    //! The run procedure for a worker thread
    void worker_run(int idx, task first) {
        g_current_pool = this;
        set_current_thread_name(fmt::format("{} #{}", config_.thread_name_prefix_, idx));
        BGTASK_LOG(log_level::debug, "worker {} started", idx);

        if (config_.worker_start_fun_) {
            try {
                config_.worker_start_fun_();
            } catch (const std::exception& e) {
                BGTASK_LOG(log_level::error, "worker start function failed: {}", e.what());
            } catch (...) {
                BGTASK_LOG(log_level::error, "worker start function failed");
            }
        }

        execute_task(first);
        first = task{};

        while (true) {
            task t;
            if (!try_extract_task(idx, t))
                return;
            BGTASK_PROFILING_SCOPE_N("bgtask task");
            execute_task(t);
        }
    }

    //! Waits for a task to execute. Returns false if the worker needs to exit; in this case, the
    //! worker is already retired.
    bool try_extract_task(int idx, task& t) {
        std::unique_lock<std::mutex> lock{bottleneck_};
        while (queue_.empty()) {
            if (stopping_) {
                retire(idx);
                return false;
            }
            if (static_cast<int>(workers_.size()) > config_.core_pool_size_) {
                // Excess worker; exit if we don't get new tasks for a while
                auto res = has_work_.wait_for(lock, config_.keep_alive_);
                if (res == std::cv_status::timeout && queue_.empty() && !stopping_ &&
                        static_cast<int>(workers_.size()) > config_.core_pool_size_) {
                    BGTASK_LOG(log_level::debug, "worker {} idle for too long; exiting", idx);
                    retire(idx);
                    return false;
                }
            } else {
                has_work_.wait(lock);
            }
        }
        t = std::move(queue_.front());
        queue_.pop_front();
        BGTASK_PROFILING_PLOT("bgtask queued tasks", int64_t(queue_.size()));
        return true;
    }

    //! Moves the worker out of the active workers list. Must be called with the lock held.
    void retire(int idx) {
        auto it = workers_.find(idx);
        retired_.push_back(std::move(it->second));
        workers_.erase(it);
        BGTASK_PROFILING_PLOT("bgtask workers", int64_t(workers_.size()));
        if (workers_.empty())
            workers_done_.notify_all();
    }

    static void join_all(std::vector<std::thread>& threads) {
        for (auto& th : threads)
            if (th.joinable())
                th.join();
    }
};

} // namespace detail

inline namespace v1 {

thread_pool::thread_pool(const init_data& config)
    : impl_(std::make_unique<detail::pool_data>(config)) {}

thread_pool::~thread_pool() {
    if (running_in_this_thread()) {
        // The workers still use the pool data; leave it alive
        BGTASK_LOG(log_level::error, "thread pool destroyed from one of its workers; leaking it");
        impl_.release();
        return;
    }
    impl_->shutdown();
}

void thread_pool::enqueue(task t) { impl_->enqueue(std::move(t)); }

void thread_pool::shutdown() { impl_->shutdown(); }

bool thread_pool::running_in_this_thread() const noexcept {
    return detail::g_current_pool == impl_.get();
}

int thread_pool::core_pool_size() const noexcept { return impl_->config_.core_pool_size_; }
int thread_pool::max_pool_size() const noexcept { return impl_->config_.max_pool_size_; }
int thread_pool::queue_capacity() const noexcept { return impl_->config_.queue_capacity_; }
std::chrono::milliseconds thread_pool::keep_alive() const noexcept {
    return impl_->config_.keep_alive_;
}

int thread_pool::num_workers() const { return impl_->num_workers(); }
int thread_pool::num_queued() const { return impl_->num_queued(); }
int thread_pool::largest_pool_size() const { return impl_->largest_pool_size(); }

} // namespace v1
} // namespace bgtask
