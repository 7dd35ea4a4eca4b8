#include <catch2/catch.hpp>
#include <bgtask/thread_pool.hpp>
#include <bgtask/pool_executor.hpp>
#include <bgtask/task_cancelled.hpp>
#include <bgtask/detail/platform.hpp>

#include "test_common/common_executor_tests.hpp"
#include "test_common/task_countdown.hpp"
#include "test_common/task_utils.hpp"

#if BGTASK_PLATFORM_LINUX && BGTASK_USE_PTHREADS
#include <pthread.h>
#endif

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>

using namespace std::chrono_literals;

namespace {

//! Configuration of a small pool, easy to saturate
bgtask::init_data small_pool_config() {
    bgtask::init_data config;
    config.core_pool_size_ = 1;
    config.max_pool_size_ = 2;
    config.queue_capacity_ = 2;
    config.keep_alive_ = 20ms;
    return config;
}

} // namespace

TEST_CASE("thread_pool uses the default sizes", "[thread_pool]") {
    const int n = std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
    bgtask::thread_pool pool;
    REQUIRE(pool.core_pool_size() == n + 1);
    REQUIRE(pool.max_pool_size() == 2 * n + 1);
    REQUIRE(pool.queue_capacity() == 128);
    REQUIRE(pool.keep_alive() == 1000ms);
    // Workers are created on demand
    REQUIRE(pool.num_workers() == 0);
}

TEST_CASE("thread_pool rejects invalid configurations", "[thread_pool]") {
    bgtask::init_data config;
    SECTION("max smaller than core") {
        config.core_pool_size_ = 4;
        config.max_pool_size_ = 2;
        REQUIRE_THROWS_AS(bgtask::thread_pool{config}, std::invalid_argument);
    }
    SECTION("negative queue capacity") {
        config.queue_capacity_ = -1;
        REQUIRE_THROWS_AS(bgtask::thread_pool{config}, std::invalid_argument);
    }
    SECTION("negative core size") {
        config.core_pool_size_ = -1;
        REQUIRE_THROWS_AS(bgtask::thread_pool{config}, std::invalid_argument);
    }
}

TEST_CASE("pool_executor executes a task", "[thread_pool]") {
    test_can_execute_a_task(bgtask::pool_executor{});
}

TEST_CASE("pool_executor executes all tasks", "[thread_pool]") {
    test_can_execute_multiple_tasks(bgtask::pool_executor{});
}

TEST_CASE("pool_executor runs tasks in parallel", "[thread_pool]") {
    test_tasks_do_run_in_parallel(bgtask::pool_executor{});
}

TEST_CASE("pool_executor can target a user pool", "[thread_pool]") {
    bgtask::thread_pool pool{small_pool_config()};
    bgtask::pool_executor e{pool};
    REQUIRE(e != bgtask::pool_executor{});
    REQUIRE(e == bgtask::pool_executor{pool});

    std::atomic<bool> in_pool{false};
    REQUIRE(enqueue_and_wait(e, [&] { in_pool = pool.running_in_this_thread(); }, 1));
    REQUIRE(in_pool.load());
    REQUIRE_FALSE(pool.running_in_this_thread());
}

TEST_CASE("thread_pool grows beyond the core size only when the queue is full", "[thread_pool]") {
    bgtask::thread_pool pool{small_pool_config()};
    gate g;
    task_countdown tc{4};
    auto blocking = [&] { g.wait(); };
    auto cont = [&](std::exception_ptr) { tc.task_finished(); };

    // First task: a core worker is created
    pool.enqueue(bgtask::task{blocking, {}, cont});
    REQUIRE(pool.num_workers() == 1);
    // The next two tasks go into the queue
    pool.enqueue(bgtask::task{blocking, {}, cont});
    pool.enqueue(bgtask::task{blocking, {}, cont});
    REQUIRE(pool.num_workers() == 1);
    REQUIRE(pool.num_queued() == 2);
    // Queue is full; an excess worker is created
    pool.enqueue(bgtask::task{blocking, {}, cont});
    REQUIRE(pool.num_workers() == 2);
    REQUIRE(pool.num_queued() == 2);
    // Everything is full; the pool is saturated
    REQUIRE_THROWS_AS(pool.enqueue(bgtask::task{blocking}), bgtask::executor_saturated);

    g.open();
    REQUIRE(tc.wait_for_all());
    REQUIRE(pool.largest_pool_size() == 2);

    // The excess worker exits after the keep-alive time
    REQUIRE(bounded_wait([&] { return pool.num_workers() == 1; }));
}

TEST_CASE("saturated pool surfaces the error through the executor", "[thread_pool]") {
    bgtask::init_data config;
    config.core_pool_size_ = 1;
    config.max_pool_size_ = 1;
    config.queue_capacity_ = 0;
    bgtask::thread_pool pool{config};
    bgtask::pool_executor e{pool};

    gate g;
    task_countdown tc{1};
    e.execute(bgtask::task{[&] { g.wait(); }, {}, [&](std::exception_ptr) { tc.task_finished(); }});
    REQUIRE_THROWS_AS(e.execute([] {}), bgtask::executor_saturated);
    REQUIRE_THROWS_AS(e.execute([] {}), bgtask::task_rejected);

    g.open();
    REQUIRE(tc.wait_for_all());
}

TEST_CASE("thread_pool shutdown cancels the queued tasks", "[thread_pool]") {
    bgtask::init_data config;
    config.core_pool_size_ = 1;
    config.max_pool_size_ = 1;
    bgtask::thread_pool pool{config};

    gate g;
    std::atomic<bool> first_started{false};
    pool.enqueue(bgtask::task{[&] {
        first_started = true;
        g.wait();
    }});
    REQUIRE(bounded_wait([&] { return first_started.load(); }));

    constexpr int num_queued = 5;
    std::atomic<int> num_executed{0};
    std::atomic<int> num_cancelled{0};
    for (int i = 0; i < num_queued; i++) {
        auto cont = [&](std::exception_ptr ex) {
            try {
                if (ex)
                    std::rethrow_exception(ex);
            } catch (const bgtask::task_cancelled&) {
                num_cancelled++;
            }
        };
        pool.enqueue(bgtask::task{[&] { num_executed++; }, {}, cont});
    }
    REQUIRE(pool.num_queued() == num_queued);

    // Shutdown waits for the running task; let it finish after the queue is dropped
    std::thread stopper{[&] { pool.shutdown(); }};
    REQUIRE(bounded_wait([&] { return num_cancelled.load() == num_queued; }));
    g.open();
    stopper.join();

    REQUIRE(num_executed.load() == 0);
    REQUIRE(pool.num_workers() == 0);
    REQUIRE_THROWS_AS(pool.enqueue(bgtask::task{[] {}}), bgtask::task_rejected);
    // Shutting down again is fine
    pool.shutdown();
}

TEST_CASE("thread_pool cannot be shut down from its own workers", "[thread_pool]") {
    bgtask::thread_pool pool{small_pool_config()};
    std::atomic<bool> got_error{false};
    REQUIRE(enqueue_and_wait(bgtask::pool_executor{pool},
            [&] {
                try {
                    pool.shutdown();
                } catch (const std::logic_error&) {
                    got_error = true;
                }
            },
            1));
    REQUIRE(got_error.load());
}

TEST_CASE("thread_pool calls the worker start function", "[thread_pool]") {
    std::atomic<int> init_count{0};
    bgtask::init_data config = small_pool_config();
    config.worker_start_fun_ = [&] { init_count++; };
    bgtask::thread_pool pool{config};

    REQUIRE(enqueue_and_wait(bgtask::pool_executor{pool}, [] {}, 1));
    REQUIRE(init_count.load() == 1);
}

#if BGTASK_PLATFORM_LINUX && BGTASK_USE_PTHREADS
TEST_CASE("thread_pool names its worker threads", "[thread_pool]") {
    bgtask::init_data config = small_pool_config();
    config.thread_name_prefix_ = "bgtest";
    bgtask::thread_pool pool{config};

    std::string name;
    REQUIRE(enqueue_and_wait(bgtask::pool_executor{pool},
            [&] {
                char buf[16] = {};
                pthread_getname_np(pthread_self(), buf, sizeof(buf));
                name = buf;
            },
            1));
    REQUIRE(name == "bgtest #1");
}
#endif
