#include <catch2/catch.hpp>
#include <bgtask/init.hpp>
#include <bgtask/pool_executor.hpp>
#include <bgtask/detail/library_data.hpp>

#include "test_common/common_executor_tests.hpp"
#include "test_common/task_utils.hpp"

#include <atomic>
#include <stdexcept>

using namespace std::chrono_literals;

TEST_CASE("can init and shutdown library", "[init]") {
    bgtask::shutdown();
    REQUIRE_FALSE(bgtask::is_initialized());
    bgtask::init();
    REQUIRE(bgtask::is_initialized());
    bgtask::shutdown();
    REQUIRE_FALSE(bgtask::is_initialized());
}

TEST_CASE("can init multiple times", "[init]") {
    bgtask::shutdown();
    REQUIRE_FALSE(bgtask::is_initialized());
    bgtask::init();
    REQUIRE(bgtask::is_initialized());
    bgtask::shutdown();
    REQUIRE_FALSE(bgtask::is_initialized());
    bgtask::init();
    REQUIRE(bgtask::is_initialized());
    bgtask::shutdown();
}

TEST_CASE("can execute tasks if initialized multiple times", "[init]") {
    bgtask::shutdown();
    bgtask::init();
    bgtask::shutdown();
    bgtask::init();
    REQUIRE(bgtask::is_initialized());
    test_can_execute_a_task(bgtask::pool_executor{});
    bgtask::shutdown();
}

TEST_CASE("the library initializes itself on first use", "[init]") {
    bgtask::shutdown();
    REQUIRE_FALSE(bgtask::is_initialized());
    REQUIRE(enqueue_and_wait(bgtask::pool_executor{}, [] {}));
    REQUIRE(bgtask::is_initialized());
}

TEST_CASE("the configuration is used by the global pool", "[init]") {
    bgtask::shutdown();

    bgtask::init_data config;
    config.core_pool_size_ = 2;
    config.max_pool_size_ = 3;
    config.queue_capacity_ = 5;
    config.keep_alive_ = 10ms;
    bgtask::init(config);

    auto& pool = bgtask::detail::get_global_pool();
    REQUIRE(pool.core_pool_size() == 2);
    REQUIRE(pool.max_pool_size() == 3);
    REQUIRE(pool.queue_capacity() == 5);
    REQUIRE(pool.keep_alive() == 10ms);

    bgtask::shutdown();
}

TEST_CASE("worker start fun is called", "[init]") {
    bgtask::shutdown();

    for (int i = 1; i < 5; i++) {
        std::atomic<int> init_count{0};

        bgtask::init_data config;
        config.core_pool_size_ = i;
        config.worker_start_fun_ = [&]() { init_count++; };
        bgtask::init(config);

        // Enqueue enough blocking tasks to start all the core workers
        gate g;
        task_countdown tc{i};
        for (int k = 0; k < i; k++)
            bgtask::pool_executor{}.execute(bgtask::task{
                    [&] { g.wait(); }, {}, [&](std::exception_ptr) { tc.task_finished(); }});
        REQUIRE(bounded_wait([&] { return init_count.load() == i; }));
        g.open();
        REQUIRE(tc.wait_for_all());

        bgtask::shutdown();
    }
}

TEST_CASE("invalid configuration is rejected", "[init]") {
    bgtask::shutdown();
    bgtask::init_data config;
    config.core_pool_size_ = 3;
    config.max_pool_size_ = 2;
    REQUIRE_THROWS_AS(bgtask::init(config), std::invalid_argument);
    REQUIRE_FALSE(bgtask::is_initialized());
}

TEST_CASE("init twice (manually) throws", "[init]") {
    bgtask::shutdown();
    bgtask::init();

    REQUIRE_THROWS_AS(bgtask::init(), bgtask::already_initialized);
    bgtask::shutdown();
}

TEST_CASE("init twice (first time automatic) throws", "[init]") {
    bgtask::shutdown();
    // Enqueueing a task here initializes the library
    test_can_execute_a_task(bgtask::pool_executor{});

    REQUIRE_THROWS_AS(bgtask::init(), bgtask::already_initialized);
}

TEST_CASE("shutdown from a task of the global pool throws", "[init]") {
    bgtask::shutdown();
    bgtask::init();

    std::atomic<bool> got_error{false};
    REQUIRE(enqueue_and_wait(bgtask::pool_executor{},
            [&] {
                try {
                    bgtask::shutdown();
                } catch (const std::logic_error&) {
                    got_error = true;
                }
            },
            1));
    REQUIRE(got_error.load());
    // The library is still usable
    REQUIRE(bgtask::is_initialized());
    test_can_execute_a_task(bgtask::pool_executor{});

    bgtask::shutdown();
    REQUIRE_FALSE(bgtask::is_initialized());
}
