#include <catch2/catch.hpp>
#include "rapidcheck_utils.hpp"
#include <bgtask/serial_executor.hpp>
#include <bgtask/pool_executor.hpp>

#include "test_common/task_countdown.hpp"

#include <atomic>
#include <mutex>
#include <vector>

using namespace std::chrono_literals;

TEST_CASE("serial_executor executes any sequence of tasks in order", "[serial]") {
    PROPERTY([](const std::vector<int>& values) {
        bgtask::serial_executor ser{bgtask::pool_executor{}};
        task_countdown tc{static_cast<int>(values.size())};

        std::mutex results_mutex;
        std::vector<int> results;
        for (int v : values)
            ser.execute([&, v] {
                {
                    std::lock_guard<std::mutex> lock{results_mutex};
                    results.push_back(v);
                }
                tc.task_finished();
            });

        RC_ASSERT(tc.wait_for_all(3000ms));
        std::lock_guard<std::mutex> lock{results_mutex};
        RC_ASSERT(results == values);
    });
}

TEST_CASE("serial_executor never runs two tasks at once", "[serial]") {
    PROPERTY([](unsigned char num_tasks) {
        bgtask::serial_executor ser{bgtask::pool_executor{}};
        task_countdown tc{num_tasks};
        std::atomic<int> cur_parallelism{0};
        std::atomic<int> num_violations{0};

        for (int i = 0; i < num_tasks; i++)
            ser.execute([&] {
                if (cur_parallelism++ != 0)
                    num_violations++;
                cur_parallelism--;
                tc.task_finished();
            });

        RC_ASSERT(tc.wait_for_all(3000ms));
        RC_ASSERT(num_violations.load() == 0);
    });
}
