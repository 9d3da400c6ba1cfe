#include <catch2/catch_test_macros.hpp>

#include "dispatch/task_queue.hpp"

#include <atomic>
#include <chrono>
#include <latch>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST_CASE("TaskQueue", "[task_queue]") {

    SECTION("RunsPostedJobs") {
        std::atomic<int> ran{0};
        {
            TaskQueue queue(2, 64);
            REQUIRE(queue.workers() == 2);
            for (int i = 0; i < 50; ++i) {
                REQUIRE(queue.try_post([&] { ++ran; }));
            }
        }
        REQUIRE(ran == 50);
    }

    SECTION("SingleWorkerKeepsFifoOrder") {
        std::vector<int> order;
        std::mutex m;
        {
            TaskQueue queue(1, 16);
            for (int i = 0; i < 10; ++i) {
                REQUIRE(queue.try_post([&, i] {
                    std::lock_guard<std::mutex> lock(m);
                    order.push_back(i);
                }));
            }
        }
        REQUIRE(order == std::vector<int>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9});
    }

    SECTION("RejectsBeyondCapacity") {
        std::latch release(1);
        std::latch started(1);
        std::atomic<int> ran{0};
        {
            TaskQueue queue(1, 2);
            // Occupy the only worker.
            REQUIRE(queue.try_post([&] {
                started.count_down();
                release.wait();
                ++ran;
            }));
            started.wait();

            REQUIRE(queue.try_post([&] { ++ran; }));
            REQUIRE(queue.try_post([&] { ++ran; }));
            REQUIRE(queue.pending() == 2);
            REQUIRE_FALSE(queue.try_post([&] { ++ran; }));

            release.count_down();
        }
        REQUIRE(ran == 3);
    }

    SECTION("ZeroSizesClampedToOne") {
        TaskQueue queue(0, 0);
        REQUIRE(queue.workers() == 1);
        REQUIRE(queue.capacity() == 1);
    }

    SECTION("ThrowingJobDoesNotKillWorker") {
        std::atomic<int> ran{0};
        {
            TaskQueue queue(1, 4);
            REQUIRE(queue.try_post([] { throw std::runtime_error("boom"); }));
            REQUIRE(queue.try_post([] { throw 7; }));
            REQUIRE(queue.try_post([&] { ++ran; }));
        }
        REQUIRE(ran == 1);
    }

    SECTION("BoundsConcurrency") {
        std::atomic<int> active{0};
        std::atomic<int> peak{0};
        {
            TaskQueue queue(3, 32);
            for (int i = 0; i < 24; ++i) {
                REQUIRE(queue.try_post([&] {
                    int now = ++active;
                    int seen = peak.load();
                    while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
                    std::this_thread::sleep_for(2ms);
                    --active;
                }));
            }
        }
        REQUIRE(peak <= 3);
        REQUIRE(peak >= 1);
    }
}
