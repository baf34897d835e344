#include <catch2/catch_test_macros.hpp>
#include "mem/periodic_task.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using vmm::mem::PeriodicTask;
using namespace std::chrono_literals;

namespace {

template <typename Pred>
bool wait_for(Pred pred, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(2ms);
    }
    return pred();
}

} // namespace

TEST_CASE("PeriodicTask ticks until stopped", "[periodic]") {
    std::atomic<int> ticks{0};
    PeriodicTask task("test", [&] { ++ticks; });

    REQUIRE(task.start(5ms));
    REQUIRE(task.running());
    REQUIRE_FALSE(task.start(5ms));
    REQUIRE(wait_for([&] { return ticks >= 3; }));

    task.stop();
    REQUIRE_FALSE(task.running());
    const int after_stop = ticks;
    std::this_thread::sleep_for(20ms);
    REQUIRE(ticks == after_stop);
    REQUIRE(task.tick_count() == static_cast<uint64_t>(after_stop));

    task.stop();
}

TEST_CASE("PeriodicTask can be restarted", "[periodic]") {
    std::atomic<int> ticks{0};
    PeriodicTask task("restart", [&] { ++ticks; });
    REQUIRE(task.start(5ms));
    task.stop();
    REQUIRE(task.start(5ms));
    REQUIRE(wait_for([&] { return ticks >= 1; }));
    task.stop();
}

TEST_CASE("PeriodicTask stop waits for the in-flight tick", "[periodic]") {
    std::atomic<bool> in_tick{false};
    std::atomic<bool> finished{false};
    PeriodicTask task("slow", [&] {
        in_tick = true;
        std::this_thread::sleep_for(30ms);
        finished = true;
    });
    REQUIRE(task.start(1ms));
    REQUIRE(wait_for([&] { return in_tick.load(); }));
    task.stop();
    REQUIRE(finished);
}

TEST_CASE("PeriodicTask survives a throwing tick", "[periodic]") {
    std::atomic<int> calls{0};
    PeriodicTask task("throwing", [&] {
        ++calls;
        throw std::runtime_error("tick failure");
    });
    REQUIRE(task.start(2ms));
    REQUIRE(wait_for([&] { return calls >= 2; }));
    task.stop();
}

TEST_CASE("PeriodicTask may stop itself from its tick", "[periodic]") {
    std::atomic<int> calls{0};
    PeriodicTask* self = nullptr;
    PeriodicTask task("self_stop", [&] {
        ++calls;
        self->stop();
    });
    self = &task;
    REQUIRE(task.start(2ms));
    REQUIRE(wait_for([&] { return !task.running(); }));
    REQUIRE(calls == 1);
    REQUIRE(task.start(2ms));
    task.stop();
}

TEST_CASE("PeriodicTask request_stop ends the loop without joining", "[periodic]") {
    std::atomic<int> ticks{0};
    PeriodicTask task("requested", [&] { ++ticks; });
    REQUIRE(task.start(2ms));
    REQUIRE(wait_for([&] { return ticks >= 1; }));

    task.request_stop();
    REQUIRE(wait_for([&] { return !task.running(); }));
    REQUIRE(task.start(2ms));
    task.stop();
    REQUIRE_FALSE(task.running());
}

TEST_CASE("PeriodicTask start and stop from racing threads", "[periodic][concurrency]") {
    std::atomic<int> ticks{0};
    PeriodicTask task("racing", [&] { ++ticks; });

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&task, t] {
            for (int i = 0; i < 50; ++i) {
                if ((i + t) % 2 == 0) {
                    task.start(1ms);
                } else {
                    task.stop();
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    task.stop();
    REQUIRE_FALSE(task.running());
    const uint64_t before = task.tick_count();
    REQUIRE(task.start(1ms));
    REQUIRE(wait_for([&] { return task.tick_count() > before; }));
    task.stop();
}
