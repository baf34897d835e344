#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace vmm::mem {

/**
 * @brief Background thread invoking a tick function at a fixed interval
 *
 * start() and stop() are idempotent and serialized against each other. stop()
 * wakes the thread and joins it, so an in-flight tick always completes before
 * stop() returns. request_stop() only wakes the thread; the next start() or
 * stop() joins it.
 */
class PeriodicTask {
public:
    using Tick = std::function<void()>;

    PeriodicTask(std::string name, Tick tick);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    // Returns false if the task was already running (interval unchanged).
    bool start(std::chrono::milliseconds interval);
    void stop();
    void request_stop();

    bool running() const { return running_.load(); }
    uint64_t tick_count() const { return tick_count_.load(); }
    const std::string& name() const { return name_; }

private:
    void worker_loop(std::chrono::milliseconds interval);

    std::string name_;
    Tick tick_;
    std::mutex lifecycle_m_; // held across start/stop, including the join
    std::thread worker_;
    std::atomic<std::thread::id> worker_id_{std::thread::id()};
    std::mutex m_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> tick_count_{0};
};

} // namespace vmm::mem
