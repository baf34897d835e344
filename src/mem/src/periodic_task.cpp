#include "mem/periodic_task.hpp"
#include "core/log.hpp"
#include <exception>

namespace vmm::mem {

PeriodicTask::PeriodicTask(std::string name, Tick tick)
    : name_(std::move(name)), tick_(std::move(tick)) {}

PeriodicTask::~PeriodicTask() { stop(); }

bool PeriodicTask::start(std::chrono::milliseconds interval) {
    // Our own tick: the thread is alive, so there is nothing to start
    if (worker_id_.load() == std::this_thread::get_id()) return false;

    std::lock_guard<std::mutex> life(lifecycle_m_);
    std::unique_lock<std::mutex> lk(m_);
    if (running_) return false;
    // A previous run stopped from inside its own tick, or by request_stop(), leaves a finished thread behind
    if (worker_.joinable()) {
        lk.unlock();
        worker_.join();
        lk.lock();
    }
    if (interval.count() <= 0) interval = std::chrono::milliseconds(1);
    stop_requested_ = false;
    running_ = true;
    worker_ = std::thread([this, interval] { worker_loop(interval); });
    worker_id_ = worker_.get_id();
    vmm::log::debug(name_ + " started, interval " + std::to_string(interval.count()) + " ms");
    return true;
}

void PeriodicTask::stop() {
    if (worker_id_.load() == std::this_thread::get_id()) {
        // Called from our own tick: the loop exits after it returns; joined by the next start()/stop()
        request_stop();
        return;
    }

    std::lock_guard<std::mutex> life(lifecycle_m_);
    {
        std::lock_guard<std::mutex> lk(m_);
        if (!worker_.joinable()) return;
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (worker_.get_id() == std::this_thread::get_id()) {
        // First tick raced ahead of start() recording the worker id
        return;
    }
    worker_.join();
    worker_id_ = std::thread::id();
    vmm::log::debug(name_ + " stopped after " + std::to_string(tick_count_.load()) + " ticks");
}

void PeriodicTask::request_stop() {
    {
        std::lock_guard<std::mutex> lk(m_);
        stop_requested_ = true;
    }
    cv_.notify_all();
}

void PeriodicTask::worker_loop(std::chrono::milliseconds interval) {
    auto next = std::chrono::steady_clock::now() + interval;
    while (true) {
        {
            std::unique_lock<std::mutex> lk(m_);
            if (cv_.wait_until(lk, next, [this] { return stop_requested_; })) break;
        }
        try {
            if (tick_) tick_();
        } catch (const std::exception& e) {
            vmm::log::error(name_ + " tick failed: " + e.what());
        }
        ++tick_count_;
        next += interval;
        auto now = std::chrono::steady_clock::now();
        if (next < now) next = now + interval; // overran, do not burst
    }
    running_ = false;
}

} // namespace vmm::mem
