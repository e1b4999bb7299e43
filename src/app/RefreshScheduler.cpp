#include "app/RefreshScheduler.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace app {

RefreshScheduler::RefreshScheduler(Task task)
    : task_(std::move(task)) {
    if (!task_) {
        throw std::invalid_argument("RefreshScheduler requires a task");
    }
}

RefreshScheduler::~RefreshScheduler() {
    stop();
}

void RefreshScheduler::start(std::chrono::milliseconds interval) {
    if (interval.count() <= 0) {
        throw std::invalid_argument("RefreshScheduler interval must be positive");
    }

    std::vector<std::thread> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            LOG_DEBUG("RefreshScheduler: restarting timer");
        }
        previous = retire_workers_();

        const auto generation = ++generation_;
        running_ = true;
        worker_ = std::thread(&RefreshScheduler::run_worker_, this, generation, interval);
    }
    for (auto& thread : previous) {
        thread.join();
    }
    LOG_INFO("RefreshScheduler: started interval_ms=" << interval.count());
}

void RefreshScheduler::stop() {
    std::vector<std::thread> previous;
    bool wasRunning = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        wasRunning = running_;
        previous = retire_workers_();
    }
    for (auto& thread : previous) {
        thread.join();
    }
    if (wasRunning) {
        LOG_INFO("RefreshScheduler: stopped");
    }
}

// Invalidates the current worker generation and hands back every thread the
// caller must join. The calling thread's own worker is parked in retired_.
// Expects mutex_ held.
std::vector<std::thread> RefreshScheduler::retire_workers_() {
    ++generation_;
    running_ = false;
    cv_.notify_all();

    std::vector<std::thread> joinable;
    const auto self = std::this_thread::get_id();
    for (auto* slot : {&retired_, &worker_}) {
        if (slot->joinable() && slot->get_id() != self) {
            joinable.push_back(std::move(*slot));
        }
    }
    if (worker_.joinable()) {
        retired_ = std::move(worker_);
    }
    return joinable;
}

void RefreshScheduler::forceRefreshNow() {
    run_task_("forced");
}

bool RefreshScheduler::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

std::uint64_t RefreshScheduler::ticks() const {
    return ticks_.load(std::memory_order_relaxed);
}

void RefreshScheduler::run_worker_(std::uint64_t generation, std::chrono::milliseconds interval) {
    auto next = std::chrono::steady_clock::now() + interval;
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            const bool cancelled = cv_.wait_until(lock, next, [&]() { return generation_ != generation; });
            if (cancelled) {
                return;
            }
        }

        ticks_.fetch_add(1, std::memory_order_relaxed);
        mkt::common::metrics::Registry::instance().incrementCounter("scheduler.ticks");
        run_task_("timer");

        next += interval;
        const auto now = std::chrono::steady_clock::now();
        if (next <= now) {
            // Round overran one or more periods; skip the missed ticks.
            next = now + interval;
        }
    }
}

void RefreshScheduler::run_task_(const char* trigger) {
    try {
        task_();
    } catch (const std::exception& ex) {
        LOG_ERR("RefreshScheduler: " << trigger << " refresh failed: " << ex.what());
    }
}

}  // namespace app
