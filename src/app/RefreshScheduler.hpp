#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace app {

// Runs a refresh task on a repeating timer. At most one timer is active:
// start() while running replaces the current timer, stop() is a no-op when
// idle. Task failures are logged and never stop the timer.
class RefreshScheduler {
public:
    using Task = std::function<void()>;

    explicit RefreshScheduler(Task task);
    ~RefreshScheduler();

    RefreshScheduler(const RefreshScheduler&) = delete;
    RefreshScheduler& operator=(const RefreshScheduler&) = delete;

    void start(std::chrono::milliseconds interval);

    // A round already running is allowed to finish. Safe to call from inside
    // the task; that worker is joined by the next start()/stop() made from
    // another thread, or by the destructor.
    void stop();

    // Runs the task on the calling thread. The timer phase is left alone.
    void forceRefreshNow();

    bool isRunning() const;
    std::uint64_t ticks() const;

private:
    void run_worker_(std::uint64_t generation, std::chrono::milliseconds interval);
    void run_task_(const char* trigger);
    std::vector<std::thread> retire_workers_();

    Task task_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    // Worker that stopped itself and still has to be joined.
    std::thread retired_;
    std::uint64_t generation_{0};
    bool running_{false};
    std::atomic<std::uint64_t> ticks_{0};
};

}  // namespace app
