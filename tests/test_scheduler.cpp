#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

#include "app/RefreshScheduler.hpp"
#include "common/Log.hpp"

namespace {
using namespace std::chrono_literals;

bool waitForCondition(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(1ms);
    }
    return predicate();
}

}  // namespace

int main() {
    mkt::log::setLevel(mkt::log::Level::Error);

    {
        std::atomic<int> runs{0};
        app::RefreshScheduler scheduler([&]() { runs.fetch_add(1); });

        scheduler.stop();  // idle stop is a no-op
        if (scheduler.isRunning()) {
            std::cerr << "Scheduler must start idle\n";
            return 1;
        }

        scheduler.start(40ms);
        scheduler.start(40ms);
        if (!scheduler.isRunning()) {
            std::cerr << "Scheduler must be running after start\n";
            return 1;
        }

        std::this_thread::sleep_for(420ms);
        const auto ticks = scheduler.ticks();
        // One timer yields about ten ticks in the window; two would yield twenty.
        if (ticks < 3U || ticks > 14U) {
            std::cerr << "Expected a single active timer, observed " << ticks << " ticks\n";
            return 1;
        }

        scheduler.stop();
        scheduler.stop();
        const auto afterStop = runs.load();
        std::this_thread::sleep_for(150ms);
        if (runs.load() != afterStop || scheduler.isRunning()) {
            std::cerr << "No round may start after stop\n";
            return 1;
        }

        const auto ticksBefore = scheduler.ticks();
        scheduler.forceRefreshNow();
        if (runs.load() != afterStop + 1 || scheduler.ticks() != ticksBefore) {
            std::cerr << "forceRefreshNow must run once without touching the timer\n";
            return 1;
        }
    }

    {
        std::atomic<int> failures{0};
        app::RefreshScheduler scheduler([&]() {
            failures.fetch_add(1);
            throw std::runtime_error("provider exploded");
        });
        scheduler.start(20ms);
        if (!waitForCondition([&]() { return failures.load() >= 3; }, 1000ms) || !scheduler.isRunning()) {
            std::cerr << "Failing rounds must not stop the timer\n";
            return 1;
        }
        scheduler.forceRefreshNow();  // exception is contained
        scheduler.stop();
    }

    {
        std::atomic<int> runs{0};
        std::atomic<bool> roundFinished{false};
        app::RefreshScheduler* self = nullptr;
        auto scheduler = std::make_unique<app::RefreshScheduler>([&]() {
            if (runs.fetch_add(1) == 1) {
                self->stop();
                // Still inside the round when the owner tears the scheduler down.
                std::this_thread::sleep_for(50ms);
                roundFinished.store(!self->isRunning());
            }
        });
        self = scheduler.get();
        scheduler->start(20ms);
        if (!waitForCondition([&]() { return !scheduler->isRunning(); }, 1000ms)) {
            std::cerr << "stop() from inside the task must end the timer\n";
            return 1;
        }
        scheduler.reset();
        if (!roundFinished.load() || runs.load() != 2) {
            std::cerr << "Destruction must wait for the round that stopped the timer, runs=" << runs.load() << "\n";
            return 1;
        }
    }

    {
        std::atomic<int> runs{0};
        app::RefreshScheduler* self = nullptr;
        app::RefreshScheduler scheduler([&]() {
            if (runs.fetch_add(1) == 0) {
                self->stop();
            }
        });
        self = &scheduler;
        scheduler.start(20ms);
        if (!waitForCondition([&]() { return !scheduler.isRunning(); }, 1000ms)) {
            std::cerr << "stop() from inside the task must end the timer\n";
            return 1;
        }
        scheduler.start(20ms);
        if (!waitForCondition([&]() { return runs.load() >= 2; }, 1000ms) || !scheduler.isRunning()) {
            std::cerr << "Timer must restart after an in-task stop\n";
            return 1;
        }
        scheduler.stop();
    }

    {
        app::RefreshScheduler scheduler([]() {});
        try {
            scheduler.start(0ms);
            std::cerr << "Zero interval must be rejected\n";
            return 1;
        } catch (const std::invalid_argument&) {
        }
    }

    std::cout << "scheduler tests passed\n";
    return 0;
}
