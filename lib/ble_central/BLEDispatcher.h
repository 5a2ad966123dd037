/**
 * @file BLEDispatcher.h
 * @brief Per-manager execution context: serialization, deferred work, timers
 *
 * Every platform callback, timer callback and public API call on a manager
 * and its peripherals runs while holding this dispatcher's lock. Callbacks
 * arriving on a BLE stack thread are marshaled in with dispatch(). Deferred
 * work (post) and delayed callbacks (schedule) run from loop(), which the
 * application calls periodically.
 *
 * The lock is recursive: result listeners run inside the context and may call
 * back into the manager.
 */
#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <vector>

namespace Tether { namespace BLE {

class BLEDispatcher {
public:
    using Clock = std::function<double()>;
    using Task = std::function<void()>;
    using TimerId = uint32_t;

    static constexpr TimerId INVALID_TIMER = 0;

    /**
     * @param clock Time source in seconds (default: RNS::Utilities::OS::time)
     */
    explicit BLEDispatcher(Clock clock = Clock());

    /**
     * @brief Current time in seconds from the dispatcher clock
     */
    double now() const;

    const Clock& clock() const { return _clock; }

    /**
     * @brief Run a task synchronously inside the execution context
     */
    void dispatch(const Task& task);

    /**
     * @brief Queue a task for the next loop() turn
     */
    void post(Task task);

    /**
     * @brief Run a task once, delay seconds from now
     * @return Timer id usable with cancel()
     */
    TimerId schedule(double delay, Task task);

    /**
     * @brief Cancel a scheduled task (no-op if already run or cancelled)
     */
    void cancel(TimerId id);

    /**
     * @brief Run posted tasks and every timer that is due
     *
     * Timers scheduled while this turn runs wait for the next turn.
     */
    void loop();

    size_t pendingTimers() const;
    size_t pendingTasks() const;

    std::recursive_mutex& mutex() const { return _mutex; }

private:
    struct Timer {
        double deadline = 0;
        Task task;
    };

    Clock _clock;
    std::vector<Task> _posted;
    std::map<TimerId, Timer> _timers;
    TimerId _next_timer_id = 1;

    mutable std::recursive_mutex _mutex;
};

}} // namespace Tether::BLE
