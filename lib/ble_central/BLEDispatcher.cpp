/**
 * @file BLEDispatcher.cpp
 * @brief Execution context implementation
 */

#include "BLEDispatcher.h"
#include "Log.h"
#include "Utilities/OS.h"

#include <algorithm>
#include <string>

namespace Tether { namespace BLE {

constexpr BLEDispatcher::TimerId BLEDispatcher::INVALID_TIMER;

BLEDispatcher::BLEDispatcher(Clock clock) : _clock(clock) {
    if (!_clock) {
        _clock = []() { return RNS::Utilities::OS::time(); };
    }
}

double BLEDispatcher::now() const {
    return _clock();
}

void BLEDispatcher::dispatch(const Task& task) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    task();
}

void BLEDispatcher::post(Task task) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _posted.push_back(std::move(task));
}

BLEDispatcher::TimerId BLEDispatcher::schedule(double delay, Task task) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    TimerId id = _next_timer_id++;
    if (_next_timer_id == INVALID_TIMER) {
        _next_timer_id = 1;
    }

    Timer timer;
    timer.deadline = now() + (delay > 0 ? delay : 0);
    timer.task = std::move(task);
    _timers[id] = std::move(timer);

    TRACE("BLEDispatcher: Scheduled timer " + std::to_string(id) +
          " in " + std::to_string(static_cast<int>(delay * 1000)) + "ms");
    return id;
}

void BLEDispatcher::cancel(TimerId id) {
    if (id == INVALID_TIMER) {
        return;
    }
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _timers.erase(id);
}

void BLEDispatcher::loop() {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    // Deferred work first, in posting order
    if (!_posted.empty()) {
        std::vector<Task> tasks;
        tasks.swap(_posted);
        for (auto& task : tasks) {
            task();
        }
    }

    // Snapshot due timers so tasks that reschedule do not run twice this turn
    double current = now();
    std::vector<std::pair<double, TimerId>> due;
    for (const auto& kv : _timers) {
        if (kv.second.deadline <= current) {
            due.push_back(std::make_pair(kv.second.deadline, kv.first));
        }
    }
    std::sort(due.begin(), due.end());

    for (const auto& entry : due) {
        auto it = _timers.find(entry.second);
        if (it == _timers.end()) {
            // Cancelled by an earlier task this turn
            continue;
        }
        Task task = std::move(it->second.task);
        _timers.erase(it);
        task();
    }
}

size_t BLEDispatcher::pendingTimers() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _timers.size();
}

size_t BLEDispatcher::pendingTasks() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _posted.size();
}

}} // namespace Tether::BLE
