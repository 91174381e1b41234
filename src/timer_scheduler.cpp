/**
 * @file timer_scheduler.cpp
 * @brief Millisecond-precision callback scheduler - Implementation
 * @version 2.0.0
 */

#include "timer_scheduler.h"
#include "log.h"

TimerScheduler scheduler;

TimerScheduler::TimerScheduler() {
    for (uint8_t i = 0; i < MAX_TIMERS; i++) {
        _timers[i].fireTimeMs = 0;
        _timers[i].generation = 0;
        _timers[i].active = false;
    }
}

TimerId TimerScheduler::schedule(uint32_t delayMs, SchedulerCallback callback) {
    if (!callback) {
        return INVALID_ID;
    }

    for (uint8_t i = 0; i < MAX_TIMERS; i++) {
        if (!_timers[i].active) {
            _timers[i].fireTimeMs = platformMillis() + delayMs;
            _timers[i].callback = std::move(callback);
            _timers[i].generation++;
            _timers[i].active = true;
            return makeId(i, _timers[i].generation);
        }
    }

    LOG_ERROR("TIMER", "No free timer slots (%d in use)", MAX_TIMERS);
    return INVALID_ID;
}

void TimerScheduler::cancel(TimerId id) {
    if (id == INVALID_ID) {
        return;
    }
    uint8_t slot = (uint8_t)((id & 0xFF) - 1);
    uint16_t generation = (uint16_t)(id >> 8);
    if (slot >= MAX_TIMERS) {
        return;
    }
    if (_timers[slot].active && _timers[slot].generation == generation) {
        _timers[slot].active = false;
        _timers[slot].callback = nullptr;
    }
}

void TimerScheduler::cancelAll() {
    for (uint8_t i = 0; i < MAX_TIMERS; i++) {
        _timers[i].active = false;
        _timers[i].callback = nullptr;
    }
}

void TimerScheduler::update() {
    uint32_t now = platformMillis();

    for (uint8_t i = 0; i < MAX_TIMERS; i++) {
        if (!_timers[i].active) {
            continue;
        }
        // Signed difference handles millis() wraparound
        if ((int32_t)(now - _timers[i].fireTimeMs) < 0) {
            continue;
        }

        // Release the slot before running so the callback can reschedule
        SchedulerCallback callback = std::move(_timers[i].callback);
        _timers[i].callback = nullptr;
        _timers[i].active = false;
        callback();
    }
}

uint8_t TimerScheduler::getPendingCount() const {
    uint8_t count = 0;
    for (uint8_t i = 0; i < MAX_TIMERS; i++) {
        if (_timers[i].active) {
            count++;
        }
    }
    return count;
}

bool TimerScheduler::isActive(TimerId id) const {
    if (id == INVALID_ID) {
        return false;
    }
    uint8_t slot = (uint8_t)((id & 0xFF) - 1);
    if (slot >= MAX_TIMERS) {
        return false;
    }
    return _timers[slot].active && _timers[slot].generation == (uint16_t)(id >> 8);
}
