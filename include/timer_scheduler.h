/**
 * @file timer_scheduler.h
 * @brief Millisecond-precision callback scheduler
 * @version 2.0.0
 *
 * Provides non-blocking timed callbacks for every delay in the bridge
 * (command reply timeouts, retry backoff, battery polling, settle delays).
 * Uses platformMillis() for timing - suitable for 1ms+ delays.
 */

#ifndef TIMER_SCHEDULER_H
#define TIMER_SCHEDULER_H

#include "platform.h"
#include <functional>

/**
 * @brief Callback function type
 */
typedef std::function<void()> SchedulerCallback;

/**
 * @brief Opaque timer handle (slot index plus generation)
 */
typedef uint32_t TimerId;

/**
 * @class TimerScheduler
 * @brief Millisecond-precision timed callback scheduler
 *
 * Schedules callbacks to fire after a specified delay. Callbacks are
 * processed in update() which should be called from the main loop.
 * A callback may schedule or cancel other timers, including its own slot.
 */
class TimerScheduler {
public:
    static constexpr TimerId INVALID_ID = 0;

    TimerScheduler();

    /**
     * @brief Schedule a callback after delay
     * @param delayMs Delay in milliseconds (0 = next update())
     * @param callback Function to call when timer fires
     * @return Timer ID or INVALID_ID if no slots available
     */
    TimerId schedule(uint32_t delayMs, SchedulerCallback callback);

    /**
     * @brief Cancel a scheduled callback
     * @param id Timer ID returned from schedule(), stale IDs are ignored
     */
    void cancel(TimerId id);

    /**
     * @brief Cancel all pending callbacks
     */
    void cancelAll();

    /**
     * @brief Process due callbacks
     *
     * Call this from the main loop. Executes all callbacks whose
     * scheduled time has passed.
     */
    void update();

    /**
     * @brief Get number of pending callbacks
     */
    uint8_t getPendingCount() const;

    /**
     * @brief Check if a timer is active
     */
    bool isActive(TimerId id) const;

private:
    static constexpr uint8_t MAX_TIMERS = 48;

    struct Timer {
        uint32_t fireTimeMs;
        SchedulerCallback callback;
        uint16_t generation;
        bool active;
    };

    Timer _timers[MAX_TIMERS];

    static TimerId makeId(uint8_t slot, uint16_t generation) {
        return ((TimerId)generation << 8) | (TimerId)(slot + 1);
    }
};

// Global instance
extern TimerScheduler scheduler;

#endif // TIMER_SCHEDULER_H
