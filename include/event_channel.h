/**
 * @file event_channel.h
 * @brief Typed device event queue from sessions to the host application
 * @version 2.0.0
 *
 * Sessions post events while holding their own state; the main loop drains
 * the queue through dispatch(), so host callbacks never run inside session
 * methods and delivery order equals posting order.
 */

#ifndef EVENT_CHANNEL_H
#define EVENT_CHANNEL_H

#include "types.h"
#include <deque>

class EventChannel {
public:
    static constexpr size_t MAX_PENDING_EVENTS = 64;

    EventChannel();

    /**
     * @brief Queue an event (oldest event is dropped when full)
     */
    void post(const DeviceEvent& event);

    /**
     * @brief Deliver all queued events to the subscriber
     * @return Number of events delivered
     */
    size_t dispatch();

    void setSubscriber(DeviceEventCallback subscriber) { _subscriber = std::move(subscriber); }

    size_t pending() const { return _queue.size(); }
    uint32_t droppedCount() const { return _dropped; }
    void clear() { _queue.clear(); }

private:
    std::deque<DeviceEvent> _queue;
    DeviceEventCallback _subscriber;
    uint32_t _dropped;
};

#endif // EVENT_CHANNEL_H
