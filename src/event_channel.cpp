/**
 * @file event_channel.cpp
 * @brief Typed device event queue - Implementation
 * @version 2.0.0
 */

#include "event_channel.h"
#include "log.h"

EventChannel::EventChannel() :
    _dropped(0)
{
}

void EventChannel::post(const DeviceEvent& event) {
    if (_queue.size() >= MAX_PENDING_EVENTS) {
        _queue.pop_front();
        _dropped++;
        LOG_WARN("EVENT", "Queue full, dropped oldest event (%lu total)", (unsigned long)_dropped);
    }
    _queue.push_back(event);
}

size_t EventChannel::dispatch() {
    size_t delivered = 0;
    // Events posted by the subscriber itself are delivered on the next dispatch
    size_t budget = _queue.size();
    while (budget-- > 0 && !_queue.empty()) {
        DeviceEvent event = _queue.front();
        _queue.pop_front();
        if (_subscriber) {
            _subscriber(event);
        }
        delivered++;
    }
    return delivered;
}
