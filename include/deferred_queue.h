/**
 * @file deferred_queue.h
 * @brief Lock-free single-producer/single-consumer queue for BLE task callbacks
 * @version 2.0.0
 *
 * SoftDevice callbacks run on the Bluefruit BLE task. They only copy the
 * event into this ring (producer); loop() drains it (consumer). No locks,
 * no allocation on the producer side.
 */

#ifndef DEFERRED_QUEUE_H
#define DEFERRED_QUEUE_H

#include <stdint.h>
#include <atomic>

template <typename T, uint16_t CAPACITY>
class DeferredQueue {
    static_assert((CAPACITY & (CAPACITY - 1)) == 0, "CAPACITY must be a power of two");

public:
    DeferredQueue() : _head(0), _tail(0), _overflows(0) {}

    /**
     * @brief Producer side (BLE task)
     * @return false if the queue is full, the item is discarded
     */
    bool enqueue(const T& item) {
        uint16_t head = _head.load(std::memory_order_relaxed);
        uint16_t next = (uint16_t)((head + 1) & (CAPACITY - 1));
        if (next == _tail.load(std::memory_order_acquire)) {
            _overflows.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        _items[head] = item;
        _head.store(next, std::memory_order_release);
        return true;
    }

    /**
     * @brief Consumer side (main loop)
     * @return false if empty
     */
    bool dequeue(T& item) {
        uint16_t tail = _tail.load(std::memory_order_relaxed);
        if (tail == _head.load(std::memory_order_acquire)) {
            return false;
        }
        item = _items[tail];
        _tail.store((uint16_t)((tail + 1) & (CAPACITY - 1)), std::memory_order_release);
        return true;
    }

    bool isEmpty() const {
        return _tail.load(std::memory_order_acquire) == _head.load(std::memory_order_acquire);
    }

    uint32_t overflowCount() const { return _overflows.load(std::memory_order_relaxed); }

    /**
     * @brief Drop all items (consumer side only)
     */
    void clear() {
        _tail.store(_head.load(std::memory_order_acquire), std::memory_order_release);
    }

private:
    T _items[CAPACITY];
    std::atomic<uint16_t> _head;
    std::atomic<uint16_t> _tail;
    std::atomic<uint32_t> _overflows;
};

#endif // DEFERRED_QUEUE_H
