/**
 * @file test_deferred_queue.cpp
 * @brief Unit tests for DeferredQueue lock-free ring buffer
 */

#include <unity.h>
#include "deferred_queue.h"
#include <thread>

// =============================================================================
// TEST FIXTURES
// =============================================================================

struct NotifyRecord {
    uint8_t slot;
    uint8_t length;
    uint8_t data[8];
};

// Usable capacity is one less than the ring size
static DeferredQueue<NotifyRecord, 8> queue;

static NotifyRecord makeRecord(uint8_t slot, uint8_t first) {
    NotifyRecord record;
    record.slot = slot;
    record.length = 2;
    record.data[0] = first;
    record.data[1] = (uint8_t)(first + 1);
    return record;
}

void setUp(void) {
    queue.clear();
}

void tearDown(void) {
    queue.clear();
}

// =============================================================================
// BASIC OPERATIONS
// =============================================================================

void test_DeferredQueue_initial_state_empty(void) {
    DeferredQueue<NotifyRecord, 4> fresh;
    TEST_ASSERT_TRUE(fresh.isEmpty());
    TEST_ASSERT_EQUAL_UINT32(0, fresh.overflowCount());
}

void test_DeferredQueue_enqueue_single(void) {
    TEST_ASSERT_TRUE(queue.enqueue(makeRecord(1, 0x10)));
    TEST_ASSERT_FALSE(queue.isEmpty());
}

void test_DeferredQueue_dequeue_copies_payload(void) {
    queue.enqueue(makeRecord(3, 0xA0));

    NotifyRecord record;
    TEST_ASSERT_TRUE(queue.dequeue(record));
    TEST_ASSERT_EQUAL_UINT8(3, record.slot);
    TEST_ASSERT_EQUAL_UINT8(2, record.length);
    TEST_ASSERT_EQUAL_HEX8(0xA0, record.data[0]);
    TEST_ASSERT_EQUAL_HEX8(0xA1, record.data[1]);
    TEST_ASSERT_TRUE(queue.isEmpty());
}

void test_DeferredQueue_dequeue_empty_returns_false(void) {
    NotifyRecord record;
    TEST_ASSERT_FALSE(queue.dequeue(record));
}

void test_DeferredQueue_fifo_order(void) {
    queue.enqueue(makeRecord(0, 1));
    queue.enqueue(makeRecord(1, 2));
    queue.enqueue(makeRecord(2, 3));

    NotifyRecord record;
    for (uint8_t i = 0; i < 3; i++) {
        TEST_ASSERT_TRUE(queue.dequeue(record));
        TEST_ASSERT_EQUAL_UINT8(i, record.slot);
        TEST_ASSERT_EQUAL_UINT8(i + 1, record.data[0]);
    }
    TEST_ASSERT_TRUE(queue.isEmpty());
}

// =============================================================================
// CAPACITY
// =============================================================================

void test_DeferredQueue_full_discards_and_counts(void) {
    uint32_t before = queue.overflowCount();

    for (uint8_t i = 0; i < 7; i++) {
        TEST_ASSERT_TRUE(queue.enqueue(makeRecord(i, i)));
    }
    TEST_ASSERT_FALSE(queue.enqueue(makeRecord(7, 7)));
    TEST_ASSERT_FALSE(queue.enqueue(makeRecord(8, 8)));
    TEST_ASSERT_EQUAL_UINT32(before + 2, queue.overflowCount());

    // Oldest item survives the overflow
    NotifyRecord record;
    TEST_ASSERT_TRUE(queue.dequeue(record));
    TEST_ASSERT_EQUAL_UINT8(0, record.slot);
}

void test_DeferredQueue_wrap_around(void) {
    NotifyRecord record;

    // Advance head and tail past the end of the ring
    for (uint8_t i = 0; i < 6; i++) {
        queue.enqueue(makeRecord(i, i));
        queue.dequeue(record);
    }

    queue.enqueue(makeRecord(10, 0x20));
    queue.enqueue(makeRecord(11, 0x30));
    queue.enqueue(makeRecord(12, 0x40));

    TEST_ASSERT_TRUE(queue.dequeue(record));
    TEST_ASSERT_EQUAL_UINT8(10, record.slot);
    TEST_ASSERT_TRUE(queue.dequeue(record));
    TEST_ASSERT_EQUAL_UINT8(11, record.slot);
    TEST_ASSERT_TRUE(queue.dequeue(record));
    TEST_ASSERT_EQUAL_HEX8(0x40, record.data[0]);
    TEST_ASSERT_TRUE(queue.isEmpty());
}

void test_DeferredQueue_clear_drops_pending(void) {
    queue.enqueue(makeRecord(0, 0));
    queue.enqueue(makeRecord(1, 1));
    queue.clear();

    NotifyRecord record;
    TEST_ASSERT_TRUE(queue.isEmpty());
    TEST_ASSERT_FALSE(queue.dequeue(record));

    TEST_ASSERT_TRUE(queue.enqueue(makeRecord(5, 5)));
    TEST_ASSERT_TRUE(queue.dequeue(record));
    TEST_ASSERT_EQUAL_UINT8(5, record.slot);
}

// =============================================================================
// PRODUCER / CONSUMER
// =============================================================================

void test_DeferredQueue_producer_thread_preserves_order(void) {
    static DeferredQueue<uint32_t, 64> ring;
    const uint32_t total = 10000;

    std::thread producer([]() {
        for (uint32_t i = 0; i < total; i++) {
            while (!ring.enqueue(i)) {
                std::this_thread::yield();
            }
        }
    });

    uint32_t expected = 0;
    bool ordered = true;
    while (expected < total) {
        uint32_t value;
        if (ring.dequeue(value)) {
            if (value != expected) {
                ordered = false;
            }
            expected++;
        } else {
            std::this_thread::yield();
        }
    }
    producer.join();

    TEST_ASSERT_TRUE(ordered);
    TEST_ASSERT_TRUE(ring.isEmpty());
}

// =============================================================================
// TEST RUNNER
// =============================================================================

int main(int argc, char **argv) {
    (void)argc;
    (void)argv;
    UNITY_BEGIN();

    // Basic operations
    RUN_TEST(test_DeferredQueue_initial_state_empty);
    RUN_TEST(test_DeferredQueue_enqueue_single);
    RUN_TEST(test_DeferredQueue_dequeue_copies_payload);
    RUN_TEST(test_DeferredQueue_dequeue_empty_returns_false);
    RUN_TEST(test_DeferredQueue_fifo_order);

    // Capacity
    RUN_TEST(test_DeferredQueue_full_discards_and_counts);
    RUN_TEST(test_DeferredQueue_wrap_around);
    RUN_TEST(test_DeferredQueue_clear_drops_pending);

    // Producer / consumer
    RUN_TEST(test_DeferredQueue_producer_thread_preserves_order);

    return UNITY_END();
}
