/**
 * @file test_event_channel.cpp
 * @brief Unit tests for EventChannel - Ordering, overflow and re-entrant posting
 */

#include <unity.h>
#include "event_channel.h"

// Include source file directly for native testing
#include "../../src/event_channel.cpp"

#include <vector>

// =============================================================================
// TEST FIXTURES
// =============================================================================

static std::vector<DeviceEvent> g_received;

void setUp(void) {
    g_received.clear();
}

void tearDown(void) {
}

static void record(const DeviceEvent& event) {
    g_received.push_back(event);
}

// =============================================================================
// DELIVERY
// =============================================================================

void test_dispatch_preserves_posting_order(void) {
    EventChannel channel;
    channel.setSubscriber(record);

    channel.post(DeviceEvent("AA", DeviceEventKind::CONNECTED, "", 87));
    channel.post(DeviceEvent("AA", DeviceEventKind::STREAMING_STARTED));
    channel.post(DeviceEvent("BB", DeviceEventKind::DISCONNECTED, "reason 0x08"));

    TEST_ASSERT_EQUAL(0, g_received.size());
    TEST_ASSERT_EQUAL(3, channel.dispatch());

    TEST_ASSERT_EQUAL(3, g_received.size());
    TEST_ASSERT_EQUAL(DeviceEventKind::CONNECTED, g_received[0].kind);
    TEST_ASSERT_EQUAL_INT16(87, g_received[0].battery);
    TEST_ASSERT_EQUAL(DeviceEventKind::STREAMING_STARTED, g_received[1].kind);
    TEST_ASSERT_EQUAL_STRING("BB", g_received[2].deviceId.c_str());
    TEST_ASSERT_EQUAL_STRING("reason 0x08", g_received[2].detail.c_str());
    TEST_ASSERT_EQUAL(0, channel.pending());
}

void test_dispatch_without_subscriber_drains(void) {
    EventChannel channel;
    channel.post(DeviceEvent("AA", DeviceEventKind::ERROR));
    TEST_ASSERT_EQUAL(1, channel.dispatch());
    TEST_ASSERT_EQUAL(0, channel.pending());
}

void test_events_posted_during_dispatch_wait_for_next_round(void) {
    EventChannel channel;
    channel.setSubscriber([&channel](const DeviceEvent& event) {
        g_received.push_back(event);
        if (event.kind == DeviceEventKind::DISCONNECTED) {
            channel.post(DeviceEvent(event.deviceId, DeviceEventKind::AUTO_RECONNECT));
        }
    });

    channel.post(DeviceEvent("AA", DeviceEventKind::DISCONNECTED));
    TEST_ASSERT_EQUAL(1, channel.dispatch());
    TEST_ASSERT_EQUAL(1, channel.pending());

    TEST_ASSERT_EQUAL(1, channel.dispatch());
    TEST_ASSERT_EQUAL(DeviceEventKind::AUTO_RECONNECT, g_received[1].kind);
}

// =============================================================================
// OVERFLOW
// =============================================================================

void test_overflow_drops_oldest(void) {
    EventChannel channel;
    channel.setSubscriber(record);

    for (size_t i = 0; i < EventChannel::MAX_PENDING_EVENTS + 2; i++) {
        channel.post(DeviceEvent(std::to_string(i), DeviceEventKind::BATTERY_UPDATE));
    }

    TEST_ASSERT_EQUAL(EventChannel::MAX_PENDING_EVENTS, channel.pending());
    TEST_ASSERT_EQUAL_UINT32(2, channel.droppedCount());

    channel.dispatch();
    TEST_ASSERT_EQUAL_STRING("2", g_received.front().deviceId.c_str());
}

void test_clear_discards_pending(void) {
    EventChannel channel;
    channel.setSubscriber(record);
    channel.post(DeviceEvent("AA", DeviceEventKind::CONNECTED));
    channel.clear();
    TEST_ASSERT_EQUAL(0, channel.dispatch());
    TEST_ASSERT_EQUAL(0, g_received.size());
}

// =============================================================================
// STRINGS
// =============================================================================

void test_deviceEventKindToString(void) {
    TEST_ASSERT_EQUAL_STRING("battery-update", deviceEventKindToString(DeviceEventKind::BATTERY_UPDATE));
    TEST_ASSERT_EQUAL_STRING("auto-reconnect", deviceEventKindToString(DeviceEventKind::AUTO_RECONNECT));
}

// =============================================================================
// TEST RUNNER
// =============================================================================

int main(int argc, char **argv) {
    (void)argc;
    (void)argv;
    UNITY_BEGIN();

    RUN_TEST(test_dispatch_preserves_posting_order);
    RUN_TEST(test_dispatch_without_subscriber_drains);
    RUN_TEST(test_events_posted_during_dispatch_wait_for_next_round);
    RUN_TEST(test_overflow_drops_oldest);
    RUN_TEST(test_clear_discards_pending);
    RUN_TEST(test_deviceEventKindToString);

    return UNITY_END();
}
