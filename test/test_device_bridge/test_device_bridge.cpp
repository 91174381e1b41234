/**
 * @file test_device_bridge.cpp
 * @brief Unit tests for DeviceBridge - Fleet operations, auto sync and software fallback
 */

#include <unity.h>
#include "device_bridge.h"

// Include source files directly for native testing
#include "../../src/platform.cpp"
#include "../../src/timer_scheduler.cpp"
#include "../../src/event_channel.cpp"
#include "../../src/state_machine.cpp"
#include "../../src/protocol_codec.cpp"
#include "../../src/ble_transport.cpp"
#include "../../src/device_session.cpp"
#include "../../src/sync_protocol.cpp"
#include "../../src/time_sync.cpp"
#include "../../src/connection_orchestrator.cpp"
#include "../../src/device_bridge.cpp"

#include "mock_transport.h"

// =============================================================================
// TEST HARNESS
// =============================================================================

static const uint64_t BASE_MS = 1700000000000ULL;
static const char* ADDR_A = "AA:BB:CC:DD:EE:01";
static const char* ADDR_B = "AA:BB:CC:DD:EE:02";

static MockAdapter* adapter = nullptr;
static DeviceBridge* bridge = nullptr;
static std::vector<DeviceEvent> g_events;
static std::vector<ConnectOutcome> g_outcomes;

static void pump(uint32_t ms) {
    for (uint32_t i = 0; i < ms; i++) {
        mockAdvanceMillis(1);
        scheduler.update();
        bridge->update();
    }
}

static size_t countEvents(DeviceEventKind kind) {
    size_t count = 0;
    for (const DeviceEvent& event : g_events) {
        if (event.kind == kind) {
            count++;
        }
    }
    return count;
}

static void record(const ConnectOutcome& outcome) {
    g_outcomes.push_back(outcome);
}

static void beginBridge(bool autoTimeSync) {
    BridgeSettings settings;
    settings.scanTimeoutMs = 500;
    settings.autoTimeSync = autoTimeSync;
    settings.frequencyCode = FREQ_50_HZ;

    Result result = Result::ERROR_NOT_INITIALIZED;
    bridge->begin(settings, [&result](Result r) { result = r; });
    pump(1);
    TEST_ASSERT_EQUAL(Result::OK, result);

    std::vector<std::string> names;
    names.push_back("sensor");
    adapter->scanFilter().setNameFilters(names);
}

static void connectAndSettle(const char* address) {
    bridge->connectDevice(address, record);
    pump(100 + CONNECTION_SETTLE_MS);
}

class KneeResolver : public IdentityResolver {
public:
    bool assignIdentity(const std::string& deviceName, DeviceIdentity& identity) override {
        if (deviceName != "SensorA") {
            return false;
        }
        identity.semanticId = 1;
        identity.joint = "left_knee";
        identity.position = "thigh";
        return true;
    }
};

// =============================================================================
// TEST FIXTURES
// =============================================================================

void setUp(void) {
    mockResetTime();
    platformSetEpochMs(BASE_MS);
    scheduler.cancelAll();
    g_events.clear();
    g_outcomes.clear();
    adapter = new MockAdapter();
    bridge = new DeviceBridge(*adapter);
    bridge->setDeviceEventCallback([](const DeviceEvent& event) { g_events.push_back(event); });
}

void tearDown(void) {
    DeviceSession::retireAll();
    scheduler.cancelAll();
    delete bridge;
    bridge = nullptr;
    delete adapter;
    adapter = nullptr;
}

// =============================================================================
// INITIALIZATION
// =============================================================================

void test_begin_applies_settings(void) {
    BridgeSettings settings;
    settings.minRssi = -65;

    Result result = Result::ERROR_NOT_INITIALIZED;
    bridge->begin(settings, [&result](Result r) { result = r; });
    pump(1);

    TEST_ASSERT_EQUAL(Result::OK, result);
    TEST_ASSERT_EQUAL_INT8(-65, adapter->scanFilter().getMinRssi());
    TEST_ASSERT_EQUAL_INT8(-65, bridge->settings().minRssi);
}

// =============================================================================
// DISCOVERY AND CONNECTION
// =============================================================================

void test_scan_posts_discovered_events(void) {
    beginBridge(false);
    adapter->addDevice(ADDR_A, "SensorA", -60);
    adapter->addDevice(ADDR_B, "Headphones", -40);

    TEST_ASSERT_EQUAL(Result::OK, bridge->startScan());
    pump(10);

    TEST_ASSERT_EQUAL(1, countEvents(DeviceEventKind::DISCOVERED));
    TEST_ASSERT_EQUAL_STRING(ADDR_A, g_events[0].deviceId.c_str());
    TEST_ASSERT_EQUAL_STRING("SensorA", g_events[0].detail.c_str());
    TEST_ASSERT_EQUAL(1, bridge->discoveredDevices().size());
}

void test_scan_and_connect_all(void) {
    beginBridge(false);
    adapter->addDevice(ADDR_A, "SensorA", -60);
    adapter->addDevice(ADDR_B, "SensorB", -62);

    TEST_ASSERT_EQUAL(Result::OK, bridge->scanAndConnectAll(record));
    pump(400);
    TEST_ASSERT_EQUAL(0, g_outcomes.size());

    pump(1000);
    TEST_ASSERT_EQUAL(2, g_outcomes.size());
    TEST_ASSERT_TRUE(g_outcomes[0].success);
    TEST_ASSERT_TRUE(g_outcomes[1].success);
    TEST_ASSERT_EQUAL(2, countEvents(DeviceEventKind::CONNECTED));
    TEST_ASSERT_EQUAL(2, bridge->getStatus().size());
}

void test_connect_all_skips_linked_devices(void) {
    beginBridge(false);
    adapter->addDiscovered(ADDR_A, "SensorA", -60);
    adapter->addDiscovered(ADDR_B, "SensorB", -60);
    connectAndSettle(ADDR_A);

    TEST_ASSERT_EQUAL(1, bridge->connectAll(record));
    pump(100);
    TEST_ASSERT_EQUAL(2, g_outcomes.size());
    TEST_ASSERT_EQUAL_STRING(ADDR_B, g_outcomes[1].deviceId.c_str());
}

void test_connect_device_canonicalizes_address(void) {
    beginBridge(false);
    adapter->addDiscovered(ADDR_A, "SensorA", -60);

    bridge->connectDevice("aa:bb:cc:dd:ee:01", record);
    pump(100);

    TEST_ASSERT_EQUAL(1, g_outcomes.size());
    TEST_ASSERT_TRUE(g_outcomes[0].success);
    TEST_ASSERT_EQUAL_STRING(ADDR_A, g_outcomes[0].deviceId.c_str());
}

void test_session_gets_configured_frequency(void) {
    beginBridge(false);
    adapter->addDiscovered(ADDR_A, "SensorA", -60);
    connectAndSettle(ADDR_A);

    TEST_ASSERT_EQUAL_HEX8(FREQ_50_HZ, DeviceSession::find(ADDR_A)->streamFrequency());
}

void test_identity_resolver_assigns_role(void) {
    KneeResolver resolver;
    bridge->setIdentityResolver(&resolver);
    beginBridge(false);
    adapter->addDiscovered(ADDR_A, "SensorA", -60);
    adapter->addDiscovered(ADDR_B, "SensorB", -60);
    connectAndSettle(ADDR_A);
    connectAndSettle(ADDR_B);

    SessionPtr a = DeviceSession::find(ADDR_A);
    TEST_ASSERT_TRUE(a->hasIdentity());
    TEST_ASSERT_EQUAL_UINT8(1, a->identity().semanticId);
    TEST_ASSERT_EQUAL_STRING("left_knee", a->identity().joint.c_str());
    TEST_ASSERT_FALSE(DeviceSession::find(ADDR_B)->hasIdentity());
}

void test_operations_on_unknown_device(void) {
    beginBridge(false);
    Result result = Result::OK;

    bridge->startStreaming(ADDR_A, [&result](Result r) { result = r; });
    TEST_ASSERT_EQUAL(Result::ERROR_NOT_FOUND, result);
    bridge->stopStreaming(ADDR_A, [&result](Result r) { result = r; });
    TEST_ASSERT_EQUAL(Result::ERROR_NOT_FOUND, result);
    bridge->disconnectDevice(ADDR_A, [&result](Result r) { result = r; });
    TEST_ASSERT_EQUAL(Result::ERROR_NOT_FOUND, result);
    TEST_ASSERT_EQUAL(Result::ERROR_NOT_FOUND,
                      bridge->syncDevice(ADDR_A, [](Result, const ClockOffsetEstimate&) {}));
}

// =============================================================================
// TIME SYNC
// =============================================================================

void test_auto_time_sync_after_connect(void) {
    beginBridge(true);
    std::shared_ptr<MockPeripheral> device = adapter->addDiscovered(ADDR_A, "SensorA", -60);
    bridge->connectDevice(ADDR_A, record);
    pump(1000);

    SessionPtr session = DeviceSession::find(ADDR_A);
    TEST_ASSERT_EQUAL(SyncState::FULLY_SYNCED, session->getSyncState());
    TEST_ASSERT_TRUE(device->hasClockOffset);
    TEST_ASSERT_DOUBLE_WITHIN(2.0, 5000.0, session->getClockOffsetMs());
}

void test_streaming_refused_during_sync(void) {
    beginBridge(true);
    adapter->addDiscovered(ADDR_A, "SensorA", -60);
    bridge->connectDevice(ADDR_A, record);
    pump(100);
    TEST_ASSERT_TRUE(bridge->timeSync().isSyncing(ADDR_A));

    Result result = Result::OK;
    bridge->startStreaming(ADDR_A, [&result](Result r) { result = r; });
    TEST_ASSERT_EQUAL(Result::ERROR_BUSY, result);
}

void test_failed_register_write_falls_back_to_software_offset(void) {
    beginBridge(false);
    std::shared_ptr<MockPeripheral> device = adapter->addDiscovered(ADDR_A, "SensorA", -60);
    device->ackErrors[CMD_SET_CLOCK_OFFSET] = 0x01;
    connectAndSettle(ADDR_A);

    Result result = Result::OK;
    TEST_ASSERT_EQUAL(Result::OK, bridge->syncDevice(ADDR_A,
        [&result](Result r, const ClockOffsetEstimate&) { result = r; }));
    pump(1000);

    SessionPtr session = DeviceSession::find(ADDR_A);
    TEST_ASSERT_EQUAL(Result::ERROR_SYNC, result);
    TEST_ASSERT_EQUAL(SyncState::OFFSET_COMPUTED, session->getSyncState());
    TEST_ASSERT_TRUE(session->hasClockOffset());

    uint64_t corrected = session->correctDeviceTimestamp(1000);
    TEST_ASSERT_TRUE(corrected >= 5998 && corrected <= 6002);
}

void test_sync_all_covers_connected_sessions(void) {
    beginBridge(false);
    adapter->addDiscovered(ADDR_A, "SensorA", -60);
    adapter->addDiscovered(ADDR_B, "SensorB", -60);
    connectAndSettle(ADDR_A);
    connectAndSettle(ADDR_B);

    std::vector<FleetSyncResult> results;
    bridge->syncAll([&results](const std::vector<FleetSyncResult>& r) { results = r; });
    pump(2000);

    TEST_ASSERT_EQUAL(2, results.size());
    TEST_ASSERT_EQUAL(Result::OK, results[0].result);
    TEST_ASSERT_EQUAL(Result::OK, results[1].result);
    TEST_ASSERT_EQUAL(SyncState::FULLY_SYNCED, DeviceSession::find(ADDR_B)->getSyncState());
}

// =============================================================================
// STREAMING
// =============================================================================

void test_stream_all_and_stop_all(void) {
    beginBridge(false);
    std::shared_ptr<MockPeripheral> a = adapter->addDiscovered(ADDR_A, "SensorA", -60);
    std::shared_ptr<MockPeripheral> b = adapter->addDiscovered(ADDR_B, "SensorB", -60);
    connectAndSettle(ADDR_A);
    connectAndSettle(ADDR_B);

    std::vector<std::string> sources;
    bridge->setMotionDataCallback([&sources](const std::string& id, const MotionSample&) {
        sources.push_back(id);
    });

    Result result = Result::ERROR_NOT_INITIALIZED;
    bridge->streamAll([&result](Result r) { result = r; });
    pump(100);
    TEST_ASSERT_EQUAL(Result::OK, result);
    TEST_ASSERT_TRUE(a->streaming);
    TEST_ASSERT_TRUE(b->streaming);

    a->streamPacket(0, 0, 0, 10);
    b->streamPacket(0, 0, 0, 20);
    TEST_ASSERT_EQUAL(2, sources.size());

    result = Result::ERROR_NOT_INITIALIZED;
    bridge->stopAll([&result](Result r) { result = r; });
    pump(100);
    TEST_ASSERT_EQUAL(Result::OK, result);
    TEST_ASSERT_FALSE(a->streaming);
    TEST_ASSERT_FALSE(b->streaming);
}

void test_stream_all_with_no_sessions(void) {
    beginBridge(false);
    Result result = Result::ERROR_NOT_INITIALIZED;
    bridge->streamAll([&result](Result r) { result = r; });
    TEST_ASSERT_EQUAL(Result::OK, result);
}

// =============================================================================
// TEARDOWN
// =============================================================================

void test_disconnect_all(void) {
    beginBridge(false);
    adapter->addDiscovered(ADDR_A, "SensorA", -60);
    adapter->addDiscovered(ADDR_B, "SensorB", -60);
    connectAndSettle(ADDR_A);
    connectAndSettle(ADDR_B);

    Result result = Result::ERROR_NOT_INITIALIZED;
    bridge->disconnectAll([&result](Result r) { result = r; });
    pump(100);

    TEST_ASSERT_EQUAL(Result::OK, result);
    TEST_ASSERT_EQUAL(SessionState::DISCONNECTED, DeviceSession::find(ADDR_A)->state());
    TEST_ASSERT_EQUAL(SessionState::DISCONNECTED, DeviceSession::find(ADDR_B)->state());
    TEST_ASSERT_EQUAL(2, countEvents(DeviceEventKind::DISCONNECTED));
    TEST_ASSERT_EQUAL(0, countEvents(DeviceEventKind::AUTO_RECONNECT));
}

void test_disconnect_all_cancels_queued_connects(void) {
    beginBridge(false);
    adapter->addDiscovered(ADDR_A, "SensorA", -60);
    adapter->addDiscovered(ADDR_B, "SensorB", -60);

    bridge->connectDevice(ADDR_A, record);
    bridge->connectDevice(ADDR_B, record);
    bridge->disconnectAll([](Result) {});

    TEST_ASSERT_EQUAL(1, g_outcomes.size());
    TEST_ASSERT_EQUAL(Result::ERROR_DISABLED, g_outcomes[0].result);
}

void test_clear_device_cache_retires_session(void) {
    beginBridge(false);
    std::shared_ptr<MockPeripheral> device = adapter->addDiscovered(ADDR_A, "SensorA", -60);
    connectAndSettle(ADDR_A);
    SessionPtr session = DeviceSession::find(ADDR_A);

    Result result = Result::ERROR_NOT_INITIALIZED;
    bridge->clearDeviceCache(ADDR_A, [&result](Result r) { result = r; });
    pump(20);

    TEST_ASSERT_EQUAL(Result::OK, result);
    TEST_ASSERT_TRUE(session->isDisposed());
    TEST_ASSERT_TRUE(DeviceSession::find(ADDR_A) == nullptr);
    TEST_ASSERT_EQUAL(1, adapter->cleared.size());
    TEST_ASSERT_FALSE(device->isConnected());
    TEST_ASSERT_TRUE(adapter->getPeripheral(ADDR_A) == nullptr);
}

void test_print_status_with_sessions(void) {
    beginBridge(false);
    adapter->addDiscovered(ADDR_A, "SensorA", -60);
    connectAndSettle(ADDR_A);

    bridge->printStatus();
    std::vector<SessionStatus> status = bridge->getStatus();
    TEST_ASSERT_EQUAL(1, status.size());
    TEST_ASSERT_EQUAL_INT16(87, status[0].battery);
}

// =============================================================================
// TEST RUNNER
// =============================================================================

int main(int argc, char **argv) {
    (void)argc;
    (void)argv;
    UNITY_BEGIN();

    RUN_TEST(test_begin_applies_settings);

    // Discovery and connection
    RUN_TEST(test_scan_posts_discovered_events);
    RUN_TEST(test_scan_and_connect_all);
    RUN_TEST(test_connect_all_skips_linked_devices);
    RUN_TEST(test_connect_device_canonicalizes_address);
    RUN_TEST(test_session_gets_configured_frequency);
    RUN_TEST(test_identity_resolver_assigns_role);
    RUN_TEST(test_operations_on_unknown_device);

    // Time sync
    RUN_TEST(test_auto_time_sync_after_connect);
    RUN_TEST(test_streaming_refused_during_sync);
    RUN_TEST(test_failed_register_write_falls_back_to_software_offset);
    RUN_TEST(test_sync_all_covers_connected_sessions);

    // Streaming
    RUN_TEST(test_stream_all_and_stop_all);
    RUN_TEST(test_stream_all_with_no_sessions);

    // Teardown
    RUN_TEST(test_disconnect_all);
    RUN_TEST(test_disconnect_all_cancels_queued_connects);
    RUN_TEST(test_clear_device_cache_retires_session);
    RUN_TEST(test_print_status_with_sessions);

    return UNITY_END();
}
