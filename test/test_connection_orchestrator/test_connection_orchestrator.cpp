/**
 * @file test_connection_orchestrator.cpp
 * @brief Unit tests for ConnectionOrchestrator - Serialized connects, settle delay, scan gating
 */

#include <unity.h>
#include "connection_orchestrator.h"

// Include source files directly for native testing
#include "../../src/platform.cpp"
#include "../../src/timer_scheduler.cpp"
#include "../../src/event_channel.cpp"
#include "../../src/state_machine.cpp"
#include "../../src/protocol_codec.cpp"
#include "../../src/ble_transport.cpp"
#include "../../src/device_session.cpp"
#include "../../src/connection_orchestrator.cpp"

#include "mock_transport.h"

// =============================================================================
// TEST HARNESS
// =============================================================================

static const uint64_t BASE_MS = 1700000000000ULL;
static const char* ADDR_A = "AA:BB:CC:DD:EE:01";
static const char* ADDR_B = "AA:BB:CC:DD:EE:02";
static const char* ADDR_C = "AA:BB:CC:DD:EE:03";

static MockAdapter* adapter = nullptr;
static EventChannel events;
static ConnectionOrchestrator* orchestrator = nullptr;
static std::vector<ConnectOutcome> g_outcomes;
static uint8_t g_maxConnecting = 0;

static void pump(uint32_t ms) {
    for (uint32_t i = 0; i < ms; i++) {
        mockAdvanceMillis(1);
        scheduler.update();
        adapter->update();
        events.dispatch();

        uint8_t connecting = 0;
        for (const PeripheralPtr& peripheral : adapter->discoveredDevices()) {
            if (peripheral->state() == PeripheralState::CONNECTING) {
                connecting++;
            }
        }
        if (connecting > g_maxConnecting) {
            g_maxConnecting = connecting;
        }
    }
}

static void record(const ConnectOutcome& outcome) {
    g_outcomes.push_back(outcome);
}

static const ConnectOutcome* outcomeFor(const std::string& deviceId) {
    for (const ConnectOutcome& outcome : g_outcomes) {
        if (outcome.deviceId == deviceId) {
            return &outcome;
        }
    }
    return nullptr;
}

// =============================================================================
// TEST FIXTURES
// =============================================================================

void setUp(void) {
    mockResetTime();
    platformSetEpochMs(BASE_MS);
    scheduler.cancelAll();
    events.clear();
    g_outcomes.clear();
    g_maxConnecting = 0;
    adapter = new MockAdapter();
    adapter->markInitialized();
    orchestrator = new ConnectionOrchestrator(*adapter, &events);
    orchestrator->begin();
}

void tearDown(void) {
    DeviceSession::retireAll();
    scheduler.cancelAll();
    delete orchestrator;
    orchestrator = nullptr;
    delete adapter;
    adapter = nullptr;
}

// =============================================================================
// SERIALIZATION
// =============================================================================

void test_single_connect_succeeds(void) {
    adapter->addDiscovered(ADDR_A, "SensorA", -60);

    orchestrator->enqueue(ADDR_A, record);
    TEST_ASSERT_TRUE(orchestrator->isInFlight(ADDR_A));
    TEST_ASSERT_EQUAL(RadioState::CONNECTING, orchestrator->getRadioState());

    pump(100);
    TEST_ASSERT_EQUAL(1, g_outcomes.size());
    TEST_ASSERT_TRUE(g_outcomes[0].success);
    TEST_ASSERT_EQUAL(Result::OK, g_outcomes[0].result);
    TEST_ASSERT_FALSE(orchestrator->isConnecting());
    TEST_ASSERT_EQUAL(RadioState::IDLE, orchestrator->getRadioState());

    SessionPtr session = DeviceSession::find(ADDR_A);
    TEST_ASSERT_NOT_NULL(session.get());
    TEST_ASSERT_EQUAL(SessionState::CONNECTED, session->state());
}

void test_connects_run_one_at_a_time(void) {
    std::shared_ptr<MockPeripheral> a = adapter->addDiscovered(ADDR_A, "SensorA", -60);
    std::shared_ptr<MockPeripheral> b = adapter->addDiscovered(ADDR_B, "SensorB", -60);
    std::shared_ptr<MockPeripheral> c = adapter->addDiscovered(ADDR_C, "SensorC", -60);

    orchestrator->enqueue(ADDR_A, record);
    orchestrator->enqueue(ADDR_B, record);
    orchestrator->enqueue(ADDR_C, record);

    TEST_ASSERT_TRUE(orchestrator->isInFlight(ADDR_A));
    TEST_ASSERT_TRUE(orchestrator->isQueued(ADDR_B));
    TEST_ASSERT_TRUE(orchestrator->isQueued(ADDR_C));
    TEST_ASSERT_EQUAL(2, orchestrator->queueLength());
    TEST_ASSERT_EQUAL_UINT32(0, b->connectCount);

    pump(1000);

    TEST_ASSERT_EQUAL(3, g_outcomes.size());
    TEST_ASSERT_EQUAL_STRING(ADDR_A, g_outcomes[0].deviceId.c_str());
    TEST_ASSERT_EQUAL_STRING(ADDR_B, g_outcomes[1].deviceId.c_str());
    TEST_ASSERT_EQUAL_STRING(ADDR_C, g_outcomes[2].deviceId.c_str());
    TEST_ASSERT_EQUAL_UINT8(1, g_maxConnecting);
    TEST_ASSERT_EQUAL_UINT32(1, c->connectCount);
    TEST_ASSERT_EQUAL(3, DeviceSession::activeCount());
}

void test_settle_delay_between_attempts(void) {
    adapter->addDiscovered(ADDR_A, "SensorA", -60);
    std::shared_ptr<MockPeripheral> b = adapter->addDiscovered(ADDR_B, "SensorB", -60);

    orchestrator->enqueue(ADDR_A, record);
    orchestrator->enqueue(ADDR_B, record);

    // A completes after ~40 ms, B must wait out the settle delay
    pump(100);
    TEST_ASSERT_EQUAL(1, g_outcomes.size());
    TEST_ASSERT_EQUAL_UINT32(0, b->connectCount);
    TEST_ASSERT_TRUE(orchestrator->isQueued(ADDR_B));

    pump(CONNECTION_SETTLE_MS);
    TEST_ASSERT_EQUAL_UINT32(1, b->connectCount);
}

void test_settle_delay_uses_platform_minimum(void) {
    TEST_ASSERT_EQUAL_UINT32(CONNECTION_SETTLE_MS, orchestrator->settleDelayMs());

    TransportTiming timing = adapter->timing();
    timing.interConnectionDelayMs = CONNECTION_SETTLE_MS + 300;
    adapter->setTiming(timing);
    TEST_ASSERT_EQUAL_UINT32(CONNECTION_SETTLE_MS + 300, orchestrator->settleDelayMs());
}

void test_failed_attempt_still_releases_queue(void) {
    std::shared_ptr<MockPeripheral> a = adapter->addDiscovered(ADDR_A, "SensorA", -60);
    adapter->addDiscovered(ADDR_B, "SensorB", -60);
    a->connectResult = Result::ERROR_HARDWARE;

    orchestrator->enqueue(ADDR_A, record);
    orchestrator->enqueue(ADDR_B, record);
    pump(1000);

    TEST_ASSERT_EQUAL(2, g_outcomes.size());
    TEST_ASSERT_FALSE(g_outcomes[0].success);
    TEST_ASSERT_EQUAL(Result::ERROR_HARDWARE, g_outcomes[0].result);
    TEST_ASSERT_TRUE(g_outcomes[0].message.find("Connection failed") == 0);
    TEST_ASSERT_TRUE(g_outcomes[1].success);
}

// =============================================================================
// REJECTIONS
// =============================================================================

void test_duplicate_in_flight_rejected(void) {
    adapter->addDiscovered(ADDR_A, "SensorA", -60);

    orchestrator->enqueue(ADDR_A, record);
    orchestrator->enqueue(ADDR_A, record);

    TEST_ASSERT_EQUAL(1, g_outcomes.size());
    TEST_ASSERT_FALSE(g_outcomes[0].success);
    TEST_ASSERT_EQUAL(Result::ERROR_BUSY, g_outcomes[0].result);
    TEST_ASSERT_EQUAL_STRING("Connection already in progress", g_outcomes[0].message.c_str());

    pump(100);
    TEST_ASSERT_EQUAL(2, g_outcomes.size());
    TEST_ASSERT_TRUE(g_outcomes[1].success);
}

void test_duplicate_queued_rejected(void) {
    adapter->addDiscovered(ADDR_A, "SensorA", -60);
    adapter->addDiscovered(ADDR_B, "SensorB", -60);

    orchestrator->enqueue(ADDR_A, record);
    orchestrator->enqueue(ADDR_B, record);
    orchestrator->enqueue(ADDR_B, record);

    TEST_ASSERT_EQUAL(1, g_outcomes.size());
    TEST_ASSERT_EQUAL(Result::ERROR_BUSY, g_outcomes[0].result);
    TEST_ASSERT_EQUAL(1, orchestrator->queueLength());
}

void test_unknown_device_not_found(void) {
    orchestrator->enqueue("11:22:33:44:55:66", record);

    TEST_ASSERT_EQUAL(1, g_outcomes.size());
    TEST_ASSERT_EQUAL(Result::ERROR_NOT_FOUND, g_outcomes[0].result);
    TEST_ASSERT_EQUAL_STRING("Device not found", g_outcomes[0].message.c_str());
    TEST_ASSERT_FALSE(orchestrator->isConnecting());
}

void test_already_connected_completes_immediately(void) {
    std::shared_ptr<MockPeripheral> a = adapter->addDiscovered(ADDR_A, "SensorA", -60);
    orchestrator->enqueue(ADDR_A, record);
    pump(100 + CONNECTION_SETTLE_MS);

    orchestrator->enqueue(ADDR_A, record);
    TEST_ASSERT_EQUAL(2, g_outcomes.size());
    TEST_ASSERT_TRUE(g_outcomes[1].success);
    TEST_ASSERT_EQUAL_STRING("Already connected", g_outcomes[1].message.c_str());
    TEST_ASSERT_EQUAL_UINT32(1, a->connectCount);
}

void test_cancel_pending_keeps_in_flight(void) {
    adapter->addDiscovered(ADDR_A, "SensorA", -60);
    adapter->addDiscovered(ADDR_B, "SensorB", -60);
    adapter->addDiscovered(ADDR_C, "SensorC", -60);

    orchestrator->enqueue(ADDR_A, record);
    orchestrator->enqueue(ADDR_B, record);
    orchestrator->enqueue(ADDR_C, record);
    orchestrator->cancelPending();

    TEST_ASSERT_EQUAL(2, g_outcomes.size());
    TEST_ASSERT_EQUAL(Result::ERROR_DISABLED, outcomeFor(ADDR_B)->result);
    TEST_ASSERT_EQUAL(Result::ERROR_DISABLED, outcomeFor(ADDR_C)->result);
    TEST_ASSERT_EQUAL(0, orchestrator->queueLength());

    pump(100);
    TEST_ASSERT_EQUAL(3, g_outcomes.size());
    TEST_ASSERT_TRUE(outcomeFor(ADDR_A)->success);
}

// =============================================================================
// SCAN GATING
// =============================================================================

void test_scan_refused_while_connecting(void) {
    adapter->addDiscovered(ADDR_A, "SensorA", -60);
    orchestrator->enqueue(ADDR_A, record);

    TEST_ASSERT_EQUAL(Result::ERROR_BUSY, orchestrator->startScan(5000));
    // The transport itself is gated too
    TEST_ASSERT_EQUAL(Result::ERROR_BUSY, adapter->startScan(5000));

    pump(100);
    TEST_ASSERT_EQUAL(Result::OK, orchestrator->startScan(5000));
    TEST_ASSERT_EQUAL(RadioState::SCANNING, orchestrator->getRadioState());
}

void test_scan_suspended_and_resumed_around_connect(void) {
    adapter->addDiscovered(ADDR_A, "SensorA", -60);

    TEST_ASSERT_EQUAL(Result::OK, orchestrator->startScan(10000));
    pump(50);
    orchestrator->enqueue(ADDR_A, record);

    TEST_ASSERT_FALSE(adapter->isScanning());
    TEST_ASSERT_EQUAL(RadioState::CONNECTING, orchestrator->getRadioState());

    pump(100 + CONNECTION_SETTLE_MS);
    TEST_ASSERT_EQUAL(1, g_outcomes.size());
    TEST_ASSERT_TRUE(adapter->isScanning());
    TEST_ASSERT_EQUAL(RadioState::SCANNING, orchestrator->getRadioState());
}

void test_stop_scan_cancels_resume(void) {
    adapter->addDiscovered(ADDR_A, "SensorA", -60);

    orchestrator->startScan(10000);
    orchestrator->enqueue(ADDR_A, record);
    orchestrator->stopScan();

    pump(100 + CONNECTION_SETTLE_MS);
    TEST_ASSERT_FALSE(adapter->isScanning());
    TEST_ASSERT_EQUAL(RadioState::IDLE, orchestrator->getRadioState());
}

void test_scan_complete_returns_radio_to_idle(void) {
    int completions = 0;
    orchestrator->setScanCompleteHandler([&completions]() { completions++; });

    orchestrator->startScan(100);
    pump(150);

    TEST_ASSERT_EQUAL(1, completions);
    TEST_ASSERT_EQUAL(RadioState::IDLE, orchestrator->getRadioState());
}

void test_scan_before_initialize_fails(void) {
    MockAdapter fresh;
    ConnectionOrchestrator other(fresh, &events);
    other.begin();
    TEST_ASSERT_EQUAL(Result::ERROR_NOT_INITIALIZED, other.startScan(1000));
    TEST_ASSERT_EQUAL(RadioState::IDLE, other.getRadioState());
}

// =============================================================================
// SESSION CONFIGURATION
// =============================================================================

void test_configurator_runs_before_connect(void) {
    adapter->addDiscovered(ADDR_A, "SensorA", -60);

    SessionState seenState = SessionState::DISPOSED;
    orchestrator->setSessionConfigurator([&seenState](const SessionPtr& session) {
        seenState = session->state();
        session->setStreamFrequency(FREQ_50_HZ);
    });

    orchestrator->enqueue(ADDR_A, record);
    pump(100);

    TEST_ASSERT_EQUAL(SessionState::DISCONNECTED, seenState);
    TEST_ASSERT_EQUAL_HEX8(FREQ_50_HZ, DeviceSession::find(ADDR_A)->streamFrequency());
}

void test_reconnect_replaces_session(void) {
    std::shared_ptr<MockPeripheral> a = adapter->addDiscovered(ADDR_A, "SensorA", -60);
    orchestrator->enqueue(ADDR_A, record);
    pump(100 + CONNECTION_SETTLE_MS);
    SessionPtr first = DeviceSession::find(ADDR_A);

    a->simulateLinkLoss();
    pump(5);
    orchestrator->enqueue(ADDR_A, record);
    pump(100);

    SessionPtr second = DeviceSession::find(ADDR_A);
    TEST_ASSERT_TRUE(first != second);
    TEST_ASSERT_TRUE(first->isDisposed());
    TEST_ASSERT_EQUAL(SessionState::CONNECTED, second->state());
    TEST_ASSERT_EQUAL(1, DeviceSession::activeCount());
}

// =============================================================================
// TEST RUNNER
// =============================================================================

int main(int argc, char **argv) {
    (void)argc;
    (void)argv;
    UNITY_BEGIN();

    // Serialization
    RUN_TEST(test_single_connect_succeeds);
    RUN_TEST(test_connects_run_one_at_a_time);
    RUN_TEST(test_settle_delay_between_attempts);
    RUN_TEST(test_settle_delay_uses_platform_minimum);
    RUN_TEST(test_failed_attempt_still_releases_queue);

    // Rejections
    RUN_TEST(test_duplicate_in_flight_rejected);
    RUN_TEST(test_duplicate_queued_rejected);
    RUN_TEST(test_unknown_device_not_found);
    RUN_TEST(test_already_connected_completes_immediately);
    RUN_TEST(test_cancel_pending_keeps_in_flight);

    // Scan gating
    RUN_TEST(test_scan_refused_while_connecting);
    RUN_TEST(test_scan_suspended_and_resumed_around_connect);
    RUN_TEST(test_stop_scan_cancels_resume);
    RUN_TEST(test_scan_complete_returns_radio_to_idle);
    RUN_TEST(test_scan_before_initialize_fails);

    // Session configuration
    RUN_TEST(test_configurator_runs_before_connect);
    RUN_TEST(test_reconnect_replaces_session);

    return UNITY_END();
}
