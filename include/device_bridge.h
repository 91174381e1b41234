/**
 * @file device_bridge.h
 * @brief Device bridge - Host-facing facade over transport, sessions, orchestrator and time sync
 * @version 2.0.0
 * @platform Adafruit Feather nRF52840 Express / Linux (BlueZ)
 *
 * The bridge wires one BleAdapter to the connection orchestrator, the
 * session registry and the time-sync engine, and exposes fleet-level
 * operations (connect all, stream all, sync all) to the host.
 *
 * Host callbacks:
 * - motion data: invoked from the transport pump for every decoded sample
 * - device events: delivered in posting order from update()
 */

#ifndef DEVICE_BRIDGE_H
#define DEVICE_BRIDGE_H

#include "connection_orchestrator.h"
#include "settings_store.h"
#include "time_sync.h"

// =============================================================================
// IDENTITY RESOLVER
// =============================================================================

/**
 * @brief Maps a sensor's advertised name to its logical role
 */
class IdentityResolver {
public:
    virtual ~IdentityResolver() = default;

    /**
     * @return true if the device has a known identity
     */
    virtual bool assignIdentity(const std::string& deviceName, DeviceIdentity& identity) = 0;
};

// =============================================================================
// DEVICE BRIDGE
// =============================================================================

class DeviceBridge {
public:
    explicit DeviceBridge(BleAdapter& adapter);

    /**
     * @brief Initialize the transport and apply settings
     */
    void begin(const BridgeSettings& settings, ResultCallback callback);

    void applySettings(const BridgeSettings& settings);
    const BridgeSettings& settings() const { return _settings; }

    /**
     * @brief Pump the transport and deliver queued events (call from the main loop)
     */
    void update();

    void setMotionDataCallback(MotionDataCallback callback) { _motionCallback = std::move(callback); }
    void setDeviceEventCallback(DeviceEventCallback callback) { _eventCallback = std::move(callback); }
    void setIdentityResolver(IdentityResolver* resolver) { _identityResolver = resolver; }

    // =========================================================================
    // DISCOVERY
    // =========================================================================

    /**
     * @param timeoutMs Scan window (0 = use the configured default)
     */
    Result startScan(uint32_t timeoutMs = 0);
    void stopScan();

    /**
     * @brief Scan for the configured window, then connect everything found
     */
    Result scanAndConnectAll(ConnectCallback perDevice);

    std::vector<PeripheralPtr> discoveredDevices() const { return _adapter.discoveredDevices(); }

    // =========================================================================
    // CONNECTIONS
    // =========================================================================

    void connectDevice(const std::string& deviceId, ConnectCallback callback);

    /**
     * @brief Queue every discovered device without a live session
     * @return Number of requests queued
     */
    size_t connectAll(ConnectCallback perDevice);

    void disconnectDevice(const std::string& deviceId, ResultCallback callback);

    /**
     * @brief Cancel queued connects and disconnect every session
     */
    void disconnectAll(ResultCallback callback);

    /**
     * @brief Retire the session, then remove the device from the OS cache
     */
    void clearDeviceCache(const std::string& address, ResultCallback callback);

    // =========================================================================
    // STREAMING
    // =========================================================================

    void startStreaming(const std::string& deviceId, ResultCallback callback);
    void stopStreaming(const std::string& deviceId, ResultCallback callback);
    void streamAll(ResultCallback callback);
    void stopAll(ResultCallback callback);

    // =========================================================================
    // TIME SYNC
    // =========================================================================

    Result syncDevice(const std::string& deviceId, SyncCallback callback);
    void syncAll(FleetSyncCallback callback);

    // =========================================================================
    // STATUS
    // =========================================================================

    std::vector<SessionStatus> getStatus() const;
    void printStatus() const;

    BleAdapter& adapter() { return _adapter; }
    ConnectionOrchestrator& orchestrator() { return _orchestrator; }
    TimeSyncEngine& timeSync() { return _timeSync; }
    EventChannel& events() { return _events; }

private:
    typedef std::function<void(const SessionPtr&, ResultCallback)> SessionOperation;

    BleAdapter& _adapter;
    EventChannel _events;
    ConnectionOrchestrator _orchestrator;
    TimeSyncEngine _timeSync;
    BridgeSettings _settings;

    MotionDataCallback _motionCallback;
    DeviceEventCallback _eventCallback;
    IdentityResolver* _identityResolver;

    bool _connectAllAfterScan;
    ConnectCallback _connectAllCallback;

    void configureSession(const SessionPtr& session);
    void onConnected(const ConnectOutcome& outcome, const ConnectCallback& callback);
    void onSyncComplete(const std::string& deviceId, Result result, const ClockOffsetEstimate& estimate);
    void onScanComplete();

    /**
     * @brief Run an operation on each session in turn
     *
     * Completes with OK, or with the first failure once every session ran.
     */
    static void runSequential(std::shared_ptr<std::vector<SessionPtr>> sessions, size_t index,
                              SessionOperation operation, Result firstError, ResultCallback done);
};

#endif // DEVICE_BRIDGE_H
