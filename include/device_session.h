/**
 * @file device_session.h
 * @brief Device session - Lifecycle of one sensor link (connect, discover, stream, teardown)
 * @version 2.0.0
 * @platform Adafruit Feather nRF52840 Express / Linux (BlueZ)
 *
 * A DeviceSession owns one physical sensor's lifecycle:
 * - connect() with platform timeout, service discovery (retried once on an
 *   empty table), characteristic discovery under a per-address lock with
 *   bounded retries, initial battery read, periodic battery polling
 * - startStreaming()/stopStreaming() on the timestamped quaternion mode
 * - command round trips (write, then read the reply) serialized per session
 * - disconnect handling that separates user-initiated teardown from link loss
 * - dispose(): terminal, idempotent; in-flight work completes with ERROR_DISPOSED
 *
 * Sessions live in a static registry keyed by device address. create()
 * retires any previous session for the same address before the new one
 * exists, so at most one non-disposed session per device is ever reachable.
 */

#ifndef DEVICE_SESSION_H
#define DEVICE_SESSION_H

#include "ble_transport.h"
#include "event_channel.h"
#include "protocol_codec.h"
#include "state_machine.h"
#include "timer_scheduler.h"
#include <deque>
#include <map>
#include <memory>

class DeviceSession;
typedef std::shared_ptr<DeviceSession> SessionPtr;

typedef std::function<void(Result, const ByteBuffer&)> CommandCallback;
typedef std::function<void(Result, uint8_t)> ValueCallback;

/**
 * @brief Snapshot of a session for status reporting
 */
struct SessionStatus {
    std::string id;
    std::string name;
    SessionState state;
    bool streaming;
    int16_t battery;
    SyncState syncState;
    bool hasClockOffset;
    double clockOffsetMs;
    uint32_t packetsReceived;
    uint32_t packetsDropped;
};

class DeviceSession : public std::enable_shared_from_this<DeviceSession> {
    // Only create() can construct the key, so sessions always go through the registry
    struct CreateKey {
        explicit CreateKey() = default;
    };

public:
    DeviceSession(CreateKey key, const PeripheralPtr& peripheral, const TransportTiming& timing,
                  EventChannel* events);

    // =========================================================================
    // REGISTRY
    // =========================================================================

    /**
     * @brief Create the session for a peripheral, retiring any previous one
     * @param events Host event channel (may be nullptr)
     */
    static SessionPtr create(const PeripheralPtr& peripheral, const TransportTiming& timing,
                             EventChannel* events);

    /**
     * @brief Active session for a device id (nullptr if none)
     */
    static SessionPtr find(const std::string& id);

    static std::vector<SessionPtr> all();

    /**
     * @brief Dispose and remove the session for a device id
     * @return true if a session existed
     */
    static bool retire(const std::string& id);

    static void retireAll();

    static size_t activeCount();

    // =========================================================================
    // DISCOVERY LOCK (shared by all instances for one address)
    // =========================================================================

    static bool isDiscoveryLocked(const std::string& address);

    // =========================================================================
    // LIFECYCLE
    // =========================================================================

    /**
     * @brief Connect, discover and read battery
     *
     * Completes with OK only after the CONNECTED event (carrying battery)
     * has been posted.
     */
    void connect(ResultCallback callback);

    /**
     * @brief User-initiated disconnect (no auto-reconnect event)
     */
    void disconnect(ResultCallback callback);

    void startStreaming(ResultCallback callback);
    void stopStreaming(ResultCallback callback);

    /**
     * @brief Retire this session
     *
     * Idempotent. Releases the discovery lock if held, strips handlers,
     * cancels timers and completes pending operations with ERROR_DISPOSED.
     */
    void dispose();

    // =========================================================================
    // COMMANDS
    // =========================================================================

    /**
     * @brief Write a command and read its reply from the command characteristic
     *
     * Commands are serialized per session. The reply wait is bounded by
     * COMMAND_RESPONSE_TIMEOUT_MS.
     */
    void sendCommand(const ByteBuffer& frame, CommandCallback callback);

    /**
     * @brief Write a command that has no reply (start/stop stream)
     */
    void writeCommand(const ByteBuffer& frame, ResultCallback callback);

    void readBattery(ValueCallback callback);
    void readSystemState(ValueCallback callback);

    // =========================================================================
    // CLOCK CORRECTION
    // =========================================================================

    SyncState getSyncState() const { return _syncState; }

    /**
     * @brief Advance sync progress (ignored once disposed)
     *
     * Dropping to UNSYNCED also forgets the recorded clock offset.
     */
    void setSyncState(SyncState state);

    /**
     * @brief Record the offset written to the device's hardware register
     */
    void setHardwareClockOffset(double offsetMs);

    /**
     * @brief Host-side correction for sessions the device does not correct
     *
     * Assigns rather than accumulates, so re-applying after a reconnect is
     * harmless. Refused for FULLY_SYNCED sessions.
     *
     * @return true if the offset is now applied in software
     */
    bool applySoftwareOffset(double offsetMs);

    bool hasClockOffset() const { return _hasClockOffset; }
    double getClockOffsetMs() const { return _clockOffsetMs; }

    void setDeviceClockInMicros(bool micros) { _deviceClockInMicros = micros; }
    bool isDeviceClockInMicros() const { return _deviceClockInMicros; }

    /**
     * @brief Convert a raw device clock value to host reference milliseconds
     */
    uint64_t correctDeviceTimestamp(uint64_t rawDeviceClock) const;

    // =========================================================================
    // DATA PATH
    // =========================================================================

    void setMotionCallback(MotionDataCallback callback) { _motionCallback = std::move(callback); }

    /**
     * @brief Sampling frequency code used by the next startStreaming()
     */
    void setStreamFrequency(uint8_t frequencyCode) { _frequencyCode = frequencyCode; }
    uint8_t streamFrequency() const { return _frequencyCode; }

    /**
     * @brief Handle one data notification
     *
     * Invalid packets are counted, logged and dropped.
     */
    void onData(const uint8_t* data, size_t length);

    // =========================================================================
    // ACCESSORS
    // =========================================================================

    const std::string& id() const { return _id; }
    const std::string& name() const { return _name; }
    SessionState state() const { return _stateMachine.getCurrentState(); }
    bool isStreaming() const { return _streaming; }
    bool isDisposed() const { return _disposed; }
    int16_t batteryLevel() const { return _battery; }
    bool hasCharacteristics() const { return _commandChar && _dataChar; }
    uint32_t packetsReceived() const { return _packetsReceived; }
    uint32_t packetsDropped() const { return _packetsDropped; }
    const PeripheralPtr& peripheral() const { return _peripheral; }

    void setIdentity(const DeviceIdentity& identity) { _identity = identity; _hasIdentity = true; }
    bool hasIdentity() const { return _hasIdentity; }
    const DeviceIdentity& identity() const { return _identity; }

    SessionStatus getStatus() const;

    SessionStateMachine& stateMachine() { return _stateMachine; }

private:
    struct PendingCommand {
        ByteBuffer frame;
        bool expectReply;
        CommandCallback callback;
    };

    // Identity
    std::string _id;
    std::string _name;
    PeripheralPtr _peripheral;
    TransportTiming _timing;
    EventChannel* _events;
    DeviceIdentity _identity;
    bool _hasIdentity;

    // Lifecycle
    SessionStateMachine _stateMachine;
    bool _disposed;
    bool _userDisconnect;
    ResultCallback _connectCallback;

    // Cached characteristics (cleared only when the link is down)
    CharacteristicPtr _commandChar;
    CharacteristicPtr _dataChar;

    // Streaming
    bool _streaming;
    uint32_t _streamMode;
    uint8_t _frequencyCode;
    uint32_t _packetsReceived;
    uint32_t _packetsDropped;
    MotionDataCallback _motionCallback;

    // Battery
    int16_t _battery;
    TimerId _batteryTimer;
    bool _batteryPollingEnabled;

    // Commands
    std::deque<PendingCommand> _commandQueue;
    bool _commandInFlight;
    std::shared_ptr<bool> _inFlightDone;
    CommandCallback _inFlightCallback;
    TimerId _commandTimer;

    // Discovery
    bool _holdsDiscoveryLock;

    // Clock
    SyncState _syncState;
    bool _hasClockOffset;
    double _clockOffsetMs;
    bool _deviceClockInMicros;

    // Bumped on every link loss; discovery results from an older link are dropped
    uint32_t _linkEpoch;

    // Connect pipeline
    void onLinkEstablished();
    void discoverProfile(ResultCallback callback);
    void discoverServices(uint32_t linkEpoch, uint8_t attempt, ResultCallback callback);
    void discoverCharacteristics(uint32_t linkEpoch, const ServicePtr& service, uint8_t attempt,
                                 ResultCallback callback);
    void finishConnect(Result result);
    void failConnect(Result result, const char* message);
    bool connectAborted() const { return _disposed || !_connectCallback; }

    // Teardown
    void handleLinkLost(uint8_t reason);
    void cleanup(bool linkDown);
    void failPendingCommands(Result result);

    // Battery polling
    void startBatteryPolling();
    void stopBatteryPolling();
    void pollBattery();

    // Command queue
    void processNextCommand();
    void completeCommand(Result result, const ByteBuffer& reply);

    // Streaming helpers
    void ensureCharacteristics(ResultCallback callback);
    void finishStreamStop(Result result, ResultCallback callback);

    // Discovery lock
    bool acquireDiscoveryLock();
    void releaseDiscoveryLock();

    bool checkDisposed(const ResultCallback& callback) const;

    /**
     * @brief Like checkDisposed(), but also stops discovery that started
     *        on a link which has since gone down
     */
    bool checkLinkChanged(uint32_t linkEpoch, const ResultCallback& callback) const;
    void post(DeviceEventKind kind, const std::string& detail = std::string());

    static std::map<std::string, const DeviceSession*> s_discoveryLocks;
    static std::map<std::string, SessionPtr> s_registry;
};

#endif // DEVICE_SESSION_H
