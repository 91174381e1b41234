/**
 * @file types.h
 * @brief MotionBridge type definitions - Enums, structs, and callback types
 * @version 2.0.0
 * @platform Adafruit Feather nRF52840 Express / Linux (BlueZ)
 */

#ifndef TYPES_H
#define TYPES_H

#include "platform.h"
#include <functional>
#include <string>

// =============================================================================
// RESULT CODES
// =============================================================================

/**
 * @brief Standard result codes for function returns and async completions
 */
enum class Result : uint8_t {
    OK = 0,
    ERROR_TIMEOUT,
    ERROR_INVALID_PARAM,
    ERROR_NOT_CONNECTED,
    ERROR_HARDWARE,
    ERROR_NOT_INITIALIZED,
    ERROR_BUSY,
    ERROR_DISABLED,
    ERROR_DISCOVERY,            // Service/characteristic discovery failed or empty
    ERROR_PROTOCOL,             // Malformed or mismatched response
    ERROR_PACKET_SIZE,          // Streaming packet length mismatch
    ERROR_SYNC,                 // Sync mode entry/exit or offset write rejected
    ERROR_OUT_OF_RANGE,         // Offset not representable as signed 64-bit
    ERROR_DISPOSED,             // Operation resumed on a retired session
    ERROR_NO_CHARACTERISTICS,   // Command/data characteristics unavailable
    ERROR_NOT_FOUND             // Unknown device
};

/**
 * @brief Get string representation of a result code
 */
inline const char* resultToString(Result result) {
    switch (result) {
        case Result::OK: return "OK";
        case Result::ERROR_TIMEOUT: return "TIMEOUT";
        case Result::ERROR_INVALID_PARAM: return "INVALID_PARAM";
        case Result::ERROR_NOT_CONNECTED: return "NOT_CONNECTED";
        case Result::ERROR_HARDWARE: return "HARDWARE";
        case Result::ERROR_NOT_INITIALIZED: return "NOT_INITIALIZED";
        case Result::ERROR_BUSY: return "BUSY";
        case Result::ERROR_DISABLED: return "DISABLED";
        case Result::ERROR_DISCOVERY: return "DISCOVERY";
        case Result::ERROR_PROTOCOL: return "PROTOCOL";
        case Result::ERROR_PACKET_SIZE: return "PACKET_SIZE";
        case Result::ERROR_SYNC: return "SYNC";
        case Result::ERROR_OUT_OF_RANGE: return "OUT_OF_RANGE";
        case Result::ERROR_DISPOSED: return "DISPOSED";
        case Result::ERROR_NO_CHARACTERISTICS: return "NO_CHARACTERISTICS";
        case Result::ERROR_NOT_FOUND: return "NOT_FOUND";
        default: return "UNKNOWN";
    }
}

// =============================================================================
// PERIPHERAL STATE
// =============================================================================

/**
 * @brief Link state of a peripheral handle as reported by the native stack
 */
enum class PeripheralState : uint8_t {
    DISCONNECTED = 0,
    CONNECTING,
    CONNECTED,
    DISCONNECTING
};

inline const char* peripheralStateToString(PeripheralState state) {
    switch (state) {
        case PeripheralState::DISCONNECTED: return "DISCONNECTED";
        case PeripheralState::CONNECTING: return "CONNECTING";
        case PeripheralState::CONNECTED: return "CONNECTED";
        case PeripheralState::DISCONNECTING: return "DISCONNECTING";
        default: return "UNKNOWN";
    }
}

// =============================================================================
// SESSION STATE
// =============================================================================

/**
 * @brief Device session lifecycle states
 */
enum class SessionState : uint8_t {
    DISCONNECTED = 0,   // No link
    CONNECTING,         // Link establishment in progress
    SERVICE_DISCOVERY,  // Link up, locating sensor service and characteristics
    CONNECTED,          // Ready for commands
    STREAMING,          // Motion data flowing
    DISCONNECTING,      // Teardown in progress
    ERROR,              // Connect, discovery or streaming failure
    DISPOSED            // Retired, terminal
};

/**
 * @brief Get string representation of session state
 */
inline const char* sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::DISCONNECTED: return "DISCONNECTED";
        case SessionState::CONNECTING: return "CONNECTING";
        case SessionState::SERVICE_DISCOVERY: return "SERVICE_DISCOVERY";
        case SessionState::CONNECTED: return "CONNECTED";
        case SessionState::STREAMING: return "STREAMING";
        case SessionState::DISCONNECTING: return "DISCONNECTING";
        case SessionState::ERROR: return "ERROR";
        case SessionState::DISPOSED: return "DISPOSED";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Check if a session state has a usable link
 */
inline bool isLinkedState(SessionState state) {
    return state == SessionState::SERVICE_DISCOVERY ||
           state == SessionState::CONNECTED ||
           state == SessionState::STREAMING;
}

// =============================================================================
// SESSION TRIGGERS
// =============================================================================

/**
 * @brief Events that drive session state transitions
 */
enum class SessionTrigger : uint8_t {
    CONNECT_REQUESTED = 0,
    LINK_ESTABLISHED,
    DISCOVERY_COMPLETE,
    STREAM_STARTED,
    STREAM_STOPPED,
    DISCONNECT_REQUESTED,
    LINK_LOST,
    FAILURE,
    DISPOSE,
    FORCED
};

inline const char* sessionTriggerToString(SessionTrigger trigger) {
    switch (trigger) {
        case SessionTrigger::CONNECT_REQUESTED: return "CONNECT_REQUESTED";
        case SessionTrigger::LINK_ESTABLISHED: return "LINK_ESTABLISHED";
        case SessionTrigger::DISCOVERY_COMPLETE: return "DISCOVERY_COMPLETE";
        case SessionTrigger::STREAM_STARTED: return "STREAM_STARTED";
        case SessionTrigger::STREAM_STOPPED: return "STREAM_STOPPED";
        case SessionTrigger::DISCONNECT_REQUESTED: return "DISCONNECT_REQUESTED";
        case SessionTrigger::LINK_LOST: return "LINK_LOST";
        case SessionTrigger::FAILURE: return "FAILURE";
        case SessionTrigger::DISPOSE: return "DISPOSE";
        case SessionTrigger::FORCED: return "FORCED";
        default: return "UNKNOWN";
    }
}

// =============================================================================
// SYNC STATE
// =============================================================================

/**
 * @brief Hardware clock synchronization progress of a session
 */
enum class SyncState : uint8_t {
    UNSYNCED = 0,
    RTC_INITIALIZED,    // Date-time register written
    OFFSET_COMPUTED,    // Median offset estimated
    FULLY_SYNCED        // Offset written to device and acknowledged
};

inline const char* syncStateToString(SyncState state) {
    switch (state) {
        case SyncState::UNSYNCED: return "UNSYNCED";
        case SyncState::RTC_INITIALIZED: return "RTC_INITIALIZED";
        case SyncState::OFFSET_COMPUTED: return "OFFSET_COMPUTED";
        case SyncState::FULLY_SYNCED: return "FULLY_SYNCED";
        default: return "UNKNOWN";
    }
}

// =============================================================================
// ORCHESTRATOR STATE
// =============================================================================

/**
 * @brief Radio usage owned by the connection orchestrator
 */
enum class RadioState : uint8_t {
    IDLE = 0,
    SCANNING,
    CONNECTING
};

inline const char* radioStateToString(RadioState state) {
    switch (state) {
        case RadioState::IDLE: return "IDLE";
        case RadioState::SCANNING: return "SCANNING";
        case RadioState::CONNECTING: return "CONNECTING";
        default: return "UNKNOWN";
    }
}

// =============================================================================
// DEVICE EVENTS
// =============================================================================

/**
 * @brief Kinds of events delivered to the host application
 */
enum class DeviceEventKind : uint8_t {
    DISCOVERED = 0,
    CONNECTED,
    DISCONNECTED,
    ERROR,
    BATTERY_UPDATE,
    STREAMING_STARTED,
    STREAMING_STOPPED,
    AUTO_RECONNECT
};

inline const char* deviceEventKindToString(DeviceEventKind kind) {
    switch (kind) {
        case DeviceEventKind::DISCOVERED: return "discovered";
        case DeviceEventKind::CONNECTED: return "connected";
        case DeviceEventKind::DISCONNECTED: return "disconnected";
        case DeviceEventKind::ERROR: return "error";
        case DeviceEventKind::BATTERY_UPDATE: return "battery-update";
        case DeviceEventKind::STREAMING_STARTED: return "streaming-started";
        case DeviceEventKind::STREAMING_STOPPED: return "streaming-stopped";
        case DeviceEventKind::AUTO_RECONNECT: return "auto-reconnect";
        default: return "unknown";
    }
}

/**
 * @brief Event posted by a session to the host
 */
struct DeviceEvent {
    std::string deviceId;
    DeviceEventKind kind;
    std::string detail;
    int16_t battery;    // -1 when unknown

    DeviceEvent() : kind(DeviceEventKind::DISCOVERED), battery(-1) {}

    DeviceEvent(const std::string& id, DeviceEventKind k,
                const std::string& det = std::string(), int16_t batt = -1) :
        deviceId(id), kind(k), detail(det), battery(batt) {}
};

// =============================================================================
// MOTION DATA
// =============================================================================

/**
 * @brief Unit quaternion orientation
 */
struct Quaternion {
    float w;
    float x;
    float y;
    float z;

    Quaternion() : w(1.0f), x(0.0f), y(0.0f), z(0.0f) {}
    Quaternion(float w_, float x_, float y_, float z_) : w(w_), x(x_), y(y_), z(z_) {}
};

/**
 * @brief One decoded motion sample delivered to the host
 */
struct MotionSample {
    uint64_t timestampMs;   // Host reference clock (device clock + offset)
    Quaternion quaternion;

    MotionSample() : timestampMs(0) {}
};

// =============================================================================
// CONNECTION OUTCOME
// =============================================================================

/**
 * @brief Completion of one orchestrated connect request
 */
struct ConnectOutcome {
    bool success;
    std::string deviceId;
    std::string message;
    Result result;

    ConnectOutcome() : success(false), result(Result::ERROR_NOT_INITIALIZED) {}

    ConnectOutcome(bool ok, const std::string& id, const std::string& msg, Result res) :
        success(ok), deviceId(id), message(msg), result(res) {}
};

// =============================================================================
// DEVICE IDENTITY
// =============================================================================

/**
 * @brief Logical role assigned to a physical sensor by the identity collaborator
 */
struct DeviceIdentity {
    uint8_t semanticId;
    std::string joint;      // e.g. "left_knee"
    std::string position;   // e.g. "thigh", "shin"

    DeviceIdentity() : semanticId(0) {}
};

// =============================================================================
// TIME SYNC
// =============================================================================

/**
 * @brief One GET_TIMESTAMP round trip
 */
struct TimeSyncSample {
    uint64_t masterBeforeMs;    // t1
    uint64_t deviceCounterMs;   // Device clock normalized to ms
    uint64_t masterAfterMs;     // t3

    TimeSyncSample() : masterBeforeMs(0), deviceCounterMs(0), masterAfterMs(0) {}
    TimeSyncSample(uint64_t t1, uint64_t counter, uint64_t t3) :
        masterBeforeMs(t1), deviceCounterMs(counter), masterAfterMs(t3) {}
};

/**
 * @brief Result of a batch of time-sync samples
 */
struct ClockOffsetEstimate {
    double offsetMs;        // Add to device clock to obtain master time
    double averageRttMs;
    uint8_t sampleCount;

    ClockOffsetEstimate() : offsetMs(0.0), averageRttMs(0.0), sampleCount(0) {}
};

// =============================================================================
// CALLBACK TYPES
// =============================================================================

typedef std::function<void(Result)> ResultCallback;
typedef std::function<void(const ConnectOutcome&)> ConnectCallback;
typedef std::function<void(const std::string& deviceId, const MotionSample& sample)> MotionDataCallback;
typedef std::function<void(const DeviceEvent& event)> DeviceEventCallback;

#endif // TYPES_H
