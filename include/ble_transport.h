/**
 * @file ble_transport.h
 * @brief BLE transport abstraction - Adapter, peripheral, service and characteristic interfaces
 * @version 2.0.0
 * @platform Adafruit Feather nRF52840 Express / Linux (BlueZ)
 *
 * Two native stacks sit behind these interfaces:
 * - BluefruitTransport: SoftDevice central, callbacks on the BLE task
 * - BluezTransport: BlueZ daemon over D-Bus, asynchronous method calls
 *
 * Every asynchronous operation completes through a callback invoked from
 * the main loop (inside BleAdapter::update() or TimerScheduler::update()),
 * never re-entrantly from inside the call that started it.
 *
 * UUIDs are compared in canonical form (see canonicalUuid()).
 */

#ifndef BLE_TRANSPORT_H
#define BLE_TRANSPORT_H

#include "types.h"
#include <memory>
#include <string>
#include <vector>

class BlePeripheral;
class BleService;
class BleCharacteristic;

typedef std::shared_ptr<BlePeripheral> PeripheralPtr;
typedef std::shared_ptr<BleService> ServicePtr;
typedef std::shared_ptr<BleCharacteristic> CharacteristicPtr;

typedef std::function<void(Result, const std::vector<uint8_t>&)> ReadCallback;
typedef std::function<void(Result, const std::vector<ServicePtr>&)> ServicesCallback;
typedef std::function<void(Result, const std::vector<CharacteristicPtr>&)> CharacteristicsCallback;
typedef std::function<void(const uint8_t* data, size_t length)> NotificationHandler;
typedef std::function<void(uint8_t reason)> DisconnectHandler;
typedef std::function<void(const PeripheralPtr&)> DiscoveryHandler;

// =============================================================================
// CHARACTERISTIC CAPABILITIES
// =============================================================================

#define CHAR_PROP_READ              0x01
#define CHAR_PROP_WRITE             0x02
#define CHAR_PROP_WRITE_NO_RESPONSE 0x04
#define CHAR_PROP_NOTIFY            0x08
#define CHAR_PROP_INDICATE          0x10

// =============================================================================
// UUID HELPERS
// =============================================================================

/**
 * @brief Canonical UUID form shared by all backends
 *
 * Lower-case hex with separators removed. UUIDs built on the Bluetooth base
 * UUID (0000xxxx-0000-1000-8000-00805f9b34fb) collapse to the 4-digit form,
 * so "0000180F-0000-1000-8000-00805F9B34FB" and "180f" compare equal.
 */
std::string canonicalUuid(const std::string& uuid);

inline bool uuidEquals(const std::string& a, const std::string& b) {
    return canonicalUuid(a) == canonicalUuid(b);
}

/**
 * @brief Canonical form of a device address ("AA:BB:..." upper case)
 */
std::string canonicalAddress(const std::string& address);

// =============================================================================
// SCAN FILTER
// =============================================================================

/**
 * @brief Name and signal filter applied identically by every backend
 */
class ScanFilter {
public:
    ScanFilter();

    /**
     * @brief Replace name filters (case-insensitive substrings, empty = accept all)
     */
    void setNameFilters(const std::vector<std::string>& filters);
    void setMinRssi(int8_t minRssi) { _minRssi = minRssi; }

    int8_t getMinRssi() const { return _minRssi; }
    const std::vector<std::string>& getNameFilters() const { return _nameFilters; }

    /**
     * @brief Check an advertisement against name and RSSI filters
     */
    bool accepts(const std::string& name, int8_t rssi) const;

private:
    std::vector<std::string> _nameFilters;  // Stored lower-case
    int8_t _minRssi;
};

// =============================================================================
// CHARACTERISTIC
// =============================================================================

class BleCharacteristic {
public:
    virtual ~BleCharacteristic() = default;

    virtual std::string uuid() const = 0;
    virtual uint8_t properties() const = 0;

    bool canRead() const { return (properties() & CHAR_PROP_READ) != 0; }
    bool canWrite() const { return (properties() & (CHAR_PROP_WRITE | CHAR_PROP_WRITE_NO_RESPONSE)) != 0; }
    bool canNotify() const { return (properties() & (CHAR_PROP_NOTIFY | CHAR_PROP_INDICATE)) != 0; }

    virtual void read(ReadCallback callback) = 0;

    /**
     * @param needsAck true = write request (ATT response), false = write command
     */
    virtual void write(const std::vector<uint8_t>& data, bool needsAck, ResultCallback callback) = 0;

    virtual void subscribe(ResultCallback callback) = 0;
    virtual void unsubscribe(ResultCallback callback) = 0;

    /**
     * @brief Install the notification stream handler (replaces any previous one)
     */
    void setNotificationHandler(NotificationHandler handler) { _notificationHandler = std::move(handler); }
    void clearNotificationHandler() { _notificationHandler = nullptr; }
    bool hasNotificationHandler() const { return static_cast<bool>(_notificationHandler); }

protected:
    /**
     * @brief Backends call this from the main loop for each notification
     */
    void deliverNotification(const uint8_t* data, size_t length) {
        if (_notificationHandler) {
            _notificationHandler(data, length);
        }
    }

private:
    NotificationHandler _notificationHandler;
};

// =============================================================================
// SERVICE
// =============================================================================

class BleService {
public:
    virtual ~BleService() = default;

    virtual std::string uuid() const = 0;
    virtual void discoverCharacteristics(CharacteristicsCallback callback) = 0;
};

// =============================================================================
// PERIPHERAL
// =============================================================================

class BlePeripheral {
public:
    BlePeripheral(const std::string& id, const std::string& address, const std::string& name, int8_t rssi) :
        _id(id), _address(address), _name(name), _rssi(rssi), _state(PeripheralState::DISCONNECTED) {}

    virtual ~BlePeripheral() = default;

    const std::string& id() const { return _id; }
    const std::string& address() const { return _address; }
    const std::string& name() const { return _name; }
    int8_t rssi() const { return _rssi; }
    PeripheralState state() const { return _state; }
    bool isConnected() const { return _state == PeripheralState::CONNECTED; }

    void updateRssi(int8_t rssi) { _rssi = rssi; }

    /**
     * @brief Establish the link
     * @param timeoutMs Platform-specific bound, the callback receives
     *        ERROR_TIMEOUT and the attempt is cancelled when it expires
     */
    virtual void connect(uint32_t timeoutMs, ResultCallback callback) = 0;
    virtual void disconnect(ResultCallback callback) = 0;
    virtual void discoverServices(ServicesCallback callback) = 0;

    /**
     * @brief Handler for link loss reported by the native stack
     *
     * Fires once per established link, after the state is DISCONNECTED.
     */
    void setDisconnectHandler(DisconnectHandler handler) { _disconnectHandler = std::move(handler); }
    void clearDisconnectHandler() { _disconnectHandler = nullptr; }

protected:
    void setState(PeripheralState state) { _state = state; }

    void notifyDisconnected(uint8_t reason) {
        _state = PeripheralState::DISCONNECTED;
        if (_disconnectHandler) {
            // Copy so the handler may clear or replace itself
            DisconnectHandler handler = _disconnectHandler;
            handler(reason);
        }
    }

    std::string _id;
    std::string _address;
    std::string _name;
    int8_t _rssi;
    PeripheralState _state;

private:
    DisconnectHandler _disconnectHandler;
};

// =============================================================================
// ADAPTER
// =============================================================================

/**
 * @brief Platform timing profile reported by a backend
 */
struct TransportTiming {
    uint32_t connectTimeoutMs;
    uint8_t gattRetryAttempts;
    uint32_t gattRetryDelayMs;
    uint32_t interConnectionDelayMs;
};

class BleAdapter {
public:
    virtual ~BleAdapter() = default;

    virtual const char* backendName() const = 0;
    virtual TransportTiming timing() const = 0;

    virtual void initialize(ResultCallback callback) = 0;

    /**
     * @brief Start a time-boxed scan
     * @param timeoutMs Scan stops automatically after this long (0 = until stopScan())
     * @return ERROR_BUSY if a connection is in flight, ERROR_NOT_INITIALIZED
     *         before initialize() completed
     */
    virtual Result startScan(uint32_t timeoutMs) = 0;
    virtual void stopScan() = 0;
    virtual bool isScanning() const = 0;

    virtual std::vector<PeripheralPtr> discoveredDevices() const = 0;
    virtual PeripheralPtr getPeripheral(const std::string& id) const = 0;
    virtual void forgetPeripheral(const std::string& id) = 0;

    /**
     * @brief Disconnect if connected, then remove the device from the OS registry
     */
    virtual void clearDeviceCache(const std::string& address, ResultCallback callback) = 0;

    /**
     * @brief Pump native events (call from the main loop)
     */
    virtual void update() = 0;

    ScanFilter& scanFilter() { return _scanFilter; }
    const ScanFilter& scanFilter() const { return _scanFilter; }

    void setDiscoveryHandler(DiscoveryHandler handler) { _discoveryHandler = std::move(handler); }
    void setScanCompleteHandler(std::function<void()> handler) { _scanCompleteHandler = std::move(handler); }

    /**
     * @brief Radio arbitration: scanning is refused while this returns true
     */
    void setConnectionGate(std::function<bool()> connectInFlight) { _connectInFlight = std::move(connectInFlight); }

protected:
    bool connectionInFlight() const { return _connectInFlight && _connectInFlight(); }

    void notifyDiscovered(const PeripheralPtr& peripheral) {
        if (_discoveryHandler) {
            _discoveryHandler(peripheral);
        }
    }

    void notifyScanComplete() {
        if (_scanCompleteHandler) {
            _scanCompleteHandler();
        }
    }

    ScanFilter _scanFilter;

private:
    DiscoveryHandler _discoveryHandler;
    std::function<void()> _scanCompleteHandler;
    std::function<bool()> _connectInFlight;
};

#endif // BLE_TRANSPORT_H
