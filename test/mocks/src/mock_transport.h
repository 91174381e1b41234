/**
 * @file mock_transport.h
 * @brief Scripted in-memory BLE backend for native unit testing
 * @note Completions are delivered through the global TimerScheduler after a
 *       configurable latency, so tests drive time with mockAdvanceMillis()
 *       and scheduler.update() exactly like the main loop would.
 *
 * MockPeripheral emulates a TropX sensor: it answers battery, system
 * state, timestamp and acknowledgement frames written to the command
 * characteristic, and can push streaming packets on the data characteristic.
 */

#ifndef MOCK_TRANSPORT_H
#define MOCK_TRANSPORT_H

#include "ble_transport.h"
#include "config.h"
#include "timer_scheduler.h"
#include <map>
#include <set>

class MockPeripheral;

// =============================================================================
// MOCK CHARACTERISTIC
// =============================================================================

class MockCharacteristic : public BleCharacteristic {
public:
    MockCharacteristic(MockPeripheral* owner, const std::string& uuid, uint8_t properties) :
        subscribed(false), _owner(owner), _uuid(uuid), _properties(properties) {}

    std::string uuid() const override { return _uuid; }
    uint8_t properties() const override { return _properties; }

    void read(ReadCallback callback) override;
    void write(const std::vector<uint8_t>& data, bool needsAck, ResultCallback callback) override;
    void subscribe(ResultCallback callback) override;
    void unsubscribe(ResultCallback callback) override;

    /**
     * @brief Push a notification to the installed handler
     */
    void emit(const std::vector<uint8_t>& data) { deliverNotification(data.data(), data.size()); }

    bool subscribed;

private:
    MockPeripheral* _owner;
    std::string _uuid;
    uint8_t _properties;
};

// =============================================================================
// MOCK SERVICE
// =============================================================================

class MockService : public BleService {
public:
    MockService(MockPeripheral* owner, const std::string& uuid) : _owner(owner), _uuid(uuid) {}

    std::string uuid() const override { return _uuid; }
    void discoverCharacteristics(CharacteristicsCallback callback) override;

    std::vector<CharacteristicPtr> characteristics;

private:
    MockPeripheral* _owner;
    std::string _uuid;
};

// =============================================================================
// MOCK PERIPHERAL
// =============================================================================

class MockPeripheral : public BlePeripheral {
public:
    MockPeripheral(const std::string& address, const std::string& name, int8_t rssi) :
        BlePeripheral(address, address, name, rssi),
        latencyMs(5),
        connectDelayMs(20),
        connectResult(Result::OK),
        emptyServiceDiscoveries(0),
        characteristicDiscoveryFailures(0),
        discoveryOutlivesLink(false),
        dropReplies(false),
        battery(87),
        systemState(DEVICE_STATE_IDLE),
        clockOffsetMs(5000),
        clockJitterMs(0),
        clockInMicros(false),
        streaming(false),
        hasClockOffset(false),
        lastClockOffset(0),
        connectCount(0),
        disconnectCount(0),
        _timestampCount(0)
    {
        std::shared_ptr<MockService> sensor = std::make_shared<MockService>(this, SENSOR_SERVICE_UUID);
        commandChar = std::make_shared<MockCharacteristic>(this, SENSOR_COMMAND_CHAR_UUID,
                                                           CHAR_PROP_READ | CHAR_PROP_WRITE);
        dataChar = std::make_shared<MockCharacteristic>(this, SENSOR_DATA_CHAR_UUID, CHAR_PROP_NOTIFY);
        sensor->characteristics.push_back(commandChar);
        sensor->characteristics.push_back(dataChar);

        std::shared_ptr<MockService> batteryService = std::make_shared<MockService>(
            this, "0000180f-0000-1000-8000-00805f9b34fb");
        services.push_back(batteryService);
        services.push_back(sensor);
    }

    // -------------------------------------------------------------------------
    // BlePeripheral
    // -------------------------------------------------------------------------

    void connect(uint32_t timeoutMs, ResultCallback callback) override {
        connectCount++;
        setState(PeripheralState::CONNECTING);

        if (connectDelayMs > timeoutMs) {
            scheduler.schedule(timeoutMs, [this, callback]() {
                setState(PeripheralState::DISCONNECTED);
                callback(Result::ERROR_TIMEOUT);
            });
            return;
        }

        scheduler.schedule(connectDelayMs, [this, callback]() {
            if (connectResult != Result::OK) {
                setState(PeripheralState::DISCONNECTED);
                callback(connectResult);
                return;
            }
            setState(PeripheralState::CONNECTED);
            callback(Result::OK);
        });
    }

    void disconnect(ResultCallback callback) override {
        disconnectCount++;
        if (_state == PeripheralState::DISCONNECTED) {
            scheduler.schedule(0, [callback]() { callback(Result::OK); });
            return;
        }
        setState(PeripheralState::DISCONNECTING);
        scheduler.schedule(latencyMs, [this, callback]() {
            dropLink(0x16);
            callback(Result::OK);
        });
    }

    void discoverServices(ServicesCallback callback) override {
        scheduler.schedule(latencyMs, [this, callback]() {
            if (!isConnected()) {
                callback(Result::ERROR_NOT_CONNECTED, std::vector<ServicePtr>());
                return;
            }
            if (emptyServiceDiscoveries > 0) {
                emptyServiceDiscoveries--;
                callback(Result::OK, std::vector<ServicePtr>());
                return;
            }
            callback(Result::OK, services);
        });
    }

    // -------------------------------------------------------------------------
    // Test controls
    // -------------------------------------------------------------------------

    /**
     * @brief Simulate an unexpected link loss
     */
    void simulateLinkLoss(uint8_t reason = 0x08) { dropLink(reason); }

    /**
     * @brief Build a streaming packet in the timestamped quaternion layout
     */
    std::vector<uint8_t> makePacket(int16_t qx, int16_t qy, int16_t qz, uint64_t deviceClock) const {
        std::vector<uint8_t> packet(PACKET_HEADER_SIZE, 0);
        const int16_t values[3] = { qx, qy, qz };
        for (int16_t v : values) {
            packet.push_back((uint8_t)((uint16_t)v & 0xFF));
            packet.push_back((uint8_t)(((uint16_t)v >> 8) & 0xFF));
        }
        for (int i = 0; i < 6; i++) {
            packet.push_back((uint8_t)((deviceClock >> (8 * i)) & 0xFF));
        }
        return packet;
    }

    void streamPacket(int16_t qx, int16_t qy, int16_t qz, uint64_t deviceClock) {
        if (dataChar->subscribed) {
            dataChar->emit(makePacket(qx, qy, qz, deviceClock));
        }
    }

    // Called by the command characteristic once the write reaches the device
    void handleCommand(const std::vector<uint8_t>& frame) {
        commandLog.push_back(frame);
        if (frame.empty()) {
            return;
        }

        uint8_t cmd = frame[0];
        switch (cmd) {
            case CMD_BATTERY | CMD_READ_MASK:
                _reply = { 0x00, 0x03, cmd, 0x00, battery };
                break;
            case CMD_STATE | CMD_READ_MASK:
                _reply = { 0x00, 0x03, cmd, 0x00, systemState };
                break;
            case CMD_ENTER_TIMESYNC | CMD_READ_MASK: {
                uint64_t counter = deviceCounter();
                _reply = { 0x00, 0x08, cmd, 0x00 };
                for (int i = 0; i < 6; i++) {
                    _reply.push_back((uint8_t)((counter >> (8 * i)) & 0xFF));
                }
                break;
            }
            case CMD_STATE:
                if (frame.size() >= 3) {
                    streaming = (frame[2] == DEVICE_STATE_STREAMING);
                    systemState = streaming ? DEVICE_STATE_STREAMING : frame[2];
                }
                _reply = { 0x00, 0x02, cmd, ackStatus(cmd) };
                break;
            case CMD_SET_CLOCK_OFFSET:
                if (frame.size() >= 10) {
                    uint64_t raw = 0;
                    for (int i = 0; i < 8; i++) {
                        raw |= (uint64_t)frame[2 + i] << (8 * i);
                    }
                    lastClockOffset = (int64_t)raw;
                    hasClockOffset = true;
                }
                _reply = { 0x00, 0x02, cmd, ackStatus(cmd) };
                break;
            default:
                _reply = { 0x00, 0x02, cmd, ackStatus(cmd) };
                break;
        }
    }

    std::vector<uint8_t> takeReply() const { return _reply; }

    size_t countCommands(uint8_t cmd) const {
        size_t count = 0;
        for (const std::vector<uint8_t>& frame : commandLog) {
            if (!frame.empty() && frame[0] == cmd) {
                count++;
            }
        }
        return count;
    }

    uint32_t latencyMs;
    uint32_t connectDelayMs;
    Result connectResult;
    uint8_t emptyServiceDiscoveries;
    uint8_t characteristicDiscoveryFailures;
    bool discoveryOutlivesLink;     // Characteristic results already in transit survive a link drop
    bool dropReplies;
    uint8_t battery;
    uint8_t systemState;
    int64_t clockOffsetMs;      // Device counter = host time - clockOffsetMs
    int32_t clockJitterMs;      // Alternating +/- jitter applied to counters
    bool clockInMicros;
    bool streaming;
    bool hasClockOffset;
    int64_t lastClockOffset;
    uint32_t connectCount;
    uint32_t disconnectCount;
    std::map<uint8_t, uint8_t> ackErrors;   // Command -> device error status
    std::vector<std::vector<uint8_t>> commandLog;
    std::vector<ServicePtr> services;
    std::shared_ptr<MockCharacteristic> commandChar;
    std::shared_ptr<MockCharacteristic> dataChar;

private:
    std::vector<uint8_t> _reply;
    uint32_t _timestampCount;

    uint8_t ackStatus(uint8_t cmd) const {
        auto it = ackErrors.find(cmd);
        return it != ackErrors.end() ? it->second : 0x00;
    }

    uint64_t deviceCounter() {
        int64_t jitter = (_timestampCount++ % 2 == 0) ? clockJitterMs : -clockJitterMs;
        int64_t ms = (int64_t)platformEpochMs() - clockOffsetMs + jitter;
        return clockInMicros ? (uint64_t)ms * 1000 : (uint64_t)ms;
    }

    void dropLink(uint8_t reason) {
        if (_state == PeripheralState::DISCONNECTED) {
            return;
        }
        commandChar->subscribed = false;
        dataChar->subscribed = false;
        streaming = false;
        notifyDisconnected(reason);
    }
};

// -----------------------------------------------------------------------------
// Deferred definitions (need MockPeripheral)
// -----------------------------------------------------------------------------

inline void MockCharacteristic::read(ReadCallback callback) {
    MockPeripheral* owner = _owner;
    scheduler.schedule(owner->latencyMs, [owner, callback]() {
        if (!owner->isConnected()) {
            callback(Result::ERROR_NOT_CONNECTED, std::vector<uint8_t>());
            return;
        }
        if (owner->dropReplies) {
            return;
        }
        callback(Result::OK, owner->takeReply());
    });
}

inline void MockCharacteristic::write(const std::vector<uint8_t>& data, bool needsAck, ResultCallback callback) {
    (void)needsAck;
    MockPeripheral* owner = _owner;
    bool isCommand = uuidEquals(_uuid, SENSOR_COMMAND_CHAR_UUID);
    scheduler.schedule(owner->latencyMs, [owner, data, isCommand, callback]() {
        if (!owner->isConnected()) {
            callback(Result::ERROR_NOT_CONNECTED);
            return;
        }
        if (isCommand) {
            owner->handleCommand(data);
        }
        callback(Result::OK);
    });
}

inline void MockCharacteristic::subscribe(ResultCallback callback) {
    MockPeripheral* owner = _owner;
    scheduler.schedule(owner->latencyMs, [this, owner, callback]() {
        if (!owner->isConnected()) {
            callback(Result::ERROR_NOT_CONNECTED);
            return;
        }
        subscribed = true;
        callback(Result::OK);
    });
}

inline void MockCharacteristic::unsubscribe(ResultCallback callback) {
    MockPeripheral* owner = _owner;
    scheduler.schedule(owner->latencyMs, [this, callback]() {
        subscribed = false;
        callback(Result::OK);
    });
}

inline void MockService::discoverCharacteristics(CharacteristicsCallback callback) {
    MockPeripheral* owner = _owner;
    scheduler.schedule(owner->latencyMs, [this, owner, callback]() {
        if (!owner->isConnected() && !owner->discoveryOutlivesLink) {
            callback(Result::ERROR_NOT_CONNECTED, std::vector<CharacteristicPtr>());
            return;
        }
        if (owner->characteristicDiscoveryFailures > 0) {
            owner->characteristicDiscoveryFailures--;
            callback(Result::OK, std::vector<CharacteristicPtr>());
            return;
        }
        callback(Result::OK, characteristics);
    });
}

// =============================================================================
// MOCK ADAPTER
// =============================================================================

class MockAdapter : public BleAdapter {
public:
    MockAdapter() : _initialized(false), _scanning(false), _scanTimer(TimerScheduler::INVALID_ID) {
        _timing.connectTimeoutMs = 1000;
        _timing.gattRetryAttempts = 2;
        _timing.gattRetryDelayMs = 50;
        _timing.interConnectionDelayMs = 0;
    }

    const char* backendName() const override { return "Mock"; }
    TransportTiming timing() const override { return _timing; }
    void setTiming(const TransportTiming& timing) { _timing = timing; }

    void initialize(ResultCallback callback) override {
        scheduler.schedule(0, [this, callback]() {
            _initialized = true;
            callback(Result::OK);
        });
    }

    Result startScan(uint32_t timeoutMs) override {
        if (!_initialized) {
            return Result::ERROR_NOT_INITIALIZED;
        }
        if (connectionInFlight()) {
            return Result::ERROR_BUSY;
        }
        _scanning = true;
        _seenThisScan.clear();
        scheduler.cancel(_scanTimer);
        _scanTimer = TimerScheduler::INVALID_ID;
        if (timeoutMs > 0) {
            _scanTimer = scheduler.schedule(timeoutMs, [this]() {
                _scanTimer = TimerScheduler::INVALID_ID;
                _scanning = false;
                notifyScanComplete();
            });
        }
        return Result::OK;
    }

    void stopScan() override {
        scheduler.cancel(_scanTimer);
        _scanTimer = TimerScheduler::INVALID_ID;
        _scanning = false;
    }

    bool isScanning() const override { return _scanning; }

    std::vector<PeripheralPtr> discoveredDevices() const override {
        std::vector<PeripheralPtr> devices;
        for (const auto& entry : _discovered) {
            devices.push_back(entry.second);
        }
        return devices;
    }

    PeripheralPtr getPeripheral(const std::string& id) const override {
        auto it = _discovered.find(id);
        return it != _discovered.end() ? it->second : nullptr;
    }

    void forgetPeripheral(const std::string& id) override { _discovered.erase(id); }

    void clearDeviceCache(const std::string& address, ResultCallback callback) override {
        std::string id = canonicalAddress(address);
        cleared.push_back(id);
        PeripheralPtr peripheral = getPeripheral(id);
        _discovered.erase(id);
        if (peripheral && peripheral->isConnected()) {
            peripheral->disconnect(callback);
            return;
        }
        scheduler.schedule(0, [callback]() { callback(Result::OK); });
    }

    void update() override {
        if (!_scanning) {
            return;
        }
        for (const std::shared_ptr<MockPeripheral>& device : _advertisers) {
            if (_seenThisScan.count(device->id()) > 0) {
                continue;
            }
            if (!_scanFilter.accepts(device->name(), device->rssi())) {
                continue;
            }
            _seenThisScan.insert(device->id());
            _discovered[device->id()] = device;
            notifyDiscovered(device);
        }
    }

    // -------------------------------------------------------------------------
    // Test controls
    // -------------------------------------------------------------------------

    std::shared_ptr<MockPeripheral> addDevice(const std::string& address, const std::string& name, int8_t rssi) {
        std::shared_ptr<MockPeripheral> device = std::make_shared<MockPeripheral>(address, name, rssi);
        _advertisers.push_back(device);
        return device;
    }

    /**
     * @brief Make a device known without scanning
     */
    std::shared_ptr<MockPeripheral> addDiscovered(const std::string& address, const std::string& name,
                                                  int8_t rssi) {
        std::shared_ptr<MockPeripheral> device = addDevice(address, name, rssi);
        _discovered[device->id()] = device;
        return device;
    }

    void markInitialized() { _initialized = true; }

    std::vector<std::string> cleared;

private:
    TransportTiming _timing;
    bool _initialized;
    bool _scanning;
    TimerId _scanTimer;
    std::vector<std::shared_ptr<MockPeripheral>> _advertisers;
    std::map<std::string, PeripheralPtr> _discovered;
    std::set<std::string> _seenThisScan;
};

#endif // MOCK_TRANSPORT_H
