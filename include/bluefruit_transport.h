/**
 * @file bluefruit_transport.h
 * @brief Bluefruit central backend - BleAdapter over the nRF52 SoftDevice
 * @version 2.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * Scanner, connect and notify callbacks run on the Bluefruit BLE task.
 * They only copy the event into a DeferredQueue; update() drains the
 * queues on the main loop and completes the pending operations.
 *
 * GATT operations use the blocking Bluefruit client API. Each one runs
 * from a zero-delay scheduler callback so its completion is never
 * delivered re-entrantly from the call that started it. The callback
 * holds a shared_ptr to its wrapper, so a session may drop the wrapper
 * while the operation is queued.
 *
 * Platform limitation: read() and write_resp() block the main loop for
 * one ATT round trip, a few connection intervals. Scheduler timers fire
 * late by that much while a command is in flight. Notifications keep
 * queueing on the BLE task and are drained on the next update().
 *
 * The SoftDevice is configured for MAX_CENTRAL_LINKS concurrent links.
 * Every link owns a fixed slot of client service/characteristic objects
 * that is bound to the connection handle during discovery.
 */

#ifndef BLUEFRUIT_TRANSPORT_H
#define BLUEFRUIT_TRANSPORT_H

#if defined(ARDUINO) || defined(NATIVE_TEST_BUILD)

#include <Arduino.h>
#include <bluefruit.h>
#include "ble_transport.h"
#include "config.h"
#include "deferred_queue.h"
#include "timer_scheduler.h"
#include <map>
#include <memory>
#include <set>

// =============================================================================
// CONFIGURATION
// =============================================================================

#define BLUEFRUIT_MTU               67
#define BLUEFRUIT_EVENT_LEN         6
#define BLUEFRUIT_HVN_QSIZE         8
#define BLUEFRUIT_WRCMD_QSIZE       8
#define BLUEFRUIT_MAX_NOTIFY_LEN    64
#define BLUEFRUIT_SCAN_QUEUE_SIZE   32
#define BLUEFRUIT_LINK_QUEUE_SIZE   16
#define BLUEFRUIT_NOTIFY_QUEUE_SIZE 64
#define BLUEFRUIT_NAME_LEN          32

class BluefruitTransport;
class BluefruitPeripheral;

// =============================================================================
// DEFERRED EVENTS
// =============================================================================

struct ScanReportEvent {
    ble_gap_addr_t addr;
    int8_t rssi;
    char name[BLUEFRUIT_NAME_LEN];
};

enum class LinkEventType : uint8_t {
    CONNECTED = 0,
    DISCONNECTED
};

struct LinkEvent {
    LinkEventType type;
    uint16_t connHandle;
    ble_gap_addr_t addr;
    uint8_t reason;
};

struct NotifyEvent {
    uint8_t slot;
    uint8_t length;
    uint8_t data[BLUEFRUIT_MAX_NOTIFY_LEN];
};

// =============================================================================
// LINK SLOT
// =============================================================================

/**
 * @brief Client objects for one central link
 */
struct LinkSlot {
    uint16_t connHandle;
    BLEClientService sensorService;
    BLEClientService batteryService;
    BLEClientCharacteristic commandChar;
    BLEClientCharacteristic dataChar;

    LinkSlot();

    bool inUse() const { return connHandle != BLE_CONN_HANDLE_INVALID; }
};

// =============================================================================
// CHARACTERISTIC / SERVICE
// =============================================================================

enum class SensorCharRole : uint8_t {
    COMMAND = 0,
    DATA
};

class BluefruitCharacteristic : public BleCharacteristic,
                                public std::enable_shared_from_this<BluefruitCharacteristic> {
public:
    BluefruitCharacteristic(BluefruitTransport* transport, uint8_t slot, uint16_t connHandle,
                            SensorCharRole role);

    std::string uuid() const override;
    uint8_t properties() const override;

    void read(ReadCallback callback) override;
    void write(const std::vector<uint8_t>& data, bool needsAck, ResultCallback callback) override;
    void subscribe(ResultCallback callback) override;
    void unsubscribe(ResultCallback callback) override;

    uint8_t slot() const { return _slot; }
    SensorCharRole role() const { return _role; }

    /**
     * @brief Forward a drained notification (main loop)
     */
    void deliver(const uint8_t* data, size_t length) { deliverNotification(data, length); }

private:
    BluefruitTransport* _transport;
    uint8_t _slot;
    uint16_t _connHandle;
    SensorCharRole _role;

    BLEClientCharacteristic* nativeCharacteristic() const;
};

class BluefruitService : public BleService, public std::enable_shared_from_this<BluefruitService> {
public:
    BluefruitService(BluefruitTransport* transport, uint8_t slot, uint16_t connHandle, const std::string& uuid) :
        _transport(transport), _slot(slot), _connHandle(connHandle), _uuid(uuid) {}

    std::string uuid() const override { return _uuid; }
    void discoverCharacteristics(CharacteristicsCallback callback) override;

private:
    BluefruitTransport* _transport;
    uint8_t _slot;
    uint16_t _connHandle;
    std::string _uuid;
};

// =============================================================================
// PERIPHERAL
// =============================================================================

class BluefruitPeripheral : public BlePeripheral,
                            public std::enable_shared_from_this<BluefruitPeripheral> {
public:
    BluefruitPeripheral(BluefruitTransport* transport, const ble_gap_addr_t& addr, const std::string& id,
                        const std::string& name, int8_t rssi);

    void connect(uint32_t timeoutMs, ResultCallback callback) override;
    void disconnect(ResultCallback callback) override;
    void discoverServices(ServicesCallback callback) override;

    const ble_gap_addr_t& gapAddress() const { return _addr; }
    uint16_t connHandle() const { return _connHandle; }
    int8_t slot() const { return _slot; }

    // Main-loop completions driven by BluefruitTransport::update()
    void onLinkUp(uint16_t connHandle, int8_t slot);
    void onLinkDown(uint8_t reason);
    void failConnect(Result result);

    void rememberName(const std::string& name) { if (_name.empty()) { _name = name; } }

private:
    BluefruitTransport* _transport;
    ble_gap_addr_t _addr;
    uint16_t _connHandle;
    int8_t _slot;
    TimerId _connectTimer;
    ResultCallback _connectCallback;
    ResultCallback _disconnectCallback;
};

// =============================================================================
// ADAPTER
// =============================================================================

class BluefruitTransport : public BleAdapter {
public:
    BluefruitTransport();

    const char* backendName() const override { return "Bluefruit"; }
    TransportTiming timing() const override;

    void initialize(ResultCallback callback) override;

    Result startScan(uint32_t timeoutMs) override;
    void stopScan() override;
    bool isScanning() const override;

    std::vector<PeripheralPtr> discoveredDevices() const override;
    PeripheralPtr getPeripheral(const std::string& id) const override;
    void forgetPeripheral(const std::string& id) override;
    void clearDeviceCache(const std::string& address, ResultCallback callback) override;

    void update() override;

    // =========================================================================
    // LINK SLOTS (used by peripherals, services and characteristics)
    // =========================================================================

    LinkSlot& linkSlot(uint8_t index) { return _slots[index]; }
    bool slotOwnedBy(uint8_t index, uint16_t connHandle) const {
        return index < MAX_CENTRAL_LINKS && _slots[index].connHandle == connHandle;
    }
    int8_t allocateSlot(uint16_t connHandle);
    void releaseSlot(uint16_t connHandle);

    /**
     * @brief Live characteristic wrappers receive drained notifications
     */
    void registerCharacteristic(const std::shared_ptr<BluefruitCharacteristic>& characteristic);

    static std::string formatAddress(const ble_gap_addr_t& addr);

private:
    bool _initialized;
    bool _scanning;
    LinkSlot _slots[MAX_CENTRAL_LINKS];
    std::map<std::string, std::shared_ptr<BluefruitPeripheral>> _peripherals;
    std::weak_ptr<BluefruitCharacteristic> _dataChars[MAX_CENTRAL_LINKS];

    DeferredQueue<ScanReportEvent, BLUEFRUIT_SCAN_QUEUE_SIZE> _scanQueue;
    DeferredQueue<LinkEvent, BLUEFRUIT_LINK_QUEUE_SIZE> _linkQueue;
    DeferredQueue<NotifyEvent, BLUEFRUIT_NOTIFY_QUEUE_SIZE> _notifyQueue;
    std::atomic<bool> _scanStopped;
    std::set<std::string> _seenThisScan;
    uint32_t _reportedOverflows;

    void drainScanReports();
    void drainLinkEvents();
    void drainNotifications();
    std::shared_ptr<BluefruitPeripheral> findByAddress(const ble_gap_addr_t& addr) const;
    std::shared_ptr<BluefruitPeripheral> findByHandle(uint16_t connHandle) const;
    void dropCachedPeripheral(const std::string& id, const std::shared_ptr<BluefruitPeripheral>& peripheral);

    // Static callbacks (BLE task)
    static void _onScanReport(ble_gap_evt_adv_report_t* report);
    static void _onScanStop();
    static void _onConnect(uint16_t connHandle);
    static void _onDisconnect(uint16_t connHandle, uint8_t reason);
    static void _onNotify(BLEClientCharacteristic* chr, uint8_t* data, uint16_t len);
};

// Global instance pointer for static callbacks
extern BluefruitTransport* g_bluefruitTransport;

#endif // ARDUINO || NATIVE_TEST_BUILD

#endif // BLUEFRUIT_TRANSPORT_H
