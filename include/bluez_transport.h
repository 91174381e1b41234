/**
 * @file bluez_transport.h
 * @brief BlueZ central backend - BleAdapter over the BlueZ D-Bus API (sd-bus)
 * @version 2.0.0
 * @platform Linux (BlueZ 5.x, systemd sd-bus)
 *
 * Every BlueZ method is called asynchronously; replies and signals are
 * dispatched by sd_bus_process() inside update(), so all completions run
 * on the gateway's main loop.
 *
 * Object model:
 *   /org/bluez/hciN                      Adapter1
 *   /org/bluez/hciN/dev_AA_BB_..         Device1
 *   .../serviceXXXX                      GattService1
 *   .../serviceXXXX/charYYYY             GattCharacteristic1
 *
 * Link state is tracked from Device1.Connected / ServicesResolved and
 * notifications arrive as PropertiesChanged on GattCharacteristic1.Value.
 */

#ifndef BLUEZ_TRANSPORT_H
#define BLUEZ_TRANSPORT_H

#include "ble_transport.h"
#include "config.h"
#include "timer_scheduler.h"
#include <systemd/sd-bus.h>
#include <map>
#include <set>

#define BLUEZ_SERVICE             "org.bluez"
#define BLUEZ_ADAPTER_IFACE       "org.bluez.Adapter1"
#define BLUEZ_DEVICE_IFACE        "org.bluez.Device1"
#define BLUEZ_GATT_SERVICE_IFACE  "org.bluez.GattService1"
#define BLUEZ_GATT_CHAR_IFACE     "org.bluez.GattCharacteristic1"
#define DBUS_PROPERTIES_IFACE     "org.freedesktop.DBus.Properties"
#define DBUS_OBJECT_MANAGER_IFACE "org.freedesktop.DBus.ObjectManager"

#define BLUEZ_DEFAULT_ADAPTER     "hci0"
#define BLUEZ_REASON_UNKNOWN      0x00
#define BLUEZ_REASON_LOCAL_HOST   0x16

class BluezTransport;

/**
 * @brief Reply continuation for an asynchronous method call
 * @param reply Reply message (valid only during the call)
 * @param error NULL on success
 */
typedef std::function<void(sd_bus_message* reply, const sd_bus_error* error)> BluezReplyHandler;

// =============================================================================
// CHARACTERISTIC
// =============================================================================

class BluezCharacteristic : public BleCharacteristic, public std::enable_shared_from_this<BluezCharacteristic> {
public:
    BluezCharacteristic(BluezTransport* transport, const std::string& path, const std::string& uuid,
                        uint8_t properties) :
        _transport(transport), _path(path), _uuid(uuid), _properties(properties) {}

    std::string uuid() const override { return _uuid; }
    uint8_t properties() const override { return _properties; }

    void read(ReadCallback callback) override;
    void write(const std::vector<uint8_t>& data, bool needsAck, ResultCallback callback) override;
    void subscribe(ResultCallback callback) override;
    void unsubscribe(ResultCallback callback) override;

    const std::string& path() const { return _path; }

    void deliver(const uint8_t* data, size_t length) { deliverNotification(data, length); }

    /**
     * @brief Translate BlueZ "Flags" strings to CHAR_PROP_* bits
     */
    static uint8_t translateFlags(const std::vector<std::string>& flags);

private:
    BluezTransport* _transport;
    std::string _path;
    std::string _uuid;
    uint8_t _properties;

    void startNotify(uint8_t attempt, ResultCallback callback);
};

// =============================================================================
// SERVICE
// =============================================================================

class BluezService : public BleService, public std::enable_shared_from_this<BluezService> {
public:
    BluezService(BluezTransport* transport, const std::string& devicePath, const std::string& path,
                 const std::string& uuid) :
        _transport(transport), _devicePath(devicePath), _path(path), _uuid(uuid) {}

    std::string uuid() const override { return _uuid; }
    void discoverCharacteristics(CharacteristicsCallback callback) override;

    const std::string& path() const { return _path; }

private:
    BluezTransport* _transport;
    std::string _devicePath;
    std::string _path;
    std::string _uuid;
};

// =============================================================================
// PERIPHERAL
// =============================================================================

class BluezPeripheral : public BlePeripheral, public std::enable_shared_from_this<BluezPeripheral> {
public:
    BluezPeripheral(BluezTransport* transport, const std::string& path, const std::string& address,
                    const std::string& name, int8_t rssi);

    void connect(uint32_t timeoutMs, ResultCallback callback) override;
    void disconnect(ResultCallback callback) override;
    void discoverServices(ServicesCallback callback) override;

    const std::string& path() const { return _path; }
    void rememberName(const std::string& name) { if (!name.empty()) { _name = name; } }

    // Driven by BluezTransport signal handlers
    void onConnectedChanged(bool connected);
    void onServicesResolved();

private:
    BluezTransport* _transport;
    std::string _path;
    bool _connectReplied;
    bool _servicesResolved;
    TimerId _verifyTimer;
    ResultCallback _connectCallback;

    void completeConnect(Result result);
    void linkDown(uint8_t reason);
};

// =============================================================================
// ADAPTER
// =============================================================================

class BluezTransport : public BleAdapter {
public:
    /**
     * @param adapterName Controller name under /org/bluez (e.g. "hci0")
     */
    explicit BluezTransport(const char* adapterName = BLUEZ_DEFAULT_ADAPTER);
    ~BluezTransport() override;

    BluezTransport(const BluezTransport&) = delete;
    BluezTransport& operator=(const BluezTransport&) = delete;

    const char* backendName() const override { return "BlueZ"; }
    TransportTiming timing() const override;

    void initialize(ResultCallback callback) override;

    Result startScan(uint32_t timeoutMs) override;
    void stopScan() override;
    bool isScanning() const override { return _scanning; }

    std::vector<PeripheralPtr> discoveredDevices() const override;
    PeripheralPtr getPeripheral(const std::string& id) const override;
    void forgetPeripheral(const std::string& id) override;
    void clearDeviceCache(const std::string& address, ResultCallback callback) override;

    void update() override;

    /**
     * @brief Block until the bus has traffic or the timeout elapses
     */
    void waitForEvents(uint64_t timeoutUsec);

    // =========================================================================
    // BUS ACCESS (used by peripherals, services and characteristics)
    // =========================================================================

    /**
     * @brief Create a method call on a BlueZ object
     * @return NULL on failure (logged)
     */
    sd_bus_message* newMethodCall(const std::string& path, const char* interface, const char* member);

    /**
     * @brief Send a prepared call, the handler runs from update()
     * @param timeoutUsec 0 = sd-bus default
     * @return false if the call could not be queued, the handler is not invoked
     */
    bool callAsync(sd_bus_message* message, BluezReplyHandler handler, uint64_t timeoutUsec = 0);

    /**
     * @brief Convenience for argument-less methods
     */
    bool callAsync(const std::string& path, const char* interface, const char* member,
                   BluezReplyHandler handler, uint64_t timeoutUsec = 0);

    void registerCharacteristic(const std::shared_ptr<BluezCharacteristic>& characteristic);

    const std::string& adapterPath() const { return _adapterPath; }

    // =========================================================================
    // HELPERS
    // =========================================================================

    static std::string devicePath(const std::string& adapterPath, const std::string& address);
    static Result mapError(const sd_bus_error* error);
    static bool isTransientError(const sd_bus_error* error);
    static const char* errorText(const sd_bus_error* error);

    /**
     * @brief Discovered GATT layout of one device
     */
    struct GattObjects {
        std::vector<std::shared_ptr<BluezService>> services;
        std::map<std::string, std::vector<CharacteristicPtr>> characteristics;  // Service path -> chars
    };

    /**
     * @brief Parse a GetManagedObjects reply for the objects under a device
     * @return sd-bus error code (< 0) or 0
     */
    int parseGattObjects(sd_bus_message* reply, const std::string& devicePath, GattObjects& out);

    /**
     * @brief Cached GATT layout from the last discoverServices() of a device
     */
    bool cachedCharacteristics(const std::string& servicePath, std::vector<CharacteristicPtr>& out) const;
    void storeGattObjects(const std::string& devicePath, const GattObjects& objects);
    void dropGattObjects(const std::string& devicePath);

private:
    struct DeviceInfo {
        std::string address;
        std::string name;
        int16_t rssi;
        bool hasRssi;
        bool connected;
        bool servicesResolved;

        DeviceInfo() : rssi(0), hasRssi(false), connected(false), servicesResolved(false) {}
    };

    std::string _adapterPath;
    sd_bus* _bus;
    sd_bus_slot* _addedSlot;
    sd_bus_slot* _removedSlot;
    sd_bus_slot* _propsSlot;
    bool _initialized;
    bool _scanning;
    TimerId _scanTimer;

    std::map<std::string, std::shared_ptr<BluezPeripheral>> _peripherals;    // Canonical address -> handle
    std::map<std::string, DeviceInfo> _knownDevices;                         // Object path -> properties
    std::map<std::string, std::weak_ptr<BluezCharacteristic>> _characteristics;  // Object path -> wrapper
    std::map<std::string, std::vector<CharacteristicPtr>> _gattCache;       // Service path -> chars
    std::set<std::string> _seenThisScan;

    bool ensurePowered();
    bool setDiscoveryFilter();
    void seedKnownDevices();
    void stopDiscovery();
    void finishScan();
    int readInterfaceSet(sd_bus_message* message, const std::string& path, bool report);
    void handleDeviceSeen(const std::string& path, const DeviceInfo& info);
    std::shared_ptr<BluezPeripheral> findByPath(const std::string& path) const;

    static int readDeviceProperties(sd_bus_message* message, DeviceInfo& info, uint8_t& changed);

    // Signal handlers (sd_bus_message_handler_t)
    static int _onInterfacesAdded(sd_bus_message* message, void* userdata, sd_bus_error* retError);
    static int _onInterfacesRemoved(sd_bus_message* message, void* userdata, sd_bus_error* retError);
    static int _onPropertiesChanged(sd_bus_message* message, void* userdata, sd_bus_error* retError);
};

#endif // BLUEZ_TRANSPORT_H
