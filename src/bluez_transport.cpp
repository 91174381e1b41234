/**
 * @file bluez_transport.cpp
 * @brief BlueZ central backend - Implementation
 * @version 2.0.0
 * @platform Linux (BlueZ 5.x, systemd sd-bus)
 *
 * Connect sequence:
 *   Device1.Connect ───────────────▶ reply OK
 *   PropertiesChanged ◀──────────── ServicesResolved=true
 *   GetManagedObjects ─────────────▶ GattService1 / GattCharacteristic1 paths
 *   StartNotify (data char) ───────▶ PropertiesChanged Value=... per packet
 */

#include "bluez_transport.h"
#include "log.h"
#include <errno.h>
#include <string.h>

// Device1 properties reported by readDeviceProperties()
#define DEVICE_PROP_RSSI              0x01
#define DEVICE_PROP_CONNECTED         0x02
#define DEVICE_PROP_SERVICES_RESOLVED 0x04
#define DEVICE_PROP_NAME              0x08
#define DEVICE_PROP_ADDRESS           0x10

// =============================================================================
// ASYNC CALL PLUMBING
// =============================================================================

namespace {

struct BluezCall {
    BluezReplyHandler handler;
};

int onMethodReply(sd_bus_message* reply, void* userdata, sd_bus_error* retError) {
    (void)retError;
    BluezCall* call = static_cast<BluezCall*>(userdata);
    const sd_bus_error* error = sd_bus_message_is_method_error(reply, nullptr) ?
        sd_bus_message_get_error(reply) : nullptr;

    BluezReplyHandler handler = std::move(call->handler);
    call->handler = nullptr;
    if (handler) {
        handler(reply, error);
    }
    return 1;
}

void destroyCall(void* userdata) {
    delete static_cast<BluezCall*>(userdata);
}

// -----------------------------------------------------------------------------
// Variant readers
// -----------------------------------------------------------------------------

int readVariantString(sd_bus_message* m, const char* type, std::string& out) {
    const char* value = nullptr;
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, type);
    if (r < 0) return r;
    r = sd_bus_message_read(m, type, &value);
    if (r < 0) return r;
    out = value ? value : "";
    return sd_bus_message_exit_container(m);
}

int readVariantBool(sd_bus_message* m, bool& out) {
    int value = 0;
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "b");
    if (r < 0) return r;
    r = sd_bus_message_read(m, "b", &value);
    if (r < 0) return r;
    out = value != 0;
    return sd_bus_message_exit_container(m);
}

int readVariantInt16(sd_bus_message* m, int16_t& out) {
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "n");
    if (r < 0) return r;
    r = sd_bus_message_read(m, "n", &out);
    if (r < 0) return r;
    return sd_bus_message_exit_container(m);
}

int readVariantStrings(sd_bus_message* m, std::vector<std::string>& out) {
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "as");
    if (r < 0) return r;
    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "s");
    if (r < 0) return r;
    const char* value = nullptr;
    while ((r = sd_bus_message_read(m, "s", &value)) > 0) {
        out.push_back(value ? value : "");
    }
    if (r < 0) return r;
    r = sd_bus_message_exit_container(m);
    if (r < 0) return r;
    return sd_bus_message_exit_container(m);
}

int readVariantBytes(sd_bus_message* m, const void** data, size_t* size) {
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "ay");
    if (r < 0) return r;
    r = sd_bus_message_read_array(m, 'y', data, size);
    if (r < 0) return r;
    return sd_bus_message_exit_container(m);
}

bool hasPrefix(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

// "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF" -> "AA:BB:CC:DD:EE:FF"
std::string addressFromPath(const std::string& path) {
    size_t pos = path.rfind("/dev_");
    if (pos == std::string::npos) {
        return std::string();
    }
    return canonicalAddress(path.substr(pos + 5, 17));
}

}  // namespace

// =============================================================================
// CHARACTERISTIC
// =============================================================================

uint8_t BluezCharacteristic::translateFlags(const std::vector<std::string>& flags) {
    uint8_t properties = 0;
    for (const std::string& flag : flags) {
        if (flag == "read") {
            properties |= CHAR_PROP_READ;
        } else if (flag == "write") {
            properties |= CHAR_PROP_WRITE;
        } else if (flag == "write-without-response") {
            properties |= CHAR_PROP_WRITE_NO_RESPONSE;
        } else if (flag == "notify") {
            properties |= CHAR_PROP_NOTIFY;
        } else if (flag == "indicate") {
            properties |= CHAR_PROP_INDICATE;
        }
    }
    return properties;
}

void BluezCharacteristic::read(ReadCallback callback) {
    sd_bus_message* message = _transport->newMethodCall(_path, BLUEZ_GATT_CHAR_IFACE, "ReadValue");
    if (message == nullptr || sd_bus_message_append(message, "a{sv}", 0) < 0) {
        sd_bus_message_unref(message);
        scheduler.schedule(0, [callback]() { callback(Result::ERROR_HARDWARE, std::vector<uint8_t>()); });
        return;
    }

    std::shared_ptr<BluezCharacteristic> self = shared_from_this();
    bool queued = _transport->callAsync(message, [self, callback](sd_bus_message* reply, const sd_bus_error* error) {
        if (error) {
            LOG_WARN("BLUEZ", "ReadValue %s failed: %s", self->_path.c_str(), BluezTransport::errorText(error));
            callback(BluezTransport::mapError(error), std::vector<uint8_t>());
            return;
        }
        const void* data = nullptr;
        size_t size = 0;
        if (sd_bus_message_read_array(reply, 'y', &data, &size) < 0) {
            callback(Result::ERROR_PROTOCOL, std::vector<uint8_t>());
            return;
        }
        const uint8_t* bytes = static_cast<const uint8_t*>(data);
        callback(Result::OK, std::vector<uint8_t>(bytes, bytes + size));
    });
    if (!queued) {
        scheduler.schedule(0, [callback]() { callback(Result::ERROR_HARDWARE, std::vector<uint8_t>()); });
    }
}

void BluezCharacteristic::write(const std::vector<uint8_t>& data, bool needsAck, ResultCallback callback) {
    sd_bus_message* message = _transport->newMethodCall(_path, BLUEZ_GATT_CHAR_IFACE, "WriteValue");
    if (message == nullptr ||
        sd_bus_message_append_array(message, 'y', data.data(), data.size()) < 0 ||
        sd_bus_message_append(message, "a{sv}", 1, "type", "s", needsAck ? "request" : "command") < 0) {
        sd_bus_message_unref(message);
        scheduler.schedule(0, [callback]() { callback(Result::ERROR_HARDWARE); });
        return;
    }

    std::shared_ptr<BluezCharacteristic> self = shared_from_this();
    bool queued = _transport->callAsync(message, [self, callback](sd_bus_message* reply, const sd_bus_error* error) {
        (void)reply;
        if (error) {
            LOG_WARN("BLUEZ", "WriteValue %s failed: %s", self->_path.c_str(), BluezTransport::errorText(error));
        }
        callback(BluezTransport::mapError(error));
    });
    if (!queued) {
        scheduler.schedule(0, [callback]() { callback(Result::ERROR_HARDWARE); });
    }
}

void BluezCharacteristic::subscribe(ResultCallback callback) {
    _transport->registerCharacteristic(shared_from_this());
    startNotify(0, callback);
}

void BluezCharacteristic::startNotify(uint8_t attempt, ResultCallback callback) {
    std::shared_ptr<BluezCharacteristic> self = shared_from_this();
    bool queued = _transport->callAsync(_path, BLUEZ_GATT_CHAR_IFACE, "StartNotify",
        [self, attempt, callback](sd_bus_message* reply, const sd_bus_error* error) {
            (void)reply;
            if (!error) {
                LOG_DEBUG("BLUEZ", "Notifications enabled on %s", self->_path.c_str());
                callback(Result::OK);
                return;
            }

            // CCCD write races right after ServicesResolved are common
            if (BluezTransport::isTransientError(error) && attempt + 1 < BLUEZ_GATT_RETRY_ATTEMPTS) {
                LOG_INFO("BLUEZ", "StartNotify transient failure (%s), retrying",
                         BluezTransport::errorText(error));
                scheduler.schedule(BLUEZ_GATT_RETRY_DELAY_MS, [self, attempt, callback]() {
                    self->startNotify((uint8_t)(attempt + 1), callback);
                });
                return;
            }

            LOG_WARN("BLUEZ", "StartNotify %s failed: %s", self->_path.c_str(), BluezTransport::errorText(error));
            callback(BluezTransport::mapError(error));
        });
    if (!queued) {
        scheduler.schedule(0, [callback]() { callback(Result::ERROR_HARDWARE); });
    }
}

void BluezCharacteristic::unsubscribe(ResultCallback callback) {
    std::shared_ptr<BluezCharacteristic> self = shared_from_this();
    bool queued = _transport->callAsync(_path, BLUEZ_GATT_CHAR_IFACE, "StopNotify",
        [self, callback](sd_bus_message* reply, const sd_bus_error* error) {
            (void)reply;
            Result result = BluezTransport::mapError(error);
            // Already stopped or link gone
            if (result == Result::ERROR_NOT_CONNECTED || result == Result::ERROR_NOT_FOUND) {
                result = Result::OK;
            }
            callback(result);
        });
    if (!queued) {
        scheduler.schedule(0, [callback]() { callback(Result::ERROR_HARDWARE); });
    }
}

// =============================================================================
// SERVICE
// =============================================================================

void BluezService::discoverCharacteristics(CharacteristicsCallback callback) {
    std::shared_ptr<BluezService> self = shared_from_this();
    scheduler.schedule(0, [self, callback]() {
        std::vector<CharacteristicPtr> characteristics;
        if (!self->_transport->cachedCharacteristics(self->_path, characteristics)) {
            LOG_WARN("BLUEZ", "%s: GATT objects gone", self->_devicePath.c_str());
            callback(Result::ERROR_NOT_CONNECTED, characteristics);
            return;
        }
        callback(Result::OK, characteristics);
    });
}

// =============================================================================
// PERIPHERAL
// =============================================================================

BluezPeripheral::BluezPeripheral(BluezTransport* transport, const std::string& path, const std::string& address,
                                 const std::string& name, int8_t rssi) :
    BlePeripheral(address, address, name, rssi),
    _transport(transport),
    _path(path),
    _connectReplied(false),
    _servicesResolved(false),
    _verifyTimer(TimerScheduler::INVALID_ID),
    _connectCallback(nullptr)
{
}

void BluezPeripheral::connect(uint32_t timeoutMs, ResultCallback callback) {
    if (_state != PeripheralState::DISCONNECTED) {
        Result result = isConnected() ? Result::OK : Result::ERROR_BUSY;
        scheduler.schedule(0, [callback, result]() { callback(result); });
        return;
    }

    setState(PeripheralState::CONNECTING);
    _connectCallback = callback;
    _connectReplied = false;
    _servicesResolved = false;

    LOG_INFO("BLUEZ", "Connecting to %s", _address.c_str());

    std::weak_ptr<BluezPeripheral> weak = shared_from_this();
    bool queued = _transport->callAsync(_path, BLUEZ_DEVICE_IFACE, "Connect",
        [weak](sd_bus_message* reply, const sd_bus_error* error) {
            (void)reply;
            std::shared_ptr<BluezPeripheral> self = weak.lock();
            if (!self || self->_state != PeripheralState::CONNECTING) {
                return;
            }

            if (error) {
                Result result = BluezTransport::mapError(error);
                LOG_WARN("BLUEZ", "Connect %s failed: %s", self->_address.c_str(), BluezTransport::errorText(error));
                if (result == Result::ERROR_TIMEOUT) {
                    // Abort the pending page so the controller is free again
                    if (!self->_transport->callAsync(self->_path, BLUEZ_DEVICE_IFACE, "Disconnect",
                            [](sd_bus_message* r, const sd_bus_error* e) { (void)r; (void)e; })) {
                        LOG_WARN("BLUEZ", "%s: connect abort not sent", self->_address.c_str());
                    }
                }
                self->completeConnect(result);
                return;
            }

            self->_connectReplied = true;
            if (self->_servicesResolved) {
                self->completeConnect(Result::OK);
                return;
            }

            // Link is up; wait for BlueZ to finish resolving the GATT database
            self->_verifyTimer = scheduler.schedule(BLUEZ_STATE_VERIFY_TIMEOUT_MS, [weak]() {
                std::shared_ptr<BluezPeripheral> peripheral = weak.lock();
                if (!peripheral) {
                    return;
                }
                peripheral->_verifyTimer = TimerScheduler::INVALID_ID;
                LOG_WARN("BLUEZ", "%s: ServicesResolved not reported, continuing", peripheral->_address.c_str());
                peripheral->completeConnect(Result::OK);
            });
        },
        (uint64_t)timeoutMs * 1000ULL);

    if (!queued) {
        scheduler.schedule(0, [weak]() {
            std::shared_ptr<BluezPeripheral> self = weak.lock();
            if (self) {
                self->completeConnect(Result::ERROR_HARDWARE);
            }
        });
    }
}

void BluezPeripheral::completeConnect(Result result) {
    if (_state != PeripheralState::CONNECTING) {
        return;
    }
    scheduler.cancel(_verifyTimer);
    _verifyTimer = TimerScheduler::INVALID_ID;
    setState(result == Result::OK ? PeripheralState::CONNECTED : PeripheralState::DISCONNECTED);

    if (result == Result::OK) {
        LOG_INFO("BLUEZ", "Connected to %s", _address.c_str());
    }

    ResultCallback callback = _connectCallback;
    _connectCallback = nullptr;
    if (callback) {
        callback(result);
    }
}

void BluezPeripheral::onServicesResolved() {
    _servicesResolved = true;
    if (_state == PeripheralState::CONNECTING && _connectReplied) {
        completeConnect(Result::OK);
    }
}

void BluezPeripheral::onConnectedChanged(bool connected) {
    if (connected) {
        return;
    }
    _servicesResolved = false;

    if (_state == PeripheralState::CONNECTING) {
        // A drop before the Connect reply is reported by the reply itself
        if (_connectReplied) {
            completeConnect(Result::ERROR_NOT_CONNECTED);
        }
        return;
    }
    if (_state == PeripheralState::CONNECTED || _state == PeripheralState::DISCONNECTING) {
        linkDown(_state == PeripheralState::DISCONNECTING ? BLUEZ_REASON_LOCAL_HOST : BLUEZ_REASON_UNKNOWN);
    }
}

void BluezPeripheral::linkDown(uint8_t reason) {
    _transport->dropGattObjects(_path);
    LOG_INFO("BLUEZ", "%s disconnected, reason=0x%02X", _address.c_str(), reason);
    notifyDisconnected(reason);
}

void BluezPeripheral::disconnect(ResultCallback callback) {
    std::weak_ptr<BluezPeripheral> weak = shared_from_this();

    if (_state == PeripheralState::DISCONNECTED) {
        scheduler.schedule(0, [callback]() { callback(Result::OK); });
        return;
    }

    if (_state == PeripheralState::CONNECTING) {
        // Disconnect aborts an outstanding Connect in BlueZ
        if (!_transport->callAsync(_path, BLUEZ_DEVICE_IFACE, "Disconnect",
                [](sd_bus_message* reply, const sd_bus_error* error) { (void)reply; (void)error; })) {
            LOG_WARN("BLUEZ", "%s: connect abort not sent", _address.c_str());
        }
        scheduler.schedule(0, [weak, callback]() {
            std::shared_ptr<BluezPeripheral> self = weak.lock();
            if (self) {
                self->completeConnect(Result::ERROR_DISABLED);
            }
            callback(Result::OK);
        });
        return;
    }

    setState(PeripheralState::DISCONNECTING);
    bool queued = _transport->callAsync(_path, BLUEZ_DEVICE_IFACE, "Disconnect",
        [weak, callback](sd_bus_message* reply, const sd_bus_error* error) {
            (void)reply;
            Result result = BluezTransport::mapError(error);
            if (result == Result::ERROR_NOT_CONNECTED) {
                result = Result::OK;
            }

            std::shared_ptr<BluezPeripheral> self = weak.lock();
            // Connected=false may arrive after the reply
            if (self && self->_state != PeripheralState::DISCONNECTED) {
                self->linkDown(BLUEZ_REASON_LOCAL_HOST);
            }
            callback(result);
        });

    if (!queued) {
        scheduler.schedule(0, [callback]() { callback(Result::ERROR_HARDWARE); });
    }
}

void BluezPeripheral::discoverServices(ServicesCallback callback) {
    if (!isConnected()) {
        scheduler.schedule(0, [callback]() { callback(Result::ERROR_NOT_CONNECTED, std::vector<ServicePtr>()); });
        return;
    }

    std::weak_ptr<BluezPeripheral> weak = shared_from_this();
    bool queued = _transport->callAsync("/", DBUS_OBJECT_MANAGER_IFACE, "GetManagedObjects",
        [weak, callback](sd_bus_message* reply, const sd_bus_error* error) {
            std::vector<ServicePtr> services;
            std::shared_ptr<BluezPeripheral> self = weak.lock();
            if (!self || !self->isConnected()) {
                callback(Result::ERROR_NOT_CONNECTED, services);
                return;
            }
            if (error) {
                LOG_WARN("BLUEZ", "GetManagedObjects failed: %s", BluezTransport::errorText(error));
                callback(BluezTransport::mapError(error), services);
                return;
            }

            BluezTransport::GattObjects objects;
            int r = self->_transport->parseGattObjects(reply, self->_path, objects);
            if (r < 0) {
                LOG_WARN("BLUEZ", "%s: malformed object tree (%d)", self->_address.c_str(), r);
                callback(Result::ERROR_DISCOVERY, services);
                return;
            }

            self->_transport->storeGattObjects(self->_path, objects);
            for (const std::shared_ptr<BluezService>& service : objects.services) {
                services.push_back(service);
            }
            LOG_DEBUG("BLUEZ", "%s: %u services", self->_address.c_str(), (unsigned)services.size());
            callback(Result::OK, services);
        });

    if (!queued) {
        scheduler.schedule(0, [callback]() { callback(Result::ERROR_HARDWARE, std::vector<ServicePtr>()); });
    }
}

// =============================================================================
// ADAPTER - LIFECYCLE
// =============================================================================

BluezTransport::BluezTransport(const char* adapterName) :
    _adapterPath(std::string("/org/bluez/") + adapterName),
    _bus(nullptr),
    _addedSlot(nullptr),
    _removedSlot(nullptr),
    _propsSlot(nullptr),
    _initialized(false),
    _scanning(false),
    _scanTimer(TimerScheduler::INVALID_ID)
{
}

BluezTransport::~BluezTransport() {
    scheduler.cancel(_scanTimer);
    if (_addedSlot) sd_bus_slot_unref(_addedSlot);
    if (_removedSlot) sd_bus_slot_unref(_removedSlot);
    if (_propsSlot) sd_bus_slot_unref(_propsSlot);
    if (_bus) {
        // Floating call slots (and their handlers) are released with the bus
        sd_bus_flush_close_unref(_bus);
    }
}

TransportTiming BluezTransport::timing() const {
    TransportTiming timing;
    timing.connectTimeoutMs = BLUEZ_CONNECT_TIMEOUT_MS;
    timing.gattRetryAttempts = BLUEZ_GATT_RETRY_ATTEMPTS;
    timing.gattRetryDelayMs = BLUEZ_GATT_RETRY_DELAY_MS;
    timing.interConnectionDelayMs = BLUEZ_INTER_CONNECTION_MS;
    return timing;
}

void BluezTransport::initialize(ResultCallback callback) {
    if (_initialized) {
        scheduler.schedule(0, [callback]() { callback(Result::OK); });
        return;
    }

    int r = sd_bus_open_system(&_bus);
    if (r < 0 || _bus == nullptr) {
        LOG_ERROR("BLUEZ", "Failed to connect to system bus: %s", strerror(-r));
        scheduler.schedule(0, [callback]() { callback(Result::ERROR_HARDWARE); });
        return;
    }

    if (!ensurePowered()) {
        scheduler.schedule(0, [callback]() { callback(Result::ERROR_HARDWARE); });
        return;
    }

    r = sd_bus_match_signal(_bus, &_addedSlot, BLUEZ_SERVICE, "/", DBUS_OBJECT_MANAGER_IFACE,
                            "InterfacesAdded", _onInterfacesAdded, this);
    if (r >= 0) {
        r = sd_bus_match_signal(_bus, &_removedSlot, BLUEZ_SERVICE, "/", DBUS_OBJECT_MANAGER_IFACE,
                                "InterfacesRemoved", _onInterfacesRemoved, this);
    }
    if (r >= 0) {
        // Device1 and GattCharacteristic1 objects live below the adapter
        r = sd_bus_add_match(_bus, &_propsSlot,
                             "type='signal',sender='org.bluez',"
                             "interface='org.freedesktop.DBus.Properties',member='PropertiesChanged',"
                             "path_namespace='/org/bluez'",
                             _onPropertiesChanged, this);
    }
    if (r < 0) {
        LOG_ERROR("BLUEZ", "Signal subscription failed: %s", strerror(-r));
        scheduler.schedule(0, [callback]() { callback(Result::ERROR_HARDWARE); });
        return;
    }

    _initialized = true;
    seedKnownDevices();
    LOG_INFO("BLUEZ", "Central ready on %s", _adapterPath.c_str());
    scheduler.schedule(0, [callback]() { callback(Result::OK); });
}

bool BluezTransport::ensurePowered() {
    sd_bus_error err = SD_BUS_ERROR_NULL;
    int powered = 0;
    int r = sd_bus_get_property_trivial(_bus, BLUEZ_SERVICE, _adapterPath.c_str(), BLUEZ_ADAPTER_IFACE,
                                        "Powered", &err, 'b', &powered);
    if (r < 0) {
        LOG_ERROR("BLUEZ", "Adapter %s unavailable: %s", _adapterPath.c_str(), errorText(&err));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    if (powered) {
        return true;
    }

    LOG_INFO("BLUEZ", "Powering on %s", _adapterPath.c_str());
    r = sd_bus_set_property(_bus, BLUEZ_SERVICE, _adapterPath.c_str(), BLUEZ_ADAPTER_IFACE,
                            "Powered", &err, "b", 1);
    if (r < 0) {
        LOG_ERROR("BLUEZ", "Power on failed: %s", errorText(&err));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    return true;
}

// =============================================================================
// ADAPTER - BUS ACCESS
// =============================================================================

sd_bus_message* BluezTransport::newMethodCall(const std::string& path, const char* interface, const char* member) {
    if (_bus == nullptr) {
        LOG_ERROR("BLUEZ", "%s.%s before initialize()", interface, member);
        return nullptr;
    }
    sd_bus_message* message = nullptr;
    int r = sd_bus_message_new_method_call(_bus, &message, BLUEZ_SERVICE, path.c_str(), interface, member);
    if (r < 0) {
        LOG_ERROR("BLUEZ", "Cannot build %s.%s: %s", interface, member, strerror(-r));
        return nullptr;
    }
    return message;
}

bool BluezTransport::callAsync(sd_bus_message* message, BluezReplyHandler handler, uint64_t timeoutUsec) {
    if (message == nullptr) {
        return false;
    }

    BluezCall* call = new BluezCall();
    call->handler = std::move(handler);

    sd_bus_slot* slot = nullptr;
    int r = sd_bus_call_async(_bus, &slot, message, onMethodReply, call, timeoutUsec);
    sd_bus_message_unref(message);
    if (r < 0) {
        LOG_ERROR("BLUEZ", "Call submission failed: %s", strerror(-r));
        delete call;
        return false;
    }

    // The bus owns the slot from here; the destroy callback frees the call
    sd_bus_slot_set_destroy_callback(slot, destroyCall);
    sd_bus_slot_set_floating(slot, 1);
    sd_bus_slot_unref(slot);
    return true;
}

bool BluezTransport::callAsync(const std::string& path, const char* interface, const char* member,
                               BluezReplyHandler handler, uint64_t timeoutUsec) {
    return callAsync(newMethodCall(path, interface, member), std::move(handler), timeoutUsec);
}

void BluezTransport::update() {
    if (_bus == nullptr) {
        return;
    }
    for (;;) {
        int r = sd_bus_process(_bus, nullptr);
        if (r < 0) {
            LOG_ERROR("BLUEZ", "sd_bus_process: %s", strerror(-r));
            break;
        }
        if (r == 0) {
            break;
        }
    }
}

void BluezTransport::waitForEvents(uint64_t timeoutUsec) {
    if (_bus == nullptr) {
        return;
    }
    int r = sd_bus_wait(_bus, timeoutUsec);
    if (r < 0 && r != -EINTR) {
        LOG_WARN("BLUEZ", "sd_bus_wait: %s", strerror(-r));
    }
}

// =============================================================================
// ADAPTER - ERRORS
// =============================================================================

const char* BluezTransport::errorText(const sd_bus_error* error) {
    if (error == nullptr) return "OK";
    if (error->message && *error->message) return error->message;
    if (error->name) return error->name;
    return "unknown";
}

Result BluezTransport::mapError(const sd_bus_error* error) {
    if (error == nullptr || !sd_bus_error_is_set(error)) {
        return Result::OK;
    }
    if (sd_bus_error_has_name(error, SD_BUS_ERROR_NO_REPLY) ||
        sd_bus_error_has_name(error, SD_BUS_ERROR_TIMEOUT) ||
        sd_bus_error_has_name(error, "org.bluez.Error.Timeout")) {
        return Result::ERROR_TIMEOUT;
    }
    if (sd_bus_error_has_name(error, "org.bluez.Error.NotConnected")) {
        return Result::ERROR_NOT_CONNECTED;
    }
    if (sd_bus_error_has_name(error, "org.bluez.Error.InProgress") ||
        sd_bus_error_has_name(error, "org.bluez.Error.AlreadyConnected")) {
        return Result::ERROR_BUSY;
    }
    if (sd_bus_error_has_name(error, "org.bluez.Error.DoesNotExist") ||
        sd_bus_error_has_name(error, SD_BUS_ERROR_UNKNOWN_OBJECT) ||
        sd_bus_error_has_name(error, SD_BUS_ERROR_UNKNOWN_METHOD)) {
        return Result::ERROR_NOT_FOUND;
    }
    if (sd_bus_error_has_name(error, "org.bluez.Error.InvalidArguments") ||
        sd_bus_error_has_name(error, "org.bluez.Error.InvalidValueLength")) {
        return Result::ERROR_INVALID_PARAM;
    }
    if (sd_bus_error_has_name(error, "org.bluez.Error.NotPermitted") ||
        sd_bus_error_has_name(error, "org.bluez.Error.NotSupported")) {
        return Result::ERROR_PROTOCOL;
    }
    return Result::ERROR_HARDWARE;
}

bool BluezTransport::isTransientError(const sd_bus_error* error) {
    if (error == nullptr) {
        return false;
    }
    const char* message = error->message ? error->message : "";
    return strstr(message, "ATT error: 0x0e") != nullptr ||
           sd_bus_error_has_name(error, SD_BUS_ERROR_NO_REPLY) ||
           sd_bus_error_has_name(error, "org.bluez.Error.InProgress");
}

std::string BluezTransport::devicePath(const std::string& adapterPath, const std::string& address) {
    std::string path = adapterPath + "/dev_";
    for (char c : canonicalAddress(address)) {
        path.push_back(c == ':' ? '_' : c);
    }
    return path;
}

// =============================================================================
// ADAPTER - SCANNING
// =============================================================================

bool BluezTransport::setDiscoveryFilter() {
    sd_bus_message* message = newMethodCall(_adapterPath, BLUEZ_ADAPTER_IFACE, "SetDiscoveryFilter");
    if (message == nullptr) {
        return false;
    }
    int r = sd_bus_message_append(message, "a{sv}", 3,
                                  "Transport", "s", "le",
                                  "DuplicateData", "b", 0,
                                  "RSSI", "n", (int16_t)_scanFilter.getMinRssi());
    if (r < 0) {
        sd_bus_message_unref(message);
        return false;
    }

    sd_bus_error err = SD_BUS_ERROR_NULL;
    sd_bus_message* reply = nullptr;
    r = sd_bus_call(_bus, message, 0, &err, &reply);
    sd_bus_message_unref(message);
    if (reply) {
        sd_bus_message_unref(reply);
    }
    if (r < 0) {
        LOG_WARN("BLUEZ", "SetDiscoveryFilter failed: %s", errorText(&err));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    return true;
}

Result BluezTransport::startScan(uint32_t timeoutMs) {
    if (!_initialized) {
        return Result::ERROR_NOT_INITIALIZED;
    }
    if (connectionInFlight()) {
        LOG_WARN("BLUEZ", "Scan refused, connection in progress");
        return Result::ERROR_BUSY;
    }

    scheduler.cancel(_scanTimer);
    _scanTimer = TimerScheduler::INVALID_ID;
    _seenThisScan.clear();

    // Filter failure only widens the results, the name filter still applies
    (void)setDiscoveryFilter();

    bool queued = callAsync(_adapterPath, BLUEZ_ADAPTER_IFACE, "StartDiscovery",
        [this](sd_bus_message* reply, const sd_bus_error* error) {
            (void)reply;
            if (error && !sd_bus_error_has_name(error, "org.bluez.Error.InProgress")) {
                LOG_ERROR("BLUEZ", "StartDiscovery failed: %s", errorText(error));
                finishScan();
                return;
            }
            LOG_DEBUG("BLUEZ", "StartDiscovery OK on %s", _adapterPath.c_str());
        });
    if (!queued) {
        return Result::ERROR_HARDWARE;
    }

    _scanning = true;
    if (timeoutMs > 0) {
        _scanTimer = scheduler.schedule(timeoutMs, [this]() {
            _scanTimer = TimerScheduler::INVALID_ID;
            stopDiscovery();
            finishScan();
        });
    }
    LOG_INFO("BLUEZ", "Scanning for %lu ms", (unsigned long)timeoutMs);
    return Result::OK;
}

void BluezTransport::stopScan() {
    scheduler.cancel(_scanTimer);
    _scanTimer = TimerScheduler::INVALID_ID;
    if (_scanning) {
        _scanning = false;
        stopDiscovery();
    }
}

void BluezTransport::stopDiscovery() {
    bool queued = callAsync(_adapterPath, BLUEZ_ADAPTER_IFACE, "StopDiscovery",
        [](sd_bus_message* reply, const sd_bus_error* error) {
            (void)reply;
            // Usually means discovery already stopped
            if (error) {
                LOG_DEBUG("BLUEZ", "StopDiscovery: %s", errorText(error));
            }
        });
    if (!queued) {
        LOG_WARN("BLUEZ", "StopDiscovery not sent");
    }
}

void BluezTransport::finishScan() {
    scheduler.cancel(_scanTimer);
    _scanTimer = TimerScheduler::INVALID_ID;
    if (!_scanning) {
        return;
    }
    _scanning = false;
    LOG_INFO("BLUEZ", "Scan complete, %u devices known", (unsigned)_peripherals.size());
    notifyScanComplete();
}

void BluezTransport::seedKnownDevices() {
    bool queued = callAsync("/", DBUS_OBJECT_MANAGER_IFACE, "GetManagedObjects",
        [this](sd_bus_message* reply, const sd_bus_error* error) {
            if (error) {
                LOG_WARN("BLUEZ", "GetManagedObjects failed: %s", errorText(error));
                return;
            }
            int r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{oa{sa{sv}}}");
            while (r >= 0 && (r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "oa{sa{sv}}")) > 0) {
                const char* path = nullptr;
                if ((r = sd_bus_message_read(reply, "o", &path)) < 0) break;
                if ((r = readInterfaceSet(reply, path, false)) < 0) break;
                if ((r = sd_bus_message_exit_container(reply)) < 0) break;
            }
            if (r < 0) {
                LOG_WARN("BLUEZ", "Malformed object tree (%d)", r);
            }
            LOG_DEBUG("BLUEZ", "%u devices cached by BlueZ", (unsigned)_knownDevices.size());
        });
    if (!queued) {
        LOG_WARN("BLUEZ", "Device cache query not sent");
    }
}

// =============================================================================
// ADAPTER - DEVICE REGISTRY
// =============================================================================

std::vector<PeripheralPtr> BluezTransport::discoveredDevices() const {
    std::vector<PeripheralPtr> devices;
    for (const auto& entry : _peripherals) {
        devices.push_back(entry.second);
    }
    return devices;
}

PeripheralPtr BluezTransport::getPeripheral(const std::string& id) const {
    auto it = _peripherals.find(canonicalAddress(id));
    return it != _peripherals.end() ? it->second : nullptr;
}

void BluezTransport::forgetPeripheral(const std::string& id) {
    _peripherals.erase(canonicalAddress(id));
}

std::shared_ptr<BluezPeripheral> BluezTransport::findByPath(const std::string& path) const {
    std::string id = addressFromPath(path);
    auto it = _peripherals.find(id);
    if (it != _peripherals.end() && it->second->path() == path) {
        return it->second;
    }
    return nullptr;
}

void BluezTransport::clearDeviceCache(const std::string& address, ResultCallback callback) {
    std::string id = canonicalAddress(address);
    std::string path = devicePath(_adapterPath, id);

    std::shared_ptr<BluezPeripheral> peripheral;
    auto it = _peripherals.find(id);
    if (it != _peripherals.end()) {
        peripheral = it->second;
        _peripherals.erase(it);
    }
    _knownDevices.erase(path);

    std::function<void()> removeDevice = [this, path, id, callback]() {
        sd_bus_message* message = newMethodCall(_adapterPath, BLUEZ_ADAPTER_IFACE, "RemoveDevice");
        if (message == nullptr || sd_bus_message_append(message, "o", path.c_str()) < 0) {
            sd_bus_message_unref(message);
            scheduler.schedule(0, [callback]() { callback(Result::ERROR_HARDWARE); });
            return;
        }
        bool queued = callAsync(message, [id, callback](sd_bus_message* reply, const sd_bus_error* error) {
            (void)reply;
            Result result = mapError(error);
            // Not in the registry is the goal state
            if (result == Result::ERROR_NOT_FOUND) {
                result = Result::OK;
            }
            if (result == Result::OK) {
                LOG_INFO("BLUEZ", "Removed %s from BlueZ cache", id.c_str());
            } else {
                LOG_WARN("BLUEZ", "RemoveDevice %s failed: %s", id.c_str(), errorText(error));
            }
            callback(result);
        });
        if (!queued) {
            scheduler.schedule(0, [callback]() { callback(Result::ERROR_HARDWARE); });
        }
    };

    if (peripheral && peripheral->state() != PeripheralState::DISCONNECTED) {
        peripheral->disconnect([peripheral, removeDevice](Result result) {
            (void)result;
            removeDevice();
        });
        return;
    }
    dropGattObjects(path);
    removeDevice();
}

// =============================================================================
// ADAPTER - GATT CACHE
// =============================================================================

int BluezTransport::parseGattObjects(sd_bus_message* reply, const std::string& devicePath, GattObjects& out) {
    struct CharInfo {
        std::string path;
        std::string uuid;
        std::string service;
        std::vector<std::string> flags;
    };
    std::vector<CharInfo> chars;
    const std::string prefix = devicePath + "/";

    // a{oa{sa{sv}}}: object path -> interface -> property -> value
    int r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{oa{sa{sv}}}");
    if (r < 0) return r;

    while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "oa{sa{sv}}")) > 0) {
        const char* objectPath = nullptr;
        if ((r = sd_bus_message_read(reply, "o", &objectPath)) < 0) return r;
        std::string path(objectPath ? objectPath : "");

        if (!hasPrefix(path, prefix)) {
            if ((r = sd_bus_message_skip(reply, "a{sa{sv}}")) < 0) return r;
            if ((r = sd_bus_message_exit_container(reply)) < 0) return r;
            continue;
        }

        if ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{sa{sv}}")) < 0) return r;
        while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0) {
            const char* iface = nullptr;
            if ((r = sd_bus_message_read(reply, "s", &iface)) < 0) return r;

            bool isService = iface && strcmp(iface, BLUEZ_GATT_SERVICE_IFACE) == 0;
            bool isChar = iface && strcmp(iface, BLUEZ_GATT_CHAR_IFACE) == 0;
            if (!isService && !isChar) {
                if ((r = sd_bus_message_skip(reply, "a{sv}")) < 0) return r;
                if ((r = sd_bus_message_exit_container(reply)) < 0) return r;
                continue;
            }

            CharInfo info;
            info.path = path;
            if ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_ARRAY, "{sv}")) < 0) return r;
            while ((r = sd_bus_message_enter_container(reply, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0) {
                const char* key = nullptr;
                if ((r = sd_bus_message_read(reply, "s", &key)) < 0) return r;

                if (key && strcmp(key, "UUID") == 0) {
                    r = readVariantString(reply, "s", info.uuid);
                } else if (isChar && key && strcmp(key, "Service") == 0) {
                    r = readVariantString(reply, "o", info.service);
                } else if (isChar && key && strcmp(key, "Flags") == 0) {
                    r = readVariantStrings(reply, info.flags);
                } else {
                    r = sd_bus_message_skip(reply, "v");
                }
                if (r < 0) return r;
                if ((r = sd_bus_message_exit_container(reply)) < 0) return r;
            }
            if (r < 0) return r;
            if ((r = sd_bus_message_exit_container(reply)) < 0) return r;   // a{sv}

            if (isService) {
                out.services.push_back(std::make_shared<BluezService>(this, devicePath, path, info.uuid));
                out.characteristics[path];
            } else {
                chars.push_back(info);
            }

            if ((r = sd_bus_message_exit_container(reply)) < 0) return r;   // {sa{sv}}
        }
        if (r < 0) return r;
        if ((r = sd_bus_message_exit_container(reply)) < 0) return r;       // a{sa{sv}}
        if ((r = sd_bus_message_exit_container(reply)) < 0) return r;       // {oa{sa{sv}}}
    }
    if (r < 0) return r;

    for (const CharInfo& info : chars) {
        std::shared_ptr<BluezCharacteristic> characteristic = std::make_shared<BluezCharacteristic>(
            this, info.path, info.uuid, BluezCharacteristic::translateFlags(info.flags));
        out.characteristics[info.service].push_back(characteristic);
        registerCharacteristic(characteristic);
    }
    return 0;
}

bool BluezTransport::cachedCharacteristics(const std::string& servicePath,
                                           std::vector<CharacteristicPtr>& out) const {
    auto it = _gattCache.find(servicePath);
    if (it == _gattCache.end()) {
        return false;
    }
    out = it->second;
    return true;
}

void BluezTransport::storeGattObjects(const std::string& devicePath, const GattObjects& objects) {
    dropGattObjects(devicePath);
    for (const auto& entry : objects.characteristics) {
        _gattCache[entry.first] = entry.second;
    }
}

void BluezTransport::dropGattObjects(const std::string& devicePath) {
    const std::string prefix = devicePath + "/";
    for (auto it = _gattCache.begin(); it != _gattCache.end();) {
        if (hasPrefix(it->first, prefix)) {
            it = _gattCache.erase(it);
        } else {
            ++it;
        }
    }
    for (auto it = _characteristics.begin(); it != _characteristics.end();) {
        if (hasPrefix(it->first, prefix) || it->second.expired()) {
            it = _characteristics.erase(it);
        } else {
            ++it;
        }
    }
}

void BluezTransport::registerCharacteristic(const std::shared_ptr<BluezCharacteristic>& characteristic) {
    _characteristics[characteristic->path()] = characteristic;
}

// =============================================================================
// ADAPTER - SIGNALS
// =============================================================================

int BluezTransport::readDeviceProperties(sd_bus_message* message, DeviceInfo& info, uint8_t& changed) {
    int r = sd_bus_message_enter_container(message, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0) return r;

    while ((r = sd_bus_message_enter_container(message, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0) {
        const char* key = nullptr;
        if ((r = sd_bus_message_read(message, "s", &key)) < 0) return r;
        std::string name(key ? key : "");

        if (name == "Address") {
            r = readVariantString(message, "s", info.address);
            changed |= DEVICE_PROP_ADDRESS;
        } else if (name == "Name" || (name == "Alias" && info.name.empty())) {
            r = readVariantString(message, "s", info.name);
            changed |= DEVICE_PROP_NAME;
        } else if (name == "RSSI") {
            r = readVariantInt16(message, info.rssi);
            info.hasRssi = true;
            changed |= DEVICE_PROP_RSSI;
        } else if (name == "Connected") {
            r = readVariantBool(message, info.connected);
            changed |= DEVICE_PROP_CONNECTED;
        } else if (name == "ServicesResolved") {
            r = readVariantBool(message, info.servicesResolved);
            changed |= DEVICE_PROP_SERVICES_RESOLVED;
        } else {
            r = sd_bus_message_skip(message, "v");
        }
        if (r < 0) return r;
        if ((r = sd_bus_message_exit_container(message)) < 0) return r;
    }
    if (r < 0) return r;
    return sd_bus_message_exit_container(message);
}

int BluezTransport::readInterfaceSet(sd_bus_message* message, const std::string& path, bool report) {
    int r = sd_bus_message_enter_container(message, SD_BUS_TYPE_ARRAY, "{sa{sv}}");
    if (r < 0) return r;

    while ((r = sd_bus_message_enter_container(message, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0) {
        const char* iface = nullptr;
        if ((r = sd_bus_message_read(message, "s", &iface)) < 0) return r;

        if (iface && strcmp(iface, BLUEZ_DEVICE_IFACE) == 0 && hasPrefix(path, _adapterPath + "/dev_")) {
            DeviceInfo& info = _knownDevices[path];
            uint8_t changed = 0;
            if ((r = readDeviceProperties(message, info, changed)) < 0) return r;
            if (report && _scanning && info.hasRssi) {
                handleDeviceSeen(path, info);
            }
        } else {
            if ((r = sd_bus_message_skip(message, "a{sv}")) < 0) return r;
        }
        if ((r = sd_bus_message_exit_container(message)) < 0) return r;
    }
    if (r < 0) return r;
    return sd_bus_message_exit_container(message);
}

void BluezTransport::handleDeviceSeen(const std::string& path, const DeviceInfo& info) {
    int8_t rssi = (int8_t)(info.rssi < -128 ? -128 : (info.rssi > 127 ? 127 : info.rssi));
    if (!_scanFilter.accepts(info.name, rssi)) {
        return;
    }

    std::string id = info.address.empty() ? addressFromPath(path) : canonicalAddress(info.address);
    std::shared_ptr<BluezPeripheral> peripheral;
    auto it = _peripherals.find(id);
    if (it != _peripherals.end()) {
        peripheral = it->second;
        peripheral->updateRssi(rssi);
        peripheral->rememberName(info.name);
    } else {
        peripheral = std::make_shared<BluezPeripheral>(this, path, id, info.name, rssi);
        _peripherals[id] = peripheral;
    }

    if (_seenThisScan.insert(id).second) {
        LOG_INFO("BLUEZ", "Found %s (%s) RSSI %d", info.name.c_str(), id.c_str(), rssi);
        notifyDiscovered(peripheral);
    }
}

int BluezTransport::_onInterfacesAdded(sd_bus_message* message, void* userdata, sd_bus_error* retError) {
    (void)retError;
    BluezTransport* self = static_cast<BluezTransport*>(userdata);
    const char* path = nullptr;
    int r = sd_bus_message_read(message, "o", &path);
    if (r < 0 || path == nullptr) {
        return 0;
    }
    r = self->readInterfaceSet(message, path, true);
    if (r < 0) {
        LOG_DEBUG("BLUEZ", "InterfacesAdded parse error on %s (%d)", path, r);
    }
    return 0;
}

int BluezTransport::_onInterfacesRemoved(sd_bus_message* message, void* userdata, sd_bus_error* retError) {
    (void)retError;
    BluezTransport* self = static_cast<BluezTransport*>(userdata);
    const char* path = nullptr;
    if (sd_bus_message_read(message, "o", &path) < 0 || path == nullptr) {
        return 0;
    }

    bool deviceRemoved = false;
    if (sd_bus_message_enter_container(message, SD_BUS_TYPE_ARRAY, "s") >= 0) {
        const char* iface = nullptr;
        while (sd_bus_message_read(message, "s", &iface) > 0) {
            if (iface && strcmp(iface, BLUEZ_DEVICE_IFACE) == 0) {
                deviceRemoved = true;
            }
        }
        sd_bus_message_exit_container(message);
    }
    if (!deviceRemoved) {
        return 0;
    }

    self->_knownDevices.erase(path);
    std::shared_ptr<BluezPeripheral> peripheral = self->findByPath(path);
    if (peripheral) {
        peripheral->onConnectedChanged(false);
    }
    return 0;
}

int BluezTransport::_onPropertiesChanged(sd_bus_message* message, void* userdata, sd_bus_error* retError) {
    (void)retError;
    BluezTransport* self = static_cast<BluezTransport*>(userdata);
    const char* objectPath = sd_bus_message_get_path(message);
    const char* iface = nullptr;
    if (objectPath == nullptr || sd_bus_message_read(message, "s", &iface) < 0 || iface == nullptr) {
        return 0;
    }
    std::string path(objectPath);

    if (strcmp(iface, BLUEZ_GATT_CHAR_IFACE) == 0) {
        auto it = self->_characteristics.find(path);
        if (it == self->_characteristics.end()) {
            return 0;
        }
        std::shared_ptr<BluezCharacteristic> characteristic = it->second.lock();
        if (!characteristic) {
            self->_characteristics.erase(it);
            return 0;
        }

        if (sd_bus_message_enter_container(message, SD_BUS_TYPE_ARRAY, "{sv}") < 0) {
            return 0;
        }
        while (sd_bus_message_enter_container(message, SD_BUS_TYPE_DICT_ENTRY, "sv") > 0) {
            const char* key = nullptr;
            if (sd_bus_message_read(message, "s", &key) < 0) {
                return 0;
            }
            if (key && strcmp(key, "Value") == 0) {
                const void* data = nullptr;
                size_t size = 0;
                if (readVariantBytes(message, &data, &size) >= 0) {
                    characteristic->deliver(static_cast<const uint8_t*>(data), size);
                }
                return 0;
            }
            if (sd_bus_message_skip(message, "v") < 0 || sd_bus_message_exit_container(message) < 0) {
                return 0;
            }
        }
        return 0;
    }

    if (strcmp(iface, BLUEZ_DEVICE_IFACE) != 0 || !hasPrefix(path, self->_adapterPath + "/dev_")) {
        return 0;
    }

    DeviceInfo& info = self->_knownDevices[path];
    uint8_t changed = 0;
    int r = readDeviceProperties(message, info, changed);
    if (r < 0) {
        LOG_DEBUG("BLUEZ", "PropertiesChanged parse error on %s (%d)", path.c_str(), r);
        return 0;
    }

    if ((changed & DEVICE_PROP_RSSI) && self->_scanning) {
        self->handleDeviceSeen(path, info);
    }

    std::shared_ptr<BluezPeripheral> peripheral = self->findByPath(path);
    if (!peripheral) {
        return 0;
    }
    if (changed & DEVICE_PROP_NAME) {
        peripheral->rememberName(info.name);
    }
    if ((changed & DEVICE_PROP_SERVICES_RESOLVED) && info.servicesResolved) {
        peripheral->onServicesResolved();
    }
    if (changed & DEVICE_PROP_CONNECTED) {
        peripheral->onConnectedChanged(info.connected);
    }
    return 0;
}
