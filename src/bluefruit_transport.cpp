/**
 * @file bluefruit_transport.cpp
 * @brief Bluefruit central backend - Implementation
 * @version 2.0.0
 * @platform Adafruit Feather nRF52840 Express
 */

#if defined(ARDUINO) || defined(NATIVE_TEST_BUILD)

#include "bluefruit_transport.h"
#include "log.h"
#include <utility/bonding.h>

// =============================================================================
// GLOBAL INSTANCE (needed for static callbacks)
// =============================================================================

BluefruitTransport* g_bluefruitTransport = nullptr;

// =============================================================================
// UUID HELPERS
// =============================================================================

static uint8_t hexNibble(char c) {
    if (c >= '0' && c <= '9') return (uint8_t)(c - '0');
    return (uint8_t)(c - 'a' + 10);
}

/**
 * @brief Build a 128-bit BLEUuid from its string form
 *
 * Bluefruit stores 128-bit UUIDs little-endian, so the canonical
 * big-endian hex string is reversed byte by byte.
 */
static BLEUuid uuidFromString(const char* text) {
    std::string hex = canonicalUuid(text);
    uint8_t bytes[16] = { 0 };
    if (hex.size() == 32) {
        for (int i = 0; i < 16; i++) {
            bytes[15 - i] = (uint8_t)((hexNibble(hex[2 * i]) << 4) | hexNibble(hex[2 * i + 1]));
        }
    }
    return BLEUuid(bytes);
}

// =============================================================================
// LINK SLOT
// =============================================================================

LinkSlot::LinkSlot() :
    connHandle(BLE_CONN_HANDLE_INVALID),
    sensorService(uuidFromString(SENSOR_SERVICE_UUID)),
    batteryService(BLEUuid(UUID16_SVC_BATTERY)),
    commandChar(uuidFromString(SENSOR_COMMAND_CHAR_UUID)),
    dataChar(uuidFromString(SENSOR_DATA_CHAR_UUID))
{
}

// =============================================================================
// CHARACTERISTIC
// =============================================================================

BluefruitCharacteristic::BluefruitCharacteristic(BluefruitTransport* transport, uint8_t slot,
                                                 uint16_t connHandle, SensorCharRole role) :
    _transport(transport),
    _slot(slot),
    _connHandle(connHandle),
    _role(role)
{
}

std::string BluefruitCharacteristic::uuid() const {
    return _role == SensorCharRole::COMMAND ? SENSOR_COMMAND_CHAR_UUID : SENSOR_DATA_CHAR_UUID;
}

uint8_t BluefruitCharacteristic::properties() const {
    return _role == SensorCharRole::COMMAND ? (CHAR_PROP_READ | CHAR_PROP_WRITE) : CHAR_PROP_NOTIFY;
}

BLEClientCharacteristic* BluefruitCharacteristic::nativeCharacteristic() const {
    if (!_transport->slotOwnedBy(_slot, _connHandle)) {
        return nullptr;
    }
    LinkSlot& slot = _transport->linkSlot(_slot);
    return _role == SensorCharRole::COMMAND ? &slot.commandChar : &slot.dataChar;
}

void BluefruitCharacteristic::read(ReadCallback callback) {
    std::shared_ptr<BluefruitCharacteristic> self = shared_from_this();
    scheduler.schedule(0, [self, callback]() {
        BLEClientCharacteristic* chr = self->nativeCharacteristic();
        if (chr == nullptr) {
            callback(Result::ERROR_NOT_CONNECTED, std::vector<uint8_t>());
            return;
        }

        uint8_t buffer[BLUEFRUIT_MAX_NOTIFY_LEN];
        uint16_t length = chr->read(buffer, sizeof(buffer));
        if (length == 0) {
            LOG_WARN("BLUEFRUIT", "Read failed on slot %d", self->_slot);
            callback(Result::ERROR_HARDWARE, std::vector<uint8_t>());
            return;
        }
        callback(Result::OK, std::vector<uint8_t>(buffer, buffer + length));
    });
}

void BluefruitCharacteristic::write(const std::vector<uint8_t>& data, bool needsAck, ResultCallback callback) {
    std::shared_ptr<BluefruitCharacteristic> self = shared_from_this();
    scheduler.schedule(0, [self, data, needsAck, callback]() {
        BLEClientCharacteristic* chr = self->nativeCharacteristic();
        if (chr == nullptr) {
            callback(Result::ERROR_NOT_CONNECTED);
            return;
        }

        uint16_t written = needsAck ? chr->write_resp(data.data(), (uint16_t)data.size())
                                    : chr->write(data.data(), (uint16_t)data.size());
        if (written != data.size()) {
            LOG_WARN("BLUEFRUIT", "Write failed on slot %d (%u of %u bytes)",
                     self->_slot, written, (unsigned)data.size());
            callback(Result::ERROR_HARDWARE);
            return;
        }
        callback(Result::OK);
    });
}

void BluefruitCharacteristic::subscribe(ResultCallback callback) {
    std::shared_ptr<BluefruitCharacteristic> self = shared_from_this();
    scheduler.schedule(0, [self, callback]() {
        BLEClientCharacteristic* chr = self->nativeCharacteristic();
        if (chr == nullptr) {
            callback(Result::ERROR_NOT_CONNECTED);
            return;
        }
        if (!chr->enableNotify()) {
            LOG_WARN("BLUEFRUIT", "enableNotify failed on slot %d", self->_slot);
            callback(Result::ERROR_HARDWARE);
            return;
        }
        callback(Result::OK);
    });
}

void BluefruitCharacteristic::unsubscribe(ResultCallback callback) {
    std::shared_ptr<BluefruitCharacteristic> self = shared_from_this();
    scheduler.schedule(0, [self, callback]() {
        BLEClientCharacteristic* chr = self->nativeCharacteristic();
        if (chr == nullptr) {
            // Link already gone, nothing left to disable
            callback(Result::OK);
            return;
        }
        if (!chr->disableNotify()) {
            callback(Result::ERROR_HARDWARE);
            return;
        }
        callback(Result::OK);
    });
}

// =============================================================================
// SERVICE
// =============================================================================

void BluefruitService::discoverCharacteristics(CharacteristicsCallback callback) {
    std::shared_ptr<BluefruitService> self = shared_from_this();
    scheduler.schedule(0, [self, callback]() {
        BluefruitTransport* transport = self->_transport;
        std::vector<CharacteristicPtr> found;
        if (!transport->slotOwnedBy(self->_slot, self->_connHandle)) {
            callback(Result::ERROR_NOT_CONNECTED, found);
            return;
        }

        // Only the sensor service exposes characteristics the bridge uses
        if (!uuidEquals(self->_uuid, SENSOR_SERVICE_UUID)) {
            callback(Result::OK, found);
            return;
        }

        LinkSlot& slot = transport->linkSlot(self->_slot);
        if (slot.commandChar.discover()) {
            found.push_back(std::make_shared<BluefruitCharacteristic>(
                transport, self->_slot, self->_connHandle, SensorCharRole::COMMAND));
        }
        if (slot.dataChar.discover()) {
            std::shared_ptr<BluefruitCharacteristic> data = std::make_shared<BluefruitCharacteristic>(
                transport, self->_slot, self->_connHandle, SensorCharRole::DATA);
            transport->registerCharacteristic(data);
            found.push_back(data);
        }

        LOG_DEBUG("BLUEFRUIT", "Slot %d: %u characteristics", self->_slot, (unsigned)found.size());
        callback(Result::OK, found);
    });
}

// =============================================================================
// PERIPHERAL
// =============================================================================

BluefruitPeripheral::BluefruitPeripheral(BluefruitTransport* transport, const ble_gap_addr_t& addr,
                                         const std::string& id, const std::string& name, int8_t rssi) :
    BlePeripheral(id, id, name, rssi),
    _transport(transport),
    _addr(addr),
    _connHandle(BLE_CONN_HANDLE_INVALID),
    _slot(-1),
    _connectTimer(TimerScheduler::INVALID_ID),
    _connectCallback(nullptr),
    _disconnectCallback(nullptr)
{
}

void BluefruitPeripheral::connect(uint32_t timeoutMs, ResultCallback callback) {
    if (_state != PeripheralState::DISCONNECTED) {
        Result result = isConnected() ? Result::OK : Result::ERROR_BUSY;
        scheduler.schedule(0, [callback, result]() { callback(result); });
        return;
    }

    setState(PeripheralState::CONNECTING);
    _connectCallback = callback;

    std::weak_ptr<BluefruitPeripheral> weak = shared_from_this();
    LOG_INFO("BLUEFRUIT", "Connecting to %s", _address.c_str());
    if (!Bluefruit.Central.connect(&_addr)) {
        scheduler.schedule(0, [weak]() {
            if (std::shared_ptr<BluefruitPeripheral> self = weak.lock()) {
                self->failConnect(Result::ERROR_HARDWARE);
            }
        });
        return;
    }

    _connectTimer = scheduler.schedule(timeoutMs, [weak]() {
        std::shared_ptr<BluefruitPeripheral> self = weak.lock();
        if (!self) {
            return;
        }
        self->_connectTimer = TimerScheduler::INVALID_ID;
        LOG_WARN("BLUEFRUIT", "Connect to %s timed out", self->_address.c_str());
        sd_ble_gap_connect_cancel();
        self->failConnect(Result::ERROR_TIMEOUT);
    });
    if (_connectTimer == TimerScheduler::INVALID_ID) {
        sd_ble_gap_connect_cancel();
        failConnect(Result::ERROR_BUSY);
    }
}

void BluefruitPeripheral::failConnect(Result result) {
    if (_state != PeripheralState::CONNECTING) {
        return;
    }
    scheduler.cancel(_connectTimer);
    _connectTimer = TimerScheduler::INVALID_ID;
    setState(PeripheralState::DISCONNECTED);

    ResultCallback callback = _connectCallback;
    _connectCallback = nullptr;
    if (callback) {
        callback(result);
    }
}

void BluefruitPeripheral::onLinkUp(uint16_t connHandle, int8_t slot) {
    scheduler.cancel(_connectTimer);
    _connectTimer = TimerScheduler::INVALID_ID;
    _connHandle = connHandle;
    _slot = slot;
    setState(PeripheralState::CONNECTED);

    LOG_INFO("BLUEFRUIT", "Connected to %s (handle %d, slot %d)", _address.c_str(), connHandle, slot);

    ResultCallback callback = _connectCallback;
    _connectCallback = nullptr;
    if (callback) {
        callback(Result::OK);
    }
}

void BluefruitPeripheral::onLinkDown(uint8_t reason) {
    _connHandle = BLE_CONN_HANDLE_INVALID;
    _slot = -1;

    if (_state == PeripheralState::CONNECTING) {
        failConnect(Result::ERROR_HARDWARE);
        return;
    }

    LOG_INFO("BLUEFRUIT", "%s disconnected, reason=0x%02X", _address.c_str(), reason);
    notifyDisconnected(reason);

    ResultCallback callback = _disconnectCallback;
    _disconnectCallback = nullptr;
    if (callback) {
        callback(Result::OK);
    }
}

void BluefruitPeripheral::disconnect(ResultCallback callback) {
    if (_state == PeripheralState::CONNECTING) {
        sd_ble_gap_connect_cancel();
        std::shared_ptr<BluefruitPeripheral> self = shared_from_this();
        scheduler.schedule(0, [self, callback]() {
            self->failConnect(Result::ERROR_DISABLED);
            callback(Result::OK);
        });
        return;
    }
    if (_state == PeripheralState::DISCONNECTED || _connHandle == BLE_CONN_HANDLE_INVALID) {
        scheduler.schedule(0, [callback]() { callback(Result::OK); });
        return;
    }

    setState(PeripheralState::DISCONNECTING);
    _disconnectCallback = callback;
    Bluefruit.disconnect(_connHandle);
}

void BluefruitPeripheral::discoverServices(ServicesCallback callback) {
    std::shared_ptr<BluefruitPeripheral> self = shared_from_this();
    scheduler.schedule(0, [self, callback]() {
        BluefruitTransport* transport = self->_transport;
        int8_t slotIndex = self->_slot;
        uint16_t connHandle = self->_connHandle;

        std::vector<ServicePtr> services;
        if (!self->isConnected() || slotIndex < 0 || !transport->slotOwnedBy((uint8_t)slotIndex, connHandle)) {
            callback(Result::ERROR_NOT_CONNECTED, services);
            return;
        }

        LinkSlot& slot = transport->linkSlot((uint8_t)slotIndex);
        if (slot.batteryService.discover(connHandle)) {
            services.push_back(std::make_shared<BluefruitService>(
                transport, (uint8_t)slotIndex, connHandle, BATTERY_SERVICE_UUID));
        }
        if (slot.sensorService.discover(connHandle)) {
            services.push_back(std::make_shared<BluefruitService>(
                transport, (uint8_t)slotIndex, connHandle, SENSOR_SERVICE_UUID));
        }
        callback(Result::OK, services);
    });
}

// =============================================================================
// ADAPTER
// =============================================================================

BluefruitTransport::BluefruitTransport() :
    _initialized(false),
    _scanning(false),
    _scanStopped(false),
    _reportedOverflows(0)
{
    // Set global instance for static callbacks
    g_bluefruitTransport = this;
}

TransportTiming BluefruitTransport::timing() const {
    TransportTiming timing;
    timing.connectTimeoutMs = BLUEFRUIT_CONNECT_TIMEOUT_MS;
    timing.gattRetryAttempts = BLUEFRUIT_GATT_RETRY_ATTEMPTS;
    timing.gattRetryDelayMs = BLUEFRUIT_GATT_RETRY_DELAY_MS;
    timing.interConnectionDelayMs = BLUEFRUIT_INTER_CONNECTION_MS;
    return timing;
}

void BluefruitTransport::initialize(ResultCallback callback) {
    if (_initialized) {
        scheduler.schedule(0, [callback]() { callback(Result::OK); });
        return;
    }

    // Connection parameters must be configured BEFORE Bluefruit.begin()
    Bluefruit.configCentralConn(BLUEFRUIT_MTU, BLUEFRUIT_EVENT_LEN, BLUEFRUIT_HVN_QSIZE, BLUEFRUIT_WRCMD_QSIZE);

    if (!Bluefruit.begin(0, MAX_CENTRAL_LINKS)) {
        LOG_ERROR("BLUEFRUIT", "Bluefruit.begin() failed");
        scheduler.schedule(0, [callback]() { callback(Result::ERROR_HARDWARE); });
        return;
    }
    Bluefruit.setName(FIRMWARE_NAME);
    Bluefruit.setTxPower(0);
    Bluefruit.autoConnLed(false);

    Bluefruit.Central.setConnectCallback(_onConnect);
    Bluefruit.Central.setDisconnectCallback(_onDisconnect);

    // Client objects are bound to a connection at discovery time
    for (uint8_t i = 0; i < MAX_CENTRAL_LINKS; i++) {
        LinkSlot& slot = _slots[i];
        slot.batteryService.begin();
        slot.sensorService.begin();
        slot.commandChar.begin(&slot.sensorService);
        slot.dataChar.begin(&slot.sensorService);
        slot.dataChar.setNotifyCallback(_onNotify);
    }

    _initialized = true;
    LOG_INFO("BLUEFRUIT", "Central ready (%d links)", MAX_CENTRAL_LINKS);
    scheduler.schedule(0, [callback]() { callback(Result::OK); });
}

// =============================================================================
// SCANNING
// =============================================================================

Result BluefruitTransport::startScan(uint32_t timeoutMs) {
    if (!_initialized) {
        return Result::ERROR_NOT_INITIALIZED;
    }
    if (connectionInFlight()) {
        LOG_WARN("BLUEFRUIT", "Scan refused, connection in progress");
        return Result::ERROR_BUSY;
    }

    if (Bluefruit.Scanner.isRunning()) {
        Bluefruit.Scanner.stop();
    }
    _seenThisScan.clear();
    _scanQueue.clear();
    _scanStopped.store(false, std::memory_order_relaxed);

    Bluefruit.Scanner.setRxCallback(_onScanReport);
    Bluefruit.Scanner.setStopCallback(_onScanStop);
    Bluefruit.Scanner.restartOnDisconnect(false);
    Bluefruit.Scanner.clearFilters();
    Bluefruit.Scanner.filterRssi(_scanFilter.getMinRssi());
    Bluefruit.Scanner.setInterval(160, 80);     // 100ms interval, 50ms window (in 0.625ms units)
    Bluefruit.Scanner.useActiveScan(true);      // Request scan response for name

    // Scanner timeout is in 10ms units, 0 = don't stop
    uint32_t ticks = timeoutMs / 10;
    if (timeoutMs > 0 && ticks == 0) {
        ticks = 1;
    }
    if (ticks > 0xFFFF) {
        ticks = 0xFFFF;
    }

    if (!Bluefruit.Scanner.start((uint16_t)ticks)) {
        LOG_ERROR("BLUEFRUIT", "Scanner.start() failed");
        return Result::ERROR_HARDWARE;
    }
    _scanning = true;
    LOG_INFO("BLUEFRUIT", "Scanning for %lu ms", (unsigned long)timeoutMs);
    return Result::OK;
}

void BluefruitTransport::stopScan() {
    if (Bluefruit.Scanner.isRunning()) {
        Bluefruit.Scanner.stop();
    }
    _scanning = false;
    _scanStopped.store(false, std::memory_order_relaxed);
}

bool BluefruitTransport::isScanning() const {
    return _scanning;
}

// =============================================================================
// DEVICE REGISTRY
// =============================================================================

std::vector<PeripheralPtr> BluefruitTransport::discoveredDevices() const {
    std::vector<PeripheralPtr> devices;
    for (const auto& entry : _peripherals) {
        devices.push_back(entry.second);
    }
    return devices;
}

PeripheralPtr BluefruitTransport::getPeripheral(const std::string& id) const {
    auto it = _peripherals.find(canonicalAddress(id));
    return it != _peripherals.end() ? it->second : nullptr;
}

void BluefruitTransport::forgetPeripheral(const std::string& id) {
    _peripherals.erase(canonicalAddress(id));
}

void BluefruitTransport::clearDeviceCache(const std::string& address, ResultCallback callback) {
    std::string id = canonicalAddress(address);
    auto it = _peripherals.find(id);
    std::shared_ptr<BluefruitPeripheral> peripheral = it != _peripherals.end() ? it->second : nullptr;

    if (peripheral && peripheral->state() != PeripheralState::DISCONNECTED) {
        // Stays registered so the link-down event can still find it by handle
        std::weak_ptr<BluefruitPeripheral> weak = peripheral;
        peripheral->disconnect([this, id, weak, callback](Result result) {
            dropCachedPeripheral(id, weak.lock());
            callback(result);
        });
        return;
    }

    dropCachedPeripheral(id, peripheral);
    scheduler.schedule(0, [callback]() { callback(Result::OK); });
}

void BluefruitTransport::dropCachedPeripheral(const std::string& id,
                                              const std::shared_ptr<BluefruitPeripheral>& peripheral) {
    auto it = _peripherals.find(id);
    if (it != _peripherals.end() && (!peripheral || it->second == peripheral)) {
        _peripherals.erase(it);
    }
    if (peripheral) {
        bond_remove_key(BLE_GAP_ROLE_CENTRAL, &peripheral->gapAddress());
    }
    LOG_INFO("BLUEFRUIT", "Cleared cache for %s", id.c_str());
}

std::string BluefruitTransport::formatAddress(const ble_gap_addr_t& addr) {
    char buffer[18];
    snprintf(buffer, sizeof(buffer), "%02X:%02X:%02X:%02X:%02X:%02X",
             addr.addr[5], addr.addr[4], addr.addr[3], addr.addr[2], addr.addr[1], addr.addr[0]);
    return std::string(buffer);
}

std::shared_ptr<BluefruitPeripheral> BluefruitTransport::findByAddress(const ble_gap_addr_t& addr) const {
    auto it = _peripherals.find(formatAddress(addr));
    return it != _peripherals.end() ? it->second : nullptr;
}

std::shared_ptr<BluefruitPeripheral> BluefruitTransport::findByHandle(uint16_t connHandle) const {
    for (const auto& entry : _peripherals) {
        if (entry.second->connHandle() == connHandle) {
            return entry.second;
        }
    }
    return nullptr;
}

// =============================================================================
// LINK SLOTS
// =============================================================================

int8_t BluefruitTransport::allocateSlot(uint16_t connHandle) {
    for (uint8_t i = 0; i < MAX_CENTRAL_LINKS; i++) {
        if (!_slots[i].inUse()) {
            _slots[i].connHandle = connHandle;
            return (int8_t)i;
        }
    }
    return -1;
}

void BluefruitTransport::releaseSlot(uint16_t connHandle) {
    for (uint8_t i = 0; i < MAX_CENTRAL_LINKS; i++) {
        if (_slots[i].connHandle == connHandle) {
            _slots[i].connHandle = BLE_CONN_HANDLE_INVALID;
            _dataChars[i].reset();
        }
    }
}

void BluefruitTransport::registerCharacteristic(const std::shared_ptr<BluefruitCharacteristic>& characteristic) {
    if (characteristic->slot() < MAX_CENTRAL_LINKS) {
        _dataChars[characteristic->slot()] = characteristic;
    }
}

// =============================================================================
// MAIN LOOP PUMP
// =============================================================================

void BluefruitTransport::update() {
    drainLinkEvents();
    drainScanReports();
    drainNotifications();

    if (_scanStopped.exchange(false, std::memory_order_acq_rel) && _scanning) {
        _scanning = false;
        LOG_INFO("BLUEFRUIT", "Scan complete, %u devices known", (unsigned)_peripherals.size());
        notifyScanComplete();
    }

    uint32_t overflows = _scanQueue.overflowCount() + _linkQueue.overflowCount() + _notifyQueue.overflowCount();
    if (overflows != _reportedOverflows) {
        LOG_WARN("BLUEFRUIT", "Deferred queue overflow (%lu dropped)", (unsigned long)(overflows - _reportedOverflows));
        _reportedOverflows = overflows;
    }
}

void BluefruitTransport::drainScanReports() {
    ScanReportEvent report;
    while (_scanQueue.dequeue(report)) {
        if (!_scanning) {
            continue;
        }
        std::string name(report.name);
        if (!_scanFilter.accepts(name, report.rssi)) {
            continue;
        }

        std::string id = formatAddress(report.addr);
        std::shared_ptr<BluefruitPeripheral> peripheral;
        auto it = _peripherals.find(id);
        if (it != _peripherals.end()) {
            peripheral = it->second;
            peripheral->updateRssi(report.rssi);
            peripheral->rememberName(name);
        } else {
            peripheral = std::make_shared<BluefruitPeripheral>(this, report.addr, id, name, report.rssi);
            _peripherals[id] = peripheral;
        }

        if (_seenThisScan.insert(id).second) {
            LOG_INFO("BLUEFRUIT", "Found %s (%s) RSSI %d", name.c_str(), id.c_str(), report.rssi);
            notifyDiscovered(peripheral);
        }
    }
}

void BluefruitTransport::drainLinkEvents() {
    LinkEvent event;
    while (_linkQueue.dequeue(event)) {
        if (event.type == LinkEventType::CONNECTED) {
            std::shared_ptr<BluefruitPeripheral> peripheral = findByAddress(event.addr);
            if (!peripheral || peripheral->state() != PeripheralState::CONNECTING) {
                LOG_WARN("BLUEFRUIT", "Unexpected link to %s, dropping", formatAddress(event.addr).c_str());
                Bluefruit.disconnect(event.connHandle);
                continue;
            }

            int8_t slot = allocateSlot(event.connHandle);
            if (slot < 0) {
                LOG_ERROR("BLUEFRUIT", "No free link slot for %s", peripheral->address().c_str());
                Bluefruit.disconnect(event.connHandle);
                peripheral->failConnect(Result::ERROR_HARDWARE);
                continue;
            }
            peripheral->onLinkUp(event.connHandle, slot);
        } else {
            std::shared_ptr<BluefruitPeripheral> peripheral = findByHandle(event.connHandle);
            releaseSlot(event.connHandle);
            if (peripheral) {
                peripheral->onLinkDown(event.reason);
            }
        }
    }
}

void BluefruitTransport::drainNotifications() {
    NotifyEvent event;
    while (_notifyQueue.dequeue(event)) {
        if (event.slot >= MAX_CENTRAL_LINKS) {
            continue;
        }
        std::shared_ptr<BluefruitCharacteristic> characteristic = _dataChars[event.slot].lock();
        if (characteristic) {
            characteristic->deliver(event.data, event.length);
        }
    }
}

// =============================================================================
// STATIC CALLBACKS (BLE task)
// =============================================================================

void BluefruitTransport::_onScanReport(ble_gap_evt_adv_report_t* report) {
    if (g_bluefruitTransport == nullptr) {
        return;
    }

    ScanReportEvent event;
    memset(&event, 0, sizeof(event));
    event.addr = report->peer_addr;
    event.rssi = report->rssi;

    uint8_t nameLen = Bluefruit.Scanner.parseReportByType(report, BLE_GAP_AD_TYPE_COMPLETE_LOCAL_NAME,
                                                          (uint8_t*)event.name, sizeof(event.name) - 1);
    if (nameLen == 0) {
        nameLen = Bluefruit.Scanner.parseReportByType(report, BLE_GAP_AD_TYPE_SHORT_LOCAL_NAME,
                                                      (uint8_t*)event.name, sizeof(event.name) - 1);
    }
    event.name[nameLen] = '\0';

    g_bluefruitTransport->_scanQueue.enqueue(event);

    // Scanner pauses after each report until resumed
    Bluefruit.Scanner.resume();
}

void BluefruitTransport::_onScanStop() {
    if (g_bluefruitTransport) {
        g_bluefruitTransport->_scanStopped.store(true, std::memory_order_release);
    }
}

void BluefruitTransport::_onConnect(uint16_t connHandle) {
    if (g_bluefruitTransport == nullptr) {
        return;
    }

    LinkEvent event;
    memset(&event, 0, sizeof(event));
    event.type = LinkEventType::CONNECTED;
    event.connHandle = connHandle;
    BLEConnection* connection = Bluefruit.Connection(connHandle);
    if (connection) {
        event.addr = connection->getPeerAddr();
    }
    g_bluefruitTransport->_linkQueue.enqueue(event);
}

void BluefruitTransport::_onDisconnect(uint16_t connHandle, uint8_t reason) {
    if (g_bluefruitTransport == nullptr) {
        return;
    }

    LinkEvent event;
    memset(&event, 0, sizeof(event));
    event.type = LinkEventType::DISCONNECTED;
    event.connHandle = connHandle;
    event.reason = reason;
    g_bluefruitTransport->_linkQueue.enqueue(event);
}

void BluefruitTransport::_onNotify(BLEClientCharacteristic* chr, uint8_t* data, uint16_t len) {
    if (g_bluefruitTransport == nullptr) {
        return;
    }

    for (uint8_t i = 0; i < MAX_CENTRAL_LINKS; i++) {
        if (&g_bluefruitTransport->_slots[i].dataChar == chr) {
            NotifyEvent event;
            event.slot = i;
            event.length = (uint8_t)(len > BLUEFRUIT_MAX_NOTIFY_LEN ? BLUEFRUIT_MAX_NOTIFY_LEN : len);
            memcpy(event.data, data, event.length);
            g_bluefruitTransport->_notifyQueue.enqueue(event);
            return;
        }
    }
}

#endif // ARDUINO || NATIVE_TEST_BUILD
