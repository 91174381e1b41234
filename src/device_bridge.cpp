/**
 * @file device_bridge.cpp
 * @brief Device bridge - Implementation
 * @version 2.0.0
 * @platform Adafruit Feather nRF52840 Express / Linux (BlueZ)
 */

#include "device_bridge.h"
#include "log.h"

// =============================================================================
// CONSTRUCTOR
// =============================================================================

DeviceBridge::DeviceBridge(BleAdapter& adapter) :
    _adapter(adapter),
    _orchestrator(adapter, &_events),
    _identityResolver(nullptr),
    _connectAllAfterScan(false)
{
}

// =============================================================================
// INITIALIZATION
// =============================================================================

void DeviceBridge::begin(const BridgeSettings& settings, ResultCallback callback) {
    applySettings(settings);

    _events.setSubscriber([this](const DeviceEvent& event) {
        LOG_DEBUG("BRIDGE", "%s: %s %s", event.deviceId.c_str(), deviceEventKindToString(event.kind),
                  event.detail.c_str());
        if (_eventCallback) {
            _eventCallback(event);
        }
    });

    _adapter.setDiscoveryHandler([this](const PeripheralPtr& peripheral) {
        _events.post(DeviceEvent(peripheral->id(), DeviceEventKind::DISCOVERED, peripheral->name()));
    });

    _orchestrator.setSessionConfigurator([this](const SessionPtr& session) {
        configureSession(session);
    });
    _orchestrator.setScanCompleteHandler([this]() { onScanComplete(); });
    _orchestrator.begin();

    LOG_INFO("BRIDGE", "Initializing %s transport", _adapter.backendName());
    _adapter.initialize([this, callback](Result result) {
        if (result == Result::OK) {
            TransportTiming timing = _adapter.timing();
            LOG_INFO("BRIDGE", "%s ready (connect %lu ms, GATT retry %u x %lu ms, settle %lu ms)",
                     _adapter.backendName(), (unsigned long)timing.connectTimeoutMs,
                     timing.gattRetryAttempts, (unsigned long)timing.gattRetryDelayMs,
                     (unsigned long)_orchestrator.settleDelayMs());
        } else {
            LOG_ERROR("BRIDGE", "%s initialization failed (%s)", _adapter.backendName(), resultToString(result));
        }
        callback(result);
    });
}

void DeviceBridge::applySettings(const BridgeSettings& settings) {
    _settings = settings;
    _adapter.scanFilter().setMinRssi(settings.minRssi);

    for (const SessionPtr& session : DeviceSession::all()) {
        session->setStreamFrequency(settings.frequencyCode);
    }
}

void DeviceBridge::update() {
    _adapter.update();
    _events.dispatch();
}

// =============================================================================
// DISCOVERY
// =============================================================================

Result DeviceBridge::startScan(uint32_t timeoutMs) {
    return _orchestrator.startScan(timeoutMs > 0 ? timeoutMs : _settings.scanTimeoutMs);
}

void DeviceBridge::stopScan() {
    _connectAllAfterScan = false;
    _orchestrator.stopScan();
}

Result DeviceBridge::scanAndConnectAll(ConnectCallback perDevice) {
    Result result = startScan(_settings.scanTimeoutMs);
    if (result != Result::OK) {
        return result;
    }
    _connectAllAfterScan = true;
    _connectAllCallback = std::move(perDevice);
    return Result::OK;
}

void DeviceBridge::onScanComplete() {
    size_t found = _adapter.discoveredDevices().size();
    LOG_INFO("BRIDGE", "Scan complete, %u devices", (unsigned)found);

    if (!_connectAllAfterScan) {
        return;
    }
    _connectAllAfterScan = false;
    ConnectCallback callback = std::move(_connectAllCallback);
    _connectAllCallback = nullptr;
    connectAll(callback);
}

// =============================================================================
// CONNECTIONS
// =============================================================================

void DeviceBridge::configureSession(const SessionPtr& session) {
    session->setStreamFrequency(_settings.frequencyCode);
    session->setMotionCallback([this](const std::string& deviceId, const MotionSample& sample) {
        if (_motionCallback) {
            _motionCallback(deviceId, sample);
        }
    });
}

void DeviceBridge::connectDevice(const std::string& deviceId, ConnectCallback callback) {
    std::string id = canonicalAddress(deviceId);
    _orchestrator.enqueue(id, [this, callback](const ConnectOutcome& outcome) {
        onConnected(outcome, callback);
    });
}

size_t DeviceBridge::connectAll(ConnectCallback perDevice) {
    size_t queued = 0;
    size_t live = 0;

    for (const SessionPtr& session : DeviceSession::all()) {
        if (isLinkedState(session->state())) {
            live++;
        }
    }

    for (const PeripheralPtr& peripheral : _adapter.discoveredDevices()) {
        SessionPtr existing = DeviceSession::find(peripheral->id());
        if (existing && isLinkedState(existing->state())) {
            continue;
        }
        if (live + queued >= MAX_FLEET_DEVICES) {
            LOG_WARN("BRIDGE", "Fleet limit %d reached, skipping %s", MAX_FLEET_DEVICES,
                     peripheral->name().c_str());
            continue;
        }
        connectDevice(peripheral->id(), perDevice);
        queued++;
    }

    LOG_INFO("BRIDGE", "Queued %u connections", (unsigned)queued);
    return queued;
}

void DeviceBridge::onConnected(const ConnectOutcome& outcome, const ConnectCallback& callback) {
    SessionPtr session = outcome.success ? DeviceSession::find(outcome.deviceId) : nullptr;

    if (session) {
        DeviceIdentity identity;
        if (_identityResolver && _identityResolver->assignIdentity(session->name(), identity)) {
            session->setIdentity(identity);
            LOG_INFO("BRIDGE", "%s: identity %u (%s %s)", session->name().c_str(), identity.semanticId,
                     identity.joint.c_str(), identity.position.c_str());
        }

        if (_settings.autoTimeSync) {
            Result started = syncDevice(session->id(), [](Result, const ClockOffsetEstimate&) {});
            if (started != Result::OK) {
                LOG_WARN("BRIDGE", "%s: auto time sync not started (%s)", session->name().c_str(),
                         resultToString(started));
            }
        }
    }

    if (callback) {
        callback(outcome);
    }
}

void DeviceBridge::disconnectDevice(const std::string& deviceId, ResultCallback callback) {
    SessionPtr session = DeviceSession::find(canonicalAddress(deviceId));
    if (!session) {
        callback(Result::ERROR_NOT_FOUND);
        return;
    }
    session->disconnect(std::move(callback));
}

void DeviceBridge::disconnectAll(ResultCallback callback) {
    _orchestrator.cancelPending();

    auto sessions = std::make_shared<std::vector<SessionPtr>>(DeviceSession::all());
    LOG_INFO("BRIDGE", "Disconnecting %u sessions", (unsigned)sessions->size());
    runSequential(sessions, 0, [](const SessionPtr& session, ResultCallback done) {
        session->disconnect(std::move(done));
    }, Result::OK, std::move(callback));
}

void DeviceBridge::clearDeviceCache(const std::string& address, ResultCallback callback) {
    std::string id = canonicalAddress(address);
    if (DeviceSession::retire(id)) {
        LOG_INFO("BRIDGE", "%s: session retired before cache clear", id.c_str());
    }
    _adapter.clearDeviceCache(id, std::move(callback));
}

// =============================================================================
// STREAMING
// =============================================================================

void DeviceBridge::startStreaming(const std::string& deviceId, ResultCallback callback) {
    SessionPtr session = DeviceSession::find(canonicalAddress(deviceId));
    if (!session) {
        callback(Result::ERROR_NOT_FOUND);
        return;
    }
    if (_timeSync.isSyncing(session->id())) {
        LOG_WARN("BRIDGE", "%s: time sync in progress", session->name().c_str());
        callback(Result::ERROR_BUSY);
        return;
    }
    session->startStreaming(std::move(callback));
}

void DeviceBridge::stopStreaming(const std::string& deviceId, ResultCallback callback) {
    SessionPtr session = DeviceSession::find(canonicalAddress(deviceId));
    if (!session) {
        callback(Result::ERROR_NOT_FOUND);
        return;
    }
    session->stopStreaming(std::move(callback));
}

void DeviceBridge::streamAll(ResultCallback callback) {
    auto sessions = std::make_shared<std::vector<SessionPtr>>();
    for (const SessionPtr& session : DeviceSession::all()) {
        if (session->state() == SessionState::CONNECTED && !_timeSync.isSyncing(session->id())) {
            sessions->push_back(session);
        }
    }

    LOG_INFO("BRIDGE", "Starting stream on %u sessions", (unsigned)sessions->size());
    runSequential(sessions, 0, [](const SessionPtr& session, ResultCallback done) {
        session->startStreaming(std::move(done));
    }, Result::OK, std::move(callback));
}

void DeviceBridge::stopAll(ResultCallback callback) {
    auto sessions = std::make_shared<std::vector<SessionPtr>>();
    for (const SessionPtr& session : DeviceSession::all()) {
        if (session->isStreaming()) {
            sessions->push_back(session);
        }
    }

    runSequential(sessions, 0, [](const SessionPtr& session, ResultCallback done) {
        session->stopStreaming(std::move(done));
    }, Result::OK, std::move(callback));
}

void DeviceBridge::runSequential(std::shared_ptr<std::vector<SessionPtr>> sessions, size_t index,
                                 SessionOperation operation, Result firstError, ResultCallback done) {
    if (index >= sessions->size()) {
        done(firstError);
        return;
    }

    SessionPtr session = (*sessions)[index];
    operation(session, [sessions, index, operation, firstError, done, session](Result result) {
        if (result != Result::OK) {
            LOG_WARN("BRIDGE", "%s: %s", session->name().c_str(), resultToString(result));
        }
        Result next = (firstError == Result::OK) ? result : firstError;
        runSequential(sessions, index + 1, operation, next, done);
    });
}

// =============================================================================
// TIME SYNC
// =============================================================================

Result DeviceBridge::syncDevice(const std::string& deviceId, SyncCallback callback) {
    SessionPtr session = DeviceSession::find(canonicalAddress(deviceId));
    if (!session) {
        return Result::ERROR_NOT_FOUND;
    }

    std::string id = session->id();
    return _timeSync.syncSession(session, platformEpochMs(),
        [this, id, callback](Result result, const ClockOffsetEstimate& estimate) {
            onSyncComplete(id, result, estimate);
            if (callback) {
                callback(result, estimate);
            }
        });
}

void DeviceBridge::syncAll(FleetSyncCallback callback) {
    std::vector<SessionPtr> sessions;
    for (const SessionPtr& session : DeviceSession::all()) {
        if (session->state() == SessionState::CONNECTED) {
            sessions.push_back(session);
        }
    }

    _timeSync.syncFleet(sessions, [this, callback](const std::vector<FleetSyncResult>& results) {
        for (const FleetSyncResult& entry : results) {
            onSyncComplete(entry.deviceId, entry.result, entry.estimate);
        }
        if (callback) {
            callback(results);
        }
    });
}

void DeviceBridge::onSyncComplete(const std::string& deviceId, Result result,
                                  const ClockOffsetEstimate& estimate) {
    SessionPtr session = DeviceSession::find(deviceId);
    if (!session || result == Result::OK) {
        return;
    }

    // The estimate is still good when only the register write failed
    if (session->getSyncState() == SyncState::OFFSET_COMPUTED &&
        session->applySoftwareOffset(estimate.offsetMs)) {
        LOG_WARN("BRIDGE", "%s: hardware sync failed (%s), correcting %.2f ms in software",
                 session->name().c_str(), resultToString(result), estimate.offsetMs);
    }
}

// =============================================================================
// STATUS
// =============================================================================

std::vector<SessionStatus> DeviceBridge::getStatus() const {
    std::vector<SessionStatus> statuses;
    for (const SessionPtr& session : DeviceSession::all()) {
        statuses.push_back(session->getStatus());
    }
    return statuses;
}

void DeviceBridge::printStatus() const {
    BRIDGE_PRINTF("------------------------------------------------------------\n");
    BRIDGE_PRINTF("[STATUS] Backend: %s | Radio: %s | Queue: %u | Sessions: %u\n",
                  _adapter.backendName(), radioStateToString(_orchestrator.getRadioState()),
                  (unsigned)_orchestrator.queueLength(), (unsigned)DeviceSession::activeCount());

    for (const SessionStatus& status : getStatus()) {
        BRIDGE_PRINTF("[DEVICE] %s (%s) | %s | Battery: %d%% | Sync: %s",
                      status.name.c_str(), status.id.c_str(), sessionStateToString(status.state),
                      status.battery, syncStateToString(status.syncState));
        if (status.hasClockOffset) {
            BRIDGE_PRINTF(" | Offset: %.1f ms", status.clockOffsetMs);
        }
        if (status.streaming) {
            BRIDGE_PRINTF(" | RX: %lu | Dropped: %lu", (unsigned long)status.packetsReceived,
                          (unsigned long)status.packetsDropped);
        }
        BRIDGE_PRINTF("\n");
    }

    if (_events.droppedCount() > 0) {
        BRIDGE_PRINTF("[EVENT] Dropped: %lu\n", (unsigned long)_events.droppedCount());
    }
    BRIDGE_PRINTF("------------------------------------------------------------\n");
}
