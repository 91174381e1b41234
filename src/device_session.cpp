/**
 * @file device_session.cpp
 * @brief Device session - Implementation
 * @version 2.0.0
 * @platform Adafruit Feather nRF52840 Express / Linux (BlueZ)
 */

#include "device_session.h"
#include "config.h"
#include "log.h"

// =============================================================================
// STATIC STORAGE
// =============================================================================

std::map<std::string, const DeviceSession*> DeviceSession::s_discoveryLocks;
std::map<std::string, SessionPtr> DeviceSession::s_registry;

// =============================================================================
// REGISTRY
// =============================================================================

SessionPtr DeviceSession::create(const PeripheralPtr& peripheral, const TransportTiming& timing,
                                 EventChannel* events) {
    if (!peripheral) {
        return nullptr;
    }

    // Retire the previous instance before the new one becomes reachable
    auto existing = s_registry.find(peripheral->id());
    if (existing != s_registry.end()) {
        SessionPtr previous = existing->second;
        s_registry.erase(existing);
        LOG_INFO("SESSION", "%s: retiring superseded session", previous->_name.c_str());
        previous->dispose();
    }

    SessionPtr session = std::make_shared<DeviceSession>(CreateKey(), peripheral, timing, events);
    s_registry[session->_id] = session;
    return session;
}

SessionPtr DeviceSession::find(const std::string& id) {
    auto it = s_registry.find(id);
    return it != s_registry.end() ? it->second : nullptr;
}

std::vector<SessionPtr> DeviceSession::all() {
    std::vector<SessionPtr> sessions;
    sessions.reserve(s_registry.size());
    for (const auto& entry : s_registry) {
        sessions.push_back(entry.second);
    }
    return sessions;
}

bool DeviceSession::retire(const std::string& id) {
    auto it = s_registry.find(id);
    if (it == s_registry.end()) {
        return false;
    }
    SessionPtr session = it->second;
    s_registry.erase(it);
    session->dispose();
    return true;
}

void DeviceSession::retireAll() {
    std::vector<SessionPtr> sessions = all();
    s_registry.clear();
    for (const SessionPtr& session : sessions) {
        session->dispose();
    }
}

size_t DeviceSession::activeCount() {
    return s_registry.size();
}

bool DeviceSession::isDiscoveryLocked(const std::string& address) {
    return s_discoveryLocks.find(address) != s_discoveryLocks.end();
}

// =============================================================================
// CONSTRUCTOR
// =============================================================================

DeviceSession::DeviceSession(CreateKey, const PeripheralPtr& peripheral, const TransportTiming& timing,
                             EventChannel* events) :
    _id(peripheral->id()),
    _name(peripheral->name().empty() ? peripheral->id() : peripheral->name()),
    _peripheral(peripheral),
    _timing(timing),
    _events(events),
    _hasIdentity(false),
    _disposed(false),
    _userDisconnect(false),
    _streaming(false),
    _streamMode(STREAM_DATA_MODE),
    _frequencyCode(STREAM_DEFAULT_FREQUENCY),
    _packetsReceived(0),
    _packetsDropped(0),
    _battery(-1),
    _batteryTimer(TimerScheduler::INVALID_ID),
    _batteryPollingEnabled(false),
    _commandInFlight(false),
    _commandTimer(TimerScheduler::INVALID_ID),
    _holdsDiscoveryLock(false),
    _syncState(SyncState::UNSYNCED),
    _hasClockOffset(false),
    _clockOffsetMs(0.0),
    _deviceClockInMicros(false),
    _linkEpoch(0)
{
    _stateMachine.begin(SessionState::DISCONNECTED, _name.c_str());
}

// =============================================================================
// CONNECT
// =============================================================================

void DeviceSession::connect(ResultCallback callback) {
    if (checkDisposed(callback)) {
        return;
    }

    SessionState current = state();
    if (current == SessionState::CONNECTED || current == SessionState::STREAMING) {
        callback(Result::OK);
        return;
    }

    if (_connectCallback || !_stateMachine.transition(SessionTrigger::CONNECT_REQUESTED)) {
        LOG_WARN("SESSION", "%s: connect refused in state %s", _name.c_str(),
                 sessionStateToString(current));
        callback(Result::ERROR_BUSY);
        return;
    }

    _connectCallback = std::move(callback);
    _userDisconnect = false;

    LOG_INFO("SESSION", "%s: connecting (timeout %lu ms)", _name.c_str(),
             (unsigned long)_timing.connectTimeoutMs);

    SessionPtr self = shared_from_this();
    _peripheral->connect(_timing.connectTimeoutMs, [self](Result result) {
        if (self->connectAborted()) {
            return;
        }
        if (result != Result::OK) {
            self->failConnect(result, "Connection failed");
            return;
        }
        self->onLinkEstablished();
    });
}

void DeviceSession::onLinkEstablished() {
    // Registered before any further I/O so a drop during discovery is observed
    std::weak_ptr<DeviceSession> weak = shared_from_this();
    _peripheral->setDisconnectHandler([weak](uint8_t reason) {
        SessionPtr self = weak.lock();
        if (self) {
            self->handleLinkLost(reason);
        }
    });

    _stateMachine.transition(SessionTrigger::LINK_ESTABLISHED);

    SessionPtr self = shared_from_this();
    discoverProfile([self](Result result) {
        if (self->connectAborted()) {
            return;
        }
        if (result != Result::OK) {
            self->failConnect(result, "Service discovery failed");
            return;
        }

        self->readBattery([self](Result batteryResult, uint8_t percent) {
            if (self->connectAborted()) {
                return;
            }
            if (batteryResult == Result::OK) {
                self->_battery = percent;
            } else {
                LOG_WARN("SESSION", "%s: initial battery read failed (%s)", self->_name.c_str(),
                         resultToString(batteryResult));
            }

            self->startBatteryPolling();
            self->_stateMachine.transition(SessionTrigger::DISCOVERY_COMPLETE);
            self->post(DeviceEventKind::CONNECTED);

            LOG_INFO("SESSION", "%s: connected (battery %d%%)", self->_name.c_str(), self->_battery);
            self->finishConnect(Result::OK);
        });
    });
}

void DeviceSession::discoverProfile(ResultCallback callback) {
    discoverServices(_linkEpoch, 0, std::move(callback));
}

void DeviceSession::discoverServices(uint32_t linkEpoch, uint8_t attempt, ResultCallback callback) {
    SessionPtr self = shared_from_this();
    _peripheral->discoverServices([self, linkEpoch, attempt, callback](Result result,
                                                                       const std::vector<ServicePtr>& services) {
        if (self->checkLinkChanged(linkEpoch, callback)) {
            return;
        }

        if (result != Result::OK || services.empty()) {
            // Some stacks report an empty table until the GATT cache settles
            if (attempt == 0 && self->_peripheral->isConnected()) {
                LOG_WARN("SESSION", "%s: no services (%s), retrying in %d ms", self->_name.c_str(),
                         resultToString(result), SERVICE_DISCOVERY_RETRY_MS);
                TimerId retry = scheduler.schedule(SERVICE_DISCOVERY_RETRY_MS, [self, linkEpoch, callback]() {
                    if (self->checkLinkChanged(linkEpoch, callback)) {
                        return;
                    }
                    self->discoverServices(linkEpoch, 1, callback);
                });
                if (retry == TimerScheduler::INVALID_ID) {
                    callback(Result::ERROR_BUSY);
                }
                return;
            }
            callback(result != Result::OK ? result : Result::ERROR_DISCOVERY);
            return;
        }

        ServicePtr target;
        for (const ServicePtr& service : services) {
            if (uuidEquals(service->uuid(), SENSOR_SERVICE_UUID)) {
                target = service;
                break;
            }
        }
        if (!target) {
            LOG_WARN("SESSION", "%s: sensor service not advertised, using %s", self->_name.c_str(),
                     services.front()->uuid().c_str());
            target = services.front();
        }

        self->discoverCharacteristics(linkEpoch, target, 1, callback);
    });
}

void DeviceSession::discoverCharacteristics(uint32_t linkEpoch, const ServicePtr& service, uint8_t attempt,
                                            ResultCallback callback) {
    SessionPtr self = shared_from_this();
    uint8_t maxAttempts = _timing.gattRetryAttempts > 0 ? _timing.gattRetryAttempts : 1;

    if (!acquireDiscoveryLock()) {
        if (attempt >= maxAttempts) {
            LOG_ERROR("SESSION", "%s: discovery lock still held, giving up", _name.c_str());
            callback(Result::ERROR_BUSY);
            return;
        }
        LOG_INFO("SESSION", "%s: discovery in progress elsewhere, waiting", _name.c_str());
        TimerId retry = scheduler.schedule(_timing.gattRetryDelayMs * attempt,
                                           [self, linkEpoch, service, attempt, callback]() {
            if (self->checkLinkChanged(linkEpoch, callback)) {
                return;
            }
            self->discoverCharacteristics(linkEpoch, service, attempt + 1, callback);
        });
        if (retry == TimerScheduler::INVALID_ID) {
            callback(Result::ERROR_BUSY);
        }
        return;
    }

    service->discoverCharacteristics([self, linkEpoch, service, attempt, maxAttempts, callback](
            Result result, const std::vector<CharacteristicPtr>& characteristics) {
        // dispose() or the link-lost cleanup has already released the lock
        if (self->checkLinkChanged(linkEpoch, callback)) {
            return;
        }

        CharacteristicPtr command;
        CharacteristicPtr data;
        if (result == Result::OK) {
            for (const CharacteristicPtr& chr : characteristics) {
                if (uuidEquals(chr->uuid(), SENSOR_COMMAND_CHAR_UUID)) {
                    command = chr;
                } else if (uuidEquals(chr->uuid(), SENSOR_DATA_CHAR_UUID)) {
                    data = chr;
                }
            }
        }

        self->releaseDiscoveryLock();

        if (command && data) {
            self->_commandChar = command;
            self->_dataChar = data;
            LOG_INFO("SESSION", "%s: characteristics ready (attempt %u)", self->_name.c_str(), attempt);
            callback(Result::OK);
            return;
        }

        if (attempt < maxAttempts && self->_peripheral->isConnected()) {
            uint32_t delayMs = self->_timing.gattRetryDelayMs * attempt;
            LOG_WARN("SESSION", "%s: characteristic discovery attempt %u/%u failed (%s), retry in %lu ms",
                     self->_name.c_str(), attempt, maxAttempts, resultToString(result),
                     (unsigned long)delayMs);
            TimerId retry = scheduler.schedule(delayMs, [self, linkEpoch, service, attempt, callback]() {
                if (self->checkLinkChanged(linkEpoch, callback)) {
                    return;
                }
                self->discoverCharacteristics(linkEpoch, service, attempt + 1, callback);
            });
            if (retry == TimerScheduler::INVALID_ID) {
                callback(Result::ERROR_BUSY);
            }
            return;
        }

        callback(result != Result::OK ? result : Result::ERROR_NO_CHARACTERISTICS);
    });
}

void DeviceSession::finishConnect(Result result) {
    if (!_connectCallback) {
        return;
    }
    ResultCallback callback = std::move(_connectCallback);
    _connectCallback = nullptr;
    callback(result);
}

void DeviceSession::failConnect(Result result, const char* message) {
    LOG_ERROR("SESSION", "%s: %s (%s)", _name.c_str(), message, resultToString(result));

    // The teardown below is ours, not a link loss
    _userDisconnect = true;
    cleanup(false);
    _stateMachine.transition(SessionTrigger::FAILURE);
    post(DeviceEventKind::ERROR, std::string(message) + ": " + resultToString(result));

    if (_peripheral->state() != PeripheralState::DISCONNECTED) {
        SessionPtr self = shared_from_this();
        _peripheral->disconnect([self](Result disconnectResult) {
            if (disconnectResult != Result::OK) {
                LOG_WARN("SESSION", "%s: disconnect after failure returned %s", self->_name.c_str(),
                         resultToString(disconnectResult));
            }
        });
    }

    finishConnect(result);
}

// =============================================================================
// DISCONNECT / TEARDOWN
// =============================================================================

void DeviceSession::disconnect(ResultCallback callback) {
    if (checkDisposed(callback)) {
        return;
    }

    if (state() == SessionState::DISCONNECTED && !_peripheral->isConnected()) {
        callback(Result::OK);
        return;
    }

    LOG_INFO("SESSION", "%s: disconnect requested", _name.c_str());
    _userDisconnect = true;
    stopBatteryPolling();
    _stateMachine.transition(SessionTrigger::DISCONNECT_REQUESTED);

    SessionPtr self = shared_from_this();
    _peripheral->disconnect([self, callback](Result result) {
        if (self->checkDisposed(callback)) {
            return;
        }
        if (self->state() != SessionState::DISCONNECTED) {
            if (!self->_peripheral->isConnected()) {
                // Stack did not report the drop through the disconnect handler
                self->handleLinkLost(0);
            } else {
                self->_stateMachine.forceState(SessionState::ERROR, "disconnect failed");
            }
        }
        callback(result);
    });
}

void DeviceSession::handleLinkLost(uint8_t reason) {
    if (_disposed || state() == SessionState::DISCONNECTED) {
        return;
    }

    if (_userDisconnect) {
        LOG_INFO("SESSION", "%s: disconnected (reason 0x%02X)", _name.c_str(), reason);
    } else {
        LOG_WARN("SESSION", "%s: link lost (reason 0x%02X)", _name.c_str(), reason);
    }

    _peripheral->clearDisconnectHandler();
    _linkEpoch++;
    cleanup(true);
    _stateMachine.transition(SessionTrigger::LINK_LOST);

    char detail[24];
    snprintf(detail, sizeof(detail), "reason 0x%02X", reason);
    post(DeviceEventKind::DISCONNECTED, detail);
    if (!_userDisconnect) {
        post(DeviceEventKind::AUTO_RECONNECT);
    }

    finishConnect(Result::ERROR_NOT_CONNECTED);
}

void DeviceSession::cleanup(bool linkDown) {
    stopBatteryPolling();

    if (!linkDown) {
        return;
    }

    failPendingCommands(Result::ERROR_NOT_CONNECTED);
    releaseDiscoveryLock();
    _streaming = false;

    // Cached characteristics survive transient errors while the link is up
    if (!_peripheral->isConnected()) {
        if (_dataChar) {
            _dataChar->clearNotificationHandler();
        }
        _commandChar.reset();
        _dataChar.reset();
    }
}

void DeviceSession::dispose() {
    if (_disposed) {
        return;
    }
    _disposed = true;

    LOG_INFO("SESSION", "%s: disposed", _name.c_str());

    releaseDiscoveryLock();
    stopBatteryPolling();
    _peripheral->clearDisconnectHandler();
    if (_dataChar) {
        _dataChar->clearNotificationHandler();
    }
    _motionCallback = nullptr;

    failPendingCommands(Result::ERROR_DISPOSED);
    finishConnect(Result::ERROR_DISPOSED);

    _stateMachine.transition(SessionTrigger::DISPOSE);
    _stateMachine.clearCallbacks();
}

bool DeviceSession::checkDisposed(const ResultCallback& callback) const {
    if (!_disposed) {
        return false;
    }
    LOG_DEBUG("SESSION", "%s: operation resumed after dispose", _name.c_str());
    if (callback) {
        callback(Result::ERROR_DISPOSED);
    }
    return true;
}

bool DeviceSession::checkLinkChanged(uint32_t linkEpoch, const ResultCallback& callback) const {
    if (checkDisposed(callback)) {
        return true;
    }
    if (linkEpoch == _linkEpoch) {
        return false;
    }
    LOG_DEBUG("SESSION", "%s: discovery resumed after its link went down", _name.c_str());
    if (callback) {
        callback(Result::ERROR_NOT_CONNECTED);
    }
    return true;
}

// =============================================================================
// DISCOVERY LOCK
// =============================================================================

bool DeviceSession::acquireDiscoveryLock() {
    auto it = s_discoveryLocks.find(_id);
    if (it != s_discoveryLocks.end() && it->second != this) {
        return false;
    }
    s_discoveryLocks[_id] = this;
    _holdsDiscoveryLock = true;
    return true;
}

void DeviceSession::releaseDiscoveryLock() {
    if (!_holdsDiscoveryLock) {
        return;
    }
    auto it = s_discoveryLocks.find(_id);
    if (it != s_discoveryLocks.end() && it->second == this) {
        s_discoveryLocks.erase(it);
    }
    _holdsDiscoveryLock = false;
}

// =============================================================================
// COMMAND QUEUE
// =============================================================================

void DeviceSession::sendCommand(const ByteBuffer& frame, CommandCallback callback) {
    if (_disposed) {
        callback(Result::ERROR_DISPOSED, ByteBuffer());
        return;
    }
    if (!_commandChar) {
        callback(Result::ERROR_NO_CHARACTERISTICS, ByteBuffer());
        return;
    }

    PendingCommand command;
    command.frame = frame;
    command.expectReply = true;
    command.callback = std::move(callback);
    _commandQueue.push_back(std::move(command));
    processNextCommand();
}

void DeviceSession::writeCommand(const ByteBuffer& frame, ResultCallback callback) {
    if (_disposed) {
        callback(Result::ERROR_DISPOSED);
        return;
    }
    if (!_commandChar) {
        callback(Result::ERROR_NO_CHARACTERISTICS);
        return;
    }

    PendingCommand command;
    command.frame = frame;
    command.expectReply = false;
    command.callback = [callback](Result result, const ByteBuffer&) { callback(result); };
    _commandQueue.push_back(std::move(command));
    processNextCommand();
}

void DeviceSession::processNextCommand() {
    if (_commandInFlight || _commandQueue.empty() || _disposed) {
        return;
    }

    PendingCommand command = std::move(_commandQueue.front());
    _commandQueue.pop_front();

    if (!_commandChar) {
        command.callback(Result::ERROR_NO_CHARACTERISTICS, ByteBuffer());
        processNextCommand();
        return;
    }

    _commandInFlight = true;
    _inFlightCallback = std::move(command.callback);
    std::shared_ptr<bool> done = std::make_shared<bool>(false);
    _inFlightDone = done;

    SessionPtr self = shared_from_this();
    _commandTimer = scheduler.schedule(COMMAND_RESPONSE_TIMEOUT_MS, [self, done]() {
        if (*done) {
            return;
        }
        self->_commandTimer = TimerScheduler::INVALID_ID;
        LOG_WARN("SESSION", "%s: command timed out after %d ms", self->_name.c_str(),
                 COMMAND_RESPONSE_TIMEOUT_MS);
        self->completeCommand(Result::ERROR_TIMEOUT, ByteBuffer());
    });
    if (_commandTimer == TimerScheduler::INVALID_ID) {
        // Without a reply timeout the command could wait forever
        completeCommand(Result::ERROR_BUSY, ByteBuffer());
        return;
    }

    LOG_DEBUG_BYTES("SESSION", "TX: ", command.frame.data(), command.frame.size());

    CharacteristicPtr chr = _commandChar;
    bool expectReply = command.expectReply;
    chr->write(command.frame, true, [self, done, chr, expectReply](Result result) {
        if (*done) {
            return;
        }
        if (result != Result::OK || !expectReply) {
            self->completeCommand(result, ByteBuffer());
            return;
        }
        chr->read([self, done](Result readResult, const std::vector<uint8_t>& reply) {
            if (*done) {
                return;
            }
            LOG_DEBUG_BYTES("SESSION", "RX: ", reply.data(), reply.size());
            self->completeCommand(readResult, reply);
        });
    });
}

void DeviceSession::completeCommand(Result result, const ByteBuffer& reply) {
    if (!_commandInFlight) {
        return;
    }
    *_inFlightDone = true;
    scheduler.cancel(_commandTimer);
    _commandTimer = TimerScheduler::INVALID_ID;
    _commandInFlight = false;

    CommandCallback callback = std::move(_inFlightCallback);
    _inFlightCallback = nullptr;
    callback(result, reply);

    processNextCommand();
}

void DeviceSession::failPendingCommands(Result result) {
    std::deque<PendingCommand> queued;
    queued.swap(_commandQueue);

    if (_commandInFlight) {
        *_inFlightDone = true;
        scheduler.cancel(_commandTimer);
        _commandTimer = TimerScheduler::INVALID_ID;
        _commandInFlight = false;
        CommandCallback callback = std::move(_inFlightCallback);
        _inFlightCallback = nullptr;
        callback(result, ByteBuffer());
    }

    for (PendingCommand& command : queued) {
        command.callback(result, ByteBuffer());
    }
}

void DeviceSession::readBattery(ValueCallback callback) {
    sendCommand(buildGetBatteryCommand(), [callback](Result result, const ByteBuffer& reply) {
        if (result != Result::OK) {
            callback(result, 0);
            return;
        }
        uint8_t percent = 0;
        Result decoded = decodeBatteryResponse(reply.data(), reply.size(), percent);
        callback(decoded, percent);
    });
}

void DeviceSession::readSystemState(ValueCallback callback) {
    sendCommand(buildGetSystemStateCommand(), [callback](Result result, const ByteBuffer& reply) {
        if (result != Result::OK) {
            callback(result, 0);
            return;
        }
        uint8_t deviceState = 0;
        Result decoded = decodeSystemStateResponse(reply.data(), reply.size(), deviceState);
        callback(decoded, deviceState);
    });
}

// =============================================================================
// BATTERY POLLING
// =============================================================================

void DeviceSession::startBatteryPolling() {
    _batteryPollingEnabled = true;
    if (scheduler.isActive(_batteryTimer)) {
        return;
    }

    std::weak_ptr<DeviceSession> weak = shared_from_this();
    _batteryTimer = scheduler.schedule(BATTERY_POLL_INTERVAL_MS, [weak]() {
        SessionPtr self = weak.lock();
        if (self) {
            self->_batteryTimer = TimerScheduler::INVALID_ID;
            self->pollBattery();
        }
    });
    if (_batteryTimer == TimerScheduler::INVALID_ID) {
        LOG_WARN("SESSION", "%s: battery polling suspended, no timer available", _name.c_str());
    }
}

void DeviceSession::stopBatteryPolling() {
    _batteryPollingEnabled = false;
    scheduler.cancel(_batteryTimer);
    _batteryTimer = TimerScheduler::INVALID_ID;
}

void DeviceSession::pollBattery() {
    if (_disposed || !_batteryPollingEnabled || _streaming) {
        return;
    }

    SessionPtr self = shared_from_this();
    readBattery([self](Result result, uint8_t percent) {
        if (self->_disposed) {
            return;
        }
        if (result == Result::OK) {
            self->_battery = percent;
            self->post(DeviceEventKind::BATTERY_UPDATE);
        } else {
            LOG_WARN("SESSION", "%s: battery poll failed (%s)", self->_name.c_str(), resultToString(result));
        }
        if (self->_batteryPollingEnabled && !self->_streaming) {
            self->startBatteryPolling();
        }
    });
}

// =============================================================================
// STREAMING
// =============================================================================

void DeviceSession::ensureCharacteristics(ResultCallback callback) {
    if (hasCharacteristics()) {
        callback(Result::OK);
        return;
    }
    if (!_peripheral->isConnected()) {
        callback(Result::ERROR_NOT_CONNECTED);
        return;
    }
    LOG_INFO("SESSION", "%s: characteristics missing, rediscovering", _name.c_str());
    discoverProfile(std::move(callback));
}

void DeviceSession::startStreaming(ResultCallback callback) {
    if (checkDisposed(callback)) {
        return;
    }
    if (_streaming) {
        callback(Result::OK);
        return;
    }
    if (state() != SessionState::CONNECTED) {
        LOG_WARN("SESSION", "%s: cannot stream in state %s", _name.c_str(), sessionStateToString(state()));
        callback(Result::ERROR_NOT_CONNECTED);
        return;
    }

    SessionPtr self = shared_from_this();
    ensureCharacteristics([self, callback](Result result) {
        if (self->checkDisposed(callback)) {
            return;
        }
        if (result != Result::OK) {
            callback(result);
            return;
        }

        CharacteristicPtr data = self->_dataChar;

        // Drop handlers left over from a previous stream before subscribing
        data->clearNotificationHandler();
        std::weak_ptr<DeviceSession> weak = self;
        data->setNotificationHandler([weak](const uint8_t* bytes, size_t length) {
            SessionPtr session = weak.lock();
            if (session) {
                session->onData(bytes, length);
            }
        });

        data->subscribe([self, data, callback](Result subscribeResult) {
            if (self->checkDisposed(callback)) {
                return;
            }
            if (subscribeResult != Result::OK) {
                LOG_ERROR("SESSION", "%s: subscribe failed (%s)", self->_name.c_str(),
                          resultToString(subscribeResult));
                data->clearNotificationHandler();
                callback(subscribeResult);
                return;
            }

            self->_packetsReceived = 0;
            self->_packetsDropped = 0;
            self->_streamMode = STREAM_DATA_MODE;

            self->writeCommand(buildStartStreamCommand(STREAM_DATA_MODE, self->_frequencyCode),
                               [self, data, callback](Result writeResult) {
                if (self->checkDisposed(callback)) {
                    return;
                }
                if (writeResult != Result::OK) {
                    LOG_ERROR("SESSION", "%s: start stream command failed (%s)", self->_name.c_str(),
                              resultToString(writeResult));
                    data->clearNotificationHandler();
                    data->unsubscribe([self](Result unsubscribeResult) {
                        if (unsubscribeResult != Result::OK) {
                            LOG_WARN("SESSION", "%s: unsubscribe after failed start returned %s",
                                     self->_name.c_str(), resultToString(unsubscribeResult));
                        }
                    });
                    callback(writeResult);
                    return;
                }

                self->_streaming = true;
                self->stopBatteryPolling();
                self->_stateMachine.transition(SessionTrigger::STREAM_STARTED);
                self->post(DeviceEventKind::STREAMING_STARTED);
                LOG_INFO("SESSION", "%s: streaming at %u Hz", self->_name.c_str(),
                         frequencyHzForCode(self->_frequencyCode));
                callback(Result::OK);
            });
        });
    });
}

void DeviceSession::stopStreaming(ResultCallback callback) {
    if (checkDisposed(callback)) {
        return;
    }
    if (!_streaming) {
        callback(Result::OK);
        return;
    }

    SessionPtr self = shared_from_this();
    writeCommand(buildStopStreamCommand(), [self, callback](Result result) {
        if (self->checkDisposed(callback)) {
            return;
        }
        CharacteristicPtr data = self->_dataChar;
        if (!data) {
            self->finishStreamStop(result, callback);
            return;
        }
        data->unsubscribe([self, result, callback](Result unsubscribeResult) {
            if (self->checkDisposed(callback)) {
                return;
            }
            if (unsubscribeResult != Result::OK) {
                LOG_WARN("SESSION", "%s: unsubscribe failed (%s)", self->_name.c_str(),
                         resultToString(unsubscribeResult));
            }
            self->finishStreamStop(result, callback);
        });
    });
}

void DeviceSession::finishStreamStop(Result result, ResultCallback callback) {
    if (_dataChar) {
        _dataChar->clearNotificationHandler();
    }
    _streaming = false;

    if (result == Result::OK) {
        _stateMachine.transition(SessionTrigger::STREAM_STOPPED);
        post(DeviceEventKind::STREAMING_STOPPED);
        startBatteryPolling();
        LOG_INFO("SESSION", "%s: streaming stopped (%lu packets, %lu dropped)", _name.c_str(),
                 (unsigned long)_packetsReceived, (unsigned long)_packetsDropped);
    } else {
        LOG_ERROR("SESSION", "%s: stop stream command failed (%s)", _name.c_str(), resultToString(result));
        _stateMachine.transition(SessionTrigger::FAILURE);
        post(DeviceEventKind::ERROR, std::string("Stop streaming failed: ") + resultToString(result));
    }

    callback(result);
}

// =============================================================================
// DATA PATH
// =============================================================================

void DeviceSession::onData(const uint8_t* data, size_t length) {
    if (_disposed) {
        return;
    }

    MotionPacket packet;
    Result result = decodeMotionPacket(data, length, _streamMode, packet);
    if (result != Result::OK) {
        _packetsDropped++;
        if (_packetsDropped <= 5 || (_packetsDropped % 100) == 0) {
            LOG_WARN("SESSION", "%s: dropped packet (%s, %u bytes, %lu total)", _name.c_str(),
                     resultToString(result), (unsigned)length, (unsigned long)_packetsDropped);
        }
        return;
    }

    _packetsReceived++;

    MotionSample sample;
    sample.quaternion = packet.quaternion;
    sample.timestampMs = packet.hasDeviceClock ? correctDeviceTimestamp(packet.deviceClock)
                                               : platformEpochMs();

    if (_motionCallback) {
        _motionCallback(_id, sample);
    }
}

// =============================================================================
// CLOCK CORRECTION
// =============================================================================

void DeviceSession::setSyncState(SyncState syncState) {
    if (_disposed) {
        return;
    }
    LOG_INFO("SESSION", "%s: sync %s -> %s", _name.c_str(), syncStateToString(_syncState),
             syncStateToString(syncState));
    _syncState = syncState;

    // A reset device clock invalidates any offset measured against it
    if (syncState == SyncState::UNSYNCED) {
        _hasClockOffset = false;
        _clockOffsetMs = 0.0;
    }
}

void DeviceSession::setHardwareClockOffset(double offsetMs) {
    if (_disposed) {
        return;
    }
    _clockOffsetMs = offsetMs;
    _hasClockOffset = true;
}

bool DeviceSession::applySoftwareOffset(double offsetMs) {
    if (_disposed) {
        return false;
    }
    if (_syncState == SyncState::FULLY_SYNCED) {
        LOG_INFO("SESSION", "%s: device clock already corrected, software offset skipped", _name.c_str());
        return false;
    }
    _clockOffsetMs = offsetMs;
    _hasClockOffset = true;
    return true;
}

uint64_t DeviceSession::correctDeviceTimestamp(uint64_t rawDeviceClock) const {
    uint64_t deviceMs = _deviceClockInMicros ? rawDeviceClock / 1000 : rawDeviceClock;

    // Hardware-corrected devices already stream reference time
    if (_syncState == SyncState::FULLY_SYNCED || !_hasClockOffset) {
        return deviceMs;
    }

    double corrected = (double)deviceMs + _clockOffsetMs;
    return corrected > 0.0 ? (uint64_t)(corrected + 0.5) : 0;
}

// =============================================================================
// STATUS
// =============================================================================

SessionStatus DeviceSession::getStatus() const {
    SessionStatus status;
    status.id = _id;
    status.name = _name;
    status.state = state();
    status.streaming = _streaming;
    status.battery = _battery;
    status.syncState = _syncState;
    status.hasClockOffset = _hasClockOffset;
    status.clockOffsetMs = _clockOffsetMs;
    status.packetsReceived = _packetsReceived;
    status.packetsDropped = _packetsDropped;
    return status;
}

void DeviceSession::post(DeviceEventKind kind, const std::string& detail) {
    if (_disposed || !_events) {
        return;
    }
    _events->post(DeviceEvent(_id, kind, detail, _battery));
}
