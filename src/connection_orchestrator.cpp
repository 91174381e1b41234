/**
 * @file connection_orchestrator.cpp
 * @brief Connection orchestrator - Implementation
 * @version 2.0.0
 * @platform Adafruit Feather nRF52840 Express / Linux (BlueZ)
 */

#include "connection_orchestrator.h"
#include "config.h"
#include "log.h"

// =============================================================================
// CONSTRUCTOR
// =============================================================================

ConnectionOrchestrator::ConnectionOrchestrator(BleAdapter& adapter, EventChannel* events) :
    _adapter(adapter),
    _events(events),
    _inFlight(false),
    _settleTimer(TimerScheduler::INVALID_ID),
    _radioState(RadioState::IDLE),
    _resumeScan(false),
    _scanTimeoutMs(0),
    _scanStartedAt(0)
{
}

void ConnectionOrchestrator::begin() {
    _adapter.setConnectionGate([this]() { return _inFlight; });
    _adapter.setScanCompleteHandler([this]() {
        if (_radioState == RadioState::SCANNING) {
            setRadioState(RadioState::IDLE);
        }
        if (_scanCompleteHandler) {
            _scanCompleteHandler();
        }
    });
}

uint32_t ConnectionOrchestrator::settleDelayMs() const {
    uint32_t platformDelay = _adapter.timing().interConnectionDelayMs;
    return platformDelay > CONNECTION_SETTLE_MS ? platformDelay : CONNECTION_SETTLE_MS;
}

// =============================================================================
// CONNECT QUEUE
// =============================================================================

void ConnectionOrchestrator::enqueue(const std::string& deviceId, ConnectCallback callback) {
    if (isQueued(deviceId) || isInFlight(deviceId)) {
        LOG_WARN("ORCH", "%s: connection already in progress", deviceId.c_str());
        callback(ConnectOutcome(false, deviceId, "Connection already in progress", Result::ERROR_BUSY));
        return;
    }

    Request request;
    request.deviceId = deviceId;
    request.callback = std::move(callback);
    _queue.push_back(std::move(request));

    LOG_INFO("ORCH", "%s: queued (%u pending)", deviceId.c_str(), (unsigned)_queue.size());
    pump();
}

void ConnectionOrchestrator::cancelPending() {
    std::deque<Request> pending;
    pending.swap(_queue);
    for (Request& request : pending) {
        request.callback(ConnectOutcome(false, request.deviceId, "Cancelled", Result::ERROR_DISABLED));
    }
}

bool ConnectionOrchestrator::isQueued(const std::string& deviceId) const {
    for (const Request& request : _queue) {
        if (request.deviceId == deviceId) {
            return true;
        }
    }
    return false;
}

bool ConnectionOrchestrator::isInFlight(const std::string& deviceId) const {
    return _inFlight && _current.deviceId == deviceId;
}

void ConnectionOrchestrator::pump() {
    if (_inFlight || scheduler.isActive(_settleTimer)) {
        return;
    }

    while (!_queue.empty()) {
        Request request = std::move(_queue.front());
        _queue.pop_front();

        PeripheralPtr peripheral = _adapter.getPeripheral(request.deviceId);
        if (!peripheral) {
            LOG_WARN("ORCH", "%s: not discovered", request.deviceId.c_str());
            request.callback(ConnectOutcome(false, request.deviceId, "Device not found", Result::ERROR_NOT_FOUND));
            continue;
        }

        SessionPtr existing = DeviceSession::find(request.deviceId);
        if (existing && (existing->state() == SessionState::CONNECTED ||
                         existing->state() == SessionState::STREAMING)) {
            request.callback(ConnectOutcome(true, request.deviceId, "Already connected", Result::OK));
            continue;
        }

        _current = std::move(request);
        _inFlight = true;
        suspendScan();
        setRadioState(RadioState::CONNECTING);

        SessionPtr session = DeviceSession::create(peripheral, _adapter.timing(), _events);
        if (_configurator) {
            _configurator(session);
        }

        std::string deviceId = _current.deviceId;
        session->connect([this, deviceId](Result result) {
            if (result == Result::OK) {
                finish(ConnectOutcome(true, deviceId, "Connected", result));
            } else {
                finish(ConnectOutcome(false, deviceId,
                                      std::string("Connection failed: ") + resultToString(result), result));
            }
        });
        return;
    }

    if (_resumeScan) {
        resumeScan();
    }
}

void ConnectionOrchestrator::finish(const ConnectOutcome& outcome) {
    if (!_inFlight || outcome.deviceId != _current.deviceId) {
        return;
    }

    _inFlight = false;
    ConnectCallback callback = std::move(_current.callback);
    _current = Request();
    setRadioState(RadioState::IDLE);

    uint32_t delayMs = settleDelayMs();
    if (outcome.success) {
        LOG_INFO("ORCH", "%s: connected, settling %lu ms", outcome.deviceId.c_str(), (unsigned long)delayMs);
    } else {
        LOG_WARN("ORCH", "%s: %s, settling %lu ms", outcome.deviceId.c_str(), outcome.message.c_str(),
                 (unsigned long)delayMs);
    }

    _settleTimer = scheduler.schedule(delayMs, [this]() {
        _settleTimer = TimerScheduler::INVALID_ID;
        pump();
    });
    bool settling = _settleTimer != TimerScheduler::INVALID_ID;

    if (callback) {
        callback(outcome);
    }

    // The queue must not stall when no timer was available
    if (!settling) {
        LOG_WARN("ORCH", "No timer for settle delay, continuing immediately");
        pump();
    }
}

// =============================================================================
// RADIO
// =============================================================================

Result ConnectionOrchestrator::startScan(uint32_t timeoutMs) {
    if (_inFlight) {
        LOG_WARN("ORCH", "Scan refused, connection in flight");
        return Result::ERROR_BUSY;
    }

    Result result = _adapter.startScan(timeoutMs);
    if (result != Result::OK) {
        LOG_ERROR("ORCH", "Scan start failed (%s)", resultToString(result));
        return result;
    }

    _scanTimeoutMs = timeoutMs;
    _scanStartedAt = platformMillis();
    setRadioState(RadioState::SCANNING);
    return Result::OK;
}

void ConnectionOrchestrator::stopScan() {
    _resumeScan = false;
    _adapter.stopScan();
    if (_radioState == RadioState::SCANNING) {
        setRadioState(RadioState::IDLE);
    }
}

void ConnectionOrchestrator::suspendScan() {
    if (!_adapter.isScanning()) {
        return;
    }

    if (_scanTimeoutMs == 0) {
        _resumeScan = true;
    } else {
        uint32_t elapsed = platformMillis() - _scanStartedAt;
        _resumeScan = elapsed < _scanTimeoutMs;
        _scanTimeoutMs = _resumeScan ? _scanTimeoutMs - elapsed : 0;
    }

    LOG_INFO("ORCH", "Scan suspended for connection");
    _adapter.stopScan();
}

void ConnectionOrchestrator::resumeScan() {
    _resumeScan = false;
    LOG_INFO("ORCH", "Resuming scan");
    Result result = startScan(_scanTimeoutMs);
    if (result != Result::OK) {
        LOG_WARN("ORCH", "Scan resume failed (%s)", resultToString(result));
    }
}

void ConnectionOrchestrator::setRadioState(RadioState state) {
    if (state == _radioState) {
        return;
    }
    LOG_DEBUG("ORCH", "Radio %s -> %s", radioStateToString(_radioState), radioStateToString(state));
    _radioState = state;
}
