/**
 * @file connection_orchestrator.h
 * @brief Connection orchestrator - Serializes connection attempts across the fleet
 * @version 2.0.0
 * @platform Adafruit Feather nRF52840 Express / Linux (BlueZ)
 *
 * Connect requests are queued FIFO and run one at a time end-to-end
 * (link, discovery, initial battery read). While a request is in flight:
 * - the radio state is CONNECTING and the transport refuses new scans
 * - an active scan is suspended and resumed once the queue drains
 *
 * Every attempt, successful or not, is followed by a settle delay of
 * max(CONNECTION_SETTLE_MS, platform inter-connection delay).
 */

#ifndef CONNECTION_ORCHESTRATOR_H
#define CONNECTION_ORCHESTRATOR_H

#include "device_session.h"
#include <deque>

/**
 * @brief Hook run on each new session before it connects
 */
typedef std::function<void(const SessionPtr&)> SessionConfigurator;

class ConnectionOrchestrator {
public:
    ConnectionOrchestrator(BleAdapter& adapter, EventChannel* events);

    /**
     * @brief Install the connection gate and scan-complete hook on the adapter
     */
    void begin();

    // =========================================================================
    // CONNECT QUEUE
    // =========================================================================

    /**
     * @brief Queue a connection
     *
     * Requests for a device already queued or in flight complete
     * immediately with "Connection already in progress" (ERROR_BUSY).
     */
    void enqueue(const std::string& deviceId, ConnectCallback callback);

    /**
     * @brief Fail every queued (not in-flight) request with ERROR_DISABLED
     */
    void cancelPending();

    bool isQueued(const std::string& deviceId) const;
    bool isInFlight(const std::string& deviceId) const;
    bool isConnecting() const { return _inFlight; }
    size_t queueLength() const { return _queue.size(); }

    // =========================================================================
    // RADIO
    // =========================================================================

    /**
     * @brief Start a scan through the orchestrator
     * @return ERROR_BUSY while a connection is in flight
     */
    Result startScan(uint32_t timeoutMs);
    void stopScan();

    RadioState getRadioState() const { return _radioState; }

    void setSessionConfigurator(SessionConfigurator configurator) { _configurator = std::move(configurator); }
    void setScanCompleteHandler(std::function<void()> handler) { _scanCompleteHandler = std::move(handler); }

    /**
     * @brief Delay applied after every attempt
     */
    uint32_t settleDelayMs() const;

private:
    struct Request {
        std::string deviceId;
        ConnectCallback callback;
    };

    BleAdapter& _adapter;
    EventChannel* _events;
    std::deque<Request> _queue;
    Request _current;
    bool _inFlight;
    TimerId _settleTimer;
    RadioState _radioState;

    // Scan suspended for a connection
    bool _resumeScan;
    uint32_t _scanTimeoutMs;
    uint32_t _scanStartedAt;

    SessionConfigurator _configurator;
    std::function<void()> _scanCompleteHandler;

    void pump();
    void finish(const ConnectOutcome& outcome);
    void suspendScan();
    void resumeScan();
    void setRadioState(RadioState state);
};

#endif // CONNECTION_ORCHESTRATOR_H
