/**
 * @file time_sync.h
 * @brief Hardware clock synchronization of sensor sessions
 * @version 2.0.0
 * @platform Adafruit Feather nRF52840 Express / Linux (BlueZ)
 *
 * Per session, after connection and before streaming:
 *   1. Read system state, return the sensor to IDLE if needed
 *   2. Set date-time to the shared reference instant     -> RTC_INITIALIZED
 *   3. Enter sync mode
 *   4. Collect round trips (t1, GET_TIMESTAMP, t3)
 *   5. Median offset, mean RTT                           -> OFFSET_COMPUTED
 *   6. Write the offset in device units (SET_CLOCK_OFFSET)
 *   7. Exit sync mode                                    -> FULLY_SYNCED
 *
 * Exit is attempted whenever a run fails after entering sync mode.
 */

#ifndef TIME_SYNC_H
#define TIME_SYNC_H

#include "device_session.h"
#include "sync_protocol.h"
#include <set>

typedef std::function<void(Result, const ClockOffsetEstimate&)> SyncCallback;

/**
 * @brief Per-device outcome of a fleet sync
 */
struct FleetSyncResult {
    std::string deviceId;
    Result result;
    ClockOffsetEstimate estimate;
};

typedef std::function<void(const std::vector<FleetSyncResult>&)> FleetSyncCallback;

class TimeSyncEngine {
public:
    TimeSyncEngine();

    /**
     * @brief Round trips per device (clamped to the estimator capacity)
     */
    void setSampleCount(uint8_t count);
    uint8_t getSampleCount() const { return _sampleCount; }

    /**
     * @brief Synchronize one session
     * @param referenceEpochMs Reference instant written as the device date-time
     * @return ERROR_BUSY if the session is already being synchronized,
     *         ERROR_NOT_CONNECTED if it is not in CONNECTED state
     */
    Result syncSession(const SessionPtr& session, uint64_t referenceEpochMs, SyncCallback callback);

    /**
     * @brief Synchronize sessions one after another against one reference instant
     */
    void syncFleet(const std::vector<SessionPtr>& sessions, FleetSyncCallback callback);

    bool isSyncing(const std::string& deviceId) const;
    size_t activeRuns() const { return _active.size(); }

    /**
     * @brief Convert an offset in ms to the device's clock units
     * @return ERROR_OUT_OF_RANGE if the value is not finite or does not fit int64
     */
    static Result offsetToDeviceUnits(double offsetMs, bool micros, int64_t& deviceUnits);

private:
    struct SyncRun;
    typedef std::shared_ptr<SyncRun> RunPtr;

    uint8_t _sampleCount;
    std::set<std::string> _active;

    void checkSystemState(const RunPtr& run);
    void setDateTime(const RunPtr& run);
    void enterSyncMode(const RunPtr& run);
    void collectSample(const RunPtr& run);
    void finishSampling(const RunPtr& run);
    void writeOffset(const RunPtr& run);
    void exitSyncMode(const RunPtr& run);
    void fail(const RunPtr& run, Result result, const char* step);
    void complete(const RunPtr& run, Result result);

    /**
     * @brief Send a command and check its acknowledgement
     */
    static void sendAcked(const SessionPtr& session, const ByteBuffer& frame, uint8_t expected,
                          ResultCallback callback);

    void syncNext(std::shared_ptr<std::vector<SessionPtr>> queue, size_t index, uint64_t referenceMs,
                  std::shared_ptr<std::vector<FleetSyncResult>> results, FleetSyncCallback callback);
};

#endif // TIME_SYNC_H
