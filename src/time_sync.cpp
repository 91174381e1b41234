/**
 * @file time_sync.cpp
 * @brief Hardware clock synchronization - Implementation
 * @version 2.0.0
 * @platform Adafruit Feather nRF52840 Express / Linux (BlueZ)
 */

#include "time_sync.h"
#include "log.h"
#include <cmath>

// =============================================================================
// RUN STATE
// =============================================================================

struct TimeSyncEngine::SyncRun {
    SessionPtr session;
    uint64_t referenceMs;
    SyncCallback callback;
    ClockOffsetEstimator estimator;
    ClockOffsetEstimate estimate;
    uint8_t sampleIndex;
    uint8_t attempt;
    bool inSyncMode;
    bool unitDetected;
    bool micros;

    SyncRun() :
        referenceMs(0), sampleIndex(0), attempt(0),
        inSyncMode(false), unitDetected(false), micros(false) {}
};

// =============================================================================
// CONSTRUCTOR
// =============================================================================

TimeSyncEngine::TimeSyncEngine() :
    _sampleCount(TIMESYNC_SAMPLE_COUNT)
{
}

void TimeSyncEngine::setSampleCount(uint8_t count) {
    if (count == 0) {
        count = 1;
    }
    if (count > ClockOffsetEstimator::MAX_SAMPLES) {
        count = ClockOffsetEstimator::MAX_SAMPLES;
    }
    _sampleCount = count;
}

bool TimeSyncEngine::isSyncing(const std::string& deviceId) const {
    return _active.find(deviceId) != _active.end();
}

// =============================================================================
// ENTRY POINTS
// =============================================================================

Result TimeSyncEngine::syncSession(const SessionPtr& session, uint64_t referenceEpochMs,
                                   SyncCallback callback) {
    if (!session) {
        return Result::ERROR_INVALID_PARAM;
    }
    if (session->isDisposed()) {
        return Result::ERROR_DISPOSED;
    }
    if (session->state() != SessionState::CONNECTED) {
        LOG_WARN("SYNC", "%s: not ready for sync (%s)", session->name().c_str(),
                 sessionStateToString(session->state()));
        return Result::ERROR_NOT_CONNECTED;
    }
    if (isSyncing(session->id())) {
        return Result::ERROR_BUSY;
    }

    _active.insert(session->id());

    RunPtr run = std::make_shared<SyncRun>();
    run->session = session;
    run->referenceMs = referenceEpochMs;
    run->callback = std::move(callback);

    // A previous offset no longer describes the device clock
    session->setSyncState(SyncState::UNSYNCED);

    LOG_INFO("SYNC", "%s: starting time sync (%u samples)", session->name().c_str(), _sampleCount);
    checkSystemState(run);
    return Result::OK;
}

void TimeSyncEngine::syncFleet(const std::vector<SessionPtr>& sessions, FleetSyncCallback callback) {
    uint64_t referenceMs = platformEpochMs();
    LOG_INFO("SYNC", "Fleet sync of %u devices, reference %llu ms", (unsigned)sessions.size(),
             (unsigned long long)referenceMs);

    auto queue = std::make_shared<std::vector<SessionPtr>>(sessions);
    auto results = std::make_shared<std::vector<FleetSyncResult>>();
    syncNext(queue, 0, referenceMs, results, std::move(callback));
}

void TimeSyncEngine::syncNext(std::shared_ptr<std::vector<SessionPtr>> queue, size_t index,
                              uint64_t referenceMs,
                              std::shared_ptr<std::vector<FleetSyncResult>> results,
                              FleetSyncCallback callback) {
    if (index >= queue->size()) {
        uint8_t synced = 0;
        for (const FleetSyncResult& r : *results) {
            if (r.result == Result::OK) {
                synced++;
            }
        }
        LOG_INFO("SYNC", "Fleet sync complete: %u/%u synced", synced, (unsigned)results->size());
        callback(*results);
        return;
    }

    SessionPtr session = (*queue)[index];
    std::string deviceId = session ? session->id() : std::string();

    Result started = syncSession(session, referenceMs,
        [this, queue, index, referenceMs, results, callback, deviceId](Result result,
                                                                       const ClockOffsetEstimate& estimate) {
            FleetSyncResult entry;
            entry.deviceId = deviceId;
            entry.result = result;
            entry.estimate = estimate;
            results->push_back(entry);
            syncNext(queue, index + 1, referenceMs, results, callback);
        });

    if (started != Result::OK) {
        LOG_WARN("SYNC", "%s: skipped (%s)", deviceId.c_str(), resultToString(started));
        FleetSyncResult entry;
        entry.deviceId = deviceId;
        entry.result = started;
        results->push_back(entry);
        syncNext(queue, index + 1, referenceMs, results, callback);
    }
}

// =============================================================================
// STEPS
// =============================================================================

void TimeSyncEngine::checkSystemState(const RunPtr& run) {
    run->session->readSystemState([this, run](Result result, uint8_t deviceState) {
        if (result != Result::OK) {
            fail(run, result, "read system state");
            return;
        }
        if (deviceState == DEVICE_STATE_IDLE) {
            setDateTime(run);
            return;
        }

        LOG_WARN("SYNC", "%s: device is %s, returning to IDLE", run->session->name().c_str(),
                 deviceStateToString(deviceState));
        sendAcked(run->session, buildSetStateCommand(DEVICE_STATE_IDLE), CMD_STATE,
                  [this, run](Result setResult) {
            if (setResult == Result::ERROR_DISPOSED) {
                fail(run, setResult, "set idle");
                return;
            }
            if (setResult != Result::OK) {
                LOG_WARN("SYNC", "%s: set idle returned %s", run->session->name().c_str(),
                         resultToString(setResult));
            }
            setDateTime(run);
        });
    });
}

void TimeSyncEngine::setDateTime(const RunPtr& run) {
    uint32_t seconds = (uint32_t)(run->referenceMs / 1000);
    sendAcked(run->session, buildSetDateTimeCommand(seconds), CMD_DATETIME, [this, run](Result result) {
        if (result != Result::OK) {
            fail(run, result, "set date-time");
            return;
        }
        run->session->setSyncState(SyncState::RTC_INITIALIZED);
        enterSyncMode(run);
    });
}

void TimeSyncEngine::enterSyncMode(const RunPtr& run) {
    sendAcked(run->session, buildEnterTimeSyncCommand(), CMD_ENTER_TIMESYNC, [this, run](Result result) {
        if (result != Result::OK) {
            fail(run, result, "enter sync mode");
            return;
        }
        run->inSyncMode = true;
        run->estimator.reset();
        run->sampleIndex = 0;
        run->attempt = 0;
        collectSample(run);
    });
}

void TimeSyncEngine::collectSample(const RunPtr& run) {
    if (run->session->isDisposed()) {
        fail(run, Result::ERROR_DISPOSED, "sampling");
        return;
    }
    if (!run->session->hasCharacteristics()) {
        fail(run, Result::ERROR_NOT_CONNECTED, "sampling");
        return;
    }

    uint64_t t1 = platformEpochMs();
    run->session->sendCommand(buildGetTimestampCommand(),
                              [this, run, t1](Result result, const ByteBuffer& reply) {
        uint64_t t3 = platformEpochMs();

        if (result == Result::ERROR_DISPOSED || result == Result::ERROR_NOT_CONNECTED) {
            fail(run, result, "sampling");
            return;
        }

        uint64_t counter = 0;
        if (result == Result::OK) {
            result = decodeTimestampResponse(reply.data(), reply.size(), counter);
        }

        if (result != Result::OK) {
            run->attempt++;
            if (run->attempt <= TIMESYNC_SAMPLE_RETRIES) {
                uint32_t delayMs = TIMESYNC_RETRY_DELAY_MS * run->attempt;
                LOG_WARN("SYNC", "%s: sample %u failed (%s), retry %u in %lu ms",
                         run->session->name().c_str(), run->sampleIndex, resultToString(result),
                         run->attempt, (unsigned long)delayMs);
                if (scheduler.schedule(delayMs, [this, run]() { collectSample(run); }) == TimerScheduler::INVALID_ID) {
                    fail(run, Result::ERROR_BUSY, "sample retry");
                }
                return;
            }
            LOG_WARN("SYNC", "%s: sample %u dropped", run->session->name().c_str(), run->sampleIndex);
        } else {
            if (!run->unitDetected) {
                run->micros = counter >= DEVICE_CLOCK_MICROS_THRESHOLD;
                run->unitDetected = true;
                run->session->setDeviceClockInMicros(run->micros);
                LOG_INFO("SYNC", "%s: device clock counts %s", run->session->name().c_str(),
                         run->micros ? "microseconds" : "milliseconds");
            }

            uint64_t counterMs = run->micros ? counter / 1000 : counter;
            if (!run->estimator.addSample(TimeSyncSample(t1, counterMs, t3))) {
                LOG_WARN("SYNC", "%s: sample %u rejected", run->session->name().c_str(), run->sampleIndex);
            } else {
                LOG_DEBUG("SYNC", "%s: sample %u offset=%.1f rtt=%llu", run->session->name().c_str(),
                          run->sampleIndex,
                          ClockOffsetEstimator::calculateMidpointOffset(t1, counterMs, t3),
                          (unsigned long long)(t3 - t1));
            }
        }

        run->sampleIndex++;
        run->attempt = 0;
        if (run->sampleIndex >= _sampleCount) {
            finishSampling(run);
            return;
        }
        if (scheduler.schedule(TIMESYNC_SAMPLE_GAP_MS, [this, run]() { collectSample(run); }) ==
            TimerScheduler::INVALID_ID) {
            fail(run, Result::ERROR_BUSY, "sample scheduling");
        }
    });
}

void TimeSyncEngine::finishSampling(const RunPtr& run) {
    if (!run->estimator.isValid()) {
        LOG_ERROR("SYNC", "%s: only %u valid samples (need %d)", run->session->name().c_str(),
                  run->estimator.getSampleCount(), TIMESYNC_MIN_VALID_SAMPLES);
        fail(run, Result::ERROR_SYNC, "sampling");
        return;
    }

    run->estimate = run->estimator.estimate();
    run->session->setSyncState(SyncState::OFFSET_COMPUTED);

    LOG_INFO("SYNC", "%s: median offset %.2f ms (mean %.2f ms), RTT %.2f ms, %u samples",
             run->session->name().c_str(), run->estimate.offsetMs, run->estimator.getMeanOffset(),
             run->estimate.averageRttMs, run->estimate.sampleCount);

    writeOffset(run);
}

void TimeSyncEngine::writeOffset(const RunPtr& run) {
    int64_t deviceUnits = 0;
    Result range = offsetToDeviceUnits(run->estimate.offsetMs, run->micros, deviceUnits);
    if (range != Result::OK) {
        fail(run, range, "offset range");
        return;
    }

    sendAcked(run->session, buildSetClockOffsetCommand(deviceUnits), CMD_SET_CLOCK_OFFSET,
              [this, run](Result result) {
        if (result != Result::OK) {
            fail(run, result, "set clock offset");
            return;
        }
        exitSyncMode(run);
    });
}

void TimeSyncEngine::exitSyncMode(const RunPtr& run) {
    run->inSyncMode = false;
    sendAcked(run->session, buildExitTimeSyncCommand(), CMD_EXIT_TIMESYNC, [this, run](Result result) {
        if (result != Result::OK) {
            fail(run, result, "exit sync mode");
            return;
        }
        run->session->setHardwareClockOffset(run->estimate.offsetMs);
        run->session->setSyncState(SyncState::FULLY_SYNCED);
        LOG_INFO("SYNC", "%s: fully synced", run->session->name().c_str());
        complete(run, Result::OK);
    });
}

void TimeSyncEngine::fail(const RunPtr& run, Result result, const char* step) {
    LOG_ERROR("SYNC", "%s: %s failed (%s)", run->session->name().c_str(), step, resultToString(result));

    if (!run->inSyncMode || run->session->isDisposed()) {
        complete(run, result);
        return;
    }

    // Leave the sensor in normal mode even though the run failed
    run->inSyncMode = false;
    sendAcked(run->session, buildExitTimeSyncCommand(), CMD_EXIT_TIMESYNC, [this, run, result](Result exitResult) {
        if (exitResult != Result::OK) {
            LOG_WARN("SYNC", "%s: exit after failure returned %s", run->session->name().c_str(),
                     resultToString(exitResult));
        }
        complete(run, result);
    });
}

void TimeSyncEngine::complete(const RunPtr& run, Result result) {
    _active.erase(run->session->id());
    SyncCallback callback = std::move(run->callback);
    run->callback = nullptr;
    if (callback) {
        callback(result, run->estimate);
    }
}

// =============================================================================
// HELPERS
// =============================================================================

void TimeSyncEngine::sendAcked(const SessionPtr& session, const ByteBuffer& frame, uint8_t expected,
                               ResultCallback callback) {
    session->sendCommand(frame, [expected, callback](Result result, const ByteBuffer& reply) {
        if (result != Result::OK) {
            callback(result);
            return;
        }
        uint8_t errorCode = 0;
        Result decoded = decodeAck(reply.data(), reply.size(), expected, &errorCode);
        if (decoded == Result::ERROR_SYNC) {
            LOG_WARN("SYNC", "Command 0x%02X rejected with device error 0x%02X", expected, errorCode);
        }
        callback(decoded);
    });
}

Result TimeSyncEngine::offsetToDeviceUnits(double offsetMs, bool micros, int64_t& deviceUnits) {
    double value = micros ? offsetMs * 1000.0 : offsetMs;

    // 2^63 is exactly representable, INT64_MAX is not
    if (!std::isfinite(value) || value >= 9223372036854775808.0 || value < -9223372036854775808.0) {
        return Result::ERROR_OUT_OF_RANGE;
    }

    deviceUnits = (int64_t)std::llround(value);
    return Result::OK;
}
