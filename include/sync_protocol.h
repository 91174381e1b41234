/**
 * @file sync_protocol.h
 * @brief Round-trip clock offset estimation for sensor time synchronization
 * @version 2.0.0
 * @platform Adafruit Feather nRF52840 Express / Linux (BlueZ)
 *
 * Each GET_TIMESTAMP round trip yields a sample (t1, counter, t3) where t1/t3
 * are master times before send and after reply. Assuming symmetric delay the
 * device read its counter at the midpoint, so:
 *
 *   candidate offset = (t1 + t3) / 2 - counter
 *
 * The estimate is the median of candidates (one retransmitted or delayed
 * exchange cannot drag it) with the mean RTT reported as a diagnostic.
 *
 * Usage:
 *   ClockOffsetEstimator estimator;
 *   estimator.addSample(TimeSyncSample(t1, counterMs, t3));
 *   ...
 *   if (estimator.isValid()) {
 *       ClockOffsetEstimate est = estimator.estimate();
 *   }
 */

#ifndef SYNC_PROTOCOL_H
#define SYNC_PROTOCOL_H

#include "config.h"
#include "types.h"

// =============================================================================
// CLOCK OFFSET ESTIMATOR
// =============================================================================

class ClockOffsetEstimator {
public:
    static constexpr uint8_t MAX_SAMPLES = 32;

    ClockOffsetEstimator();

    /**
     * @brief Candidate offset for a single round trip
     * @return midpoint(t1, t3) - counter, in ms
     */
    static double calculateMidpointOffset(uint64_t t1, uint64_t counterMs, uint64_t t3);

    /**
     * @brief Add a sample
     * @return false if the sample is malformed (t3 < t1) or the buffer is full
     */
    bool addSample(const TimeSyncSample& sample);

    /**
     * @brief Add a sample with RTT-based quality filtering
     *
     * Samples with RTT above maxRttMs (retransmissions, missed connection
     * events) are rejected.
     *
     * @return true if sample was accepted
     */
    bool addSampleWithQuality(const TimeSyncSample& sample, uint32_t maxRttMs);

    /**
     * @brief Median offset plus mean RTT of the collected samples
     *
     * Returns a zeroed estimate with sampleCount 0 when no samples exist.
     */
    ClockOffsetEstimate estimate() const;

    /**
     * @brief Mean of the candidate offsets (diagnostics only)
     */
    double getMeanOffset() const;

    uint8_t getSampleCount() const { return _sampleCount; }

    /**
     * @brief Check if enough samples were collected for a trustworthy median
     */
    bool isValid() const { return _sampleCount >= TIMESYNC_MIN_VALID_SAMPLES; }

    void reset();

private:
    double _offsets[MAX_SAMPLES];   // Candidate offsets (ms)
    double _rtts[MAX_SAMPLES];      // Round-trip times (ms)
    uint8_t _sampleCount;

    static double median(const double* values, uint8_t count);
};

#endif // SYNC_PROTOCOL_H
