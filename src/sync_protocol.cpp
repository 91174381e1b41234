/**
 * @file sync_protocol.cpp
 * @brief Round-trip clock offset estimation - Implementation
 * @version 2.0.0
 * @platform Adafruit Feather nRF52840 Express / Linux (BlueZ)
 */

#include "sync_protocol.h"
#include <string.h>

ClockOffsetEstimator::ClockOffsetEstimator() :
    _sampleCount(0)
{
    memset(_offsets, 0, sizeof(_offsets));
    memset(_rtts, 0, sizeof(_rtts));
}

double ClockOffsetEstimator::calculateMidpointOffset(uint64_t t1, uint64_t counterMs, uint64_t t3) {
    // Keep the subtraction in integers, epoch-ms values lose precision in double sums
    int64_t span = (int64_t)(t3 - t1);
    int64_t base = (int64_t)(t1 - counterMs);
    return (double)base + (double)span / 2.0;
}

bool ClockOffsetEstimator::addSample(const TimeSyncSample& sample) {
    if (sample.masterAfterMs < sample.masterBeforeMs) {
        return false;
    }
    if (_sampleCount >= MAX_SAMPLES) {
        return false;
    }

    _offsets[_sampleCount] = calculateMidpointOffset(sample.masterBeforeMs,
                                                     sample.deviceCounterMs,
                                                     sample.masterAfterMs);
    _rtts[_sampleCount] = (double)(sample.masterAfterMs - sample.masterBeforeMs);
    _sampleCount++;
    return true;
}

bool ClockOffsetEstimator::addSampleWithQuality(const TimeSyncSample& sample, uint32_t maxRttMs) {
    if (sample.masterAfterMs < sample.masterBeforeMs) {
        return false;
    }
    if (sample.masterAfterMs - sample.masterBeforeMs > maxRttMs) {
        return false;
    }
    return addSample(sample);
}

ClockOffsetEstimate ClockOffsetEstimator::estimate() const {
    ClockOffsetEstimate result;
    if (_sampleCount == 0) {
        return result;
    }

    result.offsetMs = median(_offsets, _sampleCount);

    double rttSum = 0.0;
    for (uint8_t i = 0; i < _sampleCount; i++) {
        rttSum += _rtts[i];
    }
    result.averageRttMs = rttSum / _sampleCount;
    result.sampleCount = _sampleCount;
    return result;
}

double ClockOffsetEstimator::getMeanOffset() const {
    if (_sampleCount == 0) {
        return 0.0;
    }
    double sum = 0.0;
    for (uint8_t i = 0; i < _sampleCount; i++) {
        sum += _offsets[i];
    }
    return sum / _sampleCount;
}

void ClockOffsetEstimator::reset() {
    memset(_offsets, 0, sizeof(_offsets));
    memset(_rtts, 0, sizeof(_rtts));
    _sampleCount = 0;
}

double ClockOffsetEstimator::median(const double* values, uint8_t count) {
    double sorted[MAX_SAMPLES];
    for (uint8_t i = 0; i < count; i++) {
        sorted[i] = values[i];
    }

    // Simple insertion sort (small array, O(n^2) is fine)
    for (uint8_t i = 1; i < count; i++) {
        double key = sorted[i];
        int8_t j = static_cast<int8_t>(i - 1);
        while (j >= 0 && sorted[j] > key) {
            sorted[j + 1] = sorted[j];
            j--;
        }
        sorted[j + 1] = key;
    }

    if (count % 2 == 0) {
        // Even count: average of two middle values
        uint8_t mid = count / 2;
        return (sorted[mid - 1] + sorted[mid]) / 2.0;
    }
    return sorted[count / 2];
}
