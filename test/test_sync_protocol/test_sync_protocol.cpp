/**
 * @file test_sync_protocol.cpp
 * @brief Unit tests for sync_protocol - Midpoint offsets, median estimate and RTT
 */

#include <unity.h>
#include "sync_protocol.h"

// Include source file directly for native testing
#include "../../src/sync_protocol.cpp"

// Realistic host epoch (2023-11-14) so the integer math is exercised at scale
static const uint64_t BASE_MS = 1700000000000ULL;

// =============================================================================
// TEST FIXTURES
// =============================================================================

void setUp(void) {
}

void tearDown(void) {
}

// =============================================================================
// MIDPOINT OFFSET
// =============================================================================

void test_midpoint_offset_symmetric_delay(void) {
    // Device read its counter at t1 + 10, counter = host - 5000
    uint64_t t1 = BASE_MS;
    uint64_t t3 = BASE_MS + 20;
    uint64_t counter = BASE_MS + 10 - 5000;

    double offset = ClockOffsetEstimator::calculateMidpointOffset(t1, counter, t3);
    TEST_ASSERT_EQUAL_DOUBLE(5000.0, offset);
}

void test_midpoint_offset_half_millisecond(void) {
    double offset = ClockOffsetEstimator::calculateMidpointOffset(BASE_MS, BASE_MS, BASE_MS + 5);
    TEST_ASSERT_EQUAL_DOUBLE(2.5, offset);
}

void test_midpoint_offset_negative(void) {
    // Device clock ahead of the host
    double offset = ClockOffsetEstimator::calculateMidpointOffset(BASE_MS, BASE_MS + 1000 + 4, BASE_MS + 8);
    TEST_ASSERT_EQUAL_DOUBLE(-1000.0, offset);
}

// =============================================================================
// SAMPLE COLLECTION
// =============================================================================

void test_addSample_rejects_inverted_times(void) {
    ClockOffsetEstimator estimator;
    TEST_ASSERT_FALSE(estimator.addSample(TimeSyncSample(BASE_MS + 10, BASE_MS, BASE_MS)));
    TEST_ASSERT_EQUAL_UINT8(0, estimator.getSampleCount());
}

void test_addSample_rejects_when_full(void) {
    ClockOffsetEstimator estimator;
    for (uint8_t i = 0; i < ClockOffsetEstimator::MAX_SAMPLES; i++) {
        TEST_ASSERT_TRUE(estimator.addSample(TimeSyncSample(BASE_MS, BASE_MS, BASE_MS + 4)));
    }
    TEST_ASSERT_FALSE(estimator.addSample(TimeSyncSample(BASE_MS, BASE_MS, BASE_MS + 4)));
    TEST_ASSERT_EQUAL_UINT8(ClockOffsetEstimator::MAX_SAMPLES, estimator.getSampleCount());
}

void test_addSampleWithQuality_rejects_slow_round_trip(void) {
    ClockOffsetEstimator estimator;
    TEST_ASSERT_TRUE(estimator.addSampleWithQuality(TimeSyncSample(BASE_MS, BASE_MS, BASE_MS + 30), 50));
    TEST_ASSERT_FALSE(estimator.addSampleWithQuality(TimeSyncSample(BASE_MS, BASE_MS, BASE_MS + 300), 50));
    TEST_ASSERT_EQUAL_UINT8(1, estimator.getSampleCount());
}

void test_isValid_needs_minimum_samples(void) {
    ClockOffsetEstimator estimator;
    for (int i = 0; i < TIMESYNC_MIN_VALID_SAMPLES - 1; i++) {
        estimator.addSample(TimeSyncSample(BASE_MS, BASE_MS, BASE_MS + 10));
    }
    TEST_ASSERT_FALSE(estimator.isValid());

    estimator.addSample(TimeSyncSample(BASE_MS, BASE_MS, BASE_MS + 10));
    TEST_ASSERT_TRUE(estimator.isValid());
}

void test_reset_clears_samples(void) {
    ClockOffsetEstimator estimator;
    estimator.addSample(TimeSyncSample(BASE_MS, BASE_MS, BASE_MS + 10));
    estimator.reset();
    TEST_ASSERT_EQUAL_UINT8(0, estimator.getSampleCount());
    TEST_ASSERT_EQUAL_UINT8(0, estimator.estimate().sampleCount);
}

// =============================================================================
// ESTIMATE
// =============================================================================

void test_estimate_empty_is_zero(void) {
    ClockOffsetEstimator estimator;
    ClockOffsetEstimate est = estimator.estimate();
    TEST_ASSERT_EQUAL_DOUBLE(0.0, est.offsetMs);
    TEST_ASSERT_EQUAL_DOUBLE(0.0, est.averageRttMs);
    TEST_ASSERT_EQUAL_UINT8(0, est.sampleCount);
}

void test_estimate_median_odd_count(void) {
    ClockOffsetEstimator estimator;
    // Offsets 10, 30, 20 (RTT 0)
    estimator.addSample(TimeSyncSample(BASE_MS, BASE_MS - 10, BASE_MS));
    estimator.addSample(TimeSyncSample(BASE_MS, BASE_MS - 30, BASE_MS));
    estimator.addSample(TimeSyncSample(BASE_MS, BASE_MS - 20, BASE_MS));

    TEST_ASSERT_EQUAL_DOUBLE(20.0, estimator.estimate().offsetMs);
}

void test_estimate_median_even_count(void) {
    ClockOffsetEstimator estimator;
    estimator.addSample(TimeSyncSample(BASE_MS, BASE_MS - 10, BASE_MS));
    estimator.addSample(TimeSyncSample(BASE_MS, BASE_MS - 40, BASE_MS));
    estimator.addSample(TimeSyncSample(BASE_MS, BASE_MS - 20, BASE_MS));
    estimator.addSample(TimeSyncSample(BASE_MS, BASE_MS - 30, BASE_MS));

    TEST_ASSERT_EQUAL_DOUBLE(25.0, estimator.estimate().offsetMs);
}

void test_estimate_average_rtt(void) {
    ClockOffsetEstimator estimator;
    estimator.addSample(TimeSyncSample(BASE_MS, BASE_MS, BASE_MS + 10));
    estimator.addSample(TimeSyncSample(BASE_MS, BASE_MS, BASE_MS + 20));
    estimator.addSample(TimeSyncSample(BASE_MS, BASE_MS, BASE_MS + 30));

    ClockOffsetEstimate est = estimator.estimate();
    TEST_ASSERT_EQUAL_DOUBLE(20.0, est.averageRttMs);
    TEST_ASSERT_EQUAL_UINT8(3, est.sampleCount);
}

void test_estimate_median_resists_delayed_exchange(void) {
    // 19 clean round trips (RTT 10 ms, true offset 5000) and one exchange
    // whose reply was held back for a retransmission (RTT 100 ms).
    ClockOffsetEstimator estimator;
    for (int i = 0; i < 19; i++) {
        uint64_t t1 = BASE_MS + (uint64_t)i * 50;
        estimator.addSample(TimeSyncSample(t1, t1 + 5 - 5000, t1 + 10));
    }
    uint64_t slowT1 = BASE_MS + 19 * 50;
    // Counter read early, reply delayed: midpoint lands 45 ms late
    estimator.addSample(TimeSyncSample(slowT1, slowT1 + 5 - 5000, slowT1 + 100));

    ClockOffsetEstimate est = estimator.estimate();
    TEST_ASSERT_EQUAL_UINT8(20, est.sampleCount);
    TEST_ASSERT_EQUAL_DOUBLE(5000.0, est.offsetMs);

    // The mean is pulled by the outlier, the median is not
    double mean = estimator.getMeanOffset();
    TEST_ASSERT_TRUE(mean > 5002.0);
    TEST_ASSERT_DOUBLE_WITHIN(0.01, 5002.25, mean);
}

void test_estimate_with_jitter_within_tolerance(void) {
    ClockOffsetEstimator estimator;
    const int jitter[] = { 2, -1, 0, 1, -2, 1, 0, -1, 2, 0 };
    for (int i = 0; i < 10; i++) {
        uint64_t t1 = BASE_MS + (uint64_t)i * 20;
        estimator.addSample(TimeSyncSample(t1, t1 + 4 - 5000 + jitter[i], t1 + 8));
    }
    TEST_ASSERT_DOUBLE_WITHIN(2.0, 5000.0, estimator.estimate().offsetMs);
}

// =============================================================================
// TEST RUNNER
// =============================================================================

int main(int argc, char **argv) {
    (void)argc;
    (void)argv;
    UNITY_BEGIN();

    // Midpoint
    RUN_TEST(test_midpoint_offset_symmetric_delay);
    RUN_TEST(test_midpoint_offset_half_millisecond);
    RUN_TEST(test_midpoint_offset_negative);

    // Collection
    RUN_TEST(test_addSample_rejects_inverted_times);
    RUN_TEST(test_addSample_rejects_when_full);
    RUN_TEST(test_addSampleWithQuality_rejects_slow_round_trip);
    RUN_TEST(test_isValid_needs_minimum_samples);
    RUN_TEST(test_reset_clears_samples);

    // Estimate
    RUN_TEST(test_estimate_empty_is_zero);
    RUN_TEST(test_estimate_median_odd_count);
    RUN_TEST(test_estimate_median_even_count);
    RUN_TEST(test_estimate_average_rtt);
    RUN_TEST(test_estimate_median_resists_delayed_exchange);
    RUN_TEST(test_estimate_with_jitter_within_tolerance);

    return UNITY_END();
}
