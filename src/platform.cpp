/**
 * @file platform.cpp
 * @brief Clock access - Implementation
 * @version 2.0.0
 */

#include "platform.h"

#if defined(ARDUINO) || defined(NATIVE_TEST_BUILD)

// millis() wraps every ~49 days, track the epoch relative to the last set point
static uint64_t _epochBaseMs = 0;
static uint64_t _elapsedAtLastRead = 0;
static uint32_t _lastMillis = 0;

uint32_t platformMillis() {
    return millis();
}

uint64_t platformEpochMs() {
    uint32_t now = millis();
    // Extend to 64 bits across wraps
    _elapsedAtLastRead += (uint32_t)(now - _lastMillis);
    _lastMillis = now;
    return _epochBaseMs + _elapsedAtLastRead;
}

void platformSetEpochMs(uint64_t epochMs) {
    _epochBaseMs = epochMs;
    _lastMillis = millis();
    _elapsedAtLastRead = 0;
}

#else

#include <chrono>

uint32_t platformMillis() {
    using namespace std::chrono;
    return (uint32_t)duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

uint64_t platformEpochMs() {
    using namespace std::chrono;
    return (uint64_t)duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

void platformSetEpochMs(uint64_t epochMs) {
    (void)epochMs;  // System clock is authoritative on Linux
}

#endif
