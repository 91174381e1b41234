/**
 * @file platform.h
 * @brief Clock and console access shared by the firmware and the Linux gateway
 * @version 2.0.0
 * @platform Adafruit Feather nRF52840 Express / Linux (BlueZ)
 *
 * The firmware and native test builds go through the Arduino core
 * (millis(), Serial). The Linux gateway uses the C runtime.
 */

#ifndef PLATFORM_H
#define PLATFORM_H

#include <stdint.h>

#if defined(ARDUINO) || defined(NATIVE_TEST_BUILD)
#include <Arduino.h>
#define BRIDGE_PRINTF(...) Serial.printf(__VA_ARGS__)
#else
#include <stdio.h>
#define BRIDGE_PRINTF(...) printf(__VA_ARGS__)
#endif

/**
 * @brief Monotonic milliseconds since boot (wraps at 2^32)
 */
uint32_t platformMillis();

/**
 * @brief Host wall-clock time in Unix milliseconds
 *
 * On the device there is no RTC, so the value is derived from millis()
 * and the last platformSetEpochMs() call (0-based until set).
 */
uint64_t platformEpochMs();

/**
 * @brief Set the host wall clock (device builds only, ignored on Linux)
 */
void platformSetEpochMs(uint64_t epochMs);

#endif // PLATFORM_H
