/**
 * @file config.h
 * @brief MotionBridge configuration - UUIDs, protocol constants, timing and retry parameters
 * @version 2.0.0
 * @platform Adafruit Feather nRF52840 Express / Linux (BlueZ)
 */

#ifndef CONFIG_H
#define CONFIG_H

#include "platform.h"

// =============================================================================
// FIRMWARE VERSION
// =============================================================================

#define FIRMWARE_VERSION "2.0.0"
#define FIRMWARE_NAME "MotionBridge"

// =============================================================================
// SENSOR GATT LAYOUT
// =============================================================================

// TropX / Muse sensor service and characteristics
#define SENSOR_SERVICE_UUID       "c8c0a708-e361-4b5e-a365-98fa6b0a836f"
#define SENSOR_COMMAND_CHAR_UUID  "d5913036-2d8a-41ee-85b9-4e361aa5c8a7"
#define SENSOR_DATA_CHAR_UUID     "09bf2c52-d1d9-c0b7-4145-475964544307"

// Standard battery service (informational, the sensor reports battery via commands)
#define BATTERY_SERVICE_UUID      "180f"

// =============================================================================
// DISCOVERY FILTER
// =============================================================================

// Case-insensitive substrings matched against advertised names
#define SCAN_NAME_FILTERS         { "tropx", "muse" }
#define SCAN_MIN_RSSI_DBM         -80
#define SCAN_DEFAULT_TIMEOUT_MS   10000

// =============================================================================
// FLEET LIMITS
// =============================================================================

#define MAX_FLEET_DEVICES         8
#define MAX_CENTRAL_LINKS         4     // Bluefruit concurrent central connections

// =============================================================================
// PROTOCOL COMMANDS
// =============================================================================

#define CMD_STATE                 0x02
#define CMD_BATTERY               0x07
#define CMD_DATETIME              0x0B
#define CMD_SET_CLOCK_OFFSET      0x31
#define CMD_ENTER_TIMESYNC        0x32
#define CMD_EXIT_TIMESYNC         0x33
#define CMD_READ_MASK             0x80

// Response frame layout: [type, length, echoed command, error status, payload...]
#define RESPONSE_TYPE_INDEX       0
#define RESPONSE_LENGTH_INDEX     1
#define RESPONSE_ECHO_INDEX       2
#define RESPONSE_STATUS_INDEX     3
#define RESPONSE_PAYLOAD_INDEX    4
#define RESPONSE_MIN_LENGTH       4
#define TIMESTAMP_RESPONSE_LENGTH 10

// =============================================================================
// DEVICE STATES (CMD_STATE payload)
// =============================================================================

#define DEVICE_STATE_IDLE         0x02
#define DEVICE_STATE_STREAM_LOG   0x04
#define DEVICE_STATE_STREAMING    0x08
#define DEVICE_STATE_RECORDING    0x0C

// =============================================================================
// DATA MODES (3-byte little-endian mode field)
// =============================================================================

#define DATA_MODE_GYRO            0x000001
#define DATA_MODE_ACCEL           0x000002
#define DATA_MODE_IMU             0x000003
#define DATA_MODE_MAG             0x000004
#define DATA_MODE_9DOF            0x000007
#define DATA_MODE_QUATERNION      0x000010
#define DATA_MODE_TIMESTAMP       0x400000

#define STREAM_DATA_MODE          (DATA_MODE_QUATERNION | DATA_MODE_TIMESTAMP)

// =============================================================================
// SAMPLING FREQUENCY CODES
// =============================================================================

#define FREQ_25_HZ                0x01
#define FREQ_50_HZ                0x02
#define FREQ_100_HZ               0x04
#define FREQ_200_HZ               0x08
#define FREQ_400_HZ               0x10
#define FREQ_800_HZ               0x20
#define FREQ_1600_HZ              0x40

#define STREAM_DEFAULT_FREQUENCY  FREQ_100_HZ

// =============================================================================
// MOTION PACKET LAYOUT
// =============================================================================

#define PACKET_HEADER_SIZE        8
#define PACKET_QUATERNION_SIZE    6
#define PACKET_TIMESTAMP_SIZE     6
#define QUATERNION_SCALE          (1.0f / 32767.0f)

// =============================================================================
// SESSION TIMING
// =============================================================================

#define COMMAND_RESPONSE_TIMEOUT_MS   2000
#define BATTERY_POLL_INTERVAL_MS      30000
#define SERVICE_DISCOVERY_RETRY_MS    500
#define CONNECTION_SETTLE_MS          200

// =============================================================================
// PLATFORM TIMING PROFILES
// =============================================================================

// Bluefruit (SoftDevice central)
#define BLUEFRUIT_CONNECT_TIMEOUT_MS      30000
#define BLUEFRUIT_GATT_RETRY_ATTEMPTS     2
#define BLUEFRUIT_GATT_RETRY_DELAY_MS     300
#define BLUEFRUIT_INTER_CONNECTION_MS     0

// BlueZ (D-Bus)
#define BLUEZ_CONNECT_TIMEOUT_MS          60000
#define BLUEZ_GATT_RETRY_ATTEMPTS         3
#define BLUEZ_GATT_RETRY_DELAY_MS         500
#define BLUEZ_INTER_CONNECTION_MS         200
#define BLUEZ_STATE_VERIFY_TIMEOUT_MS     10000

// =============================================================================
// TIME SYNCHRONIZATION
// =============================================================================

#define TIMESYNC_SAMPLE_COUNT             20
#define TIMESYNC_MIN_VALID_SAMPLES        5
#define TIMESYNC_SAMPLE_RETRIES           3
#define TIMESYNC_RETRY_DELAY_MS           100
#define TIMESYNC_SAMPLE_GAP_MS            10

// Counters below this value are milliseconds, above it microseconds
#define DEVICE_CLOCK_MICROS_THRESHOLD     100000000000000ULL

// =============================================================================
// SETTINGS PERSISTENCE
// =============================================================================

#define SETTINGS_FILE             "/bridge_settings.dat"
#define SETTINGS_MAGIC            0xB7
#define SETTINGS_VERSION          1

// =============================================================================
// SERIAL CONSOLE
// =============================================================================

#define SERIAL_BAUD_RATE          115200
#define STATUS_PRINT_INTERVAL_MS  5000

#endif // CONFIG_H
