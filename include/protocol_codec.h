/**
 * @file protocol_codec.h
 * @brief Sensor wire protocol - Command frame builders and response/packet decoders
 * @version 2.0.0
 * @platform Adafruit Feather nRF52840 Express / Linux (BlueZ)
 *
 * Command frames are [commandType, payloadLength, payload...].
 * Response frames are [type, length, echoedCommand, errorStatus, payload...].
 *
 * All functions are stateless. Decoders never zero-fill: a short or
 * mismatched buffer is reported as ERROR_PROTOCOL and outputs are untouched.
 */

#ifndef PROTOCOL_CODEC_H
#define PROTOCOL_CODEC_H

#include "config.h"
#include "types.h"
#include <vector>

typedef std::vector<uint8_t> ByteBuffer;

// =============================================================================
// COMMAND BUILDERS
// =============================================================================

/**
 * @brief Build a raw command frame
 * @param type Command byte (already OR'd with CMD_READ_MASK for reads)
 * @param payload Payload bytes (may be nullptr when length is 0)
 * @param length Payload length
 */
ByteBuffer buildCommand(uint8_t type, const uint8_t* payload, uint8_t length);

/**
 * @brief Read variant of a command (sets CMD_READ_MASK)
 */
inline uint8_t readCommand(uint8_t command) {
    return static_cast<uint8_t>(command | CMD_READ_MASK);
}

ByteBuffer buildSetStateCommand(uint8_t deviceState);

/**
 * @brief Start streaming: [CMD_STATE, 5, STREAMING, mode(3 LE), frequency]
 */
ByteBuffer buildStartStreamCommand(uint32_t dataMode, uint8_t frequencyCode);

ByteBuffer buildStopStreamCommand();
ByteBuffer buildGetBatteryCommand();
ByteBuffer buildGetSystemStateCommand();

/**
 * @brief Set device RTC: [CMD_DATETIME, 4, unixSeconds(4 LE)]
 */
ByteBuffer buildSetDateTimeCommand(uint32_t unixSeconds);

ByteBuffer buildEnterTimeSyncCommand();
ByteBuffer buildExitTimeSyncCommand();
ByteBuffer buildGetTimestampCommand();

/**
 * @brief Write hardware clock offset: [CMD_SET_CLOCK_OFFSET, 8, offset(8 LE signed)]
 */
ByteBuffer buildSetClockOffsetCommand(int64_t offset);

// =============================================================================
// RESPONSE DECODERS
// =============================================================================

/**
 * @brief Validate a generic acknowledgement
 * @param expectedCommand Command byte the reply must echo
 * @param errorCode Receives the device error status when the frame is well formed
 * @return OK if echo matches and status is 0, ERROR_SYNC if the device
 *         reported a non-zero status, ERROR_PROTOCOL for malformed/stale frames
 */
Result decodeAck(const uint8_t* data, size_t length, uint8_t expectedCommand, uint8_t* errorCode = nullptr);

/**
 * @brief Decode a battery reply (echo 0x87, percentage at payload[0])
 */
Result decodeBatteryResponse(const uint8_t* data, size_t length, uint8_t& percent);

/**
 * @brief Decode a system-state reply (echo 0x82, state at payload[0])
 */
Result decodeSystemStateResponse(const uint8_t* data, size_t length, uint8_t& state);

/**
 * @brief Decode a GET_TIMESTAMP reply (echo 0xB2, 48-bit LE counter)
 */
Result decodeTimestampResponse(const uint8_t* data, size_t length, uint64_t& counter);

// =============================================================================
// MOTION PACKETS
// =============================================================================

/**
 * @brief Decoded streaming packet
 */
struct MotionPacket {
    Quaternion quaternion;
    bool hasDeviceClock;
    uint64_t deviceClock;   // Raw 48-bit device counter (firmware units)

    MotionPacket() : hasDeviceClock(false), deviceClock(0) {}
};

/**
 * @brief Exact packet length produced by the firmware for a data mode
 */
size_t expectedPacketSize(uint32_t dataMode);

/**
 * @brief Decode a streaming packet for the active data mode
 * @return OK, ERROR_PACKET_SIZE on length mismatch, ERROR_INVALID_PARAM
 *         if the mode carries no quaternion
 */
Result decodeMotionPacket(const uint8_t* data, size_t length, uint32_t dataMode, MotionPacket& packet);

/**
 * @brief Rebuild the scalar part of a unit quaternion
 *
 * w = sqrt(max(0, 1 - x^2 - y^2 - z^2)); quantization noise that pushes the
 * vector norm above 1 yields exactly 0 instead of NaN.
 */
float reconstructQuaternionW(float x, float y, float z);

// =============================================================================
// HELPERS
// =============================================================================

uint64_t readUint48LE(const uint8_t* data);

/**
 * @brief Map a sample rate in Hz to its frequency code (0 if unsupported)
 */
uint8_t frequencyCodeForHz(uint16_t hz);

/**
 * @brief Map a frequency code to Hz (0 if unknown)
 */
uint16_t frequencyHzForCode(uint8_t code);

inline const char* deviceStateToString(uint8_t state) {
    switch (state) {
        case DEVICE_STATE_IDLE: return "IDLE";
        case DEVICE_STATE_STREAM_LOG: return "STREAM_LOG";
        case DEVICE_STATE_STREAMING: return "STREAMING";
        case DEVICE_STATE_RECORDING: return "RECORDING";
        default: return "UNKNOWN";
    }
}

#endif // PROTOCOL_CODEC_H
