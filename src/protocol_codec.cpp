/**
 * @file protocol_codec.cpp
 * @brief Sensor wire protocol - Implementation
 * @version 2.0.0
 * @platform Adafruit Feather nRF52840 Express / Linux (BlueZ)
 */

#include "protocol_codec.h"
#include <math.h>

// =============================================================================
// COMMAND BUILDERS
// =============================================================================

ByteBuffer buildCommand(uint8_t type, const uint8_t* payload, uint8_t length) {
    ByteBuffer frame;
    frame.reserve(2 + length);
    frame.push_back(type);
    frame.push_back(length);
    for (uint8_t i = 0; i < length; i++) {
        frame.push_back(payload[i]);
    }
    return frame;
}

ByteBuffer buildSetStateCommand(uint8_t deviceState) {
    return buildCommand(CMD_STATE, &deviceState, 1);
}

ByteBuffer buildStartStreamCommand(uint32_t dataMode, uint8_t frequencyCode) {
    uint8_t payload[5];
    payload[0] = DEVICE_STATE_STREAMING;
    payload[1] = (uint8_t)(dataMode & 0xFF);
    payload[2] = (uint8_t)((dataMode >> 8) & 0xFF);
    payload[3] = (uint8_t)((dataMode >> 16) & 0xFF);
    payload[4] = frequencyCode;
    return buildCommand(CMD_STATE, payload, sizeof(payload));
}

ByteBuffer buildStopStreamCommand() {
    return buildSetStateCommand(DEVICE_STATE_IDLE);
}

ByteBuffer buildGetBatteryCommand() {
    return buildCommand(readCommand(CMD_BATTERY), nullptr, 0);
}

ByteBuffer buildGetSystemStateCommand() {
    return buildCommand(readCommand(CMD_STATE), nullptr, 0);
}

ByteBuffer buildSetDateTimeCommand(uint32_t unixSeconds) {
    uint8_t payload[4];
    for (uint8_t i = 0; i < 4; i++) {
        payload[i] = (uint8_t)((unixSeconds >> (8 * i)) & 0xFF);
    }
    return buildCommand(CMD_DATETIME, payload, sizeof(payload));
}

ByteBuffer buildEnterTimeSyncCommand() {
    return buildCommand(CMD_ENTER_TIMESYNC, nullptr, 0);
}

ByteBuffer buildExitTimeSyncCommand() {
    return buildCommand(CMD_EXIT_TIMESYNC, nullptr, 0);
}

ByteBuffer buildGetTimestampCommand() {
    return buildCommand(readCommand(CMD_ENTER_TIMESYNC), nullptr, 0);
}

ByteBuffer buildSetClockOffsetCommand(int64_t offset) {
    uint8_t payload[8];
    uint64_t raw = (uint64_t)offset;
    for (uint8_t i = 0; i < 8; i++) {
        payload[i] = (uint8_t)((raw >> (8 * i)) & 0xFF);
    }
    return buildCommand(CMD_SET_CLOCK_OFFSET, payload, sizeof(payload));
}

// =============================================================================
// RESPONSE DECODERS
// =============================================================================

Result decodeAck(const uint8_t* data, size_t length, uint8_t expectedCommand, uint8_t* errorCode) {
    if (data == nullptr || length < RESPONSE_MIN_LENGTH) {
        return Result::ERROR_PROTOCOL;
    }
    // Stale reply to an earlier command
    if (data[RESPONSE_ECHO_INDEX] != expectedCommand) {
        return Result::ERROR_PROTOCOL;
    }

    uint8_t status = data[RESPONSE_STATUS_INDEX];
    if (errorCode) {
        *errorCode = status;
    }
    return (status == 0x00) ? Result::OK : Result::ERROR_SYNC;
}

// Shared path for single-byte payload reads
static Result decodeByteResponse(const uint8_t* data, size_t length, uint8_t expectedCommand, uint8_t& value) {
    if (data == nullptr || length < RESPONSE_PAYLOAD_INDEX + 1) {
        return Result::ERROR_PROTOCOL;
    }
    if (data[RESPONSE_ECHO_INDEX] != expectedCommand) {
        return Result::ERROR_PROTOCOL;
    }
    if (data[RESPONSE_STATUS_INDEX] != 0x00) {
        return Result::ERROR_PROTOCOL;
    }
    value = data[RESPONSE_PAYLOAD_INDEX];
    return Result::OK;
}

Result decodeBatteryResponse(const uint8_t* data, size_t length, uint8_t& percent) {
    uint8_t value = 0;
    Result result = decodeByteResponse(data, length, readCommand(CMD_BATTERY), value);
    if (result != Result::OK) {
        return result;
    }
    if (value > 100) {
        return Result::ERROR_PROTOCOL;
    }
    percent = value;
    return Result::OK;
}

Result decodeSystemStateResponse(const uint8_t* data, size_t length, uint8_t& state) {
    return decodeByteResponse(data, length, readCommand(CMD_STATE), state);
}

Result decodeTimestampResponse(const uint8_t* data, size_t length, uint64_t& counter) {
    if (data == nullptr || length < TIMESTAMP_RESPONSE_LENGTH) {
        return Result::ERROR_PROTOCOL;
    }
    if (data[RESPONSE_ECHO_INDEX] != readCommand(CMD_ENTER_TIMESYNC)) {
        return Result::ERROR_PROTOCOL;
    }
    if (data[RESPONSE_STATUS_INDEX] != 0x00) {
        return Result::ERROR_SYNC;
    }
    counter = readUint48LE(data + RESPONSE_PAYLOAD_INDEX);
    return Result::OK;
}

// =============================================================================
// MOTION PACKETS
// =============================================================================

size_t expectedPacketSize(uint32_t dataMode) {
    size_t size = PACKET_HEADER_SIZE;
    if (dataMode & DATA_MODE_GYRO) size += 6;
    if (dataMode & DATA_MODE_ACCEL) size += 6;
    if (dataMode & DATA_MODE_MAG) size += 6;
    if (dataMode & DATA_MODE_QUATERNION) size += PACKET_QUATERNION_SIZE;
    if (dataMode & DATA_MODE_TIMESTAMP) size += PACKET_TIMESTAMP_SIZE;
    return size;
}

Result decodeMotionPacket(const uint8_t* data, size_t length, uint32_t dataMode, MotionPacket& packet) {
    if (!(dataMode & DATA_MODE_QUATERNION)) {
        return Result::ERROR_INVALID_PARAM;
    }
    if (data == nullptr || length != expectedPacketSize(dataMode)) {
        return Result::ERROR_PACKET_SIZE;
    }

    // Raw IMU blocks precede the quaternion when enabled
    size_t offset = PACKET_HEADER_SIZE;
    if (dataMode & DATA_MODE_GYRO) offset += 6;
    if (dataMode & DATA_MODE_ACCEL) offset += 6;
    if (dataMode & DATA_MODE_MAG) offset += 6;

    const uint8_t* q = data + offset;
    int16_t rawX = (int16_t)(q[0] | (q[1] << 8));
    int16_t rawY = (int16_t)(q[2] | (q[3] << 8));
    int16_t rawZ = (int16_t)(q[4] | (q[5] << 8));

    float x = rawX * QUATERNION_SCALE;
    float y = rawY * QUATERNION_SCALE;
    float z = rawZ * QUATERNION_SCALE;

    packet.quaternion = Quaternion(reconstructQuaternionW(x, y, z), x, y, z);
    packet.hasDeviceClock = (dataMode & DATA_MODE_TIMESTAMP) != 0;
    packet.deviceClock = packet.hasDeviceClock ?
        readUint48LE(q + PACKET_QUATERNION_SIZE) : 0;
    return Result::OK;
}

float reconstructQuaternionW(float x, float y, float z) {
    float remainder = 1.0f - x * x - y * y - z * z;
    if (!(remainder > 0.0f)) {
        return 0.0f;
    }
    return sqrtf(remainder);
}

// =============================================================================
// HELPERS
// =============================================================================

uint64_t readUint48LE(const uint8_t* data) {
    uint64_t value = 0;
    for (uint8_t i = 0; i < 6; i++) {
        value |= (uint64_t)data[i] << (8 * i);
    }
    return value;
}

uint8_t frequencyCodeForHz(uint16_t hz) {
    switch (hz) {
        case 25: return FREQ_25_HZ;
        case 50: return FREQ_50_HZ;
        case 100: return FREQ_100_HZ;
        case 200: return FREQ_200_HZ;
        case 400: return FREQ_400_HZ;
        case 800: return FREQ_800_HZ;
        case 1600: return FREQ_1600_HZ;
        default: return 0;
    }
}

uint16_t frequencyHzForCode(uint8_t code) {
    switch (code) {
        case FREQ_25_HZ: return 25;
        case FREQ_50_HZ: return 50;
        case FREQ_100_HZ: return 100;
        case FREQ_200_HZ: return 200;
        case FREQ_400_HZ: return 400;
        case FREQ_800_HZ: return 800;
        case FREQ_1600_HZ: return 1600;
        default: return 0;
    }
}
