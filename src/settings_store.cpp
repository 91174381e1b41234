/**
 * @file settings_store.cpp
 * @brief Bridge settings - Implementation
 * @version 2.0.0
 * @platform Adafruit Feather nRF52840 Express / Linux (BlueZ)
 */

#include "settings_store.h"
#include "log.h"
#include "protocol_codec.h"
#include <string.h>

#if defined(ARDUINO) || defined(NATIVE_TEST_BUILD)
#include <Adafruit_LittleFS.h>
#include <InternalFileSystem.h>

using namespace Adafruit_LittleFS_Namespace;
#else
#include <stdio.h>
#endif

// =============================================================================
// CONSTRUCTOR
// =============================================================================

SettingsStore::SettingsStore(const char* path) :
    _path(path ? path : SETTINGS_FILE),
    _storageAvailable(false)
{
}

// =============================================================================
// INITIALIZATION
// =============================================================================

bool SettingsStore::begin(bool loadFromStorage) {
    _storageAvailable = mountStorage();

    if (!_storageAvailable) {
        LOG_WARN("SETTINGS", "Storage not available, using defaults");
        return false;
    }

    LOG_INFO("SETTINGS", "Storage mounted (%s)", _path.c_str());
    if (loadFromStorage) {
        load();
    }
    return true;
}

void SettingsStore::resetToDefaults() {
    _settings = BridgeSettings();
    LOG_INFO("SETTINGS", "Reset to defaults");
}

// =============================================================================
// VALIDATED SETTERS
// =============================================================================

Result SettingsStore::setMinRssi(int16_t dbm) {
    if (!isValidRssi(dbm)) {
        return Result::ERROR_INVALID_PARAM;
    }
    _settings.minRssi = (int8_t)dbm;
    return Result::OK;
}

Result SettingsStore::setScanTimeoutMs(uint32_t timeoutMs) {
    if (!isValidScanTimeout(timeoutMs)) {
        return Result::ERROR_INVALID_PARAM;
    }
    _settings.scanTimeoutMs = timeoutMs;
    return Result::OK;
}

Result SettingsStore::setFrequencyCode(uint8_t code) {
    if (frequencyHzForCode(code) == 0) {
        return Result::ERROR_INVALID_PARAM;
    }
    _settings.frequencyCode = code;
    return Result::OK;
}

// =============================================================================
// RECORD CONVERSION
// =============================================================================

SettingsRecord SettingsStore::toRecord() const {
    SettingsRecord record;
    memset(&record, 0, sizeof(record));

    record.magic = SETTINGS_MAGIC;
    record.version = SETTINGS_VERSION;
    record.minRssi = _settings.minRssi;
    record.scanTimeoutMs = _settings.scanTimeoutMs;
    record.frequencyCode = _settings.frequencyCode;
    record.autoTimeSync = _settings.autoTimeSync ? 1 : 0;
    record.debugMode = _settings.debugMode ? 1 : 0;
    return record;
}

bool SettingsStore::applyRecord(const SettingsRecord& record) {
    if (record.magic != SETTINGS_MAGIC || record.version != SETTINGS_VERSION) {
        LOG_WARN("SETTINGS", "Invalid file format (magic 0x%02X, version %u)", record.magic, record.version);
        return false;
    }

    BridgeSettings defaults;

    // Reject values outside the accepted range, corrupted flash keeps defaults
    if (isValidRssi(record.minRssi)) {
        _settings.minRssi = record.minRssi;
    } else {
        LOG_WARN("SETTINGS", "Invalid minRssi %d, keeping default %d", record.minRssi, defaults.minRssi);
        _settings.minRssi = defaults.minRssi;
    }

    if (isValidScanTimeout(record.scanTimeoutMs)) {
        _settings.scanTimeoutMs = record.scanTimeoutMs;
    } else {
        LOG_WARN("SETTINGS", "Invalid scanTimeoutMs %lu, keeping default %lu",
                 (unsigned long)record.scanTimeoutMs, (unsigned long)defaults.scanTimeoutMs);
        _settings.scanTimeoutMs = defaults.scanTimeoutMs;
    }

    if (frequencyHzForCode(record.frequencyCode) != 0) {
        _settings.frequencyCode = record.frequencyCode;
    } else {
        LOG_WARN("SETTINGS", "Invalid frequency code 0x%02X, keeping default", record.frequencyCode);
        _settings.frequencyCode = defaults.frequencyCode;
    }

    _settings.autoTimeSync = (record.autoTimeSync != 0);
    _settings.debugMode = (record.debugMode != 0);

    LOG_INFO("SETTINGS", "RSSI >= %d dBm, scan %lu ms, %u Hz, auto-sync %s, debug %s",
             _settings.minRssi, (unsigned long)_settings.scanTimeoutMs,
             frequencyHzForCode(_settings.frequencyCode),
             _settings.autoTimeSync ? "on" : "off", _settings.debugMode ? "on" : "off");
    return true;
}

// =============================================================================
// PERSISTENCE
// =============================================================================

bool SettingsStore::save() {
    if (!_storageAvailable) {
        return false;
    }

    if (!writeRecord(toRecord())) {
        LOG_ERROR("SETTINGS", "Write failed");
        return false;
    }

    LOG_INFO("SETTINGS", "Saved");
    return true;
}

bool SettingsStore::load() {
    if (!_storageAvailable) {
        return false;
    }

    SettingsRecord record;
    if (!readRecord(record)) {
        return false;
    }

    return applyRecord(record);
}

#if defined(ARDUINO) || defined(NATIVE_TEST_BUILD)

bool SettingsStore::mountStorage() {
    return InternalFS.begin();
}

bool SettingsStore::writeRecord(const SettingsRecord& record) {
    File file(InternalFS);
    if (!file.open(_path.c_str(), FILE_O_WRITE)) {
        LOG_ERROR("SETTINGS", "Failed to open file for writing");
        return false;
    }

    // FILE_O_WRITE positions at EOF
    file.seek(0);

    size_t written = file.write((const uint8_t*)&record, sizeof(record));
    file.flush();
    file.close();
    return written == sizeof(record);
}

bool SettingsStore::readRecord(SettingsRecord& record) {
    if (!InternalFS.exists(_path.c_str())) {
        LOG_INFO("SETTINGS", "No settings file found");
        return false;
    }

    File file(InternalFS);
    if (!file.open(_path.c_str(), FILE_O_READ)) {
        LOG_ERROR("SETTINGS", "Failed to open file");
        return false;
    }

    size_t bytesRead = file.read((uint8_t*)&record, sizeof(record));
    file.close();

    if (bytesRead != sizeof(record)) {
        LOG_WARN("SETTINGS", "Truncated settings file (%u bytes)", (unsigned)bytesRead);
        return false;
    }
    return true;
}

#else

bool SettingsStore::mountStorage() {
    // A regular file needs no mounting
    return true;
}

bool SettingsStore::writeRecord(const SettingsRecord& record) {
    FILE* file = fopen(_path.c_str(), "wb");
    if (!file) {
        LOG_ERROR("SETTINGS", "Failed to open %s for writing", _path.c_str());
        return false;
    }

    size_t written = fwrite(&record, 1, sizeof(record), file);
    bool flushed = fflush(file) == 0;
    bool closed = fclose(file) == 0;
    return written == sizeof(record) && flushed && closed;
}

bool SettingsStore::readRecord(SettingsRecord& record) {
    FILE* file = fopen(_path.c_str(), "rb");
    if (!file) {
        LOG_INFO("SETTINGS", "No settings file found");
        return false;
    }

    size_t bytesRead = fread(&record, 1, sizeof(record), file);
    fclose(file);

    if (bytesRead != sizeof(record)) {
        LOG_WARN("SETTINGS", "Truncated settings file (%u bytes)", (unsigned)bytesRead);
        return false;
    }
    return true;
}

#endif
