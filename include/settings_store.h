/**
 * @file settings_store.h
 * @brief Bridge settings - Runtime configuration persisted as a binary record
 * @version 2.0.0
 * @platform Adafruit Feather nRF52840 Express / Linux (BlueZ)
 *
 * Settings live in a single packed record validated by magic byte and
 * version. On the device the record is stored on InternalFS (LittleFS);
 * the Linux gateway keeps it in a regular file.
 *
 * Values that fail validation on load fall back to their defaults.
 */

#ifndef SETTINGS_STORE_H
#define SETTINGS_STORE_H

#include "config.h"
#include "types.h"
#include <string>

// =============================================================================
// LIMITS
// =============================================================================

#define SETTINGS_RSSI_MIN           -100
#define SETTINGS_RSSI_MAX           -20
#define SETTINGS_SCAN_TIMEOUT_MIN   1000
#define SETTINGS_SCAN_TIMEOUT_MAX   120000

// =============================================================================
// SETTINGS
// =============================================================================

/**
 * @brief Runtime-adjustable bridge configuration
 */
struct BridgeSettings {
    int8_t minRssi;             // Scan filter threshold (dBm)
    uint32_t scanTimeoutMs;     // Default scan window
    uint8_t frequencyCode;      // Streaming rate (FREQ_* code)
    bool autoTimeSync;          // Synchronize clocks after each connect
    bool debugMode;             // Verbose console output

    BridgeSettings() :
        minRssi(SCAN_MIN_RSSI_DBM),
        scanTimeoutMs(SCAN_DEFAULT_TIMEOUT_MS),
        frequencyCode(STREAM_DEFAULT_FREQUENCY),
        autoTimeSync(true),
        debugMode(false) {}
};

/**
 * @brief On-disk settings record
 */
struct __attribute__((packed)) SettingsRecord {
    uint8_t magic;              // SETTINGS_MAGIC
    uint8_t version;            // SETTINGS_VERSION
    int8_t minRssi;
    uint32_t scanTimeoutMs;
    uint8_t frequencyCode;
    uint8_t autoTimeSync;       // 0 or 1
    uint8_t debugMode;          // 0 or 1
    uint8_t reserved[4];        // Future use
};

// =============================================================================
// SETTINGS STORE
// =============================================================================

class SettingsStore {
public:
    /**
     * @param path Storage location (file name on InternalFS, or host path)
     */
    explicit SettingsStore(const char* path = SETTINGS_FILE);

    /**
     * @brief Mount storage and optionally load saved settings
     * @return true when storage is available
     */
    bool begin(bool loadFromStorage = true);

    bool save();
    bool load();

    void resetToDefaults();

    const BridgeSettings& settings() const { return _settings; }
    bool isStorageAvailable() const { return _storageAvailable; }

    // =========================================================================
    // VALIDATED SETTERS
    // =========================================================================

    Result setMinRssi(int16_t dbm);
    Result setScanTimeoutMs(uint32_t timeoutMs);
    Result setFrequencyCode(uint8_t code);
    void setAutoTimeSync(bool enabled) { _settings.autoTimeSync = enabled; }
    void setDebugMode(bool enabled) { _settings.debugMode = enabled; }

    static bool isValidRssi(int16_t dbm) { return dbm >= SETTINGS_RSSI_MIN && dbm <= SETTINGS_RSSI_MAX; }
    static bool isValidScanTimeout(uint32_t ms) {
        return ms >= SETTINGS_SCAN_TIMEOUT_MIN && ms <= SETTINGS_SCAN_TIMEOUT_MAX;
    }

    /**
     * @brief Apply a record, keeping defaults for out-of-range fields
     * @return false if magic or version does not match
     */
    bool applyRecord(const SettingsRecord& record);
    SettingsRecord toRecord() const;

private:
    std::string _path;
    BridgeSettings _settings;
    bool _storageAvailable;

    bool mountStorage();
    bool writeRecord(const SettingsRecord& record);
    bool readRecord(SettingsRecord& record);
};

#endif // SETTINGS_STORE_H
