/**
 * @file main.cpp
 * @brief MotionBridge Firmware - Main Application
 * @version 2.0.0
 * @platform Adafruit Feather nRF52840 Express
 *
 * BLE central bridge for TropX motion sensors:
 * - Scans for sensors and holds up to MAX_CENTRAL_LINKS links
 * - Streams quaternion samples to the USB serial host
 * - Synchronizes sensor clocks to the host clock
 *
 * Configuration:
 * - Settings persist on InternalFS (SET_* then SAVE over serial)
 * - Send "HELP" over serial for the command list
 * - Send "SET_EPOCH <ms>" to align the bridge clock with the host
 */

#include <Arduino.h>
#include <Adafruit_LittleFS.h>
#include <InternalFileSystem.h>
#include "config.h"
#include "types.h"
#include "log.h"
#include "bluefruit_transport.h"
#include "device_bridge.h"
#include "bridge_console.h"
#include "settings_store.h"
#include "timer_scheduler.h"

// =============================================================================
// GLOBAL INSTANCES
// =============================================================================

SettingsStore settingsStore(SETTINGS_FILE);
BluefruitTransport transport;
DeviceBridge bridge(transport);
BridgeConsole console(bridge);

// =============================================================================
// STATE VARIABLES
// =============================================================================

bool bridgeReady = false;
uint32_t lastStatusPrint = 0;

// Sample counter for the streaming summary in the status block
uint32_t samplesForwarded = 0;

// =============================================================================
// FUNCTION DECLARATIONS
// =============================================================================

void printBanner();
void onBridgeReady(Result result);
void onMotionData(const std::string& deviceId, const MotionSample& sample);
void onDeviceEvent(const DeviceEvent& event);
bool onSaveSettings(const BridgeSettings& settings);

// =============================================================================
// SETUP
// =============================================================================

void setup()
{
    // Initialize serial
    Serial.begin(SERIAL_BAUD_RATE);

    // Wait for serial with timeout
    uint32_t serialWaitStart = millis();
    while (!Serial && (millis() - serialWaitStart < 3000))
    {
        delay(10);
    }

    Serial.printf("\n[BOOT] Serial ready at millis=%lu\n", (unsigned long)millis());
    Serial.flush();

    printBanner();

    // Load persisted settings (defaults when storage is empty or invalid)
    Serial.println(F("\n--- Settings ---"));
    if (!settingsStore.begin(true))
    {
        Serial.println(F("[WARNING] InternalFS unavailable - using default settings"));
    }
    const BridgeSettings& settings = settingsStore.settings();
    Serial.printf("[SETTINGS] RSSI >= %d dBm | Scan %lu ms | Auto sync %s\n",
                  settings.minRssi, (unsigned long)settings.scanTimeoutMs,
                  settings.autoTimeSync ? "ON" : "OFF");

    // Host callbacks
    bridge.setMotionDataCallback(onMotionData);
    bridge.setDeviceEventCallback(onDeviceEvent);

    // Console
    console.setSaveHandler(onSaveSettings);

    // Initialize BLE central (completes from the scheduler)
    Serial.println(F("\n--- BLE Initialization ---"));
    bridge.begin(settings, onBridgeReady);

    Serial.println(F("\n+============================================================+"));
    Serial.println(F("|  Send 'SCAN_CONNECT' to connect all nearby sensors         |"));
    Serial.println(F("|  Send 'STREAM_ALL' to start streaming                      |"));
    Serial.println(F("|  Send 'HELP' for the full command list                     |"));
    Serial.println(F("+============================================================+"));
    Serial.println(F("|  Status printed every 5 seconds                           |"));
    Serial.println(F("+============================================================+\n"));
}

// =============================================================================
// LOOP
// =============================================================================

void loop()
{
    // Process millisecond timer callbacks (GATT operations, timeouts, retries)
    scheduler.update();

    // Drain BLE task events and deliver device events
    bridge.update();

    // Process Serial commands
    if (Serial.available())
    {
        String input = Serial.readStringUntil('\n');
        input.trim();
        if (input.length() > 0)
        {
            console.handleCommand(input.c_str());
        }
    }

    // Periodic status
    uint32_t now = millis();
    if (bridgeReady && now - lastStatusPrint >= STATUS_PRINT_INTERVAL_MS)
    {
        lastStatusPrint = now;
        bridge.printStatus();
        Serial.printf("[STATUS] Samples forwarded: %lu\n", (unsigned long)samplesForwarded);
    }

    yield();
}

// =============================================================================
// CALLBACKS
// =============================================================================

void onBridgeReady(Result result)
{
    bridgeReady = (result == Result::OK);

    if (bridgeReady)
    {
        Serial.println(F("[SUCCESS] BLE central initialized"));
    }
    else
    {
        Serial.printf("[FAILURE] BLE initialization failed: %s\n", resultToString(result));
    }
}

void onMotionData(const std::string& deviceId, const MotionSample& sample)
{
    samplesForwarded++;

    const Quaternion& q = sample.quaternion;
    Serial.printf("DATA:%s,%llu,%.4f,%.4f,%.4f,%.4f\n",
                  deviceId.c_str(),
                  (unsigned long long)sample.timestampMs,
                  q.w, q.x, q.y, q.z);
}

void onDeviceEvent(const DeviceEvent& event)
{
    if (event.kind == DeviceEventKind::BATTERY_UPDATE)
    {
        Serial.printf("EVENT:%s,%s,%d\n", event.deviceId.c_str(),
                      deviceEventKindToString(event.kind), event.battery);
        return;
    }

    Serial.printf("EVENT:%s,%s,%s\n", event.deviceId.c_str(),
                  deviceEventKindToString(event.kind), event.detail.c_str());
}

bool onSaveSettings(const BridgeSettings& settings)
{
    if (settingsStore.setMinRssi(settings.minRssi) != Result::OK ||
        settingsStore.setScanTimeoutMs(settings.scanTimeoutMs) != Result::OK ||
        settingsStore.setFrequencyCode(settings.frequencyCode) != Result::OK)
    {
        LOG_ERROR("SETTINGS", "Rejected settings on save");
        return false;
    }
    settingsStore.setAutoTimeSync(settings.autoTimeSync);
    settingsStore.setDebugMode(settings.debugMode);

    return settingsStore.save();
}

// =============================================================================
// HELPERS
// =============================================================================

void printBanner()
{
    Serial.println(F("\n"));
    Serial.println(F("+============================================================+"));
    Serial.println(F("|                  MotionBridge Firmware                     |"));
    Serial.println(F("+============================================================+"));
    Serial.printf("|  Firmware: %-47s |\n", FIRMWARE_VERSION);
    Serial.println(F("|  Platform: Adafruit Feather nRF52840 Express              |"));
    Serial.printf("|  Central links: %-42d |\n", MAX_CENTRAL_LINKS);
    Serial.println(F("+============================================================+"));
}
