/**
 * @file bridge_console.h
 * @brief Bridge console - Line command processing for the serial / stdin console
 * @version 2.0.0
 * @platform Adafruit Feather nRF52840 Express / Linux (BlueZ)
 *
 * Commands (case-insensitive, one per line, arguments separated by spaces):
 * - Discovery: SCAN [ms], STOP_SCAN, LIST, SCAN_CONNECT
 * - Links: CONNECT <id>, CONNECT_ALL, DISCONNECT <id>, DISCONNECT_ALL, CLEAR_CACHE <addr>
 * - Streaming: STREAM <id>, STREAM_ALL, STOP <id>, STOP_ALL
 * - Clocks: SYNC [id], SET_EPOCH <ms>
 * - Settings: SET_RSSI <dBm>, SET_SCAN_TIMEOUT <ms>, SET_FREQ <hz>,
 *             SET_AUTOSYNC <0|1>, SET_DEBUG <0|1>, SETTINGS, SAVE
 * - System: STATUS, GET_VER, HELP
 *
 * Responses are KEY:VALUE lines. Asynchronous operations print their
 * outcome when they complete.
 */

#ifndef BRIDGE_CONSOLE_H
#define BRIDGE_CONSOLE_H

#include "device_bridge.h"

// =============================================================================
// CONSTANTS
// =============================================================================

#define CONSOLE_LINE_SIZE       128
#define CONSOLE_RESPONSE_SIZE   160

// =============================================================================
// CALLBACK TYPES
// =============================================================================

/**
 * @brief Receives one response line (without trailing newline)
 */
typedef std::function<void(const char* line)> ConsoleOutput;

/**
 * @brief Persists settings, returns false on storage failure
 */
typedef std::function<bool(const BridgeSettings& settings)> SettingsSaveHandler;

// =============================================================================
// BRIDGE CONSOLE CLASS
// =============================================================================

/**
 * @brief Line command controller for the bridge
 *
 * Usage:
 *   BridgeConsole console(bridge);
 *   console.setSaveHandler(saveSettings);
 *   console.handleCommand("CONNECT AA:BB:CC:DD:EE:01");
 */
class BridgeConsole {
public:
    explicit BridgeConsole(DeviceBridge& bridge);

    /**
     * @brief Replace the output sink (default prints through the log sink)
     */
    void setOutput(ConsoleOutput output) { _output = std::move(output); }
    void setSaveHandler(SettingsSaveHandler handler) { _saveHandler = std::move(handler); }

    /**
     * @brief Parse and execute one command line
     * @return false if the command is unknown or malformed
     */
    bool handleCommand(const char* line);

private:
    DeviceBridge& _bridge;
    ConsoleOutput _output;
    SettingsSaveHandler _saveHandler;

    void respond(const char* format, ...) __attribute__((format(printf, 2, 3)));
    void respondResult(const char* command, const std::string& id, Result result);

    // Command handlers
    void cmdHelp();
    void cmdScan(const char* arg);
    void cmdList();
    void cmdConnect(const char* id);
    void cmdConnectAll(bool scanFirst);
    void cmdSync(const char* id);
    void cmdSettings();
    bool cmdSet(const char* key, const char* value);
    void cmdSetEpoch(const char* value);
    void cmdSave();

    void onConnectOutcome(const ConnectOutcome& outcome);

    static bool parseInt(const char* text, long& value);
};

#endif // BRIDGE_CONSOLE_H
