/**
 * @file bridge_console.cpp
 * @brief Bridge console - Implementation
 * @version 2.0.0
 * @platform Adafruit Feather nRF52840 Express / Linux (BlueZ)
 */

#include "bridge_console.h"
#include "log.h"
#include "protocol_codec.h"
#include <ctype.h>
#include <errno.h>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

// =============================================================================
// CONSTRUCTOR
// =============================================================================

BridgeConsole::BridgeConsole(DeviceBridge& bridge) :
    _bridge(bridge),
    _output(nullptr),
    _saveHandler(nullptr)
{
}

// =============================================================================
// RESPONSE FORMATTING
// =============================================================================

void BridgeConsole::respond(const char* format, ...) {
    char line[CONSOLE_RESPONSE_SIZE];

    va_list args;
    va_start(args, format);
    vsnprintf(line, sizeof(line), format, args);
    va_end(args);

    if (_output) {
        _output(line);
    } else {
        BRIDGE_PRINTF("%s\n", line);
    }
}

void BridgeConsole::respondResult(const char* command, const std::string& id, Result result) {
    if (id.empty()) {
        respond("%s:%s", command, resultToString(result));
    } else {
        respond("%s:%s,%s", command, id.c_str(), resultToString(result));
    }
}

bool BridgeConsole::parseInt(const char* text, long& value) {
    if (!text || *text == '\0') {
        return false;
    }

    char* end = nullptr;
    errno = 0;
    long parsed = strtol(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0') {
        return false;
    }

    value = parsed;
    return true;
}

// =============================================================================
// COMMAND PROCESSING
// =============================================================================

bool BridgeConsole::handleCommand(const char* line) {
    if (!line) {
        return false;
    }

    // Working copy, trimmed at the first line terminator
    char buffer[CONSOLE_LINE_SIZE];
    strncpy(buffer, line, sizeof(buffer) - 1);
    buffer[sizeof(buffer) - 1] = '\0';
    buffer[strcspn(buffer, "\r\n")] = '\0';

    char* command = strtok(buffer, " \t");
    if (!command) {
        return false;
    }
    char* arg = strtok(nullptr, " \t");

    for (char* c = command; *c; c++) {
        *c = toupper(*c);
    }

    if (_bridge.settings().debugMode) {
        LOG_DEBUG("CONSOLE", "Command: %s %s", command, arg ? arg : "");
    }

    std::string id = arg ? std::string(arg) : std::string();

    if (strcmp(command, "HELP") == 0) {
        cmdHelp();
    } else if (strcmp(command, "GET_VER") == 0) {
        respond("VERSION:%s", FIRMWARE_VERSION);
        respond("BACKEND:%s", _bridge.adapter().backendName());
    } else if (strcmp(command, "SCAN") == 0) {
        cmdScan(arg);
    } else if (strcmp(command, "STOP_SCAN") == 0) {
        _bridge.stopScan();
        respond("SCAN:STOPPED");
    } else if (strcmp(command, "LIST") == 0) {
        cmdList();
    } else if (strcmp(command, "SCAN_CONNECT") == 0) {
        cmdConnectAll(true);
    } else if (strcmp(command, "CONNECT_ALL") == 0) {
        cmdConnectAll(false);
    } else if (strcmp(command, "DISCONNECT_ALL") == 0) {
        _bridge.disconnectAll([this](Result result) {
            respondResult("DISCONNECT_ALL", std::string(), result);
        });
    } else if (strcmp(command, "STREAM_ALL") == 0) {
        _bridge.streamAll([this](Result result) {
            respondResult("STREAM_ALL", std::string(), result);
        });
    } else if (strcmp(command, "STOP_ALL") == 0) {
        _bridge.stopAll([this](Result result) {
            respondResult("STOP_ALL", std::string(), result);
        });
    } else if (strcmp(command, "SYNC") == 0) {
        cmdSync(arg);
    } else if (strcmp(command, "STATUS") == 0) {
        _bridge.printStatus();
    } else if (strcmp(command, "SETTINGS") == 0) {
        cmdSettings();
    } else if (strcmp(command, "SAVE") == 0) {
        cmdSave();
    } else if (strcmp(command, "SET_EPOCH") == 0) {
        cmdSetEpoch(arg);
    } else if (strncmp(command, "SET_", 4) == 0) {
        return cmdSet(command + 4, arg);
    } else if (strcmp(command, "CONNECT") == 0 ||
               strcmp(command, "DISCONNECT") == 0 ||
               strcmp(command, "STREAM") == 0 ||
               strcmp(command, "STOP") == 0 ||
               strcmp(command, "CLEAR_CACHE") == 0) {
        if (id.empty()) {
            respond("ERROR:%s requires a device id", command);
            return false;
        }

        if (strcmp(command, "CONNECT") == 0) {
            cmdConnect(arg);
        } else if (strcmp(command, "DISCONNECT") == 0) {
            _bridge.disconnectDevice(id, [this, id](Result result) {
                respondResult("DISCONNECT", id, result);
            });
        } else if (strcmp(command, "STREAM") == 0) {
            _bridge.startStreaming(id, [this, id](Result result) {
                respondResult("STREAM", id, result);
            });
        } else if (strcmp(command, "STOP") == 0) {
            _bridge.stopStreaming(id, [this, id](Result result) {
                respondResult("STOP", id, result);
            });
        } else {
            _bridge.clearDeviceCache(id, [this, id](Result result) {
                respondResult("CLEAR_CACHE", id, result);
            });
        }
    } else {
        respond("ERROR:Unknown command: %s", command);
        return false;
    }

    return true;
}

// =============================================================================
// COMMAND HANDLERS
// =============================================================================

void BridgeConsole::cmdHelp() {
    respond("COMMANDS:HELP,GET_VER,STATUS,SETTINGS,SAVE");
    respond("COMMANDS:SCAN [ms],STOP_SCAN,LIST,SCAN_CONNECT");
    respond("COMMANDS:CONNECT <id>,CONNECT_ALL,DISCONNECT <id>,DISCONNECT_ALL,CLEAR_CACHE <addr>");
    respond("COMMANDS:STREAM <id>,STREAM_ALL,STOP <id>,STOP_ALL");
    respond("COMMANDS:SYNC [id],SET_EPOCH <ms>");
    respond("COMMANDS:SET_RSSI <dBm>,SET_SCAN_TIMEOUT <ms>,SET_FREQ <hz>,SET_AUTOSYNC <0|1>,SET_DEBUG <0|1>");
}

void BridgeConsole::cmdScan(const char* arg) {
    long timeoutMs = 0;
    if (arg && (!parseInt(arg, timeoutMs) || timeoutMs < 0)) {
        respond("ERROR:Invalid scan timeout: %s", arg);
        return;
    }

    Result result = _bridge.startScan(static_cast<uint32_t>(timeoutMs));
    if (result == Result::OK) {
        respond("SCAN:STARTED");
    } else {
        respondResult("SCAN", std::string(), result);
    }
}

void BridgeConsole::cmdList() {
    std::vector<PeripheralPtr> devices = _bridge.discoveredDevices();

    for (size_t i = 0; i < devices.size(); i++) {
        const PeripheralPtr& device = devices[i];
        respond("DEV:%s,%s,%d,%s",
                device->id().c_str(),
                device->name().c_str(),
                device->rssi(),
                peripheralStateToString(device->state()));
    }
    respond("COUNT:%u", static_cast<unsigned>(devices.size()));
}

void BridgeConsole::onConnectOutcome(const ConnectOutcome& outcome) {
    if (outcome.success) {
        respond("CONNECT:%s,OK", outcome.deviceId.c_str());
    } else {
        respond("CONNECT:%s,%s,%s",
                outcome.deviceId.c_str(),
                resultToString(outcome.result),
                outcome.message.c_str());
    }
}

void BridgeConsole::cmdConnect(const char* id) {
    _bridge.connectDevice(id, [this](const ConnectOutcome& outcome) {
        onConnectOutcome(outcome);
    });
}

void BridgeConsole::cmdConnectAll(bool scanFirst) {
    ConnectCallback perDevice = [this](const ConnectOutcome& outcome) {
        onConnectOutcome(outcome);
    };

    if (scanFirst) {
        Result result = _bridge.scanAndConnectAll(perDevice);
        if (result == Result::OK) {
            respond("SCAN_CONNECT:STARTED");
        } else {
            respondResult("SCAN_CONNECT", std::string(), result);
        }
        return;
    }

    size_t queued = _bridge.connectAll(perDevice);
    respond("CONNECT_ALL:%u", static_cast<unsigned>(queued));
}

void BridgeConsole::cmdSync(const char* id) {
    if (!id) {
        _bridge.syncAll([this](const std::vector<FleetSyncResult>& results) {
            for (size_t i = 0; i < results.size(); i++) {
                const FleetSyncResult& entry = results[i];
                if (entry.result == Result::OK) {
                    respond("SYNC:%s,OK,%lld,%u",
                            entry.deviceId.c_str(),
                            static_cast<long long>(entry.estimate.offsetMs),
                            static_cast<unsigned>(entry.estimate.averageRttMs));
                } else {
                    respondResult("SYNC", entry.deviceId, entry.result);
                }
            }
            respond("SYNC_ALL:%u", static_cast<unsigned>(results.size()));
        });
        return;
    }

    std::string deviceId(id);
    Result result = _bridge.syncDevice(deviceId, [this, deviceId](Result syncResult,
                                                                   const ClockOffsetEstimate& estimate) {
        if (syncResult == Result::OK) {
            respond("SYNC:%s,OK,%lld,%u",
                    deviceId.c_str(),
                    static_cast<long long>(estimate.offsetMs),
                    static_cast<unsigned>(estimate.averageRttMs));
        } else {
            respondResult("SYNC", deviceId, syncResult);
        }
    });

    if (result != Result::OK) {
        respondResult("SYNC", deviceId, result);
    }
}

void BridgeConsole::cmdSettings() {
    const BridgeSettings& settings = _bridge.settings();

    respond("RSSI:%d", settings.minRssi);
    respond("SCAN_TIMEOUT:%lu", static_cast<unsigned long>(settings.scanTimeoutMs));
    respond("FREQ:%u", frequencyHzForCode(settings.frequencyCode));
    respond("AUTOSYNC:%d", settings.autoTimeSync ? 1 : 0);
    respond("DEBUG:%d", settings.debugMode ? 1 : 0);
}

bool BridgeConsole::cmdSet(const char* key, const char* value) {
    long number = 0;
    if (!parseInt(value, number)) {
        respond("ERROR:Invalid value for %s", key);
        return false;
    }

    BridgeSettings settings = _bridge.settings();

    if (strcmp(key, "RSSI") == 0) {
        if (number < INT16_MIN || number > INT16_MAX || !SettingsStore::isValidRssi(static_cast<int16_t>(number))) {
            respond("ERROR:RSSI out of range (%d..%d)", SETTINGS_RSSI_MIN, SETTINGS_RSSI_MAX);
            return false;
        }
        settings.minRssi = static_cast<int8_t>(number);
    } else if (strcmp(key, "SCAN_TIMEOUT") == 0) {
        if (number < 0 || !SettingsStore::isValidScanTimeout(static_cast<uint32_t>(number))) {
            respond("ERROR:Scan timeout out of range (%d..%d)", SETTINGS_SCAN_TIMEOUT_MIN, SETTINGS_SCAN_TIMEOUT_MAX);
            return false;
        }
        settings.scanTimeoutMs = static_cast<uint32_t>(number);
    } else if (strcmp(key, "FREQ") == 0) {
        uint8_t code = (number > 0 && number <= UINT16_MAX) ? frequencyCodeForHz(static_cast<uint16_t>(number)) : 0;
        if (code == 0) {
            respond("ERROR:Unsupported frequency: %ld", number);
            return false;
        }
        settings.frequencyCode = code;
    } else if (strcmp(key, "AUTOSYNC") == 0) {
        settings.autoTimeSync = (number != 0);
    } else if (strcmp(key, "DEBUG") == 0) {
        settings.debugMode = (number != 0);
    } else {
        respond("ERROR:Unknown setting: %s", key);
        return false;
    }

    _bridge.applySettings(settings);
    respond("SET_%s:%s", key, value);
    return true;
}

void BridgeConsole::cmdSetEpoch(const char* value) {
    if (!value || *value == '\0') {
        respond("ERROR:SET_EPOCH requires milliseconds");
        return;
    }

    char* end = nullptr;
    errno = 0;
    unsigned long long epochMs = strtoull(value, &end, 10);
    if (errno != 0 || *end != '\0') {
        respond("ERROR:Invalid epoch: %s", value);
        return;
    }

    platformSetEpochMs(static_cast<uint64_t>(epochMs));
    respond("EPOCH:%llu", static_cast<unsigned long long>(platformEpochMs()));
}

void BridgeConsole::cmdSave() {
    if (!_saveHandler) {
        respond("SAVE:%s", resultToString(Result::ERROR_NOT_INITIALIZED));
        return;
    }

    if (_saveHandler(_bridge.settings())) {
        respond("SAVE:OK");
    } else {
        respond("SAVE:%s", resultToString(Result::ERROR_HARDWARE));
    }
}
