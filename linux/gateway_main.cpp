/**
 * @file gateway_main.cpp
 * @brief MotionBridge Gateway - Linux host application over BlueZ
 * @version 2.0.0
 * @platform Linux (BlueZ 5.x, systemd sd-bus)
 *
 * Same bridge and console as the firmware, with BlueZ as the central
 * and stdin as the command console. Samples and events go to stdout.
 *
 * Usage:
 *   motion_bridge_gateway [-a hci0] [-s settings.dat] [-c]
 *     -a  Bluetooth controller (default hci0)
 *     -s  Settings file (default ./bridge_settings.dat)
 *     -c  Scan and connect all sensors at startup
 */

#include "config.h"
#include "types.h"
#include "log.h"
#include "bluez_transport.h"
#include "device_bridge.h"
#include "bridge_console.h"
#include "settings_store.h"
#include "timer_scheduler.h"
#include <errno.h>
#include <poll.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

// =============================================================================
// CONFIGURATION
// =============================================================================

#define GATEWAY_SETTINGS_FILE      "bridge_settings.dat"
#define GATEWAY_BUS_WAIT_USEC      5000
#define GATEWAY_SHUTDOWN_TIMEOUT_MS 5000

// =============================================================================
// STATE VARIABLES
// =============================================================================

static volatile sig_atomic_t shutdownRequested = 0;
static bool bridgeReady = false;
static bool connectAtStartup = false;
static uint32_t samplesForwarded = 0;

// Partial stdin line between reads
static char inputBuffer[CONSOLE_LINE_SIZE];
static size_t inputLength = 0;

// =============================================================================
// SIGNALS
// =============================================================================

static void onSignal(int signum)
{
    (void)signum;
    shutdownRequested = 1;
}

static void installSignalHandlers()
{
    struct sigaction action;
    memset(&action, 0, sizeof(action));
    action.sa_handler = onSignal;
    sigemptyset(&action.sa_mask);

    if (sigaction(SIGINT, &action, nullptr) != 0 || sigaction(SIGTERM, &action, nullptr) != 0)
    {
        LOG_WARN("GATEWAY", "Could not install signal handlers: %s", strerror(errno));
    }
}

// =============================================================================
// CALLBACKS
// =============================================================================

static void onMotionData(const std::string& deviceId, const MotionSample& sample)
{
    samplesForwarded++;

    const Quaternion& q = sample.quaternion;
    printf("DATA:%s,%llu,%.4f,%.4f,%.4f,%.4f\n",
           deviceId.c_str(),
           (unsigned long long)sample.timestampMs,
           q.w, q.x, q.y, q.z);
}

static void onDeviceEvent(const DeviceEvent& event)
{
    if (event.kind == DeviceEventKind::BATTERY_UPDATE)
    {
        printf("EVENT:%s,%s,%d\n", event.deviceId.c_str(),
               deviceEventKindToString(event.kind), event.battery);
        return;
    }

    printf("EVENT:%s,%s,%s\n", event.deviceId.c_str(),
           deviceEventKindToString(event.kind), event.detail.c_str());
}

// =============================================================================
// STDIN CONSOLE
// =============================================================================

/**
 * @brief Read whatever stdin has and dispatch complete lines
 * @return false once stdin is closed
 */
static bool pollConsole(BridgeConsole& console)
{
    struct pollfd pfd;
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int ready = poll(&pfd, 1, 0);
    if (ready <= 0 || !(pfd.revents & (POLLIN | POLLHUP)))
    {
        return true;
    }

    char chunk[64];
    ssize_t count = read(STDIN_FILENO, chunk, sizeof(chunk));
    if (count == 0)
    {
        return false;
    }
    if (count < 0)
    {
        if (errno != EINTR && errno != EAGAIN)
        {
            LOG_ERROR("GATEWAY", "stdin read failed: %s", strerror(errno));
            return false;
        }
        return true;
    }

    for (ssize_t i = 0; i < count; i++)
    {
        char c = chunk[i];
        if (c == '\n')
        {
            inputBuffer[inputLength] = '\0';
            if (inputLength > 0)
            {
                console.handleCommand(inputBuffer);
            }
            inputLength = 0;
        }
        else if (inputLength < sizeof(inputBuffer) - 1)
        {
            inputBuffer[inputLength++] = c;
        }
    }

    return true;
}

// =============================================================================
// MAIN LOOP
// =============================================================================

static void pump(BluezTransport& transport, DeviceBridge& bridge)
{
    scheduler.update();
    bridge.update();
    fflush(stdout);
    transport.waitForEvents(GATEWAY_BUS_WAIT_USEC);
}

static void shutdownBridge(BluezTransport& transport, DeviceBridge& bridge)
{
    LOG_INFO("GATEWAY", "Shutting down, disconnecting all sensors");

    bool done = false;
    bridge.disconnectAll([&done](Result result) {
        if (result != Result::OK)
        {
            LOG_WARN("GATEWAY", "Disconnect all finished with %s", resultToString(result));
        }
        done = true;
    });

    uint32_t start = platformMillis();
    while (!done && platformMillis() - start < GATEWAY_SHUTDOWN_TIMEOUT_MS)
    {
        pump(transport, bridge);
    }

    if (!done)
    {
        LOG_WARN("GATEWAY", "Disconnect all timed out");
    }
}

int main(int argc, char** argv)
{
    const char* adapterName = BLUEZ_DEFAULT_ADAPTER;
    const char* settingsPath = GATEWAY_SETTINGS_FILE;

    int opt;
    while ((opt = getopt(argc, argv, "a:s:ch")) != -1)
    {
        switch (opt)
        {
            case 'a':
                adapterName = optarg;
                break;
            case 's':
                settingsPath = optarg;
                break;
            case 'c':
                connectAtStartup = true;
                break;
            default:
                fprintf(stderr, "Usage: %s [-a adapter] [-s settings-file] [-c]\n", argv[0]);
                return opt == 'h' ? 0 : 2;
        }
    }

    printf("%s Gateway %s (BlueZ %s)\n", FIRMWARE_NAME, FIRMWARE_VERSION, adapterName);
    installSignalHandlers();

    SettingsStore settingsStore(settingsPath);
    if (!settingsStore.begin(true))
    {
        LOG_WARN("GATEWAY", "Settings file %s unavailable - using defaults", settingsPath);
    }

    BluezTransport transport(adapterName);
    DeviceBridge bridge(transport);
    BridgeConsole console(bridge);

    bridge.setMotionDataCallback(onMotionData);
    bridge.setDeviceEventCallback(onDeviceEvent);

    console.setSaveHandler([&settingsStore](const BridgeSettings& settings) {
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
    });

    bool initDone = false;
    bridge.begin(settingsStore.settings(), [&initDone, &bridge](Result result) {
        initDone = true;
        bridgeReady = (result == Result::OK);
        if (!bridgeReady)
        {
            LOG_ERROR("GATEWAY", "BlueZ initialization failed: %s", resultToString(result));
            return;
        }

        LOG_INFO("GATEWAY", "Ready - type HELP for commands");
        if (connectAtStartup)
        {
            Result scanResult = bridge.scanAndConnectAll([](const ConnectOutcome& outcome) {
                printf("CONNECT:%s,%s\n", outcome.deviceId.c_str(),
                       outcome.success ? "OK" : outcome.message.c_str());
            });
            if (scanResult != Result::OK)
            {
                LOG_ERROR("GATEWAY", "Scan failed: %s", resultToString(scanResult));
            }
        }
    });

    bool stdinOpen = true;
    uint32_t lastStatusPrint = platformMillis();

    while (!shutdownRequested)
    {
        pump(transport, bridge);

        if (initDone && !bridgeReady)
        {
            return 1;
        }

        if (stdinOpen)
        {
            stdinOpen = pollConsole(console);
        }

        uint32_t now = platformMillis();
        if (bridgeReady && bridge.settings().debugMode &&
            now - lastStatusPrint >= STATUS_PRINT_INTERVAL_MS)
        {
            lastStatusPrint = now;
            bridge.printStatus();
            printf("[STATUS] Samples forwarded: %lu\n", (unsigned long)samplesForwarded);
        }
    }

    if (bridgeReady)
    {
        shutdownBridge(transport, bridge);
    }

    return 0;
}
