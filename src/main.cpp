/**
 * @file main.cpp
 * @brief Service entry point and module wiring.
 */

/// Load Core Functions
#include "Core/ConfigStore.h"
#include "Core/Log.h"
#include "Core/ModuleManager.h"
#include "Core/ServiceRegistry.h"
#include "Core/SystemClock.h"
#include "Core/SystemLimits.h"

/// Load Modules
// Logs Modules
#include "Modules/Logs/LogHubModule/LogHubModule.h"
#include "Modules/Logs/LogDispatcherModule/LogDispatcherModule.h"
#include "Modules/Logs/LogConsoleSinkModule/LogConsoleSinkModule.h"
#include "Modules/Logs/LogFileSinkModule/LogFileSinkModule.h"
// IO / network / zones
#include "Modules/IOModule/IOModule.h"
#include "Modules/Network/MQTTModule/MQTTModule.h"
#include "Modules/ZoneModule/ZoneModule.h"

#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#define LOG_TAG_MAIN "Main"

static constexpr char DefaultConfigPath[] = "/etc/zonelink/zonelink.json";
static constexpr int ExitGpio = 2;

static ConfigStore registry;
static ModuleManager moduleManager;
static ServiceRegistry services;

static LogHubModule         logHubModule;
static LogDispatcherModule  logDispatcherModule;
static LogConsoleSinkModule logConsoleSinkModule;
static LogFileSinkModule    logFileSinkModule;
static IOModule             ioModule;
static MQTTModule           mqttModule;
static ZoneModule           zoneModule;

static volatile sig_atomic_t gStopRequested = 0;

static void onSignal(int)
{
    gStopRequested = 1;
}

static void usage(const char* prog)
{
    fprintf(stderr,
            "Usage: %s [--config <path>] [--cleanup] [--help]\n"
            "  --config <path>  JSON configuration file (default %s when present)\n"
            "  --cleanup        retract every discovery record and exit\n"
            "  --help           show this help\n",
            prog, DefaultConfigPath);
}

static bool installSignalHandlers()
{
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = onSignal;
    sigemptyset(&sa.sa_mask);
    if (sigaction(SIGINT, &sa, nullptr) != 0) return false;
    if (sigaction(SIGTERM, &sa, nullptr) != 0) return false;
    return true;
}

int main(int argc, char** argv)
{
    const char* configPath = nullptr;
    bool cleanup = false;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            configPath = argv[++i];
        } else if (strcmp(argv[i], "--cleanup") == 0) {
            cleanup = true;
        } else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            usage(argv[0]);
            return 0;
        } else {
            fprintf(stderr, "unknown argument: %s\n", argv[i]);
            usage(argv[0]);
            return 1;
        }
    }

    if (configPath) {
        registry.setFilePath(configPath);
    } else if (access(DefaultConfigPath, R_OK) == 0) {
        registry.setFilePath(DefaultConfigPath);
    }
    registry.addEnvFile(".env");
    const char* home = getenv("HOME");
    if (home && home[0] != '\0') {
        char envPath[Limits::PathBuf];
        const int n = snprintf(envPath, sizeof(envPath), "%s/zonelink/config/config.env", home);
        if (n > 0 && (size_t)n < sizeof(envPath)) registry.addEnvFile(envPath);
    }

    if (!installSignalHandlers()) {
        fprintf(stderr, "signal handler setup failed\n");
        return 1;
    }

    Module* modules[] = {
        &logHubModule, &logDispatcherModule, &logConsoleSinkModule, &logFileSinkModule,
        &ioModule, &mqttModule, &zoneModule
    };
    for (Module* m : modules) {
        if (!moduleManager.add(m)) {
            fprintf(stderr, "module registration failed: %s\n", m->moduleId());
            return 1;
        }
    }
    zoneModule.setCleanupMode(cleanup);

    if (!moduleManager.initAll(registry, services)) {
        const bool gpioFatal = ioModule.gpioFailed() || zoneModule.pinSetupFailed();
        Log::error(LOG_TAG_MAIN, "startup aborted%s", gpioFatal ? " (GPIO unavailable)" : "");
        logDispatcherModule.flush();
        return gpioFatal ? ExitGpio : 1;
    }
    Log::info(LOG_TAG_MAIN, "zonelink running host=%s%s", zoneModule.host(), cleanup ? " (cleanup)" : "");

    int rc = 0;
    const uint32_t startMs = millis();
    while (!gStopRequested) {
        if (cleanup) {
            if (zoneModule.cleanupDone()) break;
            if ((uint32_t)(millis() - startMs) >= Limits::CleanupTimeoutMs) {
                Log::error(LOG_TAG_MAIN, "cleanup: broker not reachable within %ums",
                           (unsigned)Limits::CleanupTimeoutMs);
                rc = 1;
                break;
            }
        }
        delayMs(100);
    }

    Log::info(LOG_TAG_MAIN, "stopping");
    moduleManager.stopAll();
    return rc;
}
