/**
 * @file main.cpp
 * @brief Firmware entry point and module wiring.
 */
#include <Arduino.h>
#include <Preferences.h>
#include "Core/NvsKeys.h"    ///< Preference needs to be singleton-like global to work

/// Load Core Functions
#include "Core/ConfigStore.h"
#include "Core/ModuleManager.h"
#include "Core/ServiceRegistry.h"

/// Load Modules
// Network modules
#include "Modules/Network/WifiModule/WifiModule.h"
#include "Modules/Network/ProbeModule/ProbeModule.h"
#include "Modules/Network/RelayModule/RelayModule.h"
#include "Modules/Network/LanDiscoveryModule/LanDiscoveryModule.h"
#include "Modules/Network/RadioScanModule/RadioScanModule.h"
#include "Modules/Network/WiredLinkModule/WiredLinkModule.h"
// Stores Modules
#include "Modules/Stores/ConfigStoreModule/ConfigStoreModule.h"
// System Modules
#include "Modules/System/SystemModule/SystemModule.h"
#include "Modules/System/ConsoleModule/ConsoleModule.h"
// Logs Modules
#include "Modules/Logs/LogHubModule/LogHubModule.h"
#include "Modules/Logs/LogSerialSinkModule/LogSerialSinkModule.h"
#include "Modules/Logs/LogDispatcherModule/LogDispatcherModule.h"

#include "Modules/EventBusModule/EventBusModule.h"
#include "Modules/CommandModule/CommandModule.h"
#include "Modules/DevicesModule/DevicesModule.h"

static Preferences preferences;
static ConfigStore registry;

static ModuleManager moduleManager;
static ServiceRegistry services;

static LogHubModule         logHubModule;
static LogDispatcherModule  logDispatcherModule;
static LogSerialSinkModule  logSerialSinkModule;
static EventBusModule       eventBusModule;
static ConfigStoreModule    configStoreModule;
static CommandModule        commandModule;
static WifiModule           wifiModule;
static SystemModule         systemModule;
static DevicesModule        devicesModule;
static ProbeModule          probeModule;
static LanDiscoveryModule   lanDiscoveryModule;
static RadioScanModule      radioScanModule;
static RelayModule          relayModule;
static WiredLinkModule      wiredLinkModule;
static ConsoleModule        consoleModule;

void setup() {
    Serial.begin(115200);
    delay(50);
    if (!preferences.begin(NvsKeys::StorageNamespace, false)) {
        Serial.println("Setup failure: preferences not opened");
        while (true) delay(1000);
    }
    registry.setPreferences(preferences);

    moduleManager.add(&logHubModule);
    moduleManager.add(&logDispatcherModule);
    moduleManager.add(&logSerialSinkModule);
    moduleManager.add(&eventBusModule);

    moduleManager.add(&configStoreModule);
    moduleManager.add(&commandModule);
    moduleManager.add(&wifiModule);
    moduleManager.add(&systemModule);

    moduleManager.add(&devicesModule);
    moduleManager.add(&probeModule);
    moduleManager.add(&lanDiscoveryModule);
    moduleManager.add(&radioScanModule);
    moduleManager.add(&relayModule);
    moduleManager.add(&wiredLinkModule);
    moduleManager.add(&consoleModule);

    bool ok = moduleManager.initAll(registry, services);
    if (!ok) {
        Serial.println("Setup failure: module init");
        while (true) delay(1000);
    }

    Serial.print(
        "\x1b[34m"
        " ____                 _     _       _    \n"
        "|  _ \\ ___  ___ _ __ | |   (_)_ __ | | __\n"
        "| |_) / _ \\/ _ \\ '__|| |   | | '_ \\| |/ /\n"
        "|  __/  __/  __/ |   | |___| | | | |   < \n"
        "|_|   \\___|\\___|_|   |_____|_|_| |_|_|\\_\\\n"
        "\x1b[0m"
        );
}

void loop() {
    delay(20);
}
