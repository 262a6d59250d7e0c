#pragma once
/**
 * @file IConfig.h
 * @brief Config store service interface.
 */

/** @brief Storage-level access to the config namespace (reads go through `config.get`). */
struct ConfigStoreService {
    /** Erase every persisted config key; values in RAM stay until reboot. */
    bool (*erase)(void* ctx);
    void* ctx;
};
