#pragma once
/**
 * @file PeerSnapshot.h
 * @brief JSON rendering of device records and of the full ordered registry.
 */

#include <stddef.h>
#include <stdint.h>

#include <ArduinoJson.h>

#include "Modules/DevicesModule/DeviceRegistry.h"

/** @brief Fill `obj` with one record (session fields included). */
void writeDeviceJson(JsonObject obj, const DeviceRecord& rec);

/**
 * @brief Render `{"ok":true,"gen":..,"online":..,"devices":[...]}` in `all()` order.
 * @return false when the output does not fit.
 */
bool buildPeersSnapshot(const DeviceRegistry& registry, char* out, size_t outLen);

/** @brief Render `{"ok":true,"device":{...}}` for one record. */
bool buildDeviceReply(const DeviceRecord& rec, char* out, size_t outLen);
