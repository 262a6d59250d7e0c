#pragma once
/**
 * @file DeviceRegistry.h
 * @brief Keyed in-memory store of device records with merge and ordering rules.
 */

#include <stdint.h>

#include "Modules/DevicesModule/PeerTypes.h"

class StatusCache;

/** @brief Outcome of `DeviceRegistry::upsert`. */
enum class UpsertResult : uint8_t {
    Created,
    Updated,
    Unchanged,
    Rejected
};

/**
 * @brief Fixed-capacity device table keyed by normalized callsign.
 *
 * Merges are all-or-nothing: the patch is applied to a copy and committed
 * only when every field fits. Each committed change bumps `generation()`.
 */
class DeviceRegistry {
public:
    /** @brief Cache evicted by `remove` (optional). */
    void setStatusCache(StatusCache* cache) { cache_ = cache; }

    /** @brief Local node identity, excluded from `all()`; empty clears it. */
    bool setLocalCallsign(const char* callsign);
    const char* localCallsign() const { return localCallsign_; }

    /**
     * @brief Create or merge a record.
     * @param nowMs Used as creation time for a new record.
     */
    UpsertResult upsert(const char* callsign, const DevicePatch& patch, uint32_t nowMs);

    /** @brief Case-insensitive lookup, nullptr when unknown. */
    const DeviceRecord* get(const char* callsign) const;

    /** @brief Remove a record and evict its cache entry. */
    bool remove(const char* callsign);

    /**
     * @brief Records ordered pinned first, online first, then display name (case-insensitive).
     *
     * The local node's own record is excluded.
     */
    uint8_t all(const DeviceRecord** out, uint8_t max) const;

    uint8_t count() const { return count_; }
    const DeviceRecord* at(uint8_t idx) const { return (idx < count_) ? &records_[idx] : nullptr; }
    uint8_t onlineCount() const;

    /**
     * @brief Remove unpinned default-folder records with no transport since `idleMs`.
     * @return Number of records removed.
     */
    uint8_t removeIdle(uint32_t nowMs, uint32_t idleMs, uint8_t defaultFolderId);

    /** @brief Move every record from folder `fromId` to `toId`; returns count moved. */
    uint8_t reassignFolder(uint8_t fromId, uint8_t toId);

    uint32_t generation() const { return generation_; }

private:
    DeviceRecord records_[Limits::Peers::MaxDevices];
    uint32_t createdMs_[Limits::Peers::MaxDevices] = {0};
    uint8_t count_ = 0;
    char localCallsign_[Limits::Peers::CallsignBuf] = {0};
    uint32_t generation_ = 0;
    StatusCache* cache_ = nullptr;

    int16_t indexOf_(const char* normalized) const;
    void removeAt_(uint8_t idx);
    static bool applyPatch_(DeviceRecord& rec, const DevicePatch& patch, bool& changed);
};
