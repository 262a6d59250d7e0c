/**
 * @file DeviceRegistry.cpp
 * @brief Device registry merge, lookup and ordering.
 */

#include "Modules/DevicesModule/DeviceRegistry.h"
#include "Modules/DevicesModule/StatusCache.h"

#include <string.h>

template <size_t N>
static bool setText_(char (&field)[N], const char* value, bool& changed)
{
    if (!value) return true;
    const size_t len = strlen(value);
    if (len >= N) return false;
    if (strcmp(field, value) == 0) return true;
    memcpy(field, value, len + 1);
    changed = true;
    return true;
}

template <typename T>
static void setValue_(T& field, const T& value, bool& changed)
{
    if (field == value) return;
    field = value;
    changed = true;
}

bool DeviceRegistry::applyPatch_(DeviceRecord& rec, const DevicePatch& patch, bool& changed)
{
    if (!setText_(rec.npub, patch.npub, changed)) return false;
    if (!setText_(rec.name, patch.name, changed)) return false;
    if (!setText_(rec.nickname, patch.nickname, changed)) return false;
    if (!setText_(rec.platform, patch.platform, changed)) return false;
    if (!setText_(rec.endpoint, patch.endpoint, changed)) return false;
    if (!setText_(rec.description, patch.description, changed)) return false;
    if (!setText_(rec.color, patch.color, changed)) return false;
    if (!setText_(rec.proximity, patch.proximity, changed)) return false;

    if (patch.hasOnline) setValue_(rec.online, patch.online, changed);
    if (patch.hasLatency) setValue_(rec.latencyMs, patch.latencyMs, changed);
    if (patch.hasSeenAt) setValue_(rec.lastSeenMs, patch.seenAtMs, changed);
    if (patch.hasCheckedAt) setValue_(rec.lastCheckedMs, patch.checkedAtMs, changed);
    if (patch.hasFetchedAt) setValue_(rec.lastFetchedMs, patch.fetchedAtMs, changed);

    TransportSet tags = rec.transports;
    tags.bits |= patch.addTransports.bits;
    tags.bits &= (uint8_t)~patch.removeTransports.bits;
    setValue_(rec.transports, tags, changed);
    if (patch.hasSeenAt && !rec.transports.empty()) {
        setValue_(rec.lastConfirmedMs, patch.seenAtMs, changed);
    }

    if (patch.hasLocation) {
        setValue_(rec.hasLocation, true, changed);
        setValue_(rec.latitude, patch.latitude, changed);
        setValue_(rec.longitude, patch.longitude, changed);
    }

    if (patch.hasPinned) setValue_(rec.pinned, patch.pinned, changed);
    if (patch.hasFolder) setValue_(rec.folderId, patch.folderId, changed);
    if (patch.hasSource) setValue_(rec.source, patch.source, changed);

    if (patch.clearRssi) {
        setValue_(rec.hasRssi, false, changed);
        setValue_(rec.rssi, (int16_t)0, changed);
    } else if (patch.hasRssi) {
        setValue_(rec.hasRssi, true, changed);
        setValue_(rec.rssi, patch.rssi, changed);
    }
    return true;
}

bool DeviceRegistry::setLocalCallsign(const char* callsign)
{
    if (!callsign || callsign[0] == '\0') {
        localCallsign_[0] = '\0';
        return true;
    }
    char norm[Limits::Peers::CallsignBuf];
    if (!normalizeCallsign(callsign, norm, sizeof(norm))) return false;
    memcpy(localCallsign_, norm, sizeof(localCallsign_));
    ++generation_;
    return true;
}

int16_t DeviceRegistry::indexOf_(const char* normalized) const
{
    for (uint8_t i = 0; i < count_; ++i) {
        if (strcmp(records_[i].callsign, normalized) == 0) return (int16_t)i;
    }
    return -1;
}

UpsertResult DeviceRegistry::upsert(const char* callsign, const DevicePatch& patch, uint32_t nowMs)
{
    char norm[Limits::Peers::CallsignBuf];
    if (!normalizeCallsign(callsign, norm, sizeof(norm))) return UpsertResult::Rejected;

    const int16_t idx = indexOf_(norm);
    if (idx >= 0) {
        DeviceRecord next = records_[idx];
        bool changed = false;
        if (!applyPatch_(next, patch, changed)) return UpsertResult::Rejected;
        if (!changed) return UpsertResult::Unchanged;
        records_[idx] = next;
        ++generation_;
        return UpsertResult::Updated;
    }

    if (count_ >= Limits::Peers::MaxDevices) return UpsertResult::Rejected;

    DeviceRecord fresh{};
    memcpy(fresh.callsign, norm, sizeof(fresh.callsign));
    bool changed = false;
    if (!applyPatch_(fresh, patch, changed)) return UpsertResult::Rejected;

    records_[count_] = fresh;
    createdMs_[count_] = nowMs;
    ++count_;
    ++generation_;
    return UpsertResult::Created;
}

const DeviceRecord* DeviceRegistry::get(const char* callsign) const
{
    char norm[Limits::Peers::CallsignBuf];
    if (!normalizeCallsign(callsign, norm, sizeof(norm))) return nullptr;
    const int16_t idx = indexOf_(norm);
    return (idx >= 0) ? &records_[idx] : nullptr;
}

void DeviceRegistry::removeAt_(uint8_t idx)
{
    if (idx >= count_) return;
    if (cache_) cache_->evict(records_[idx].callsign);

    for (uint8_t i = idx; (uint8_t)(i + 1U) < count_; ++i) {
        records_[i] = records_[i + 1];
        createdMs_[i] = createdMs_[i + 1];
    }
    --count_;
    records_[count_] = DeviceRecord{};
    createdMs_[count_] = 0;
    ++generation_;
}

bool DeviceRegistry::remove(const char* callsign)
{
    char norm[Limits::Peers::CallsignBuf];
    if (!normalizeCallsign(callsign, norm, sizeof(norm))) return false;
    const int16_t idx = indexOf_(norm);
    if (idx < 0) return false;
    removeAt_((uint8_t)idx);
    return true;
}

static bool sortsBefore_(const DeviceRecord& a, const DeviceRecord& b)
{
    if (a.pinned != b.pinned) return a.pinned;
    if (a.online != b.online) return a.online;
    const int byName = compareNoCase(displayName(a), displayName(b));
    if (byName != 0) return byName < 0;
    return strcmp(a.callsign, b.callsign) < 0;
}

uint8_t DeviceRegistry::all(const DeviceRecord** out, uint8_t max) const
{
    if (!out || max == 0) return 0;

    uint8_t n = 0;
    for (uint8_t i = 0; i < count_ && n < max; ++i) {
        if (localCallsign_[0] != '\0' && strcmp(records_[i].callsign, localCallsign_) == 0) continue;
        out[n++] = &records_[i];
    }

    for (uint8_t i = 1; i < n; ++i) {
        const DeviceRecord* cur = out[i];
        uint8_t j = i;
        while (j > 0 && sortsBefore_(*cur, *out[j - 1])) {
            out[j] = out[j - 1];
            --j;
        }
        out[j] = cur;
    }
    return n;
}

uint8_t DeviceRegistry::onlineCount() const
{
    uint8_t n = 0;
    for (uint8_t i = 0; i < count_; ++i) {
        if (records_[i].online) ++n;
    }
    return n;
}

uint8_t DeviceRegistry::removeIdle(uint32_t nowMs, uint32_t idleMs, uint8_t defaultFolderId)
{
    if (idleMs == 0) return 0;

    uint8_t removed = 0;
    for (int16_t i = (int16_t)count_ - 1; i >= 0; --i) {
        const DeviceRecord& r = records_[i];
        if (r.pinned || r.online || !r.transports.empty()) continue;
        if (r.folderId != defaultFolderId) continue;

        uint32_t ref = createdMs_[i];
        if (r.lastConfirmedMs > ref) ref = r.lastConfirmedMs;
        if (ref > nowMs || (uint32_t)(nowMs - ref) < idleMs) continue;

        removeAt_((uint8_t)i);
        ++removed;
    }
    return removed;
}

uint8_t DeviceRegistry::reassignFolder(uint8_t fromId, uint8_t toId)
{
    if (fromId == toId) return 0;
    uint8_t moved = 0;
    for (uint8_t i = 0; i < count_; ++i) {
        if (records_[i].folderId != fromId) continue;
        records_[i].folderId = toId;
        ++moved;
    }
    if (moved > 0) ++generation_;
    return moved;
}
