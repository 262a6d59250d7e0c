/**
 * @file FolderTable.cpp
 * @brief Organizational folders overlaid on the device registry.
 */

#include "Modules/DevicesModule/FolderTable.h"
#include "Domain/PeerDefaults.h"

#include <ArduinoJson.h>
#include <string.h>

FolderTable::FolderTable()
{
    reset();
}

void FolderTable::reset()
{
    for (uint8_t i = 0; i < Limits::Peers::MaxFolders; ++i) folders_[i] = Folder{};
    Folder& def = folders_[0];
    def.id = PeerDefaults::DefaultFolderId;
    copyBounded(def.name, sizeof(def.name), PeerDefaults::DefaultFolderName);
    def.rank = 0;
    count_ = 1;
}

int16_t FolderTable::indexOf_(uint8_t id) const
{
    for (uint8_t i = 0; i < count_; ++i) {
        if (folders_[i].id == id) return (int16_t)i;
    }
    return -1;
}

const Folder* FolderTable::get(uint8_t id) const
{
    const int16_t idx = indexOf_(id);
    return (idx >= 0) ? &folders_[idx] : nullptr;
}

bool FolderTable::validName_(const char* name) const
{
    if (!name) return false;
    while (*name == ' ') ++name;
    const size_t len = strlen(name);
    return len > 0 && len < Limits::Peers::FolderNameBuf;
}

void FolderTable::sortByRank_()
{
    for (uint8_t i = 1; i < count_; ++i) {
        const Folder cur = folders_[i];
        uint8_t j = i;
        while (j > 0 && folders_[j - 1].rank > cur.rank) {
            folders_[j] = folders_[j - 1];
            --j;
        }
        folders_[j] = cur;
    }
}

FolderResult FolderTable::add(const char* name, uint8_t& outId)
{
    if (!validName_(name)) return FolderResult::InvalidName;
    if (count_ >= Limits::Peers::MaxFolders) return FolderResult::TableFull;

    uint8_t id = 1;
    while (id < 0xFF && indexOf_(id) >= 0) ++id;
    if (id == 0xFF) return FolderResult::TableFull;

    uint8_t rank = 0;
    for (uint8_t i = 0; i < count_; ++i) {
        if (folders_[i].rank >= rank) rank = (uint8_t)(folders_[i].rank + 1U);
    }

    Folder f{};
    f.id = id;
    f.rank = rank;
    copyBounded(f.name, sizeof(f.name), name);
    folders_[count_++] = f;
    outId = id;
    return FolderResult::Ok;
}

FolderResult FolderTable::rename(uint8_t id, const char* name)
{
    if (id == PeerDefaults::DefaultFolderId) return FolderResult::Protected;
    const int16_t idx = indexOf_(id);
    if (idx < 0) return FolderResult::UnknownFolder;
    if (!validName_(name)) return FolderResult::InvalidName;
    copyBounded(folders_[idx].name, sizeof(folders_[idx].name), name);
    return FolderResult::Ok;
}

FolderResult FolderTable::remove(uint8_t id)
{
    if (id == PeerDefaults::DefaultFolderId) return FolderResult::Protected;
    const int16_t idx = indexOf_(id);
    if (idx < 0) return FolderResult::UnknownFolder;

    for (uint8_t i = (uint8_t)idx; (uint8_t)(i + 1U) < count_; ++i) folders_[i] = folders_[i + 1];
    --count_;
    folders_[count_] = Folder{};
    return FolderResult::Ok;
}

FolderResult FolderTable::setFlags(uint8_t id, const bool* expanded, const bool* chatEnabled)
{
    const int16_t idx = indexOf_(id);
    if (idx < 0) return FolderResult::UnknownFolder;
    if (expanded) folders_[idx].expanded = *expanded;
    if (chatEnabled) folders_[idx].chatEnabled = *chatEnabled;
    return FolderResult::Ok;
}

bool FolderTable::toJson(char* out, size_t outLen) const
{
    if (!out || outLen == 0) return false;

    DynamicJsonDocument doc(Limits::PeerJson::FolderDoc);
    JsonArray arr = doc.to<JsonArray>();
    for (uint8_t i = 0; i < count_; ++i) {
        JsonObject o = arr.createNestedObject();
        o["id"] = folders_[i].id;
        o["name"] = folders_[i].name;
        o["rank"] = folders_[i].rank;
        o["expanded"] = folders_[i].expanded;
        o["chat"] = folders_[i].chatEnabled;
    }
    if (doc.overflowed() || measureJson(doc) >= outLen) return false;
    serializeJson(doc, out, outLen);
    return true;
}

bool FolderTable::fromJson(const char* json)
{
    if (!json || json[0] == '\0') return false;

    DynamicJsonDocument doc(Limits::PeerJson::FolderDoc);
    if (deserializeJson(doc, json) || !doc.is<JsonArrayConst>()) return false;

    reset();
    for (JsonObjectConst o : doc.as<JsonArrayConst>()) {
        if (!o["id"].is<uint8_t>()) continue;
        const uint8_t id = o["id"].as<uint8_t>();
        const char* name = o["name"] | "";

        Folder* slot = nullptr;
        if (id == PeerDefaults::DefaultFolderId) {
            slot = &folders_[0];
        } else {
            if (indexOf_(id) >= 0 || count_ >= Limits::Peers::MaxFolders) continue;
            if (!validName_(name)) continue;
            slot = &folders_[count_++];
            *slot = Folder{};
            slot->id = id;
            copyBounded(slot->name, sizeof(slot->name), name);
        }
        slot->rank = o["rank"] | slot->rank;
        slot->expanded = o["expanded"] | true;
        slot->chatEnabled = o["chat"] | false;
    }
    sortByRank_();
    return true;
}
