#pragma once
/**
 * @file FolderTable.h
 * @brief Organizational folders overlaid on the device registry.
 */

#include <stddef.h>
#include <stdint.h>

#include "Modules/DevicesModule/PeerTypes.h"

/** @brief Outcome of a folder mutation. */
enum class FolderResult : uint8_t {
    Ok,
    UnknownFolder,
    TableFull,
    InvalidName,
    Protected
};

/**
 * @brief Fixed-size folder table. Folder 0 ("Discovered") always exists.
 */
class FolderTable {
public:
    FolderTable();

    /** @brief Drop user folders, keep the default one. */
    void reset();

    FolderResult add(const char* name, uint8_t& outId);
    FolderResult rename(uint8_t id, const char* name);
    /** @brief Remove a user folder; the default folder is protected. */
    FolderResult remove(uint8_t id);
    FolderResult setFlags(uint8_t id, const bool* expanded, const bool* chatEnabled);

    const Folder* get(uint8_t id) const;
    bool exists(uint8_t id) const { return get(id) != nullptr; }
    uint8_t count() const { return count_; }
    /** @brief Folder at position `idx`, ordered by rank. */
    const Folder* at(uint8_t idx) const { return (idx < count_) ? &folders_[idx] : nullptr; }

    bool toJson(char* out, size_t outLen) const;
    /** @brief Replace the table from JSON; the default folder is restored if missing. */
    bool fromJson(const char* json);

private:
    Folder folders_[Limits::Peers::MaxFolders];
    uint8_t count_ = 0;

    int16_t indexOf_(uint8_t id) const;
    bool validName_(const char* name) const;
    void sortByRank_();
};
