#pragma once
/**
 * @file ILan.h
 * @brief Local-network discovery service.
 */
#include <stddef.h>
#include <stdint.h>

#include "Core/SystemLimits.h"

/** @brief Known local endpoint handed to a quick recheck. */
struct LanTarget {
    char callsign[Limits::Peers::CallsignBuf];
    char endpoint[Limits::Peers::UrlBuf];
};

struct LanService {
    /** Full scan (mDNS + optional /24 sweep); false when not available. */
    bool (*discover)(void* ctx);
    /** Re-probe only the given known peers. */
    bool (*recheck)(void* ctx, const LanTarget* targets, uint8_t count);
    void* ctx;
};
