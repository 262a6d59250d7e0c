#pragma once
/**
 * @file IRadio.h
 * @brief Short-range radio scan service.
 */
#include <stdint.h>

struct RadioService {
    /** Start one scan window now; false when the radio is disabled or busy. */
    bool (*requestScan)(void* ctx);
    bool (*isAvailable)(void* ctx);
    void* ctx;
};
