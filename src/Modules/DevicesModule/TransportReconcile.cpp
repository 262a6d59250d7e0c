/**
 * @file TransportReconcile.cpp
 * @brief Pure transport-tag transitions used by the listener handlers.
 */

#include "Modules/DevicesModule/TransportReconcile.h"

TransportSet reconcile(TransportSet oldTags, bool inScan, bool enhanced)
{
    TransportSet next = oldTags;
    next.remove(Transport::ShortRangeRadio);
    next.remove(Transport::RadioEnhanced);
    if (inScan) {
        next.add(Transport::ShortRangeRadio);
        if (enhanced) next.add(Transport::RadioEnhanced);
    }
    return next;
}

TransportSet withoutWired(TransportSet tags)
{
    tags.remove(Transport::WiredLink);
    return tags;
}

uint8_t transitionCause(TransportSet before, TransportSet after, bool online)
{
    TransportSet delta;
    delta.bits = online ? (uint8_t)(after.bits & ~before.bits) : (uint8_t)(before.bits & ~after.bits);

    Transport t;
    if (delta.first(t)) return (uint8_t)t;
    if (online && after.first(t)) return (uint8_t)t;
    return kTransportNone;
}
