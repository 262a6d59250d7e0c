#pragma once
/**
 * @file NetAddress.h
 * @brief URL helpers: host extraction, private-range classification, relay URL rewriting.
 */

#include <stddef.h>
#include <stdint.h>

/** @brief Copy the host part of `url` (no scheme, port or path) into `out`. */
bool urlHost(const char* url, char* out, size_t outLen);

/**
 * @brief True when the host of `url` is loopback or RFC1918 (10/8, 172.16/12, 192.168/16).
 *
 * `localhost` counts as private. Hostnames other than `localhost` are public.
 */
bool isPrivateHost(const char* url);

/**
 * @brief Derive the relay HTTP base from its socket URL.
 *
 * `ws://` becomes `http://`, `wss://` becomes `https://`, http(s) is kept and
 * any path is dropped: `wss://relay.example:443/ws` -> `https://relay.example:443`.
 */
bool relayHttpBase(const char* socketUrl, char* out, size_t outLen);

/**
 * @brief Split a `ws://` or `wss://` URL for the socket client.
 *
 * Port defaults to 80 (ws) or 443 (wss), path to `/`.
 */
bool parseSocketUrl(const char* url, char* host, size_t hostLen, uint16_t& port,
                    char* path, size_t pathLen, bool& tls);

/** @brief `base` + `path` with exactly one `/` between them. */
bool joinUrl(const char* base, const char* path, char* out, size_t outLen);

/** @brief `http://a.b.c.d:port`. */
bool formatLocalUrl(const uint8_t ip[4], uint16_t port, char* out, size_t outLen);
