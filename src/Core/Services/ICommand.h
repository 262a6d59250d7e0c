#pragma once
/**
 * @file ICommand.h
 * @brief Command service interface.
 */
#include <stdint.h>
#include <stddef.h>

struct CommandRequest;

/**
 * @brief Command handler.
 *
 * Writes exactly one JSON object into `reply`: `{"ok":true,...}` on success,
 * a `writeErrorJson` payload otherwise. Returns false on failure.
 */
typedef bool (*CommandHandler)(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);

/** @brief Named command table shared by every module (`cmd`). */
struct CommandService {
    /** Register `cmd` once during init; false when the name is taken or the table is full. */
    bool (*registerHandler)(void* ctx, const char* cmd, CommandHandler fn, void* userCtx);
    /** Run `cmd`; `json` is the raw request line and `args` the serialized args object (may be null). */
    bool (*execute)(void* ctx, const char* cmd, const char* json, const char* args, char* reply, size_t replyLen);
    void* ctx;
};
