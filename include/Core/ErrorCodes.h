#pragma once
/**
 * @file ErrorCodes.h
 * @brief Shared error codes and JSON error payload formatting helpers.
 */

#include <stddef.h>
#include <stdint.h>
#include <stdio.h>

enum class ErrorCode : uint16_t {
    UnknownCmd,
    BadCmdJson,
    MissingCmd,
    CmdServiceUnavailable,
    ArgsTooLarge,
    CmdHandlerFailed,
    BadCfgJson,
    CfgServiceUnavailable,
    CfgApplyFailed,
    CfgTruncated,
    MissingArgs,
    MissingValue,
    NotReady,
    IoError,
    Failed,
    InvalidBool,
    InvalidLabel,
    InvalidCallsign,
    UnknownPeer,
    RegistryFull,
    UnknownFolder,
    FolderTableFull,
    ReplyOverflow
};

static inline const char* errorCodeStr(ErrorCode code)
{
    switch (code) {
    case ErrorCode::UnknownCmd: return "UnknownCmd";
    case ErrorCode::BadCmdJson: return "BadCmdJson";
    case ErrorCode::MissingCmd: return "MissingCmd";
    case ErrorCode::CmdServiceUnavailable: return "CmdServiceUnavailable";
    case ErrorCode::ArgsTooLarge: return "ArgsTooLarge";
    case ErrorCode::CmdHandlerFailed: return "CmdHandlerFailed";
    case ErrorCode::BadCfgJson: return "BadCfgJson";
    case ErrorCode::CfgServiceUnavailable: return "CfgServiceUnavailable";
    case ErrorCode::CfgApplyFailed: return "CfgApplyFailed";
    case ErrorCode::CfgTruncated: return "CfgTruncated";
    case ErrorCode::MissingArgs: return "MissingArgs";
    case ErrorCode::MissingValue: return "MissingValue";
    case ErrorCode::NotReady: return "NotReady";
    case ErrorCode::IoError: return "IoError";
    case ErrorCode::Failed: return "Failed";
    case ErrorCode::InvalidBool: return "InvalidBool";
    case ErrorCode::InvalidLabel: return "InvalidLabel";
    case ErrorCode::InvalidCallsign: return "InvalidCallsign";
    case ErrorCode::UnknownPeer: return "UnknownPeer";
    case ErrorCode::RegistryFull: return "RegistryFull";
    case ErrorCode::UnknownFolder: return "UnknownFolder";
    case ErrorCode::FolderTableFull: return "FolderTableFull";
    case ErrorCode::ReplyOverflow: return "ReplyOverflow";
    default: return "Unknown";
    }
}

static inline bool errorCodeRetryable(ErrorCode code)
{
    switch (code) {
    case ErrorCode::CmdServiceUnavailable:
    case ErrorCode::CfgServiceUnavailable:
    case ErrorCode::NotReady:
    case ErrorCode::IoError:
    case ErrorCode::ReplyOverflow:
    case ErrorCode::CfgTruncated:
        return true;
    default:
        return false;
    }
}

static inline bool writeErrorJson(char* out, size_t outLen, ErrorCode code, const char* where)
{
    if (!out || outLen == 0) return false;
    const char* w = (where && where[0] != '\0') ? where : "unknown";
    const int wrote = snprintf(
        out,
        outLen,
        "{\"ok\":false,\"err\":{\"code\":\"%s\",\"where\":\"%s\",\"retryable\":%s}}",
        errorCodeStr(code),
        w,
        errorCodeRetryable(code) ? "true" : "false"
    );
    return (wrote > 0) && ((size_t)wrote < outLen);
}
