#include "core/error_codes.h"

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace segue {

namespace {

struct ErrorCodeInfo {
    const char* name;
    int httpStatus;
};

const std::unordered_map<ErrorCode, ErrorCodeInfo>& errorTable() {
    static const std::unordered_map<ErrorCode, ErrorCodeInfo> table = {
        {ErrorCode::OK, {"OK", 200}},

        {ErrorCode::AUDIO_DECODE_FAILED, {"AUDIO_DECODE_FAILED", 422}},
        {ErrorCode::AUDIO_UNSUPPORTED_FORMAT, {"AUDIO_UNSUPPORTED_FORMAT", 415}},
        {ErrorCode::AUDIO_INVALID_SAMPLE_RATE, {"AUDIO_INVALID_SAMPLE_RATE", 400}},
        {ErrorCode::AUDIO_SEEK_FAILED, {"AUDIO_SEEK_FAILED", 500}},
        {ErrorCode::AUDIO_BUFFER_UNDERRUN, {"AUDIO_BUFFER_UNDERRUN", 500}},

        {ErrorCode::DAC_DEVICE_NOT_FOUND, {"DAC_DEVICE_NOT_FOUND", 404}},
        {ErrorCode::DAC_OPEN_FAILED, {"DAC_OPEN_FAILED", 500}},
        {ErrorCode::DAC_RATE_NOT_SUPPORTED, {"DAC_RATE_NOT_SUPPORTED", 422}},
        {ErrorCode::DAC_DEVICE_LOST, {"DAC_DEVICE_LOST", 503}},
        {ErrorCode::DAC_WRITE_FAILED, {"DAC_WRITE_FAILED", 503}},

        {ErrorCode::IPC_CONNECTION_FAILED, {"IPC_CONNECTION_FAILED", 503}},
        {ErrorCode::IPC_TIMEOUT, {"IPC_TIMEOUT", 504}},
        {ErrorCode::IPC_INVALID_COMMAND, {"IPC_INVALID_COMMAND", 400}},
        {ErrorCode::IPC_INVALID_PARAMS, {"IPC_INVALID_PARAMS", 400}},
        {ErrorCode::IPC_DAEMON_NOT_RUNNING, {"IPC_DAEMON_NOT_RUNNING", 503}},
        {ErrorCode::IPC_PROTOCOL_ERROR, {"IPC_PROTOCOL_ERROR", 500}},

        {ErrorCode::QUEUE_ENTRY_NOT_FOUND, {"QUEUE_ENTRY_NOT_FOUND", 404}},
        {ErrorCode::QUEUE_EMPTY, {"QUEUE_EMPTY", 409}},
        {ErrorCode::PLAYBACK_NOT_ACTIVE, {"PLAYBACK_NOT_ACTIVE", 409}},
        {ErrorCode::PLAYBACK_SEEK_OUT_OF_RANGE, {"PLAYBACK_SEEK_OUT_OF_RANGE", 400}},

        {ErrorCode::VALIDATION_INVALID_CONFIG, {"VALIDATION_INVALID_CONFIG", 400}},
        {ErrorCode::VALIDATION_INVALID_TIMING, {"VALIDATION_INVALID_TIMING", 400}},
        {ErrorCode::VALIDATION_FILE_NOT_FOUND, {"VALIDATION_FILE_NOT_FOUND", 404}},
        {ErrorCode::VALIDATION_PASSAGE_NOT_FOUND, {"VALIDATION_PASSAGE_NOT_FOUND", 404}},
        {ErrorCode::PERSISTENCE_WRITE_FAILED, {"PERSISTENCE_WRITE_FAILED", 500}},
        {ErrorCode::PERSISTENCE_READ_FAILED, {"PERSISTENCE_READ_FAILED", 500}},

        {ErrorCode::RESOURCE_EXHAUSTED, {"RESOURCE_EXHAUSTED", 503}},
        {ErrorCode::RESOURCE_DECODER_HANDLES, {"RESOURCE_DECODER_HANDLES", 503}},
        {ErrorCode::RESOURCE_ALREADY_RUNNING, {"RESOURCE_ALREADY_RUNNING", 409}},
        {ErrorCode::RESOURCE_PID_FILE, {"RESOURCE_PID_FILE", 500}},
        {ErrorCode::RESOURCE_RT_PRIORITY_DENIED, {"RESOURCE_RT_PRIORITY_DENIED", 503}},

        {ErrorCode::INTERNAL_UNKNOWN, {"INTERNAL_UNKNOWN", 500}},
        {ErrorCode::INTERNAL_FRAME_MISMATCH, {"INTERNAL_FRAME_MISMATCH", 500}},
    };
    return table;
}

const std::unordered_map<std::string, ErrorCode>& reverseTable() {
    static const std::unordered_map<std::string, ErrorCode> table = [] {
        std::unordered_map<std::string, ErrorCode> reverse;
        for (const auto& [code, info] : errorTable()) {
            reverse.emplace(info.name, code);
        }
        return reverse;
    }();
    return table;
}

}  // namespace

const char* errorCodeToString(ErrorCode code) {
    auto it = errorTable().find(code);
    if (it != errorTable().end()) {
        return it->second.name;
    }
    return "UNKNOWN_ERROR";
}

const char* getErrorCategory(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return "ok";
    }
    if (isAudioError(code)) {
        return "decode";
    }
    if (isDacError(code)) {
        return "output_device";
    }
    if (isIpcError(code)) {
        return "ipc";
    }
    if (isPlaybackError(code)) {
        return "playback";
    }
    if (isValidationError(code)) {
        return "validation";
    }
    if (isResourceError(code)) {
        return "resource";
    }
    return "internal";
}

int toHttpStatus(ErrorCode code) {
    auto it = errorTable().find(code);
    if (it != errorTable().end()) {
        return it->second.httpStatus;
    }
    return 500;
}

std::string errorCodeToHex(ErrorCode code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(4) << static_cast<uint32_t>(code);
    return oss.str();
}

ErrorCode stringToErrorCode(const std::string& str) {
    auto it = reverseTable().find(str);
    if (it != reverseTable().end()) {
        return it->second;
    }
    return ErrorCode::INTERNAL_UNKNOWN;
}

}  // namespace segue
