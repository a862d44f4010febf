#ifndef SEGUE_ERROR_CODES_H
#define SEGUE_ERROR_CODES_H

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace segue {

/**
 * @brief Error codes for the playback engine.
 *
 * Categories use the upper nibble of the low 16 bits (0xF000 mask):
 * - 0x1xxx: Decode / audio data (taxonomy: decode failure)
 * - 0x2xxx: Output device (taxonomy: output device loss)
 * - 0x3xxx: IPC / control plane
 * - 0x4xxx: Queue / playback state
 * - 0x5xxx: Validation and persistence (taxonomy: persistence failure)
 * - 0x6xxx: Resource exhaustion
 * - 0xFxxx: Internal
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // Decode / audio data (0x1000)
    AUDIO_DECODE_FAILED = 0x1001,
    AUDIO_UNSUPPORTED_FORMAT = 0x1002,
    AUDIO_INVALID_SAMPLE_RATE = 0x1003,
    AUDIO_SEEK_FAILED = 0x1004,
    AUDIO_BUFFER_UNDERRUN = 0x1005,

    // Output device (0x2000)
    DAC_DEVICE_NOT_FOUND = 0x2001,
    DAC_OPEN_FAILED = 0x2002,
    DAC_RATE_NOT_SUPPORTED = 0x2003,
    DAC_DEVICE_LOST = 0x2004,
    DAC_WRITE_FAILED = 0x2005,

    // IPC (0x3000)
    IPC_CONNECTION_FAILED = 0x3001,
    IPC_TIMEOUT = 0x3002,
    IPC_INVALID_COMMAND = 0x3003,
    IPC_INVALID_PARAMS = 0x3004,
    IPC_DAEMON_NOT_RUNNING = 0x3005,
    IPC_PROTOCOL_ERROR = 0x3006,

    // Queue / playback (0x4000)
    QUEUE_ENTRY_NOT_FOUND = 0x4001,
    QUEUE_EMPTY = 0x4002,
    PLAYBACK_NOT_ACTIVE = 0x4003,
    PLAYBACK_SEEK_OUT_OF_RANGE = 0x4004,

    // Validation / persistence (0x5000)
    VALIDATION_INVALID_CONFIG = 0x5001,
    VALIDATION_INVALID_TIMING = 0x5002,
    VALIDATION_FILE_NOT_FOUND = 0x5003,
    VALIDATION_PASSAGE_NOT_FOUND = 0x5004,
    PERSISTENCE_WRITE_FAILED = 0x5005,
    PERSISTENCE_READ_FAILED = 0x5006,

    // Resources (0x6000)
    RESOURCE_EXHAUSTED = 0x6001,
    RESOURCE_DECODER_HANDLES = 0x6002,
    RESOURCE_ALREADY_RUNNING = 0x6003,
    RESOURCE_PID_FILE = 0x6004,
    RESOURCE_RT_PRIORITY_DENIED = 0x6005,

    // Internal (0xF000)
    INTERNAL_UNKNOWN = 0xF001,
    INTERNAL_FRAME_MISMATCH = 0xF002,
};

const char* errorCodeToString(ErrorCode code);

/// Category name (e.g., "output_device"), or "internal" for unknown codes.
const char* getErrorCategory(ErrorCode code);

/// HTTP status equivalent for API adapters; 500 for unknown codes.
int toHttpStatus(ErrorCode code);

/// Hex form, e.g. "0x2004".
std::string errorCodeToHex(ErrorCode code);

/// Reverse of errorCodeToString; INTERNAL_UNKNOWN if not found.
ErrorCode stringToErrorCode(const std::string& str);

constexpr bool isAudioError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x1000;
}
constexpr bool isDacError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x2000;
}
constexpr bool isIpcError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x3000;
}
constexpr bool isPlaybackError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x4000;
}
constexpr bool isValidationError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x5000;
}
constexpr bool isResourceError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x6000;
}
constexpr bool isInternalError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0xF000;
}

/**
 * @brief Transient conditions a caller may retry.
 *
 * Device loss is retried by the output loop itself; IPC errors by clients.
 */
constexpr bool isRetryable(ErrorCode code) {
    return code == ErrorCode::IPC_DAEMON_NOT_RUNNING || code == ErrorCode::IPC_TIMEOUT ||
           code == ErrorCode::IPC_CONNECTION_FAILED || code == ErrorCode::DAC_DEVICE_LOST ||
           code == ErrorCode::DAC_WRITE_FAILED;
}

/**
 * @brief Outcome of an engine command, mapped to control-plane responses.
 */
struct CommandResult {
    ErrorCode code = ErrorCode::OK;
    std::string message;

    bool ok() const {
        return code == ErrorCode::OK;
    }

    static CommandResult success(std::string message = {}) {
        return CommandResult{ErrorCode::OK, std::move(message)};
    }
    static CommandResult failure(ErrorCode code, std::string message) {
        return CommandResult{code, std::move(message)};
    }
};

/**
 * @brief Exception carrying an ErrorCode across component boundaries.
 */
class EngineError : public std::runtime_error {
   public:
    EngineError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept {
        return code_;
    }

   private:
    ErrorCode code_;
};

}  // namespace segue

#endif  // SEGUE_ERROR_CODES_H
