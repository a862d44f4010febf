#include "audio/sndfile_decoder.h"

#include "logging/logger.h"

#include <cerrno>
#include <filesystem>

namespace segue::audio {

SndfileDecoder::SndfileDecoder(const std::string& path) : path_(path) {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        throw DecodeError(ErrorCode::VALIDATION_FILE_NOT_FOUND, "File not found: " + path_);
    }

    errno = 0;
    file_ = sf_open(path_.c_str(), SFM_READ, &info_);
    if (!file_) {
        const int openErrno = errno;
        std::string reason = sf_strerror(nullptr);
        LOG_ERROR("libsndfile error opening {}: {}", path_, reason);
        if (openErrno == EMFILE || openErrno == ENFILE) {
            throw DecodeError(ErrorCode::RESOURCE_DECODER_HANDLES,
                              "Out of file handles opening " + path_);
        }
        throw DecodeError(ErrorCode::AUDIO_UNSUPPORTED_FORMAT,
                          "Cannot decode " + path_ + ": " + reason);
    }
    if (info_.channels <= 0 || info_.samplerate <= 0) {
        sf_close(file_);
        file_ = nullptr;
        throw DecodeError(ErrorCode::AUDIO_UNSUPPORTED_FORMAT, "Invalid stream layout in " + path_);
    }

    LOG_DEBUG("Opened {} ({} Hz, {} ch, {} frames)", path_, info_.samplerate, info_.channels,
              static_cast<long long>(info_.frames));
}

SndfileDecoder::~SndfileDecoder() {
    if (file_) {
        sf_close(file_);
        file_ = nullptr;
    }
}

std::optional<std::int64_t> SndfileDecoder::totalFrames() const {
    if (info_.frames <= 0) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(info_.frames);
}

void SndfileDecoder::seek(std::int64_t frame) {
    if (!info_.seekable) {
        throw DecodeError(ErrorCode::AUDIO_SEEK_FAILED, "Source is not seekable: " + path_);
    }
    if (sf_seek(file_, static_cast<sf_count_t>(frame), SEEK_SET) < 0) {
        throw DecodeError(ErrorCode::AUDIO_SEEK_FAILED,
                          "Seek to frame " + std::to_string(frame) + " failed in " + path_ +
                              ": " + sf_strerror(file_));
    }
}

size_t SndfileDecoder::read(float* interleaved, size_t frames) {
    sf_count_t got = sf_readf_float(file_, interleaved, static_cast<sf_count_t>(frames));
    if (got < 0 || sf_error(file_) != SF_ERR_NO_ERROR) {
        throw DecodeError(ErrorCode::AUDIO_DECODE_FAILED,
                          "Decode error in " + path_ + ": " + sf_strerror(file_));
    }
    return static_cast<size_t>(got);
}

DecoderFactory makeSndfileDecoderFactory() {
    return [](const std::string& path) -> std::unique_ptr<AudioDecoder> {
        return std::make_unique<SndfileDecoder>(path);
    };
}

}  // namespace segue::audio
