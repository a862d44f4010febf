#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace segue::daemon_output {

// Blocking sink for interleaved signed 32-bit frames.
class AudioSink {
   public:
    virtual ~AudioSink() = default;

    virtual bool open(int sampleRate, unsigned int channels) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    // false once the device is disconnected or suspended.
    virtual bool alive() const = 0;

    // Frames written, or a negative errno when the device could not be recovered.
    virtual long write(const std::int32_t* interleaved, size_t frames) = 0;

    // Period negotiated on open (0 when closed).
    virtual size_t periodFrames() const = 0;
    virtual const std::string& device() const = 0;
};

}  // namespace segue::daemon_output
