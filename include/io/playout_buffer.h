#ifndef SEGUE_PLAYOUT_BUFFER_H
#define SEGUE_PLAYOUT_BUFFER_H

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace segue::io {

// Lock-free SPSC ring of interleaved stereo float frames, one per decoder chain.
//
// Producer (decode worker): writeFrames(), markDecodeComplete().
// Consumer (mixer thread):  readFrames(), skipFrames().
//
// Backpressure:
//   - The producer pause flag is raised when free space drops to the headroom.
//   - It is cleared by the consumer only once free space reaches
//     headroom + resumeHysteresis; clearing fires the resume callback once.
//
// Memory ordering:
//   - producer is the sole writer of tail_, consumer of head_ (relaxed).
//   - size_ is the synchronization point: sample writes happen-before
//     size_.fetch_add(release); size_.load(acquire) happens-before reads.
//   - reset() must be externally synchronized (neither side active).
class PlayoutBuffer {
   public:
    static constexpr size_t kChannels = 2;

    struct Config {
        size_t capacityFrames = 661941;
        size_t headroomFrames = 4410;
        size_t resumeHysteresisFrames = 44100;
    };

    using ResumeCallback = std::function<void()>;

    explicit PlayoutBuffer(const Config& config) : config_(config) {
        if (config.capacityFrames == 0) {
            throw std::invalid_argument("PlayoutBuffer capacity must be > 0");
        }
        if (config.headroomFrames == 0 || config.headroomFrames >= config.capacityFrames) {
            throw std::invalid_argument("PlayoutBuffer headroom must be in (0, capacity), got " +
                                        std::to_string(config.headroomFrames));
        }
        config_.resumeHysteresisFrames =
            std::min(config.resumeHysteresisFrames, config.capacityFrames - config.headroomFrames);
        buffer_.assign(config.capacityFrames * kChannels, 0.0f);
    }

    // Set before the buffer is shared with the consumer.
    void setResumeCallback(ResumeCallback callback) {
        resumeCallback_ = std::move(callback);
    }

    size_t capacityFrames() const {
        return config_.capacityFrames;
    }
    size_t headroomFrames() const {
        return config_.headroomFrames;
    }
    size_t resumeHysteresisFrames() const {
        return config_.resumeHysteresisFrames;
    }

    size_t availableFrames() const {
        return size_.load(std::memory_order_acquire);
    }
    size_t freeFrames() const {
        return capacityFrames() - availableFrames();
    }

    bool shouldPauseProducer() const {
        return producerPaused_.load(std::memory_order_acquire);
    }

    // Producer: copies up to @p frames and returns the number written.
    size_t writeFrames(const float* interleaved, size_t frames) {
        const size_t cap = capacityFrames();
        const size_t count = std::min(frames, freeFrames());
        if (count > 0) {
            size_t tail = tail_.load(std::memory_order_relaxed);
            size_t first = std::min(count, cap - tail);
            std::memcpy(buffer_.data() + tail * kChannels, interleaved,
                        first * kChannels * sizeof(float));
            size_t remaining = count - first;
            if (remaining > 0) {
                std::memcpy(buffer_.data(), interleaved + first * kChannels,
                            remaining * kChannels * sizeof(float));
            }
            tail_.store((tail + count) % cap, std::memory_order_relaxed);
            size_.fetch_add(count, std::memory_order_release);
            totalWritten_.fetch_add(count, std::memory_order_relaxed);
        }
        if (freeFrames() <= config_.headroomFrames) {
            producerPaused_.store(true, std::memory_order_release);
        }
        return count;
    }

    void markDecodeComplete() {
        decodeComplete_.store(true, std::memory_order_release);
    }
    bool isDecodeComplete() const {
        return decodeComplete_.load(std::memory_order_acquire);
    }

    // Decode finished and every written frame consumed.
    bool isExhausted() const {
        return isDecodeComplete() && availableFrames() == 0;
    }

    // Consumer: copies up to @p frames and returns the number read.
    size_t readFrames(float* dst, size_t frames) {
        const size_t cap = capacityFrames();
        const size_t count = std::min(frames, availableFrames());
        if (count > 0) {
            size_t head = head_.load(std::memory_order_relaxed);
            size_t first = std::min(count, cap - head);
            std::memcpy(dst, buffer_.data() + head * kChannels, first * kChannels * sizeof(float));
            size_t remaining = count - first;
            if (remaining > 0) {
                std::memcpy(dst + first * kChannels, buffer_.data(),
                            remaining * kChannels * sizeof(float));
            }
            advanceHead(count);
        }
        return count;
    }

    // Consumer: discards up to @p frames without copying.
    size_t skipFrames(size_t frames) {
        const size_t count = std::min(frames, availableFrames());
        if (count > 0) {
            advanceHead(count);
        }
        return count;
    }

    std::uint64_t totalWritten() const {
        return totalWritten_.load(std::memory_order_relaxed);
    }
    std::uint64_t totalRead() const {
        return totalRead_.load(std::memory_order_relaxed);
    }

    // Returns the buffer to its freshly constructed state (resume callback kept).
    void reset() {
        head_.store(0, std::memory_order_relaxed);
        tail_.store(0, std::memory_order_relaxed);
        totalWritten_.store(0, std::memory_order_relaxed);
        totalRead_.store(0, std::memory_order_relaxed);
        producerPaused_.store(false, std::memory_order_relaxed);
        decodeComplete_.store(false, std::memory_order_relaxed);
        size_.store(0, std::memory_order_release);
    }

   private:
    void advanceHead(size_t count) {
        size_t head = head_.load(std::memory_order_relaxed);
        head_.store((head + count) % capacityFrames(), std::memory_order_relaxed);
        size_.fetch_sub(count, std::memory_order_release);
        totalRead_.fetch_add(count, std::memory_order_relaxed);

        if (producerPaused_.load(std::memory_order_acquire) &&
            freeFrames() >= config_.headroomFrames + config_.resumeHysteresisFrames) {
            bool expected = true;
            if (producerPaused_.compare_exchange_strong(expected, false,
                                                        std::memory_order_acq_rel) &&
                resumeCallback_) {
                resumeCallback_();
            }
        }
    }

    Config config_;
    std::vector<float> buffer_;
    std::atomic<size_t> head_{0};  // read frame index (consumer)
    std::atomic<size_t> tail_{0};  // write frame index (producer)
    std::atomic<size_t> size_{0};  // frames stored
    std::atomic<std::uint64_t> totalWritten_{0};
    std::atomic<std::uint64_t> totalRead_{0};
    std::atomic<bool> producerPaused_{false};
    std::atomic<bool> decodeComplete_{false};
    ResumeCallback resumeCallback_;
};

}  // namespace segue::io

#endif  // SEGUE_PLAYOUT_BUFFER_H
