#pragma once

#include "playback/decoder_chain.h"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>

namespace segue::playback {

/**
 * @brief Fixed set of decoder chains, allocated once and recycled.
 *
 * Free indices come from a min-heap so the lowest index is reused first.
 * The effective limit starts at the pool size and can only be lowered
 * (resource exhaustion); chains above it stay idle.
 */
class ChainPool {
   public:
    using ResumeHandler = std::function<void(size_t chainIndex)>;

    ChainPool(size_t size, const DecoderChain::Config& chainConfig);

    ChainPool(const ChainPool&) = delete;
    ChainPool& operator=(const ChainPool&) = delete;

    // Wires every ring's resume callback to @p handler (chain index).
    void setResumeHandler(const ResumeHandler& handler);

    // Reserves a chain for @p entryId. Returns the existing index when the
    // entry already holds one; nullopt when no chain is available.
    std::optional<size_t> acquire(const std::string& entryId);

    // Cancels the chain's work and returns it to the free heap.
    // false when the entry holds no chain.
    bool release(const std::string& entryId);

    std::optional<size_t> indexOf(const std::string& entryId) const;
    DecoderChain* chainFor(const std::string& entryId);
    DecoderChain& chain(size_t index) {
        return *chains_.at(index);
    }

    std::vector<std::string> assignedEntries() const;

    size_t size() const {
        return chains_.size();
    }
    size_t effectiveLimit() const;
    size_t inUse() const;
    bool hasFree() const;

    // Lowers the limit by one, never below 1. Returns the new limit.
    size_t lowerLimit();

   private:
    std::vector<std::unique_ptr<DecoderChain>> chains_;

    mutable std::mutex mutex_;
    std::priority_queue<size_t, std::vector<size_t>, std::greater<size_t>> freeIndices_;
    std::unordered_map<std::string, size_t> assigned_;
    size_t limit_;
};

}  // namespace segue::playback
