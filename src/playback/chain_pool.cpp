#include "playback/chain_pool.h"

#include "logging/logger.h"

#include <stdexcept>

namespace segue::playback {

ChainPool::ChainPool(size_t size, const DecoderChain::Config& chainConfig) : limit_(size) {
    if (size == 0) {
        throw std::invalid_argument("ChainPool size must be > 0");
    }
    chains_.reserve(size);
    for (size_t i = 0; i < size; ++i) {
        chains_.push_back(std::make_unique<DecoderChain>(i, chainConfig));
        freeIndices_.push(i);
    }
    LOG_INFO("Decoder chain pool: {} chains, {} frames per ring", size,
             chainConfig.buffer.capacityFrames);
}

void ChainPool::setResumeHandler(const ResumeHandler& handler) {
    for (auto& chain : chains_) {
        const size_t index = chain->index();
        chain->buffer().setResumeCallback([handler, index]() {
            if (handler) {
                handler(index);
            }
        });
    }
}

std::optional<size_t> ChainPool::acquire(const std::string& entryId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = assigned_.find(entryId);
    if (it != assigned_.end()) {
        return it->second;
    }
    if (assigned_.size() >= limit_ || freeIndices_.empty()) {
        return std::nullopt;
    }
    const size_t index = freeIndices_.top();
    freeIndices_.pop();
    assigned_.emplace(entryId, index);
    return index;
}

bool ChainPool::release(const std::string& entryId) {
    size_t index = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = assigned_.find(entryId);
        if (it == assigned_.end()) {
            return false;
        }
        index = it->second;
        assigned_.erase(it);
        freeIndices_.push(index);
    }
    chains_[index]->release();
    LOG_DEBUG("Chain {} released from {}", index, entryId);
    return true;
}

std::optional<size_t> ChainPool::indexOf(const std::string& entryId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = assigned_.find(entryId);
    if (it == assigned_.end()) {
        return std::nullopt;
    }
    return it->second;
}

DecoderChain* ChainPool::chainFor(const std::string& entryId) {
    auto index = indexOf(entryId);
    return index ? chains_[*index].get() : nullptr;
}

std::vector<std::string> ChainPool::assignedEntries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(assigned_.size());
    for (const auto& [id, index] : assigned_) {
        ids.push_back(id);
    }
    return ids;
}

size_t ChainPool::effectiveLimit() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return limit_;
}

size_t ChainPool::inUse() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return assigned_.size();
}

bool ChainPool::hasFree() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return assigned_.size() < limit_ && !freeIndices_.empty();
}

size_t ChainPool::lowerLimit() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (limit_ > 1) {
        --limit_;
        LOG_WARN("Decoder chain limit lowered to {}", limit_);
    }
    return limit_;
}

}  // namespace segue::playback
