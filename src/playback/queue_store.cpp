#include "playback/queue_store.h"

#include "core/error_codes.h"
#include "logging/logger.h"
#include "playback/entry_json.h"

#include <algorithm>

namespace segue::playback {

namespace {

constexpr int kQueueFileVersion = 1;

}  // namespace

const char* toString(StoreResult result) {
    switch (result) {
    case StoreResult::Ok:
        return "ok";
    case StoreResult::NotFound:
        return "not_found";
    case StoreResult::Failed:
        return "failed";
    }
    return "unknown";
}

StoreResult MemoryQueueStore::insert(const QueueEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& row : rows_) {
        if (row.queueEntryId == entry.queueEntryId) {
            row = entry;
            return StoreResult::Ok;
        }
    }
    rows_.push_back(entry);
    return StoreResult::Ok;
}

StoreResult MemoryQueueStore::remove(const std::string& queueEntryId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(rows_.begin(), rows_.end(),
                           [&](const QueueEntry& e) { return e.queueEntryId == queueEntryId; });
    if (it == rows_.end()) {
        return StoreResult::NotFound;
    }
    rows_.erase(it);
    return StoreResult::Ok;
}

StoreResult MemoryQueueStore::update(const QueueEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& row : rows_) {
        if (row.queueEntryId == entry.queueEntryId) {
            row = entry;
            return StoreResult::Ok;
        }
    }
    return StoreResult::NotFound;
}

StoreResult MemoryQueueStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    rows_.clear();
    return StoreResult::Ok;
}

std::vector<QueueEntry> MemoryQueueStore::sortedLocked() const {
    std::vector<QueueEntry> rows = rows_;
    std::stable_sort(rows.begin(), rows.end(), [](const QueueEntry& a, const QueueEntry& b) {
        return a.playOrder < b.playOrder;
    });
    return rows;
}

std::vector<QueueEntry> MemoryQueueStore::loadAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    return sortedLocked();
}

JsonQueueStore::JsonQueueStore(std::string path) : file_(std::move(path)) {}

bool JsonQueueStore::flushLocked() {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& row : sortedLocked()) {
        entries.push_back(entryToJson(row));
    }
    nlohmann::json payload;
    payload["version"] = kQueueFileVersion;
    payload["entries"] = std::move(entries);
    if (!file_.writeJsonAtomically(payload)) {
        LOG_ERROR("Failed to write queue file {}", file_.path());
        return false;
    }
    return true;
}

StoreResult JsonQueueStore::insert(const QueueEntry& entry) {
    MemoryQueueStore::insert(entry);
    std::lock_guard<std::mutex> lock(mutex_);
    return flushLocked() ? StoreResult::Ok : StoreResult::Failed;
}

StoreResult JsonQueueStore::remove(const std::string& queueEntryId) {
    const StoreResult result = MemoryQueueStore::remove(queueEntryId);
    if (result != StoreResult::Ok) {
        return result;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return flushLocked() ? StoreResult::Ok : StoreResult::Failed;
}

StoreResult JsonQueueStore::update(const QueueEntry& entry) {
    const StoreResult result = MemoryQueueStore::update(entry);
    if (result != StoreResult::Ok) {
        return result;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return flushLocked() ? StoreResult::Ok : StoreResult::Failed;
}

StoreResult JsonQueueStore::clear() {
    MemoryQueueStore::clear();
    std::lock_guard<std::mutex> lock(mutex_);
    return flushLocked() ? StoreResult::Ok : StoreResult::Failed;
}

std::vector<QueueEntry> JsonQueueStore::loadAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (loaded_) {
        return sortedLocked();
    }
    loaded_ = true;

    std::optional<nlohmann::json> payload;
    try {
        payload = file_.read();
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Queue file {} is unreadable: {}", file_.path(), e.what());
        return {};
    }
    if (!payload) {
        LOG_INFO("No queue file at {}, starting empty", file_.path());
        return {};
    }
    if (!payload->contains("entries") || !(*payload)["entries"].is_array()) {
        LOG_ERROR("Queue file {} has no 'entries' array", file_.path());
        return {};
    }

    rows_.clear();
    for (const auto& item : (*payload)["entries"]) {
        try {
            rows_.push_back(entryFromJson(item));
        } catch (const EngineError& e) {
            LOG_WARN("Skipping queue row: {} ({})", e.what(), errorCodeToString(e.code()));
        }
    }
    LOG_INFO("Loaded {} queue rows from {}", rows_.size(), file_.path());
    return sortedLocked();
}

}  // namespace segue::playback
