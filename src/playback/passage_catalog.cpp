#include "playback/passage_catalog.h"

#include "core/error_codes.h"
#include "io/json_file.h"
#include "logging/logger.h"
#include "playback/entry_json.h"
#include "playback/passage_timing.h"

namespace segue::playback {

void MemoryPassageCatalog::add(const PassageRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_[record.passageId] = record;
}

std::optional<PassageRecord> MemoryPassageCatalog::find(const std::string& passageId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(passageId);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t MemoryPassageCatalog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

JsonPassageCatalog::JsonPassageCatalog(const std::string& path) {
    io::JsonFile file(path);
    std::optional<nlohmann::json> payload;
    try {
        payload = file.read();
    } catch (const nlohmann::json::exception& e) {
        throw EngineError(ErrorCode::PERSISTENCE_READ_FAILED,
                          "Passage catalog " + path + " is malformed: " + e.what());
    }
    if (!payload) {
        throw EngineError(ErrorCode::PERSISTENCE_READ_FAILED, "Passage catalog not found: " + path);
    }
    if (!payload->is_array()) {
        throw EngineError(ErrorCode::PERSISTENCE_READ_FAILED,
                          "Passage catalog must be a JSON array: " + path);
    }

    for (const auto& item : *payload) {
        if (!item.is_object() || !item.contains("passage_id") || !item["passage_id"].is_string() ||
            !item.contains("file") || !item["file"].is_string()) {
            LOG_WARN("Skipping catalog item without 'passage_id'/'file'");
            continue;
        }
        PassageRecord record;
        record.passageId = item["passage_id"].get<std::string>();
        record.filePath = item["file"].get<std::string>();
        try {
            record.timing = timingFromJson(item);
        } catch (const EngineError& e) {
            LOG_WARN("Skipping passage {}: {}", record.passageId, e.what());
            continue;
        }
        if (auto problem = validateTiming(record.timing)) {
            LOG_WARN("Skipping passage {}: {}", record.passageId, *problem);
            continue;
        }
        add(record);
    }
    LOG_INFO("Passage catalog {}: {} passages", path, size());
}

}  // namespace segue::playback
