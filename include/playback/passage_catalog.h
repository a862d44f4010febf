#pragma once

#include "playback/types.h"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace segue::playback {

struct PassageRecord {
    std::string passageId;
    std::string filePath;
    PassageTiming timing;
};

class PassageCatalog {
   public:
    virtual ~PassageCatalog() = default;
    virtual std::optional<PassageRecord> find(const std::string& passageId) const = 0;
};

class MemoryPassageCatalog : public PassageCatalog {
   public:
    void add(const PassageRecord& record);
    std::optional<PassageRecord> find(const std::string& passageId) const override;
    size_t size() const;

   protected:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, PassageRecord> records_;
};

/**
 * @brief Catalog read from a JSON array of passages:
 *
 *   [{"passage_id": "p1", "file": "/music/a.flac",
 *     "start_ms": 0, "end_ms": 215000, "fade_out_ms": 210000,
 *     "lead_out_ms": 208000, "fade_in_curve": "cosine"}, ...]
 *
 * Timing fields may be given in ticks (no suffix) or milliseconds (_ms).
 */
class JsonPassageCatalog : public MemoryPassageCatalog {
   public:
    // Throws EngineError(PERSISTENCE_READ_FAILED) when the file is missing or
    // malformed. Invalid passages are skipped with a warning.
    explicit JsonPassageCatalog(const std::string& path);
};

}  // namespace segue::playback
