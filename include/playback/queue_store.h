#pragma once

#include "io/json_file.h"
#include "playback/types.h"

#include <mutex>
#include <string>
#include <vector>

namespace segue::playback {

enum class StoreResult { Ok, NotFound, Failed };

const char* toString(StoreResult result);

// Durable copy of the queue. The in-memory QueueManager stays authoritative;
// store failures are reported, never thrown.
class QueueStore {
   public:
    virtual ~QueueStore() = default;

    virtual StoreResult insert(const QueueEntry& entry) = 0;
    virtual StoreResult remove(const std::string& queueEntryId) = 0;
    virtual StoreResult update(const QueueEntry& entry) = 0;
    virtual StoreResult clear() = 0;

    // Rows in ascending play order.
    virtual std::vector<QueueEntry> loadAll() = 0;
};

class MemoryQueueStore : public QueueStore {
   public:
    StoreResult insert(const QueueEntry& entry) override;
    StoreResult remove(const std::string& queueEntryId) override;
    StoreResult update(const QueueEntry& entry) override;
    StoreResult clear() override;
    std::vector<QueueEntry> loadAll() override;

   protected:
    // Caller holds mutex_.
    std::vector<QueueEntry> sortedLocked() const;

    mutable std::mutex mutex_;
    std::vector<QueueEntry> rows_;
};

/**
 * @brief Queue rows mirrored to a JSON file, rewritten on every mutation.
 *
 * The file holds {"version": 1, "entries": [...]}. Rows that fail to parse
 * are skipped with a warning when loading.
 */
class JsonQueueStore : public MemoryQueueStore {
   public:
    explicit JsonQueueStore(std::string path);

    StoreResult insert(const QueueEntry& entry) override;
    StoreResult remove(const std::string& queueEntryId) override;
    StoreResult update(const QueueEntry& entry) override;
    StoreResult clear() override;
    std::vector<QueueEntry> loadAll() override;

    const std::string& path() const {
        return file_.path();
    }

   private:
    // Caller holds mutex_.
    bool flushLocked();

    io::JsonFile file_;
    bool loaded_ = false;
};

}  // namespace segue::playback
