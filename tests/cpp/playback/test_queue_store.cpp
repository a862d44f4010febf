#include "core/error_codes.h"
#include "playback/entry_json.h"
#include "playback/passage_catalog.h"
#include "playback/queue_store.h"
#include "test_support.h"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace segue::playback;
using segue::EngineError;
using segue::ErrorCode;
using segue::test::makeEntry;
using segue::timing::msToTicks;

namespace {

QueueEntry entryWithOrder(const std::string& id, std::int64_t order) {
    QueueEntry entry = makeEntry(id, "/music/" + id + ".flac", 0, 60000);
    entry.playOrder = order;
    entry.passageId = "passage-" + id;
    return entry;
}

}  // namespace

class QueueStoreTest : public ::testing::Test {
   protected:
    fs::path tempDir;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = info ? std::string(info->name()) : "queue_store";
        for (char& c : name) {
            if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) {
                c = '_';
            }
        }
        tempDir = fs::temp_directory_path() /
                  ("segue_queue_store_" + name + "_" + std::to_string(getpid()));
        fs::create_directories(tempDir);
    }

    void TearDown() override {
        fs::remove_all(tempDir);
    }

    void writeText(const fs::path& path, const std::string& text) {
        std::ofstream out(path);
        out << text;
    }
};

TEST_F(QueueStoreTest, MemoryStoreKeepsPlayOrder) {
    MemoryQueueStore store;
    EXPECT_EQ(store.insert(entryWithOrder("c", 3)), StoreResult::Ok);
    EXPECT_EQ(store.insert(entryWithOrder("a", 1)), StoreResult::Ok);
    EXPECT_EQ(store.insert(entryWithOrder("b", 2)), StoreResult::Ok);

    auto rows = store.loadAll();
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].queueEntryId, "a");
    EXPECT_EQ(rows[2].queueEntryId, "c");

    EXPECT_EQ(store.remove("b"), StoreResult::Ok);
    EXPECT_EQ(store.remove("b"), StoreResult::NotFound);
    EXPECT_EQ(store.update(entryWithOrder("zzz", 9)), StoreResult::NotFound);
    EXPECT_EQ(store.clear(), StoreResult::Ok);
    EXPECT_TRUE(store.loadAll().empty());
}

TEST_F(QueueStoreTest, MemoryStoreInsertReplacesSameId) {
    MemoryQueueStore store;
    store.insert(entryWithOrder("a", 1));
    QueueEntry changed = entryWithOrder("a", 1);
    changed.discoveredEnd = msToTicks(500);
    store.insert(changed);
    auto rows = store.loadAll();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].discoveredEnd, msToTicks(500));
}

TEST_F(QueueStoreTest, JsonStoreSurvivesReopen) {
    const std::string path = (tempDir / "queue.json").string();
    {
        JsonQueueStore store(path);
        EXPECT_TRUE(store.loadAll().empty());
        ASSERT_EQ(store.insert(entryWithOrder("b", 2)), StoreResult::Ok);
        ASSERT_EQ(store.insert(entryWithOrder("a", 1)), StoreResult::Ok);
        QueueEntry updated = entryWithOrder("b", 2);
        updated.discoveredEnd = msToTicks(42000);
        ASSERT_EQ(store.update(updated), StoreResult::Ok);
    }

    JsonQueueStore reopened(path);
    auto rows = reopened.loadAll();
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].queueEntryId, "a");
    EXPECT_EQ(rows[0].passageId, "passage-a");
    EXPECT_EQ(rows[1].discoveredEnd, msToTicks(42000));
    EXPECT_EQ(rows[1].timing.end, msToTicks(60000));

    ASSERT_EQ(reopened.remove("a"), StoreResult::Ok);
    JsonQueueStore third(path);
    EXPECT_EQ(third.loadAll().size(), 1u);
}

TEST_F(QueueStoreTest, JsonStoreFileLayout) {
    const fs::path path = tempDir / "queue.json";
    JsonQueueStore store(path.string());
    store.insert(entryWithOrder("a", 1));

    std::ifstream in(path);
    const auto json = nlohmann::json::parse(in);
    EXPECT_EQ(json["version"], 1);
    ASSERT_TRUE(json["entries"].is_array());
    ASSERT_EQ(json["entries"].size(), 1u);
    EXPECT_EQ(json["entries"][0]["queue_entry_id"], "a");
    EXPECT_EQ(json["entries"][0]["timing"]["end"], msToTicks(60000));
}

TEST_F(QueueStoreTest, JsonStoreSkipsBrokenRows) {
    const fs::path path = tempDir / "queue.json";
    writeText(path, R"({"version": 1, "entries": [
        {"queue_entry_id": "ok", "file": "/a.flac", "play_order": 1},
        {"file": "/missing-id.flac"},
        {"queue_entry_id": "bad-curve", "file": "/b.flac",
         "timing": {"fade_in_curve": "sawtooth"}}
    ]})");
    JsonQueueStore store(path.string());
    auto rows = store.loadAll();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].queueEntryId, "ok");
}

TEST_F(QueueStoreTest, JsonStoreTreatsMalformedFileAsEmpty) {
    const fs::path path = tempDir / "queue.json";
    writeText(path, "{ not json");
    JsonQueueStore store(path.string());
    EXPECT_TRUE(store.loadAll().empty());
}

TEST_F(QueueStoreTest, JsonStoreReportsWriteFailure) {
    JsonQueueStore store((tempDir / "missing_dir" / "queue.json").string());
    EXPECT_TRUE(store.loadAll().empty());
    EXPECT_EQ(store.insert(entryWithOrder("a", 1)), StoreResult::Failed);
    // The in-memory copy still holds the row.
    EXPECT_EQ(store.loadAll().size(), 1u);
}

TEST_F(QueueStoreTest, TimingReadsMillisecondFields) {
    const auto timing = timingFromJson(nlohmann::json{{"start_ms", 250},
                                                      {"end_ms", 1500},
                                                      {"fade_out_ms", 1000},
                                                      {"lead_out", msToTicks(1250)},
                                                      {"fade_in_curve", "linear"}});
    EXPECT_EQ(timing.start, msToTicks(250));
    EXPECT_EQ(timing.end, msToTicks(1500));
    EXPECT_EQ(timing.fadeInPoint, msToTicks(250));
    EXPECT_EQ(timing.leadInPoint, msToTicks(250));
    EXPECT_EQ(timing.fadeOutPoint, msToTicks(1000));
    EXPECT_EQ(timing.leadOutPoint, msToTicks(1250));
    EXPECT_EQ(timing.fadeInCurve, segue::audio::FadeCurve::Linear);
    EXPECT_EQ(timing.fadeOutCurve, segue::audio::FadeCurve::Exponential);
}

TEST_F(QueueStoreTest, TimingRejectsBadFields) {
    try {
        timingFromJson(nlohmann::json{{"fade_out_curve", "zigzag"}});
        FAIL() << "expected EngineError";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.code(), ErrorCode::VALIDATION_INVALID_TIMING);
    }
    EXPECT_THROW(timingFromJson(nlohmann::json{{"start", "soon"}}), EngineError);
    EXPECT_THROW(timingFromJson(nlohmann::json::array()), EngineError);
}

TEST_F(QueueStoreTest, EntryJsonKeepsOptionalFields) {
    QueueEntry entry = makeEntry("e1", "/x.wav");
    const auto json = entryToJson(entry);
    EXPECT_TRUE(json["passage_id"].is_null());
    EXPECT_TRUE(json["timing"]["end"].is_null());

    const QueueEntry back = entryFromJson(json);
    EXPECT_FALSE(back.passageId.has_value());
    EXPECT_FALSE(back.timing.end.has_value());
    EXPECT_FALSE(back.discoveredEnd.has_value());
    EXPECT_EQ(back.filePath, "/x.wav");

    try {
        entryFromJson(nlohmann::json{{"file", "/x.wav"}});
        FAIL() << "expected EngineError";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.code(), ErrorCode::PERSISTENCE_READ_FAILED);
    }
}

TEST_F(QueueStoreTest, MemoryCatalogLookup) {
    MemoryPassageCatalog catalog;
    PassageRecord record;
    record.passageId = "p1";
    record.filePath = "/music/p1.flac";
    catalog.add(record);
    EXPECT_EQ(catalog.size(), 1u);
    ASSERT_TRUE(catalog.find("p1").has_value());
    EXPECT_EQ(catalog.find("p1")->filePath, "/music/p1.flac");
    EXPECT_FALSE(catalog.find("p2").has_value());
}

TEST_F(QueueStoreTest, JsonCatalogSkipsInvalidPassages) {
    const fs::path path = tempDir / "catalog.json";
    writeText(path, R"([
        {"passage_id": "p1", "file": "/music/a.flac", "start_ms": 0, "end_ms": 1500,
         "fade_out_ms": 1000, "lead_out_ms": 1250, "fade_in_curve": "cosine"},
        {"passage_id": "p2", "file": "/music/b.flac", "start_ms": 1500, "end_ms": 1000},
        {"passage_id": "p3"},
        {"passage_id": "p4", "file": "/music/d.flac", "fade_out_curve": "zigzag"}
    ])");
    JsonPassageCatalog catalog(path.string());
    EXPECT_EQ(catalog.size(), 1u);
    const auto p1 = catalog.find("p1");
    ASSERT_TRUE(p1.has_value());
    EXPECT_EQ(p1->timing.end, msToTicks(1500));
    EXPECT_EQ(p1->timing.fadeInCurve, segue::audio::FadeCurve::SCurve);
}

TEST_F(QueueStoreTest, JsonCatalogRequiresReadableArray) {
    try {
        JsonPassageCatalog missing((tempDir / "none.json").string());
        FAIL() << "expected EngineError";
    } catch (const EngineError& e) {
        EXPECT_EQ(e.code(), ErrorCode::PERSISTENCE_READ_FAILED);
    }

    const fs::path object = tempDir / "object.json";
    writeText(object, R"({"passage_id": "p1"})");
    EXPECT_THROW(JsonPassageCatalog catalog(object.string()), EngineError);

    const fs::path broken = tempDir / "broken.json";
    writeText(broken, "[{");
    EXPECT_THROW(JsonPassageCatalog catalog(broken.string()), EngineError);
}
