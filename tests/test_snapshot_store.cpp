#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <random>
#include <thread>
#include <vector>

#include "json-io.hpp"
#include "snapshot-store.hpp"
#include "test_helpers.hpp"

using namespace cutlist;
using namespace cutlist::fixtures;

namespace fs = std::filesystem;

namespace {

class SnapshotStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device device;
        directory_ = fs::temp_directory_path() /
                     ("cutlist-store-" + std::to_string(device()) + "-" +
                      std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(directory_, ec);
    }

    void writeRaw(const std::string& itemId, const std::string& text) {
        fs::create_directories(directory_);
        std::ofstream out(directory_ / (itemId + ".json"));
        out << text;
    }

    fs::path directory_;
};

InputSnapshot sampleSnapshot() {
    auto snapshot = standardSnapshot();
    Part part = makePart("side", 720, 560, 2);
    part.edge(Edge::Top).banded = true;
    snapshot.parts.push_back(part);
    snapshot.priority = OptimizationPriority::Offcut;
    return snapshot;
}

/** In-memory store that can be told to fail. */
class RecordingStore : public SnapshotStore {
public:
    std::optional<InputSnapshot> load(const std::string& itemId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = saved_.find(itemId);
        if (it == saved_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void save(const std::string& itemId, const InputSnapshot& snapshot) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++attempts_;
        if (failing_) {
            throw StoreError("store offline", true);
        }
        saved_[itemId] = snapshot;
        ++writes_;
    }

    void setFailing(bool failing) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_ = failing;
    }

    int writes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return writes_;
    }

    int attempts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return attempts_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, InputSnapshot> saved_;
    bool failing_ = false;
    int writes_ = 0;
    int attempts_ = 0;
};

/**
 * Store whose saves wait until released. The first save can be set to
 * fail once released.
 */
class GatedStore : public SnapshotStore {
public:
    std::optional<InputSnapshot> load(const std::string&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (saved_.empty()) {
            return std::nullopt;
        }
        return saved_.back();
    }

    void save(const std::string&, const InputSnapshot& snapshot) override {
        std::unique_lock<std::mutex> lock(mutex_);
        int call = ++entered_;
        released_.wait(lock, [this] { return open_; });
        if (call == 1 && failFirst_) {
            throw StoreError("store offline", true);
        }
        saved_.push_back(snapshot);
    }

    void failFirst() {
        std::lock_guard<std::mutex> lock(mutex_);
        failFirst_ = true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        released_.notify_all();
    }

    int entered() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entered_;
    }

    std::vector<InputSnapshot> saved() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return saved_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::vector<InputSnapshot> saved_;
    bool open_ = false;
    bool failFirst_ = false;
    int entered_ = 0;
};

InputSnapshot snapshotWithQuantity(int quantity) {
    auto snapshot = sampleSnapshot();
    snapshot.parts[0].quantity = quantity;
    return snapshot;
}

template <class Predicate>
bool waitFor(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

} // namespace

TEST_F(SnapshotStoreTest, MissingItemLoadsAsNothing) {
    FileSnapshotStore store(directory_.string());
    EXPECT_FALSE(store.load("quote-item-1").has_value());
}

TEST_F(SnapshotStoreTest, SaveThenLoadReturnsEqualSnapshot) {
    FileSnapshotStore store(directory_.string());
    auto snapshot = sampleSnapshot();

    store.save("quote-item-1", snapshot);
    auto loaded = store.load("quote-item-1");

    ASSERT_TRUE(loaded.has_value());
    EXPECT_TRUE(*loaded == snapshot);
}

TEST_F(SnapshotStoreTest, SavedDocumentIsVersioned) {
    FileSnapshotStore store(directory_.string());
    store.save("item", sampleSnapshot());

    std::ifstream in(store.pathFor("item"));
    json document = json::parse(in);
    EXPECT_EQ(document["version"], 2);
    EXPECT_FALSE(fs::exists(store.pathFor("item") + ".tmp"));
}

TEST_F(SnapshotStoreTest, OtherVersionsLoadAsNothing) {
    FileSnapshotStore store(directory_.string());
    json document = sampleSnapshot();

    document["version"] = 1;
    writeRaw("old", document.dump());
    EXPECT_FALSE(store.load("old").has_value());

    document.erase("version");
    writeRaw("unversioned", document.dump());
    EXPECT_FALSE(store.load("unversioned").has_value());
}

TEST_F(SnapshotStoreTest, CorruptDocumentLoadsAsNothing) {
    FileSnapshotStore store(directory_.string());
    writeRaw("broken", "{\"version\": 2, \"parts\": [");
    EXPECT_FALSE(store.load("broken").has_value());

    writeRaw("mistyped", "{\"version\": 2, \"parts\": [{\"id\": \"a\", \"length_mm\": \"x\"}]}");
    EXPECT_FALSE(store.load("mistyped").has_value());
}

TEST_F(SnapshotStoreTest, RejectsUnsafeItemIds) {
    FileSnapshotStore store(directory_.string());
    for (const std::string id : {"", "../escape", "a/b", ".hidden"}) {
        try {
            store.save(id, sampleSnapshot());
            ADD_FAILURE() << "accepted item id '" << id << "'";
        } catch (const StoreError& e) {
            EXPECT_FALSE(e.retryable()) << id;
        }
    }
}

TEST_F(SnapshotStoreTest, UnwritableDirectoryIsRetryable) {
    fs::create_directories(directory_);
    std::ofstream(directory_ / "blocker") << "not a directory";

    FileSnapshotStore store((directory_ / "blocker").string());
    try {
        store.save("item", sampleSnapshot());
        FAIL() << "save into a file path succeeded";
    } catch (const StoreError& e) {
        EXPECT_TRUE(e.retryable());
    }
}

TEST_F(SnapshotStoreTest, LabelThatIsNotUtf8FailsWithoutRetry) {
    FileSnapshotStore store(directory_.string());
    auto snapshot = sampleSnapshot();
    snapshot.parts[0].label = "\xff";

    try {
        store.save("item", snapshot);
        FAIL() << "saved a label that is not UTF-8";
    } catch (const StoreError& e) {
        EXPECT_FALSE(e.retryable());
    }
    EXPECT_FALSE(store.load("item").has_value());
    EXPECT_FALSE(fs::exists(store.pathFor("item") + ".tmp"));
}

TEST_F(SnapshotStoreTest, SaverKeepsSnapshotItCannotEncode) {
    FileSnapshotStore store(directory_.string());
    auto bad = sampleSnapshot();
    bad.parts[0].label = "\xff";

    {
        DebouncedSaver saver(store, "item", std::chrono::milliseconds(20));
        saver.schedule(bad);
        // The background write fails and is reported instead of escaping the thread
        ASSERT_TRUE(waitFor([&] { return saver.lastError().has_value(); }));
        EXPECT_TRUE(saver.hasPending());
        EXPECT_THROW(saver.flush(), StoreError);
        EXPECT_TRUE(saver.hasPending());

        auto good = sampleSnapshot();
        saver.schedule(good);
        saver.flush();
        EXPECT_FALSE(saver.hasPending());
        auto loaded = store.load("item");
        ASSERT_TRUE(loaded.has_value());
        EXPECT_TRUE(*loaded == good);
    }
}

TEST(DebouncedSaver, CoalescesRapidSaves) {
    RecordingStore store;
    DebouncedSaver saver(store, "item", std::chrono::milliseconds(50));

    for (int quantity = 1; quantity <= 5; ++quantity) {
        auto snapshot = sampleSnapshot();
        snapshot.parts[0].quantity = quantity;
        saver.schedule(snapshot);
    }

    ASSERT_TRUE(waitFor([&] { return saver.savedCount() == 1; }));
    EXPECT_EQ(store.writes(), 1);
    EXPECT_FALSE(saver.hasPending());
    auto saved = store.load("item");
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(saved->parts[0].quantity, 5);
}

TEST(DebouncedSaver, FlushWritesImmediately) {
    RecordingStore store;
    DebouncedSaver saver(store, "item", std::chrono::seconds(30));

    saver.schedule(sampleSnapshot());
    EXPECT_TRUE(saver.hasPending());
    saver.flush();

    EXPECT_FALSE(saver.hasPending());
    EXPECT_EQ(store.writes(), 1);
    EXPECT_TRUE(store.load("item").has_value());
}

TEST(DebouncedSaver, FailedSaveKeepsSnapshotPending) {
    RecordingStore store;
    store.setFailing(true);
    DebouncedSaver saver(store, "item", std::chrono::seconds(30));

    auto snapshot = sampleSnapshot();
    saver.schedule(snapshot);
    EXPECT_THROW(saver.flush(), StoreError);
    EXPECT_TRUE(saver.hasPending());
    ASSERT_TRUE(saver.lastError().has_value());
    EXPECT_EQ(*saver.lastError(), "store offline");

    store.setFailing(false);
    saver.flush();
    EXPECT_FALSE(saver.hasPending());
    EXPECT_FALSE(saver.lastError().has_value());
    auto saved = store.load("item");
    ASSERT_TRUE(saved.has_value());
    EXPECT_TRUE(*saved == snapshot);
}

TEST(DebouncedSaver, BackgroundFailureIsReported) {
    RecordingStore store;
    store.setFailing(true);
    DebouncedSaver saver(store, "item", std::chrono::milliseconds(20));

    saver.schedule(sampleSnapshot());
    ASSERT_TRUE(waitFor([&] { return store.attempts() >= 1 && saver.lastError().has_value(); }));
    EXPECT_TRUE(saver.hasPending());
    EXPECT_EQ(saver.savedCount(), 0);

    store.setFailing(false);
}

TEST(DebouncedSaver, NewerSnapshotIsWrittenLast) {
    GatedStore store;
    DebouncedSaver saver(store, "item", std::chrono::seconds(30));

    saver.schedule(snapshotWithQuantity(1));
    std::thread first([&] { saver.flush(); });
    ASSERT_TRUE(waitFor([&] { return store.entered() == 1; }));

    saver.schedule(snapshotWithQuantity(2));
    std::thread second([&] { saver.flush(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    store.release();
    first.join();
    second.join();

    auto saved = store.saved();
    ASSERT_EQ(saved.size(), 2u);
    EXPECT_EQ(saved[0].parts[0].quantity, 1);
    EXPECT_EQ(saved[1].parts[0].quantity, 2);
    EXPECT_FALSE(saver.hasPending());
}

TEST(DebouncedSaver, FailedOlderSnapshotIsNotQueuedBehindNewer) {
    GatedStore store;
    store.failFirst();
    DebouncedSaver saver(store, "item", std::chrono::seconds(30));

    saver.schedule(snapshotWithQuantity(1));
    std::thread first([&] { EXPECT_THROW(saver.flush(), StoreError); });
    ASSERT_TRUE(waitFor([&] { return store.entered() == 1; }));

    saver.schedule(snapshotWithQuantity(2));
    std::thread second([&] { saver.flush(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    store.release();
    first.join();
    second.join();

    EXPECT_FALSE(saver.hasPending());
    auto latest = store.load("item");
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->parts[0].quantity, 2);

    // Nothing older is left to overwrite it
    saver.flush();
    EXPECT_EQ(store.saved().size(), 1u);
}
