/**
 * Persistence of input snapshots.
 *
 * Snapshots are stored as versioned JSON documents. A document that is
 * missing, unreadable or not at the current version loads as "no saved
 * data"; it is never migrated. Write failures throw a retryable
 * StoreError and leave the caller's snapshot untouched.
 */

#ifndef CUTLIST_SNAPSHOT_STORE_HPP
#define CUTLIST_SNAPSHOT_STORE_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "errors.hpp"
#include "types.hpp"

namespace cutlist {

class SnapshotStore {
public:
    virtual ~SnapshotStore() = default;

    virtual std::optional<InputSnapshot> load(const std::string& itemId) = 0;
    virtual void save(const std::string& itemId, const InputSnapshot& snapshot) = 0;
};

/**
 * One `<directory>/<itemId>.json` document per item.
 */
class FileSnapshotStore : public SnapshotStore {
public:
    explicit FileSnapshotStore(std::string directory);

    std::optional<InputSnapshot> load(const std::string& itemId) override;
    void save(const std::string& itemId, const InputSnapshot& snapshot) override;

    std::string pathFor(const std::string& itemId) const;

private:
    std::string directory_;
};

/**
 * Coalesces rapid saves of one item: only the newest snapshot scheduled
 * within the delay window is written, from a background thread. A failed
 * write keeps that snapshot pending for the next schedule() or flush().
 */
class DebouncedSaver {
public:
    DebouncedSaver(SnapshotStore& store, std::string itemId,
                   std::chrono::milliseconds delay = std::chrono::milliseconds(500));
    ~DebouncedSaver();

    DebouncedSaver(const DebouncedSaver&) = delete;
    DebouncedSaver& operator=(const DebouncedSaver&) = delete;

    void schedule(InputSnapshot snapshot);

    /**
     * Write the pending snapshot now, if any. Throws StoreError on failure.
     */
    void flush();

    bool hasPending() const;
    int savedCount() const;
    std::optional<std::string> lastError() const;

private:
    void run();
    void writePending(std::unique_lock<std::mutex>& lock);

    SnapshotStore& store_;
    std::string itemId_;
    std::chrono::milliseconds delay_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::mutex writeMutex_;
    std::optional<InputSnapshot> pending_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
    std::optional<std::string> lastError_;
    int savedCount_ = 0;
    bool stopping_ = false;
    std::thread worker_;
};

} // namespace cutlist

#endif // CUTLIST_SNAPSHOT_STORE_HPP
