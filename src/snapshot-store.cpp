#include "snapshot-store.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

#include "json-io.hpp"
#include "log.hpp"

namespace fs = std::filesystem;

namespace cutlist {

namespace {

void checkItemId(const std::string& itemId) {
    bool valid = !itemId.empty() && itemId.size() <= 128 && itemId.front() != '.' &&
                 std::all_of(itemId.begin(), itemId.end(), [](unsigned char c) {
                     return std::isalnum(c) || c == '-' || c == '_' || c == '.';
                 });
    if (!valid) {
        throw StoreError("invalid item id '" + itemId + "'", false);
    }
}

} // namespace

// --- FileSnapshotStore ---

FileSnapshotStore::FileSnapshotStore(std::string directory) : directory_(std::move(directory)) {}

std::string FileSnapshotStore::pathFor(const std::string& itemId) const {
    checkItemId(itemId);
    return (fs::path(directory_) / (itemId + ".json")).string();
}

std::optional<InputSnapshot> FileSnapshotStore::load(const std::string& itemId) {
    std::string path = pathFor(itemId);
    std::ifstream in(path);
    if (!in) {
        logDebug("No saved snapshot for ", itemId);
        return std::nullopt;
    }

    json document = json::parse(in, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        logWarn("Ignoring unreadable snapshot ", path);
        return std::nullopt;
    }

    auto version = document.find("version");
    if (version == document.end() || !version->is_number_integer() ||
        version->get<int>() != kSnapshotVersion) {
        logInfo("Ignoring snapshot ", path, " saved at another version");
        return std::nullopt;
    }

    try {
        return document.get<InputSnapshot>();
    } catch (const json::exception& e) {
        logWarn("Ignoring malformed snapshot ", path, ": ", e.what());
    } catch (const std::invalid_argument& e) {
        logWarn("Ignoring malformed snapshot ", path, ": ", e.what());
    }
    return std::nullopt;
}

void FileSnapshotStore::save(const std::string& itemId, const InputSnapshot& snapshot) {
    std::string path = pathFor(itemId);

    std::string document;
    try {
        document = json(snapshot).dump(2);
    } catch (const json::exception& e) {
        // Labels and ids that are not valid UTF-8 cannot be written as JSON
        throw StoreError("cannot encode snapshot " + itemId + ": " + e.what(), false);
    }

    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw StoreError("cannot create " + directory_ + ": " + ec.message(), true);
    }

    // Write aside and rename so a failed write never truncates the last good copy
    std::string temp = path + ".tmp";
    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out) {
            throw StoreError("cannot open " + temp + " for writing", true);
        }
        out << document << '\n';
        out.flush();
        if (!out) {
            throw StoreError("failed writing " + temp, true);
        }
    }

    fs::rename(temp, path, ec);
    if (ec) {
        fs::remove(temp, ec);
        throw StoreError("cannot replace " + path, true);
    }
    logDebug("Saved snapshot ", itemId, " (", snapshot.parts.size(), " part(s))");
}

// --- DebouncedSaver ---

DebouncedSaver::DebouncedSaver(SnapshotStore& store, std::string itemId,
                               std::chrono::milliseconds delay)
    : store_(store), itemId_(std::move(itemId)), delay_(delay), worker_([this] { run(); }) {}

DebouncedSaver::~DebouncedSaver() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    wake_.notify_all();
    worker_.join();

    try {
        flush();
    } catch (const std::exception& e) {
        logError("Unsaved changes to ", itemId_, " lost on shutdown: ", e.what());
    }
}

void DebouncedSaver::schedule(InputSnapshot snapshot) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_ = std::move(snapshot);
        deadline_ = std::chrono::steady_clock::now() + delay_;
    }
    wake_.notify_all();
}

void DebouncedSaver::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    writePending(lock);
}

bool DebouncedSaver::hasPending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.has_value();
}

int DebouncedSaver::savedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return savedCount_;
}

std::optional<std::string> DebouncedSaver::lastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

void DebouncedSaver::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (!deadline_) {
            wake_.wait(lock);
            continue;
        }
        auto deadline = *deadline_;
        if (std::chrono::steady_clock::now() < deadline) {
            wake_.wait_until(lock, deadline);
            continue;
        }
        try {
            writePending(lock);
        } catch (const std::exception& e) {
            logWarn("Saving ", itemId_, " failed, keeping it pending: ", e.what());
        }
    }
}

void DebouncedSaver::writePending(std::unique_lock<std::mutex>& lock) {
    if (!pending_) {
        return;
    }

    // The newest snapshot is taken only under the write lock
    lock.unlock();
    std::lock_guard<std::mutex> writeLock(writeMutex_);
    lock.lock();
    if (!pending_) {
        deadline_.reset();
        return;
    }
    InputSnapshot snapshot = std::move(*pending_);
    pending_.reset();
    deadline_.reset();
    lock.unlock();

    try {
        store_.save(itemId_, snapshot);
    } catch (const std::exception& e) {
        lock.lock();
        // A newer schedule() wins over the failed snapshot
        if (!pending_) {
            pending_ = std::move(snapshot);
        }
        lastError_ = e.what();
        throw;
    }

    lock.lock();
    ++savedCount_;
    lastError_.reset();
}

} // namespace cutlist
