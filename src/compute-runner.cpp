#include "compute-runner.hpp"

#include <atomic>
#include <memory>
#include <utility>

#include "log.hpp"
#include "summary.hpp"

namespace cutlist {

ComputeRunner::ComputeRunner(Callback onResult, ComputeOptions options)
    : onResult_(std::move(onResult)), options_(std::move(options)), worker_([this] { run(); }) {}

ComputeRunner::~ComputeRunner() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        queued_.reset();
        if (inFlight_) {
            inFlight_->store(true);
        }
    }
    wake_.notify_all();
    worker_.join();
}

std::uint64_t ComputeRunner::submit(InputSnapshot snapshot) {
    std::uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        generation = ++latest_;
        if (inFlight_) {
            inFlight_->store(true);
        }
        if (queued_) {
            ++discarded_;
        }
        queued_ = Request{generation, std::move(snapshot), std::make_shared<std::atomic<bool>>(false)};
    }
    wake_.notify_all();
    return generation;
}

void ComputeRunner::waitIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return !queued_ && !busy_; });
}

std::uint64_t ComputeRunner::latestGeneration() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_;
}

int ComputeRunner::deliveredCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return delivered_;
}

int ComputeRunner::discardedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return discarded_;
}

void ComputeRunner::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        wake_.wait(lock, [this] { return stopping_ || queued_.has_value(); });
        if (stopping_) {
            break;
        }

        Request request = std::move(*queued_);
        queued_.reset();
        inFlight_ = request.cancel;
        busy_ = true;
        lock.unlock();

        ComputeOptions options = options_;
        options.cancel = request.cancel;
        auto result = compute(request.snapshot, options);

        lock.lock();
        inFlight_.reset();
        bool current = request.generation == latest_ && !stopping_;
        if (current) {
            ++delivered_;
        } else {
            ++discarded_;
            logDebug("Discarding result of superseded request ", request.generation);
        }

        if (current && onResult_) {
            lock.unlock();
            onResult_(request.generation, result);
            lock.lock();
        }
        busy_ = false;
        idle_.notify_all();
    }
    busy_ = false;
    idle_.notify_all();
}

} // namespace cutlist
