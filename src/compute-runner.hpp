#ifndef CUTLIST_COMPUTE_RUNNER_HPP
#define CUTLIST_COMPUTE_RUNNER_HPP

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

#include "errors.hpp"
#include "options.hpp"
#include "types.hpp"

namespace cutlist {

/**
 * Runs compute() on a background thread with "last request wins" ordering.
 *
 * Each submit() supersedes every earlier request: a queued request is
 * replaced, the in-flight run has its cancel flag raised, and a result is
 * only delivered if its generation is still the newest when it finishes.
 */
class ComputeRunner {
public:
    using Callback = std::function<void(std::uint64_t generation, const Result<CutlistSummary>&)>;

    explicit ComputeRunner(Callback onResult, ComputeOptions options = {});
    ~ComputeRunner();

    ComputeRunner(const ComputeRunner&) = delete;
    ComputeRunner& operator=(const ComputeRunner&) = delete;

    /** Returns the generation assigned to this request. */
    std::uint64_t submit(InputSnapshot snapshot);

    /** Block until nothing is queued or running. */
    void waitIdle();

    std::uint64_t latestGeneration() const;
    int deliveredCount() const;
    int discardedCount() const;

private:
    struct Request {
        std::uint64_t generation = 0;
        InputSnapshot snapshot;
        CancelFlag cancel;
    };

    void run();

    Callback onResult_;
    ComputeOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::condition_variable idle_;
    std::optional<Request> queued_;
    CancelFlag inFlight_;
    std::uint64_t latest_ = 0;
    int delivered_ = 0;
    int discarded_ = 0;
    bool busy_ = false;
    bool stopping_ = false;
    std::thread worker_;
};

} // namespace cutlist

#endif // CUTLIST_COMPUTE_RUNNER_HPP
