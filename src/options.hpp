#ifndef CUTLIST_OPTIONS_HPP
#define CUTLIST_OPTIONS_HPP

#include <atomic>
#include <cstdint>
#include <memory>

namespace cutlist {

using CancelFlag = std::shared_ptr<std::atomic<bool>>;

/**
 * Host-side tuning of a compute run. None of these change the result for
 * the fast and offcut strategies; the deep search stops at whichever of its
 * budgets runs out first and keeps the best candidate found.
 */
struct ComputeOptions {
    /** Candidate layouts evaluated by the deep search after its seed orders. */
    int deep_iterations = 400;
    /** Wall-clock limit for the deep search in ms; 0 disables it. */
    long deep_time_budget_ms = 0;
    /** Seed of the deep search's move generator. */
    std::uint32_t seed = 20240611u;
    /** Raised by the host when this run has been superseded. */
    CancelFlag cancel;

    bool cancelled() const { return cancel && cancel->load(); }
};

} // namespace cutlist

#endif // CUTLIST_OPTIONS_HPP
