#ifndef DYNAMICNEST_SRC_DYNAMIC_DYNAMIC_RUNNER_H_
#define DYNAMICNEST_SRC_DYNAMIC_DYNAMIC_RUNNER_H_

#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <vector>

#include "absl/synchronization/mutex.h"

#include "allocation_planner.h"
#include "sampler/sampler.h"

namespace DynamicNest {

/**
 * Seed for the run with the given thread_id (0 for the initial run). A pure
 * function of its arguments; negative base seeds mean "unseeded" and are
 * passed through unchanged.
 */
int64_t DeriveSeed(int64_t base_seed, int thread_id);

// "<file_root>_thread<index>" for plan entry index.
std::string ThreadFileRoot(const std::string& file_root, size_t index);

struct RunnerOptions {
    int num_workers = 1;
    size_t queue_capacity = 64;
};

/**
 * Runs one sampler invocation per allocation plan entry on a pool of worker
 * threads and returns the runs in entry order.
 */
class DynamicRunner {
public:
    DynamicRunner(ISampler& sampler, RunnerOptions options = RunnerOptions());

    /**
     * Blocks until every dispatched entry finished. Entries with no live
     * points or starting at or above plan.init_max_logl are not dispatched
     * and yield an empty run.
     *
     * The first failing entry cancels the others; its error is rethrown
     * (ExternalRunFailure naming the entry when the sampler raised something
     * else). A token cancelled by the caller raises CancelledError.
     */
    std::vector<RunRecord> Run(const AllocationPlan& plan, const SamplerConfig& base,
                               CancellationToken* cancel = nullptr);

    // Config for plan entry index, derived from the base config.
    static SamplerConfig ThreadConfig(const SamplerConfig& base, const AllocationEntry& entry,
                                      size_t index);

private:
    struct Task {
        size_t index;
        SamplerConfig config;
    };

    void RunTask(const Task& task, CancellationToken& cancel, std::vector<RunRecord>& results);
    void RecordFailure(std::exception_ptr error, CancellationToken& cancel);

    ISampler& sampler_;
    RunnerOptions options_;

    absl::Mutex mutex_;
    std::exception_ptr first_error_;
};

} // namespace DynamicNest

#endif // DYNAMICNEST_SRC_DYNAMIC_DYNAMIC_RUNNER_H_
