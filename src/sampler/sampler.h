#ifndef DYNAMICNEST_SRC_SAMPLER_SAMPLER_H_
#define DYNAMICNEST_SRC_SAMPLER_SAMPLER_H_

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

#include "run/run_record.h"

namespace DynamicNest {

/**
 * Shared flag used to abandon a dynamic run. Samplers poll it; once set,
 * nothing produced afterwards is merged.
 */
class CancellationToken {
public:
    void Cancel() { cancelled_.store(true, std::memory_order_release); }
    bool IsCancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * Settings for one sampler invocation. Immutable once handed to a sampler;
 * every invocation gets its own copy.
 */
struct SamplerConfig {
    int nlive = 0;
    int num_repeats = 0;
    std::string file_root;
    std::string base_dir;
    // Negative seeds leave the sampler unseeded.
    int64_t seed = -1;
    // Sample only above this likelihood (the thread's thread_min_logl).
    std::optional<double> start_threshold;
    // Stop once every live point lies above this likelihood.
    std::optional<double> stop_threshold;
    // <= 0 means no limit.
    int max_ndead = -1;
    double precision_criterion = 0.001;
    int thread_id = kInitialThreadId;

    // Output switches of PolyChord-style samplers.
    bool write_dead = true;
    bool read_resume = false;
    bool equals = false;
    bool posteriors = false;

    // Opaque likelihood/prior description forwarded to external samplers.
    std::string prior_block;
    std::string derived_block;
};

/**
 * The nested sampler capability. Implementations run one nested sampling
 * pass with config.nlive live points and return its dead points with their
 * live point counts.
 *
 * Failures raise ExternalRunFailure (MalformedOutputError when output was
 * produced but is inconsistent, CancelledError when the token fired).
 * Implementations must be safe to call from several threads at once with
 * different configs.
 */
class ISampler {
public:
    virtual ~ISampler() = default;

    virtual RunRecord Run(const SamplerConfig& config, const CancellationToken* cancel) = 0;
};

} // namespace DynamicNest

#endif // DYNAMICNEST_SRC_SAMPLER_SAMPLER_H_
