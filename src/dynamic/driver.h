#ifndef DYNAMICNEST_SRC_DYNAMIC_DRIVER_H_
#define DYNAMICNEST_SRC_DYNAMIC_DRIVER_H_

#include <cstdint>
#include <memory>
#include <string>

#include "allocation_planner.h"
#include "dynamic_runner.h"
#include "importance.h"
#include "run/run_io.h"
#include "run_merger.h"
#include "sampler/sampler.h"

namespace DynamicNest {

/**
 * Sampler settings shared by the initial run and every thread.
 */
struct DriverSettings {
    std::string file_root;
    std::string base_dir;
    int64_t seed = -1;
    int num_repeats = 0;
    int max_ndead = -1;
    double precision_criterion = 0.001;
    bool keep_thread_files = false;

    // Required by the dynamic run; other values are overridden with a warning.
    bool write_dead = true;
    bool read_resume = false;
    // Forwarded to the sampler as given.
    bool equals = false;
    bool posteriors = false;

    std::string prior_block;
    std::string derived_block;
};

struct DriverOptions {
    RunnerOptions runner;
    PlannerOptions planner;
    MergerOptions merger;
    // Null selects PosteriorMassPolicy.
    std::shared_ptr<const ImportancePolicy> policy;
    // Optional; cancelling it abandons the run with CancelledError.
    CancellationToken* cancel = nullptr;
};

struct DynamicResult {
    RunRecord run;
    AllocationPlan plan;
    RunSummary summary;
};

// Forces the mandatory sampler settings, logging a warning for each override.
// Returns the number of settings overridden.
int CheckSettings(DriverSettings& settings);

// "<likelihood>_<prior>_<prior_scale>_dg<goal>_<ninit>init_<ndim>d_<nlive>nlive_<nrepeats>nrepeats"
std::string SettingsRoot(const std::string& likelihood_name, const std::string& prior_name,
                         int ndim, double prior_scale, double dynamic_goal, int nlive_const,
                         int ninit, int num_repeats);

/**
 * Dynamic nested sampling: an exploratory run with ninit live points, an
 * allocation of the remaining budget of a constant nlive_const run following
 * the importance for dynamic_goal, the threads realising it and their merge.
 *
 * The combined run is written to "<base_dir>/<file_root>_dead-birth.txt",
 * its posterior samples to "<file_root>.txt" and a "<file_root>.stats"
 * summary with the parameter means. Invalid arguments raise
 * ConfigurationError before the sampler is called; sampler failures
 * propagate and nothing is written.
 */
DynamicResult RunDynamicNestedSampling(ISampler& sampler, double dynamic_goal,
                                       DriverSettings settings, int ninit, int nlive_const,
                                       const DriverOptions& options = DriverOptions());

} // namespace DynamicNest

#endif // DYNAMICNEST_SRC_DYNAMIC_DRIVER_H_
