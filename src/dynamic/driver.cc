#include "driver.h"

#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <glog/logging.h>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"

#include "common/errors.h"

namespace DynamicNest {

namespace {

bool ForceSetting(const char* name, bool& value, bool required) {
    if (value == required) {
        return false;
    }
    LOG(WARNING) << "Sampler setting " << name << " must be " << (required ? "true" : "false")
                 << " for dynamic nested sampling; overriding";
    value = required;
    return true;
}

void ValidateArguments(double dynamic_goal, const DriverSettings& settings, int ninit,
                       int nlive_const, const DriverOptions& options) {
    ValidateDynamicGoal(dynamic_goal);
    if (ninit <= 0 || nlive_const <= 0) {
        throw ConfigurationError("ninit and nlive_const must be positive, got " +
                                 std::to_string(ninit) + " and " + std::to_string(nlive_const));
    }
    if (ninit > nlive_const) {
        throw ConfigurationError("ninit (" + std::to_string(ninit) + ") exceeds nlive_const (" +
                                 std::to_string(nlive_const) + ")");
    }
    if (settings.file_root.empty() || settings.base_dir.empty()) {
        throw ConfigurationError("file_root and base_dir must not be empty");
    }
    if (options.runner.num_workers < 1) {
        throw ConfigurationError("num_workers must be >= 1, got " +
                                 std::to_string(options.runner.num_workers));
    }
    if (!(settings.precision_criterion > 0.0)) {
        throw ConfigurationError("precision_criterion must be positive");
    }
}

void ThrowIfCancelled(const CancellationToken* cancel) {
    if (cancel != nullptr && cancel->IsCancelled()) {
        throw CancelledError("dynamic run cancelled");
    }
}

// Removes the files the initial run and the threads left under base_dir.
void RemoveIntermediateFiles(const DriverSettings& settings) {
    const std::string init_prefix = settings.file_root + "_init";
    const std::string thread_prefix = settings.file_root + "_thread";
    std::error_code ec;
    std::filesystem::directory_iterator it(settings.base_dir, ec);
    if (ec) {
        LOG(WARNING) << "Cannot list " << settings.base_dir << ": " << ec.message();
        return;
    }
    size_t removed = 0;
    for (const auto& entry : it) {
        const std::string name = entry.path().filename().string();
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        if (absl::StartsWith(name, init_prefix) || absl::StartsWith(name, thread_prefix)) {
            if (std::filesystem::remove(entry.path(), ec)) {
                ++removed;
            } else if (ec) {
                LOG(WARNING) << "Failed to remove " << entry.path() << ": " << ec.message();
            }
        }
    }
    VLOG(1) << "Removed " << removed << " intermediate files";
}

} // namespace

int CheckSettings(DriverSettings& settings) {
    int overridden = 0;
    overridden += ForceSetting("write_dead", settings.write_dead, true);
    overridden += ForceSetting("read_resume", settings.read_resume, false);
    return overridden;
}

std::string SettingsRoot(const std::string& likelihood_name, const std::string& prior_name,
                         int ndim, double prior_scale, double dynamic_goal, int nlive_const,
                         int ninit, int num_repeats) {
    return absl::StrCat(likelihood_name, "_", prior_name, "_", prior_scale, "_dg", dynamic_goal,
                        "_", ninit, "init_", ndim, "d_", nlive_const, "nlive_", num_repeats,
                        "nrepeats");
}

DynamicResult RunDynamicNestedSampling(ISampler& sampler, double dynamic_goal,
                                       DriverSettings settings, int ninit, int nlive_const,
                                       const DriverOptions& options) {
    ValidateArguments(dynamic_goal, settings, ninit, nlive_const, options);
    CheckSettings(settings);
    AllocationPlanner planner(options.planner);
    ImportanceCalculator importance(options.policy);
    DynamicRunner runner(sampler, options.runner);

    SamplerConfig base;
    base.num_repeats = settings.num_repeats;
    base.file_root = settings.file_root;
    base.base_dir = settings.base_dir;
    base.seed = settings.seed;
    base.max_ndead = settings.max_ndead;
    base.precision_criterion = settings.precision_criterion;
    base.prior_block = settings.prior_block;
    base.derived_block = settings.derived_block;
    base.write_dead = settings.write_dead;
    base.read_resume = settings.read_resume;
    base.equals = settings.equals;
    base.posteriors = settings.posteriors;

    SamplerConfig init_config = base;
    init_config.nlive = ninit;
    init_config.file_root = settings.file_root + "_init";
    init_config.seed = DeriveSeed(settings.seed, kInitialThreadId);
    init_config.thread_id = kInitialThreadId;

    LOG(INFO) << "Initial run: " << ninit << " live points, root " << init_config.file_root;
    RunRecord initial;
    try {
        initial = sampler.Run(init_config, options.cancel);
    } catch (const DynamicNestError&) {
        throw;
    } catch (const std::exception& e) {
        throw ExternalRunFailure("initial_run", ThreadIndex(kInitialThreadId), 0, e.what());
    }
    initial.Validate(options.merger.logl_tolerance);
    ThrowIfCancelled(options.cancel);
    LOG(INFO) << "Initial run finished with " << initial.size() << " dead points, max logl "
              << initial.max_logl();

    ImportanceProfile profile = importance.Compute(initial, dynamic_goal);
    AllocationPlan plan = planner.Plan(profile, initial, ninit, nlive_const);
    std::vector<RunRecord> threads = runner.Run(plan, base, options.cancel);
    ThrowIfCancelled(options.cancel);

    DynamicResult result;
    result.run = MergeRuns(std::move(initial), std::move(threads), options.merger);
    result.plan = std::move(plan);

    SummariseRun(result.run, result.summary);
    result.summary.nthreads = result.plan.entries.size();
    result.summary.planned_cost = result.plan.planned_cost;
    result.summary.dynamic_goal = dynamic_goal;
    result.summary.budget_scaled = result.plan.budget_scaled;

    const std::string dead_path = DeadBirthPath(settings.base_dir, settings.file_root);
    WriteDeadBirthFile(result.run, dead_path);
    WritePosteriorsFile(result.run, PosteriorsPath(settings.base_dir, settings.file_root));
    WriteStatsFile(result.summary,
                   (std::filesystem::path(settings.base_dir) / (settings.file_root + ".stats")).string());
    if (!settings.keep_thread_files) {
        RemoveIntermediateFiles(settings);
    }
    LOG(INFO) << "Wrote " << result.run.size() << " dead points to " << dead_path << ", logZ "
              << result.summary.log_evidence;
    return result;
}

} // namespace DynamicNest
