#ifndef DYNAMICNEST_SRC_RUN_RUN_IO_H_
#define DYNAMICNEST_SRC_RUN_RUN_IO_H_

#include <string>
#include <vector>

#include "run_record.h"

namespace DynamicNest {

// Samplers in the PolyChord family write log(0) as this value.
constexpr double kSamplerLogZero = -1e30;

std::string DeadBirthPath(const std::string& base_dir, const std::string& file_root);

/**
 * Reads a "<root>_dead-birth.txt" file. Each row holds the parameters
 * followed by logl and the logl of the contour the point was born in.
 * Live point counts are reconstructed from the birth contours.
 *
 * Throws MalformedOutputError (tagged with thread_id) on unreadable or
 * inconsistent rows and std::runtime_error if the file cannot be opened.
 */
RunRecord ReadDeadBirthFile(const std::string& path, int thread_id = kInitialThreadId,
                            double thread_min_logl = kLogZero);

/**
 * Writes the run in the same format, full precision. Creates parent
 * directories. Throws std::runtime_error on I/O failure.
 */
void WriteDeadBirthFile(const RunRecord& run, const std::string& path);

// "<base_dir>/<file_root>.txt"
std::string PosteriorsPath(const std::string& base_dir, const std::string& file_root);

/**
 * Writes the weighted posterior samples in PolyChord's posteriors format:
 * one row per dead point with weight / max weight, -2 logl and the
 * parameters. Throws std::runtime_error on I/O failure.
 */
void WritePosteriorsFile(const RunRecord& run, const std::string& path);

struct RunSummary {
    size_t ndead = 0;
    size_t nthreads = 0;
    double log_evidence = kLogZero;
    double planned_cost = 0.0;
    double dynamic_goal = 0.0;
    bool budget_scaled = false;
    // Posterior mean and standard deviation per parameter.
    std::vector<double> param_means;
    std::vector<double> param_sigmas;
};

// Fills the evidence and parameter estimates of `summary` from `run`.
void SummariseRun(const RunRecord& run, RunSummary& summary);

void WriteStatsFile(const RunSummary& summary, const std::string& path);

} // namespace DynamicNest

#endif // DYNAMICNEST_SRC_RUN_RUN_IO_H_
