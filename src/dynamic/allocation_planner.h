#ifndef DYNAMICNEST_SRC_DYNAMIC_ALLOCATION_PLANNER_H_
#define DYNAMICNEST_SRC_DYNAMIC_ALLOCATION_PLANNER_H_

#include <vector>

#include "importance.h"
#include "run/run_record.h"

namespace DynamicNest {

/**
 * One thread to run: nlive additional live points sampled above start_logl
 * until every live point is above end_logl.
 */
struct AllocationEntry {
    double start_logl = kLogZero;
    double end_logl = kLogZero;
    int nlive = 0;
};

struct AllocationPlan {
    // Ordered by start_logl, then end_logl.
    std::vector<AllocationEntry> entries;
    // Highest likelihood reached by the initial run.
    double init_max_logl = kLogZero;
    // Additional samples allowed: nlive_const * ndead_init / ninit - ndead_init.
    double budget = 0.0;
    // Sum over entries of nlive * (logX(start) - logX(end)) on the initial run.
    double planned_cost = 0.0;
    // Largest target live point count along the run.
    double peak_nlive = 0.0;
    // Set when additional counts were scaled down to fit the budget.
    bool budget_scaled = false;
};

struct PlannerOptions {
    // Centred moving average over this many points of the target profile;
    // 0 or 1 disables smoothing.
    int smoothing_window = 0;
    // Additional counts are multiples of this; larger values give fewer,
    // fatter threads.
    int nlive_quantum = 1;
};

class AllocationPlanner {
public:
    explicit AllocationPlanner(PlannerOptions options = PlannerOptions());

    /**
     * Turns the importance profile of the initial run into thread entries.
     * The target live point count t_i = c * weight_i * nlive_i is normalised
     * so that it integrates to the budget of a constant nlive_const run; the
     * additional count max(0, t_i - nlive_i) is then decomposed into the
     * fewest rectangular (start, end, nlive) layers.
     *
     * Throws ConfigurationError for non-positive counts, ninit > nlive_const
     * or a profile that does not match the run.
     */
    AllocationPlan Plan(const ImportanceProfile& profile, const RunRecord& initial,
                        int ninit, int nlive_const) const;

private:
    std::vector<double> Smooth(const std::vector<double>& values) const;

    PlannerOptions options_;
};

/**
 * Fewest (start, end, nlive) layers whose sum equals `additional` point by
 * point over the initial run. A layer covering points s..e starts at the
 * logl of point s - 1 (kLogZero for s = 0) and ends at the logl of point e.
 */
std::vector<AllocationEntry> DecomposeLayers(const std::vector<int>& additional,
                                             const RunRecord& initial);

// logX of the initial run at a likelihood threshold (0 below the first point).
double LogXAtThreshold(const RunRecord& initial, const std::vector<double>& logx, double logl);

// Sum over entries of nlive * (logX(start) - logX(end)).
double PlannedCost(const std::vector<AllocationEntry>& entries, const RunRecord& initial);

} // namespace DynamicNest

#endif // DYNAMICNEST_SRC_DYNAMIC_ALLOCATION_PLANNER_H_
