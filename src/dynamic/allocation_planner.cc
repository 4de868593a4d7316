#include "allocation_planner.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <string>
#include <utility>

#include <glog/logging.h>

#include "common/errors.h"

namespace DynamicNest {

namespace {

// Cost in samples of adding `counts` live points along the initial run.
double CostOf(const std::vector<double>& counts, const std::vector<double>& dlogx) {
    double cost = 0.0;
    for (size_t i = 0; i < counts.size(); ++i) {
        cost += counts[i] * dlogx[i];
    }
    return cost;
}

} // namespace

AllocationPlanner::AllocationPlanner(PlannerOptions options)
    : options_(options) {
    if (options_.nlive_quantum < 1) {
        throw ConfigurationError("nlive_quantum must be >= 1, got " + std::to_string(options_.nlive_quantum));
    }
    if (options_.smoothing_window < 0) {
        throw ConfigurationError("smoothing_window must be >= 0, got " +
                                 std::to_string(options_.smoothing_window));
    }
}

std::vector<double> AllocationPlanner::Smooth(const std::vector<double>& values) const {
    if (options_.smoothing_window <= 1 || values.size() < 3) {
        return values;
    }
    const long half = options_.smoothing_window / 2;
    const long n = static_cast<long>(values.size());
    std::vector<double> smoothed(values.size());
    for (long i = 0; i < n; ++i) {
        long lo = std::max(0L, i - half);
        long hi = std::min(n - 1, i + half);
        double total = 0.0;
        for (long j = lo; j <= hi; ++j) {
            total += values[j];
        }
        smoothed[i] = total / static_cast<double>(hi - lo + 1);
    }
    return smoothed;
}

AllocationPlan AllocationPlanner::Plan(const ImportanceProfile& profile, const RunRecord& initial,
                                       int ninit, int nlive_const) const {
    if (ninit <= 0 || nlive_const <= 0) {
        throw ConfigurationError("ninit and nlive_const must be positive, got " +
                                 std::to_string(ninit) + " and " + std::to_string(nlive_const));
    }
    if (ninit > nlive_const) {
        throw ConfigurationError("ninit (" + std::to_string(ninit) + ") exceeds nlive_const (" +
                                 std::to_string(nlive_const) + ")");
    }
    if (profile.weights.size() != initial.size()) {
        throw ConfigurationError("importance profile has " + std::to_string(profile.weights.size()) +
                                 " weights for a run of " + std::to_string(initial.size()) + " points");
    }

    AllocationPlan plan;
    plan.init_max_logl = initial.max_logl();
    const size_t n = initial.size();
    if (n < 2) {
        LOG(INFO) << "Initial run has " << n << " dead points; no threads planned";
        return plan;
    }

    const double ndead = static_cast<double>(n);
    const double samp_tot = static_cast<double>(nlive_const) * ndead / static_cast<double>(ninit);
    plan.budget = samp_tot - ndead;
    if (plan.budget <= 0.0) {
        LOG(INFO) << "nlive_const equals ninit; the initial run already uses the whole budget";
        return plan;
    }

    const std::vector<int>& nlive = initial.nlive();
    std::vector<double> logx = initial.LogX();
    std::vector<double> dlogx(n);
    for (size_t i = 0; i < n; ++i) {
        dlogx[i] = (i == 0 ? 0.0 : logx[i - 1]) - logx[i];
    }

    // Importance per sample times sample density gives importance per unit logX.
    std::vector<double> shape(n);
    for (size_t i = 0; i < n; ++i) {
        shape[i] = profile.weights[i] * static_cast<double>(nlive[i]);
    }
    shape = Smooth(shape);
    double shape_integral = CostOf(shape, dlogx);
    if (!(shape_integral > 0.0)) {
        LOG(WARNING) << "Importance profile is zero everywhere; no threads planned";
        return plan;
    }

    // Target live points, normalised to the samples of a constant nlive_const run.
    const double scale = samp_tot / shape_integral;
    std::vector<double> wanted(n);
    double peak = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double target = scale * shape[i];
        peak = std::max(peak, target);
        wanted[i] = std::max(0.0, target - static_cast<double>(nlive[i]));
    }
    plan.peak_nlive = peak;

    const double q = static_cast<double>(options_.nlive_quantum);
    std::vector<double> rounded(n);
    for (size_t i = 0; i < n; ++i) {
        rounded[i] = q * std::round(wanted[i] / q);
    }
    double wanted_cost = CostOf(wanted, dlogx);
    if (CostOf(rounded, dlogx) > plan.budget) {
        // Points already present cannot be removed, so the clipped profile can
        // cost more than the budget. Shrink every layer by the same factor.
        double shrink = std::min(1.0, plan.budget / wanted_cost);
        for (size_t i = 0; i < n; ++i) {
            rounded[i] = q * std::floor(shrink * wanted[i] / q);
        }
        if (shrink < 1.0) {
            plan.budget_scaled = true;
            LOG(WARNING) << "Allocation needs " << wanted_cost << " samples but the budget is "
                         << plan.budget << "; scaling additional live points by " << shrink;
        }
    }

    std::vector<int> additional(n);
    for (size_t i = 0; i < n; ++i) {
        additional[i] = static_cast<int>(rounded[i]);
    }
    plan.entries = DecomposeLayers(additional, initial);
    for (AllocationEntry& entry : plan.entries) {
        if (entry.start_logl >= plan.init_max_logl) {
            entry.nlive = 0;
        }
    }
    plan.planned_cost = PlannedCost(plan.entries, initial);

    LOG(INFO) << "Planned " << plan.entries.size() << " threads, cost " << plan.planned_cost
              << " of budget " << plan.budget << " samples, peak target nlive " << plan.peak_nlive;
    return plan;
}

std::vector<AllocationEntry> DecomposeLayers(const std::vector<int>& additional,
                                             const RunRecord& initial) {
    const std::vector<DeadPoint>& points = initial.points();
    auto start_threshold = [&](size_t first) {
        return first == 0 ? kLogZero : points[first - 1].logl;
    };

    // Merges layers sharing both thresholds.
    std::map<std::pair<double, double>, int> layers;
    auto emit = [&](size_t first, size_t last, int count) {
        layers[{start_threshold(first), points[last].logl}] += count;
    };

    struct Open {
        size_t first;
        int count;
    };
    std::vector<Open> open;
    int level = 0;
    for (size_t i = 0; i < additional.size() && i < points.size(); ++i) {
        int wanted = std::max(0, additional[i]);
        if (wanted > level) {
            open.push_back({i, wanted - level});
            level = wanted;
        }
        // Most recently opened layers are the narrowest; close those first.
        while (wanted < level) {
            Open& top = open.back();
            int take = std::min(top.count, level - wanted);
            emit(top.first, i - 1, take);
            top.count -= take;
            level -= take;
            if (top.count == 0) {
                open.pop_back();
            }
        }
    }
    size_t last = std::min(additional.size(), points.size());
    for (const Open& layer : open) {
        emit(layer.first, last - 1, layer.count);
    }

    std::vector<AllocationEntry> entries;
    entries.reserve(layers.size());
    for (const auto& [bounds, count] : layers) {
        entries.push_back({bounds.first, bounds.second, count});
    }
    return entries;
}

double LogXAtThreshold(const RunRecord& initial, const std::vector<double>& logx, double logl) {
    const std::vector<DeadPoint>& points = initial.points();
    auto it = std::upper_bound(points.begin(), points.end(), logl,
        [](double value, const DeadPoint& p) { return value < p.logl; });
    size_t below = static_cast<size_t>(it - points.begin());
    return below == 0 ? 0.0 : logx[below - 1];
}

double PlannedCost(const std::vector<AllocationEntry>& entries, const RunRecord& initial) {
    std::vector<double> logx = initial.LogX();
    double cost = 0.0;
    for (const AllocationEntry& entry : entries) {
        double span = LogXAtThreshold(initial, logx, entry.start_logl) -
                      LogXAtThreshold(initial, logx, entry.end_logl);
        cost += entry.nlive * span;
    }
    return cost;
}

} // namespace DynamicNest
