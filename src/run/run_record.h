#ifndef DYNAMICNEST_SRC_RUN_RUN_RECORD_H_
#define DYNAMICNEST_SRC_RUN_RUN_RECORD_H_

#include <cstddef>
#include <limits>
#include <vector>

namespace DynamicNest {

constexpr double kLogZero = -std::numeric_limits<double>::infinity();

// thread_id of the initial exploratory run; plan entry i runs as thread i + 1.
constexpr int kInitialThreadId = 0;

inline int ThreadIndex(int thread_id) { return thread_id - 1; }

/**
 * A sample removed from the live set.
 * logl_birth is the likelihood contour the sample was drawn inside; points
 * drawn when their thread started carry the thread's start threshold.
 */
struct DeadPoint {
    std::vector<double> theta;
    double logl = 0.0;
    double logl_birth = kLogZero;
    double thread_min_logl = kLogZero;
    int thread_id = kInitialThreadId;
};

/**
 * A nested sampling run: dead points in non-decreasing logl order and the
 * number of live points present immediately before each one was removed.
 */
class RunRecord {
public:
    RunRecord() = default;
    RunRecord(std::vector<DeadPoint> points, std::vector<int> nlive,
              int thread_id = kInitialThreadId, double thread_min_logl = kLogZero);

    // Sorts points by logl and reconstructs live counts from birth contours:
    // nlive_i = #{ j : logl_birth_j < logl_i <= logl_j }.
    // Throws MalformedOutputError when a point lies outside its birth contour.
    static RunRecord FromBirthContours(std::vector<DeadPoint> points,
                                       int thread_id = kInitialThreadId,
                                       double thread_min_logl = kLogZero);

    size_t size() const { return points_.size(); }
    bool empty() const { return points_.empty(); }
    size_t ndim() const { return points_.empty() ? 0 : points_.front().theta.size(); }

    const std::vector<DeadPoint>& points() const { return points_; }
    const std::vector<int>& nlive() const { return nlive_; }
    int thread_id() const { return thread_id_; }
    double thread_min_logl() const { return thread_min_logl_; }

    // kLogZero for an empty run.
    double max_logl() const;

    // Checks the run invariants. Likelihood inversions no larger than
    // logl_tolerance are repaired by a stable re-sort of the points; anything
    // else throws MalformedOutputError tagged with this run's thread index.
    void Validate(double logl_tolerance = 0.0);

    // Expected log enclosed prior volume after each point:
    // logX_i = sum_{k<=i} log(n_k / (n_k + 1)).
    std::vector<double> LogX() const;

    // Trapezium-rule log posterior weights (unnormalised),
    // logw_i = logl_i + log((X_{i-1} - X_{i+1}) / 2) with X_{-1} = 1, X_N = 0.
    std::vector<double> LogWeights() const;

private:
    std::vector<DeadPoint> points_;
    std::vector<int> nlive_;
    int thread_id_ = kInitialThreadId;
    double thread_min_logl_ = kLogZero;
};

double LogSumExp(const std::vector<double>& values);

// Log evidence estimate from the run's weights; kLogZero for an empty run.
double LogEvidence(const RunRecord& run);

// Posterior mean of parameter `param`. Throws std::out_of_range when the
// run is empty or has fewer parameters.
double ParamMean(const RunRecord& run, size_t param);

// Posterior standard deviation of parameter `param`; same preconditions.
double ParamSigma(const RunRecord& run, size_t param);

} // namespace DynamicNest

#endif // DYNAMICNEST_SRC_RUN_RUN_RECORD_H_
