#include "gaussian_sampler.h"

#include <algorithm>
#include <cmath>
#include <queue>
#include <string>
#include <utility>

#include <boost/math/special_functions/gamma.hpp>
#include <glog/logging.h>

#include "common/errors.h"

namespace DynamicNest {

namespace {

constexpr int kMaxRedraws = 100;

struct HigherLogl {
    bool operator()(const DeadPoint& a, const DeadPoint& b) const { return a.logl > b.logl; }
};

double LogAddExp(double a, double b) {
    if (a == kLogZero) return b;
    if (b == kLogZero) return a;
    return a > b ? a + std::log1p(std::exp(b - a)) : b + std::log1p(std::exp(a - b));
}

} // namespace

GaussianSampler::GaussianSampler(GaussianProblem problem)
    : problem_(problem) {
    if (problem_.ndim < 1 || !(problem_.sigma > 0.0) || !(problem_.prior_scale > 0.0)) {
        throw ConfigurationError("Gaussian problem needs ndim >= 1 and positive sigma/prior_scale");
    }
    log_norm_ = -0.5 * problem_.ndim * std::log(2.0 * M_PI * problem_.sigma * problem_.sigma);
}

double GaussianSampler::LogLikelihood(const std::vector<double>& theta) const {
    double r2 = 0.0;
    for (double x : theta) {
        r2 += x * x;
    }
    return log_norm_ - r2 / (2.0 * problem_.sigma * problem_.sigma);
}

double GaussianSampler::AnalyticLogEvidence() const {
    double var = problem_.sigma * problem_.sigma + problem_.prior_scale * problem_.prior_scale;
    return -0.5 * problem_.ndim * std::log(2.0 * M_PI * var);
}

std::vector<double> GaussianSampler::DrawInside(double logl_threshold, int thread_id,
                                                std::mt19937_64& rng) const {
    const double a = 0.5 * problem_.ndim;
    const double s2 = problem_.prior_scale * problem_.prior_scale;
    // Upper bound of the prior chi-square variable r^2 / prior_scale^2.
    double cdf_max = 1.0;
    if (logl_threshold != kLogZero) {
        double r2_max = 2.0 * problem_.sigma * problem_.sigma * (log_norm_ - logl_threshold);
        cdf_max = boost::math::gamma_p(a, 0.5 * r2_max / s2);
    }

    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    std::normal_distribution<double> normal(0.0, 1.0);
    std::vector<double> theta(problem_.ndim);
    for (int attempt = 0; attempt < kMaxRedraws; ++attempt) {
        double u = uniform(rng) * cdf_max;
        double chi2 = 2.0 * boost::math::gamma_p_inv(a, u);
        double radius = problem_.prior_scale * std::sqrt(chi2);

        double norm = 0.0;
        for (double& x : theta) {
            x = normal(rng);
            norm += x * x;
        }
        norm = std::sqrt(norm);
        if (norm == 0.0) {
            continue;
        }
        for (double& x : theta) {
            x *= radius / norm;
        }
        // Rounding in the inverse gamma can land exactly on the contour.
        if (LogLikelihood(theta) > logl_threshold) {
            return theta;
        }
    }
    throw ExternalRunFailure("gaussian_sampler", ThreadIndex(thread_id), 0,
        "no draw inside contour logl > " + std::to_string(logl_threshold));
}

RunRecord GaussianSampler::Run(const SamplerConfig& config, const CancellationToken* cancel) {
    if (config.nlive <= 0) {
        throw ConfigurationError("GaussianSampler needs nlive > 0, got " + std::to_string(config.nlive));
    }
    const double start = config.start_threshold.value_or(kLogZero);
    if (start >= log_norm_) {
        VLOG(2) << "Thread " << config.thread_id << " starts at " << start
                << " above the likelihood peak; nothing to sample";
        return RunRecord({}, {}, config.thread_id, start);
    }

    std::mt19937_64 rng(config.seed >= 0 ? static_cast<uint64_t>(config.seed)
                                         : static_cast<uint64_t>(std::random_device{}()));

    std::priority_queue<DeadPoint, std::vector<DeadPoint>, HigherLogl> live;
    double max_live_logl = kLogZero;
    auto add_live = [&](double birth) {
        DeadPoint p;
        p.theta = DrawInside(birth, config.thread_id, rng);
        p.logl = LogLikelihood(p.theta);
        p.logl_birth = birth;
        p.thread_min_logl = start;
        p.thread_id = config.thread_id;
        max_live_logl = std::max(max_live_logl, p.logl);
        live.push(std::move(p));
    };
    for (int i = 0; i < config.nlive; ++i) {
        add_live(start);
    }

    const double n = static_cast<double>(config.nlive);
    const double log_shrink = std::log(n / (n + 1.0));
    const double log_precision = std::log(config.precision_criterion);
    double logx = 0.0;
    double logz = kLogZero;

    std::vector<DeadPoint> dead;
    while (true) {
        if (cancel != nullptr && cancel->IsCancelled()) {
            throw CancelledError("thread " + std::to_string(config.thread_id) + " cancelled");
        }
        const DeadPoint& worst = live.top();
        if (config.stop_threshold && worst.logl > *config.stop_threshold) {
            break;
        }
        if (config.max_ndead > 0 && static_cast<int>(dead.size()) >= config.max_ndead) {
            break;
        }
        if (logz != kLogZero && logx + max_live_logl - logz < log_precision) {
            break;
        }

        double width = logx + std::log1p(-std::exp(log_shrink));
        logz = LogAddExp(logz, worst.logl + width);
        logx += log_shrink;

        double contour = worst.logl;
        dead.push_back(worst);
        live.pop();
        add_live(contour);
    }

    // Remaining live points die in likelihood order once sampling stops.
    while (!live.empty()) {
        dead.push_back(live.top());
        live.pop();
    }

    VLOG(2) << "Thread " << config.thread_id << ": " << dead.size() << " dead points, nlive "
            << config.nlive << ", start " << start;
    return RunRecord::FromBirthContours(std::move(dead), config.thread_id, start);
}

} // namespace DynamicNest
