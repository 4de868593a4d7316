#include "run_record.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include <glog/logging.h>

#include "common/errors.h"

namespace DynamicNest {

namespace {

bool LoglLess(const DeadPoint& a, const DeadPoint& b) {
    return a.logl < b.logl;
}

} // namespace

RunRecord::RunRecord(std::vector<DeadPoint> points, std::vector<int> nlive,
                     int thread_id, double thread_min_logl)
    : points_(std::move(points)),
      nlive_(std::move(nlive)),
      thread_id_(thread_id),
      thread_min_logl_(thread_min_logl) {}

RunRecord RunRecord::FromBirthContours(std::vector<DeadPoint> points, int thread_id,
                                       double thread_min_logl) {
    std::stable_sort(points.begin(), points.end(), LoglLess);

    std::vector<double> births;
    births.reserve(points.size());
    for (size_t i = 0; i < points.size(); ++i) {
        const DeadPoint& p = points[i];
        if (std::isnan(p.logl) || std::isnan(p.logl_birth)) {
            throw MalformedOutputError(ThreadIndex(thread_id),
                "NaN likelihood at row " + std::to_string(i));
        }
        if (p.logl_birth >= p.logl) {
            throw MalformedOutputError(ThreadIndex(thread_id),
                "point with logl " + std::to_string(p.logl) +
                " is not inside its birth contour " + std::to_string(p.logl_birth));
        }
        births.push_back(p.logl_birth);
    }
    std::sort(births.begin(), births.end());

    // Points still alive just before point i dies are those at or after i in
    // likelihood order which were born below logl_i.
    const size_t n = points.size();
    std::vector<int> nlive(n);
    for (size_t i = 0; i < n; ++i) {
        size_t born_later = births.end() -
            std::lower_bound(births.begin(), births.end(), points[i].logl);
        long count = static_cast<long>(n - i) - static_cast<long>(born_later);
        if (count <= 0) {
            throw MalformedOutputError(ThreadIndex(thread_id),
                "birth contours give no live points at logl " + std::to_string(points[i].logl));
        }
        nlive[i] = static_cast<int>(count);
    }

    return RunRecord(std::move(points), std::move(nlive), thread_id, thread_min_logl);
}

double RunRecord::max_logl() const {
    if (points_.empty()) {
        return kLogZero;
    }
    return points_.back().logl;
}

void RunRecord::Validate(double logl_tolerance) {
    const int index = ThreadIndex(thread_id_);
    if (points_.size() != nlive_.size()) {
        throw MalformedOutputError(index,
            "run has " + std::to_string(points_.size()) + " dead points but " +
            std::to_string(nlive_.size()) + " live point counts");
    }
    if (points_.empty()) {
        return;
    }

    const size_t dim = points_.front().theta.size();
    bool needs_repair = false;
    for (size_t i = 0; i < points_.size(); ++i) {
        const DeadPoint& p = points_[i];
        if (p.theta.size() != dim) {
            throw MalformedOutputError(index,
                "row " + std::to_string(i) + " has " + std::to_string(p.theta.size()) +
                " parameters, expected " + std::to_string(dim));
        }
        if (std::isnan(p.logl)) {
            throw MalformedOutputError(index, "NaN likelihood at row " + std::to_string(i));
        }
        if (nlive_[i] < 1) {
            throw MalformedOutputError(index,
                "live point count " + std::to_string(nlive_[i]) + " at row " + std::to_string(i));
        }
        if (i > 0 && p.logl < points_[i - 1].logl) {
            double drop = points_[i - 1].logl - p.logl;
            if (drop > logl_tolerance) {
                throw MalformedOutputError(index,
                    "likelihood decreases by " + std::to_string(drop) + " at row " + std::to_string(i));
            }
            needs_repair = true;
        }
    }

    if (needs_repair) {
        VLOG(2) << "Repairing likelihood order of thread " << thread_id_
                << " within tolerance " << logl_tolerance;
        std::stable_sort(points_.begin(), points_.end(), LoglLess);
    }
}

std::vector<double> RunRecord::LogX() const {
    std::vector<double> logx(nlive_.size());
    double acc = 0.0;
    for (size_t i = 0; i < nlive_.size(); ++i) {
        double n = static_cast<double>(nlive_[i]);
        acc += std::log(n / (n + 1.0));
        logx[i] = acc;
    }
    return logx;
}

std::vector<double> RunRecord::LogWeights() const {
    const size_t n = points_.size();
    std::vector<double> logw(n);
    if (n == 0) {
        return logw;
    }
    std::vector<double> logx = LogX();
    for (size_t i = 0; i < n; ++i) {
        double logx_prev = (i == 0) ? 0.0 : logx[i - 1];
        double logx_next = (i + 1 == n) ? kLogZero : logx[i + 1];
        // log(X_prev - X_next) without leaving log space.
        double log_width = logx_prev + std::log1p(-std::exp(logx_next - logx_prev));
        logw[i] = points_[i].logl + log_width - std::log(2.0);
    }
    return logw;
}

double LogSumExp(const std::vector<double>& values) {
    if (values.empty()) {
        return kLogZero;
    }
    double max_value = *std::max_element(values.begin(), values.end());
    if (std::isinf(max_value)) {
        return max_value;
    }
    double sum = 0.0;
    for (double v : values) {
        sum += std::exp(v - max_value);
    }
    return max_value + std::log(sum);
}

double LogEvidence(const RunRecord& run) {
    return LogSumExp(run.LogWeights());
}

namespace {

// First and second posterior moments of one parameter.
std::pair<double, double> ParamMoments(const RunRecord& run, size_t param, const char* caller) {
    if (run.empty() || param >= run.ndim()) {
        throw std::out_of_range(std::string(caller) + ": parameter " + std::to_string(param) +
                                " not present in run of dimension " + std::to_string(run.ndim()));
    }
    std::vector<double> logw = run.LogWeights();
    double max_logw = *std::max_element(logw.begin(), logw.end());
    double first = 0.0;
    double second = 0.0;
    double total = 0.0;
    for (size_t i = 0; i < logw.size(); ++i) {
        double w = std::exp(logw[i] - max_logw);
        double x = run.points()[i].theta[param];
        first += w * x;
        second += w * x * x;
        total += w;
    }
    return {first / total, second / total};
}

} // namespace

double ParamMean(const RunRecord& run, size_t param) {
    return ParamMoments(run, param, "ParamMean").first;
}

double ParamSigma(const RunRecord& run, size_t param) {
    auto [mean, second] = ParamMoments(run, param, "ParamSigma");
    return std::sqrt(std::max(0.0, second - mean * mean));
}

} // namespace DynamicNest
