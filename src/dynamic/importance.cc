#include "importance.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>
#include <utility>

#include <glog/logging.h>

#include "common/errors.h"

namespace DynamicNest {

namespace {

// Scales to unit sum; an all-zero vector becomes uniform.
void Normalize(std::vector<double>& values) {
    double total = std::accumulate(values.begin(), values.end(), 0.0);
    if (!(total > 0.0)) {
        std::fill(values.begin(), values.end(), 1.0 / static_cast<double>(values.size()));
        return;
    }
    for (double& v : values) {
        v /= total;
    }
}

std::vector<double> RelativeWeights(const RunRecord& run) {
    std::vector<double> logw = run.LogWeights();
    double max_logw = *std::max_element(logw.begin(), logw.end());
    std::vector<double> w(logw.size());
    for (size_t i = 0; i < logw.size(); ++i) {
        w[i] = std::exp(logw[i] - max_logw);
    }
    return w;
}

} // namespace

std::vector<double> PosteriorMassPolicy::EvidenceTerm(const RunRecord& run) const {
    std::vector<double> w = RelativeWeights(run);
    std::vector<double> importance(w.size());
    double remaining = 0.0;
    for (size_t i = w.size(); i-- > 0;) {
        importance[i] = remaining / static_cast<double>(run.nlive()[i]);
        remaining += w[i];
    }
    Normalize(importance);
    return importance;
}

std::vector<double> PosteriorMassPolicy::ParameterTerm(const RunRecord& run) const {
    std::vector<double> w = RelativeWeights(run);
    Normalize(w);
    return w;
}

void ValidateDynamicGoal(double dynamic_goal) {
    if (!(dynamic_goal >= 0.0 && dynamic_goal <= 1.0)) {
        throw ConfigurationError("dynamic_goal must be in [0, 1], got " + std::to_string(dynamic_goal));
    }
}

ImportanceCalculator::ImportanceCalculator(std::shared_ptr<const ImportancePolicy> policy)
    : policy_(policy ? std::move(policy) : std::make_shared<PosteriorMassPolicy>()) {}

ImportanceProfile ImportanceCalculator::Compute(const RunRecord& initial, double dynamic_goal) const {
    ValidateDynamicGoal(dynamic_goal);
    if (initial.empty()) {
        throw ConfigurationError("initial run has no dead points to compute importance from");
    }

    ImportanceProfile profile;
    profile.dynamic_goal = dynamic_goal;
    if (initial.size() == 1) {
        profile.weights = {1.0};
        return profile;
    }

    std::vector<double> evidence;
    std::vector<double> parameter;
    if (dynamic_goal < 1.0) {
        evidence = policy_->EvidenceTerm(initial);
    } else {
        evidence.assign(initial.size(), 0.0);
    }
    if (dynamic_goal > 0.0) {
        parameter = policy_->ParameterTerm(initial);
    } else {
        parameter.assign(initial.size(), 0.0);
    }
    if (evidence.size() != initial.size() || parameter.size() != initial.size()) {
        throw ConfigurationError("importance policy returned " + std::to_string(evidence.size()) +
                                 "/" + std::to_string(parameter.size()) + " terms for " +
                                 std::to_string(initial.size()) + " points");
    }

    profile.weights.resize(initial.size());
    for (size_t i = 0; i < initial.size(); ++i) {
        profile.weights[i] = (1.0 - dynamic_goal) * evidence[i] + dynamic_goal * parameter[i];
    }
    Normalize(profile.weights);

    VLOG(2) << "Importance profile over " << initial.size() << " points, goal " << dynamic_goal;
    return profile;
}

} // namespace DynamicNest
