#ifndef DYNAMICNEST_SRC_SAMPLER_GAUSSIAN_SAMPLER_H_
#define DYNAMICNEST_SRC_SAMPLER_GAUSSIAN_SAMPLER_H_

#include <random>
#include <vector>

#include "sampler.h"

namespace DynamicNest {

struct GaussianProblem {
    int ndim = 10;
    // Likelihood N(0, sigma^2 I).
    double sigma = 1.0;
    // Prior N(0, prior_scale^2 I).
    double prior_scale = 10.0;
};

/**
 * Exact nested sampler for an isotropic Gaussian likelihood under an
 * isotropic Gaussian prior, both centred on the origin.
 *
 * The likelihood only depends on the radius, so a draw from the prior
 * restricted to logl > L* is a radius from the truncated chi distribution
 * (inverse regularised incomplete gamma) times a uniform direction. No MCMC
 * is involved, so runs are exact and reproducible for a fixed seed. Used as
 * the reference problem for tests and the demo CLI.
 */
class GaussianSampler : public ISampler {
public:
    explicit GaussianSampler(GaussianProblem problem);

    RunRecord Run(const SamplerConfig& config, const CancellationToken* cancel) override;

    double LogLikelihood(const std::vector<double>& theta) const;

    // Largest attainable logl (at the origin).
    double MaxLogLikelihood() const { return log_norm_; }

    // ln Z = -ndim/2 * ln(2 pi (sigma^2 + prior_scale^2)).
    double AnalyticLogEvidence() const;

    const GaussianProblem& problem() const { return problem_; }

private:
    std::vector<double> DrawInside(double logl_threshold, int thread_id, std::mt19937_64& rng) const;

    GaussianProblem problem_;
    double log_norm_;
};

} // namespace DynamicNest

#endif // DYNAMICNEST_SRC_SAMPLER_GAUSSIAN_SAMPLER_H_
