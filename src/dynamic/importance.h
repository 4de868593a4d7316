#ifndef DYNAMICNEST_SRC_DYNAMIC_IMPORTANCE_H_
#define DYNAMICNEST_SRC_DYNAMIC_IMPORTANCE_H_

#include <memory>
#include <vector>

#include "run/run_record.h"

namespace DynamicNest {

/**
 * Importance of each dead point of the initial run, one weight per point,
 * summing to 1.
 */
struct ImportanceProfile {
    std::vector<double> weights;
    double dynamic_goal = 0.0;
};

/**
 * How much each point matters for the two goals. Each term is returned
 * normalised to sum to 1 so that mixtures are comparable across goals.
 */
class ImportancePolicy {
public:
    virtual ~ImportancePolicy() = default;

    virtual std::vector<double> EvidenceTerm(const RunRecord& run) const = 0;
    virtual std::vector<double> ParameterTerm(const RunRecord& run) const = 0;
};

/**
 * Importance from Higson et al. (2019), "Dynamic nested sampling":
 * evidence importance is the evidence still to come after a point divided by
 * the number of live points there, parameter importance is the point's
 * posterior weight.
 */
class PosteriorMassPolicy : public ImportancePolicy {
public:
    std::vector<double> EvidenceTerm(const RunRecord& run) const override;
    std::vector<double> ParameterTerm(const RunRecord& run) const override;
};

// Throws ConfigurationError unless 0 <= dynamic_goal <= 1.
void ValidateDynamicGoal(double dynamic_goal);

class ImportanceCalculator {
public:
    // A null policy selects PosteriorMassPolicy.
    explicit ImportanceCalculator(std::shared_ptr<const ImportancePolicy> policy = nullptr);

    // weight_i = (1 - dynamic_goal) * evidence_i + dynamic_goal * parameter_i.
    // A one-point run gives the trivial profile {1}. Throws ConfigurationError
    // for an invalid goal or an empty run.
    ImportanceProfile Compute(const RunRecord& initial, double dynamic_goal) const;

private:
    std::shared_ptr<const ImportancePolicy> policy_;
};

} // namespace DynamicNest

#endif // DYNAMICNEST_SRC_DYNAMIC_IMPORTANCE_H_
