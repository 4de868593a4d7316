#ifndef DYNAMICNEST_SRC_DYNAMIC_RUN_MERGER_H_
#define DYNAMICNEST_SRC_DYNAMIC_RUN_MERGER_H_

#include <cstddef>
#include <vector>

#include "run/run_record.h"

namespace DynamicNest {

struct MergerOptions {
    // Number of points allowed to repeat an identical parameter vector.
    size_t duplicate_tolerance = 0;
    // Likelihood inversions up to this size inside a run are re-sorted.
    double logl_tolerance = 0.0;
};

/**
 * Combines the initial run and its threads into one nested sampling run.
 *
 * Points are ordered by (logl, thread_id, index in their own run), so the
 * result does not depend on the order of `threads`. Live point counts are
 * recomputed: a run covers the likelihood range (thread_min_logl, last
 * point] and contributes at every combined position in that range the live
 * count of its own next point.
 *
 * Throws MalformedOutputError for an invalid input run, repeated thread ids,
 * a position with no live points or too many duplicated parameter vectors.
 */
RunRecord MergeRuns(RunRecord initial, std::vector<RunRecord> threads,
                    const MergerOptions& options = MergerOptions());

} // namespace DynamicNest

#endif // DYNAMICNEST_SRC_DYNAMIC_RUN_MERGER_H_
