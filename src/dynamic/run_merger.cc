#include "run_merger.h"

#include <algorithm>
#include <string>
#include <tuple>
#include <utility>

#include <glog/logging.h>

#include "absl/container/flat_hash_map.h"

#include "common/errors.h"

namespace DynamicNest {

namespace {

struct Slot {
    double logl;
    int thread_id;
    size_t index;
    size_t run;
};

bool SlotLess(const Slot& a, const Slot& b) {
    return std::tie(a.logl, a.thread_id, a.index) < std::tie(b.logl, b.thread_id, b.index);
}

void CheckDuplicates(const std::vector<DeadPoint>& points, size_t tolerance) {
    absl::flat_hash_map<std::vector<double>, size_t> seen;
    seen.reserve(points.size());
    size_t duplicates = 0;
    for (const DeadPoint& p : points) {
        if (seen[p.theta]++ > 0) {
            ++duplicates;
        }
    }
    if (duplicates > tolerance) {
        throw MalformedOutputError(-1, std::to_string(duplicates) +
            " points repeat an identical parameter vector (tolerance " +
            std::to_string(tolerance) + ")");
    }
}

} // namespace

RunRecord MergeRuns(RunRecord initial, std::vector<RunRecord> threads, const MergerOptions& options) {
    std::vector<RunRecord> runs;
    runs.reserve(threads.size() + 1);
    runs.push_back(std::move(initial));
    for (RunRecord& thread : threads) {
        runs.push_back(std::move(thread));
    }
    std::stable_sort(runs.begin(), runs.end(), [](const RunRecord& a, const RunRecord& b) {
        return a.thread_id() < b.thread_id();
    });

    size_t total = 0;
    size_t ndim = 0;
    for (size_t r = 0; r < runs.size(); ++r) {
        RunRecord& run = runs[r];
        const int index = ThreadIndex(run.thread_id());
        if (r > 0 && runs[r - 1].thread_id() == run.thread_id()) {
            throw MalformedOutputError(index, "thread id " + std::to_string(run.thread_id()) +
                                       " appears more than once");
        }
        run.Validate(options.logl_tolerance);
        if (run.empty()) {
            continue;
        }
        if (ndim == 0) {
            ndim = run.ndim();
        } else if (run.ndim() != ndim) {
            throw MalformedOutputError(index, "points have " + std::to_string(run.ndim()) +
                                       " parameters, expected " + std::to_string(ndim));
        }
        if (!(run.points().front().logl > run.thread_min_logl())) {
            throw MalformedOutputError(index, "point with logl " +
                std::to_string(run.points().front().logl) + " is not above the thread threshold " +
                std::to_string(run.thread_min_logl()));
        }
        total += run.size();
    }

    std::vector<Slot> slots;
    slots.reserve(total);
    for (size_t r = 0; r < runs.size(); ++r) {
        const std::vector<DeadPoint>& points = runs[r].points();
        for (size_t j = 0; j < points.size(); ++j) {
            slots.push_back({points[j].logl, runs[r].thread_id(), j, r});
        }
    }
    std::sort(slots.begin(), slots.end(), SlotLess);

    // Combined position of every point of every run.
    std::vector<std::vector<size_t>> position(runs.size());
    for (size_t r = 0; r < runs.size(); ++r) {
        position[r].resize(runs[r].size());
    }
    for (size_t q = 0; q < slots.size(); ++q) {
        position[slots[q].run][slots[q].index] = q;
    }

    // Run r adds n_r[j] on (pos(j - 1), pos(j)] and n_r[0] from its first
    // covered position; accumulate as a difference array.
    std::vector<long> diff(slots.size() + 1, 0);
    for (size_t r = 0; r < runs.size(); ++r) {
        const RunRecord& run = runs[r];
        if (run.empty()) {
            continue;
        }
        const std::vector<int>& n = run.nlive();
        auto first = std::upper_bound(slots.begin(), slots.end(), run.thread_min_logl(),
            [](double value, const Slot& s) { return value < s.logl; });
        size_t start = static_cast<size_t>(first - slots.begin());
        diff[start] += n[0];
        for (size_t j = 0; j + 1 < run.size(); ++j) {
            diff[position[r][j] + 1] += n[j + 1] - n[j];
        }
        diff[position[r].back() + 1] -= n.back();
    }

    std::vector<DeadPoint> points;
    std::vector<int> nlive;
    points.reserve(slots.size());
    nlive.reserve(slots.size());
    long running = 0;
    for (size_t q = 0; q < slots.size(); ++q) {
        running += diff[q];
        if (running < 1) {
            throw MalformedOutputError(-1, "no live points at combined logl " +
                                       std::to_string(slots[q].logl));
        }
        points.push_back(runs[slots[q].run].points()[slots[q].index]);
        nlive.push_back(static_cast<int>(running));
    }
    CheckDuplicates(points, options.duplicate_tolerance);

    LOG(INFO) << "Merged " << runs.size() << " runs into " << points.size() << " dead points";
    return RunRecord(std::move(points), std::move(nlive), kInitialThreadId, kLogZero);
}

} // namespace DynamicNest
