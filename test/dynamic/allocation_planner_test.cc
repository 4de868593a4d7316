#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/dynamic/allocation_planner.h"
#include "../../src/common/errors.h"
#include "../../src/sampler/gaussian_sampler.h"
#include "../../src/common/configuration.h"
#include <cmath>
#include <memory>
#include <vector>

using namespace DynamicNest;

namespace {

RunRecord LadderRun(int npoints) {
    std::vector<DeadPoint> points;
    std::vector<int> nlive;
    for (int i = 0; i < npoints; ++i) {
        DeadPoint p;
        p.theta = {0.0};
        p.logl = static_cast<double>(i + 1);
        points.push_back(p);
        nlive.push_back(1);
    }
    return RunRecord(points, nlive);
}

} // namespace

class AllocationPlannerTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        GaussianSampler sampler(GaussianProblem{});
        SamplerConfig config;
        config.nlive = kNinit;
        config.seed = 23;
        initial_ = std::make_unique<RunRecord>(sampler.Run(config, nullptr));
    }

    static void TearDownTestSuite() {
        initial_.reset();
    }

    AllocationPlan PlanFor(double goal, PlannerOptions options = PlannerOptions()) const {
        ImportanceProfile profile = ImportanceCalculator().Compute(*initial_, goal);
        return AllocationPlanner(options).Plan(profile, *initial_, kNinit, kNliveConst);
    }

    static constexpr int kNinit = 50;
    static constexpr int kNliveConst = 250;
    static std::unique_ptr<RunRecord> initial_;
};

std::unique_ptr<RunRecord> AllocationPlannerTest::initial_;

TEST_F(AllocationPlannerTest, RejectsInvalidCounts) {
    ImportanceProfile profile = ImportanceCalculator().Compute(*initial_, 0.5);
    AllocationPlanner planner;
    EXPECT_THROW(planner.Plan(profile, *initial_, 0, kNliveConst), ConfigurationError);
    EXPECT_THROW(planner.Plan(profile, *initial_, kNinit, -1), ConfigurationError);
    EXPECT_THROW(planner.Plan(profile, *initial_, 300, kNliveConst), ConfigurationError);

    profile.weights.pop_back();
    EXPECT_THROW(planner.Plan(profile, *initial_, kNinit, kNliveConst), ConfigurationError);
}

TEST_F(AllocationPlannerTest, RejectsInvalidOptions) {
    PlannerOptions options;
    options.nlive_quantum = 0;
    EXPECT_THROW(AllocationPlanner planner(options), ConfigurationError);
    options.nlive_quantum = 1;
    options.smoothing_window = -3;
    EXPECT_THROW(AllocationPlanner planner(options), ConfigurationError);
}

TEST_F(AllocationPlannerTest, NoBudgetNoThreads) {
    ImportanceProfile profile = ImportanceCalculator().Compute(*initial_, 1.0);
    AllocationPlan plan = AllocationPlanner().Plan(profile, *initial_, kNinit, kNinit);
    EXPECT_TRUE(plan.entries.empty());
    EXPECT_DOUBLE_EQ(plan.budget, 0.0);
    EXPECT_DOUBLE_EQ(plan.init_max_logl, initial_->max_logl());
}

TEST_F(AllocationPlannerTest, PlannedCostStaysWithinBudget) {
    const double expected_budget =
        static_cast<double>(kNliveConst) * initial_->size() / kNinit - initial_->size();
    for (double goal : {0.0, 0.5, 1.0}) {
        AllocationPlan plan = PlanFor(goal);
        EXPECT_NEAR(plan.budget, expected_budget, 1e-6);
        EXPECT_FALSE(plan.entries.empty()) << "goal " << goal;
        EXPECT_GT(plan.planned_cost, 0.0);
        EXPECT_LE(plan.planned_cost, plan.budget * (1.0 + 1e-9)) << "goal " << goal;
        EXPECT_DOUBLE_EQ(plan.planned_cost, PlannedCost(plan.entries, *initial_));
    }
}

TEST_F(AllocationPlannerTest, EntriesAreOrderedIntervals) {
    AllocationPlan plan = PlanFor(0.5);
    for (size_t i = 0; i < plan.entries.size(); ++i) {
        const AllocationEntry& entry = plan.entries[i];
        EXPECT_LT(entry.start_logl, entry.end_logl);
        EXPECT_GT(entry.nlive, 0);
        if (i > 0) {
            EXPECT_LE(plan.entries[i - 1].start_logl, entry.start_logl);
        }
    }
}

TEST_F(AllocationPlannerTest, EvidenceGoalStartsFromPrior) {
    AllocationPlan evidence = PlanFor(0.0);
    EXPECT_EQ(evidence.entries.front().start_logl, kLogZero);

    // Parameter estimation spends nothing on the prior-dominated start.
    AllocationPlan parameter = PlanFor(1.0);
    EXPECT_GT(parameter.entries.front().start_logl, initial_->points()[kNinit].logl);
}

TEST_F(AllocationPlannerTest, ClippedTargetIsScaledToBudget) {
    // Points the initial run already has cannot be removed, so part of the
    // posterior-mass target is lost and the rest must shrink.
    AllocationPlan plan = PlanFor(1.0);
    EXPECT_TRUE(plan.budget_scaled);
    EXPECT_LE(plan.planned_cost, plan.budget * (1.0 + 1e-9));
    EXPECT_GT(plan.peak_nlive, kNliveConst);
}

TEST_F(AllocationPlannerTest, QuantumRoundsThreadSizes) {
    PlannerOptions options;
    options.nlive_quantum = 10;
    AllocationPlan plan = PlanFor(1.0, options);
    ASSERT_FALSE(plan.entries.empty());
    for (const AllocationEntry& entry : plan.entries) {
        EXPECT_EQ(entry.nlive % 10, 0) << entry.nlive;
    }
    EXPECT_LT(plan.entries.size(), PlanFor(1.0).entries.size());
}

TEST_F(AllocationPlannerTest, ConfiguredDefaultsGiveFewerFatterThreads) {
    Configuration configuration;
    PlannerOptions options = configuration.ToDriverOptions().planner;
    EXPECT_GT(options.smoothing_window, 1);
    EXPECT_GT(options.nlive_quantum, 1);

    AllocationPlan plan = PlanFor(1.0, options);
    AllocationPlan raw = PlanFor(1.0);
    ASSERT_FALSE(plan.entries.empty());
    EXPECT_LT(plan.entries.size(), raw.entries.size());
    for (const AllocationEntry& entry : plan.entries) {
        EXPECT_EQ(entry.nlive % options.nlive_quantum, 0) << entry.nlive;
    }
    EXPECT_LE(plan.planned_cost, plan.budget * (1.0 + 1e-9));
}

TEST_F(AllocationPlannerTest, SmoothingKeepsBudget) {
    PlannerOptions options;
    options.smoothing_window = 9;
    AllocationPlan plan = PlanFor(1.0, options);
    EXPECT_FALSE(plan.entries.empty());
    EXPECT_LE(plan.planned_cost, plan.budget * (1.0 + 1e-9));
}

TEST(DecomposeLayersTest, RiseAndFallBecomeNestedLayers) {
    RunRecord run = LadderRun(5);
    std::vector<AllocationEntry> entries = DecomposeLayers({0, 2, 3, 1, 0}, run);

    ASSERT_EQ(entries.size(), 3u);
    EXPECT_DOUBLE_EQ(entries[0].start_logl, 1.0);
    EXPECT_DOUBLE_EQ(entries[0].end_logl, 3.0);
    EXPECT_EQ(entries[0].nlive, 1);
    EXPECT_DOUBLE_EQ(entries[1].start_logl, 1.0);
    EXPECT_DOUBLE_EQ(entries[1].end_logl, 4.0);
    EXPECT_EQ(entries[1].nlive, 1);
    EXPECT_DOUBLE_EQ(entries[2].start_logl, 2.0);
    EXPECT_DOUBLE_EQ(entries[2].end_logl, 3.0);
    EXPECT_EQ(entries[2].nlive, 1);
}

TEST(DecomposeLayersTest, LayerFromFirstPointStartsAtMinusInfinity) {
    RunRecord run = LadderRun(3);
    std::vector<AllocationEntry> entries = DecomposeLayers({4, 4, 4}, run);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].start_logl, kLogZero);
    EXPECT_DOUBLE_EQ(entries[0].end_logl, 3.0);
    EXPECT_EQ(entries[0].nlive, 4);
}

TEST(DecomposeLayersTest, CoverageMatchesRequestedCounts) {
    RunRecord run = LadderRun(8);
    std::vector<int> additional = {1, 3, 3, 5, 2, 2, 4, 0};
    std::vector<AllocationEntry> entries = DecomposeLayers(additional, run);
    for (size_t i = 0; i < additional.size(); ++i) {
        int covered = 0;
        for (const AllocationEntry& entry : entries) {
            double logl = run.points()[i].logl;
            if (logl > entry.start_logl && logl <= entry.end_logl) {
                covered += entry.nlive;
            }
        }
        EXPECT_EQ(covered, additional[i]) << "point " << i;
    }
}

TEST(PlannedCostTest, SpansLogXBetweenThresholds) {
    RunRecord run = LadderRun(3);
    std::vector<double> logx = run.LogX();
    EXPECT_DOUBLE_EQ(LogXAtThreshold(run, logx, kLogZero), 0.0);
    EXPECT_DOUBLE_EQ(LogXAtThreshold(run, logx, 2.0), logx[1]);
    EXPECT_DOUBLE_EQ(LogXAtThreshold(run, logx, 2.5), logx[1]);

    std::vector<AllocationEntry> entries = {{kLogZero, 3.0, 2}, {1.0, 2.0, 1}};
    EXPECT_NEAR(PlannedCost(entries, run), 2 * 3 * std::log(2.0) + std::log(2.0), 1e-12);
}
