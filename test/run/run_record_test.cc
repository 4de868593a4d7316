#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/run/run_record.h"
#include "../../src/common/errors.h"
#include <cmath>
#include <stdexcept>
#include <vector>

using namespace DynamicNest;

namespace {

DeadPoint Point(double x, double logl, double birth = kLogZero) {
    DeadPoint p;
    p.theta = {x};
    p.logl = logl;
    p.logl_birth = birth;
    return p;
}

} // namespace

TEST(RunRecordTest, InitialRunIndexIsMinusOne) {
    EXPECT_EQ(ThreadIndex(kInitialThreadId), -1);
    EXPECT_EQ(ThreadIndex(3), 2);
}

TEST(RunRecordTest, BirthContoursGiveLiveCounts) {
    // Two points drawn from the prior, then one replacement per death.
    RunRecord run = RunRecord::FromBirthContours(
        {Point(0, 1.0), Point(0, 2.0), Point(0, 3.0, 1.0), Point(0, 4.0, 2.0)});
    EXPECT_THAT(run.nlive(), ::testing::ElementsAre(2, 2, 2, 1));
    run.Validate();
}

TEST(RunRecordTest, BirthContoursSortByLikelihood) {
    RunRecord run = RunRecord::FromBirthContours(
        {Point(3, 3.0, 1.0), Point(1, 1.0), Point(2, 2.0)}, 2, kLogZero);
    ASSERT_EQ(run.size(), 3u);
    EXPECT_DOUBLE_EQ(run.points()[0].logl, 1.0);
    EXPECT_DOUBLE_EQ(run.points()[2].logl, 3.0);
    EXPECT_DOUBLE_EQ(run.points()[2].theta[0], 3.0);
    EXPECT_THAT(run.nlive(), ::testing::ElementsAre(2, 2, 1));
    EXPECT_EQ(run.thread_id(), 2);
    EXPECT_DOUBLE_EQ(run.max_logl(), 3.0);
}

TEST(RunRecordTest, PointOutsideBirthContourIsMalformed) {
    EXPECT_THROW(RunRecord::FromBirthContours({Point(0, 1.0, 2.0)}), MalformedOutputError);
}

TEST(RunRecordTest, ValidateRejectsLengthMismatch) {
    RunRecord run({Point(0, 1.0), Point(0, 2.0)}, {2}, 1);
    try {
        run.Validate();
        FAIL() << "expected MalformedOutputError";
    } catch (const MalformedOutputError& e) {
        EXPECT_EQ(e.thread_index(), 0);
    }
}

TEST(RunRecordTest, ValidateRejectsZeroLiveCount) {
    RunRecord run({Point(0, 1.0), Point(0, 2.0)}, {1, 0});
    EXPECT_THROW(run.Validate(), MalformedOutputError);
}

TEST(RunRecordTest, ValidateRejectsDimensionChange) {
    DeadPoint wide = Point(0, 2.0);
    wide.theta.push_back(1.0);
    RunRecord run({Point(0, 1.0), wide}, {2, 1});
    EXPECT_THROW(run.Validate(), MalformedOutputError);
}

TEST(RunRecordTest, ValidateRepairsSmallInversions) {
    RunRecord run({Point(1, 1.0), Point(2, 0.9999), Point(3, 2.0)}, {3, 2, 1});
    EXPECT_THROW(RunRecord(run).Validate(0.0), MalformedOutputError);

    run.Validate(1e-3);
    EXPECT_DOUBLE_EQ(run.points()[0].theta[0], 2.0);
    EXPECT_DOUBLE_EQ(run.points()[1].theta[0], 1.0);
}

TEST(RunRecordTest, LogXShrinksByLiveCount) {
    RunRecord run({Point(0, 1.0), Point(0, 2.0), Point(0, 3.0)}, {1, 1, 3});
    std::vector<double> logx = run.LogX();
    ASSERT_EQ(logx.size(), 3u);
    EXPECT_NEAR(logx[0], std::log(0.5), 1e-12);
    EXPECT_NEAR(logx[1], 2 * std::log(0.5), 1e-12);
    EXPECT_NEAR(logx[2], 2 * std::log(0.5) + std::log(0.75), 1e-12);
}

TEST(RunRecordTest, SinglePointEvidence) {
    // X_{-1} = 1 and X_1 = 0, so the only weight is L * 1/2.
    RunRecord run({Point(0, 3.0)}, {1});
    EXPECT_NEAR(LogEvidence(run), 3.0 - std::log(2.0), 1e-12);
}

TEST(RunRecordTest, EmptyRunHasNoEvidence) {
    RunRecord run;
    EXPECT_EQ(LogEvidence(run), kLogZero);
    EXPECT_EQ(run.max_logl(), kLogZero);
    EXPECT_THROW(ParamMean(run, 0), std::out_of_range);
}

TEST(RunRecordTest, ParamMeanUsesPosteriorWeights) {
    // X = {1/2, 1/4}: weights (1 - 1/4)/2 = 3/8 and (1/2 - 0)/2 = 1/4.
    RunRecord run({Point(0.0, 0.0), Point(1.0, 0.0)}, {1, 1});
    EXPECT_NEAR(ParamMean(run, 0), 0.4, 1e-12);
    EXPECT_THROW(ParamMean(run, 1), std::out_of_range);
    // E[x^2] = 0.4, so the variance is 0.4 - 0.16.
    EXPECT_NEAR(ParamSigma(run, 0), std::sqrt(0.24), 1e-12);
    EXPECT_THROW(ParamSigma(run, 1), std::out_of_range);
}

TEST(RunRecordTest, LogSumExpHandlesInfinities) {
    EXPECT_EQ(LogSumExp({}), kLogZero);
    EXPECT_EQ(LogSumExp({kLogZero, kLogZero}), kLogZero);
    EXPECT_NEAR(LogSumExp({0.0, 0.0}), std::log(2.0), 1e-12);
}
