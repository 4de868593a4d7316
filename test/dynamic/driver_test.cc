#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/dynamic/driver.h"
#include "../../src/common/errors.h"
#include "../../src/run/run_io.h"
#include "../../src/sampler/gaussian_sampler.h"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace DynamicNest;
using ::testing::_;
using ::testing::Invoke;

namespace {

class MockSampler : public ISampler {
public:
    MOCK_METHOD(RunRecord, Run, (const SamplerConfig& config, const CancellationToken* cancel), (override));
};

} // namespace

class DriverTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::path(::testing::TempDir()) /
               ("driver_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(dir_);
        settings_.base_dir = dir_.string();
        settings_.file_root = "gaussian";
        settings_.seed = 1;
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::filesystem::path dir_;
    DriverSettings settings_;
};

TEST_F(DriverTest, InvalidArgumentsFailBeforeSampling) {
    MockSampler sampler;
    EXPECT_CALL(sampler, Run(_, _)).Times(0);

    EXPECT_THROW(RunDynamicNestedSampling(sampler, 1.5, settings_, 10, 50), ConfigurationError);
    EXPECT_THROW(RunDynamicNestedSampling(sampler, -0.5, settings_, 10, 50), ConfigurationError);
    EXPECT_THROW(RunDynamicNestedSampling(sampler, 0.5, settings_, 0, 50), ConfigurationError);
    EXPECT_THROW(RunDynamicNestedSampling(sampler, 0.5, settings_, 60, 50), ConfigurationError);

    DriverSettings no_root = settings_;
    no_root.file_root.clear();
    EXPECT_THROW(RunDynamicNestedSampling(sampler, 0.5, no_root, 10, 50), ConfigurationError);

    DriverOptions options;
    options.runner.num_workers = 0;
    EXPECT_THROW(RunDynamicNestedSampling(sampler, 0.5, settings_, 10, 50, options), ConfigurationError);
}

TEST_F(DriverTest, InitialRunFailurePropagates) {
    MockSampler sampler;
    EXPECT_CALL(sampler, Run(_, _)).WillOnce(Invoke(
        [](const SamplerConfig& config, const CancellationToken*) -> RunRecord {
            EXPECT_EQ(config.thread_id, kInitialThreadId);
            EXPECT_EQ(config.file_root, "gaussian_init");
            EXPECT_EQ(config.nlive, 10);
            EXPECT_FALSE(config.start_threshold.has_value());
            throw ExternalRunFailure("subprocess", -1, 2, "crashed");
        }));

    try {
        RunDynamicNestedSampling(sampler, 0.5, settings_, 10, 50);
        FAIL() << "expected ExternalRunFailure";
    } catch (const ExternalRunFailure& e) {
        EXPECT_EQ(e.thread_index(), -1);
        EXPECT_EQ(e.exit_status(), 2);
    }
    EXPECT_FALSE(std::filesystem::exists(DeadBirthPath(settings_.base_dir, settings_.file_root)));
}

TEST_F(DriverTest, ForeignInitialFailureIsWrapped) {
    MockSampler sampler;
    EXPECT_CALL(sampler, Run(_, _)).WillOnce(Invoke(
        [](const SamplerConfig&, const CancellationToken*) -> RunRecord {
            throw std::runtime_error("out of memory");
        }));
    try {
        RunDynamicNestedSampling(sampler, 0.5, settings_, 10, 50);
        FAIL() << "expected ExternalRunFailure";
    } catch (const ExternalRunFailure& e) {
        EXPECT_EQ(e.thread_index(), -1);
        EXPECT_EQ(e.stage(), "initial_run");
    }
}

TEST_F(DriverTest, CancelledRunWritesNothing) {
    GaussianSampler sampler(GaussianProblem{2, 1.0, 10.0});
    CancellationToken cancel;
    cancel.Cancel();
    DriverOptions options;
    options.cancel = &cancel;
    EXPECT_THROW(RunDynamicNestedSampling(sampler, 1.0, settings_, 10, 50, options), CancelledError);
    EXPECT_FALSE(std::filesystem::exists(DeadBirthPath(settings_.base_dir, settings_.file_root)));
}

TEST_F(DriverTest, MandatorySettingsAreForced) {
    DriverSettings settings;
    settings.write_dead = false;
    settings.read_resume = true;
    EXPECT_EQ(CheckSettings(settings), 2);
    EXPECT_TRUE(settings.write_dead);
    EXPECT_FALSE(settings.read_resume);
    EXPECT_EQ(CheckSettings(settings), 0);
}

TEST_F(DriverTest, OnlyResumeIsOverriddenAmongOutputSwitches) {
    DriverSettings settings;
    settings.read_resume = true;
    settings.equals = true;
    settings.posteriors = false;
    EXPECT_EQ(CheckSettings(settings), 1);
    EXPECT_FALSE(settings.read_resume);
    EXPECT_TRUE(settings.equals);
    EXPECT_FALSE(settings.posteriors);
}

TEST_F(DriverTest, OutputSwitchesReachTheSampler) {
    MockSampler sampler;
    EXPECT_CALL(sampler, Run(_, _)).WillOnce(Invoke(
        [](const SamplerConfig& config, const CancellationToken*) -> RunRecord {
            EXPECT_TRUE(config.equals);
            EXPECT_TRUE(config.posteriors);
            EXPECT_TRUE(config.write_dead);
            EXPECT_FALSE(config.read_resume);
            throw ExternalRunFailure("subprocess", -1, 1, "stop after the initial call");
        }));
    DriverSettings settings = settings_;
    settings.equals = true;
    settings.posteriors = true;
    settings.read_resume = true;
    EXPECT_THROW(RunDynamicNestedSampling(sampler, 0.5, settings, 10, 50), ExternalRunFailure);
}

TEST_F(DriverTest, SettingsRootNamesRun) {
    EXPECT_EQ(SettingsRoot("gaussian", "uniform", 2, 1.0, 1.0, 1, 1, 1),
              "gaussian_uniform_1_dg1_1init_2d_1nlive_1nrepeats");
    EXPECT_EQ(SettingsRoot("gaussian", "gaussian", 10, 10.0, 0.25, 500, 100, 50),
              "gaussian_gaussian_10_dg0.25_100init_10d_500nlive_50nrepeats");
}

TEST_F(DriverTest, EvidenceGoalAddsPointsFromThePrior) {
    GaussianSampler sampler(GaussianProblem{2, 1.0, 10.0});
    DriverOptions options;
    options.runner.num_workers = 2;
    DynamicResult result = RunDynamicNestedSampling(sampler, 0.0, settings_, 20, 100, options);

    EXPECT_GT(result.run.nlive().front(), 20);
    EXPECT_LE(result.plan.planned_cost, result.plan.budget * (1.0 + 1e-9));
    EXPECT_NEAR(LogEvidence(result.run), sampler.AnalyticLogEvidence(), 1.0);
}

TEST_F(DriverTest, WorkerCountDoesNotChangeResult) {
    GaussianSampler sampler(GaussianProblem{4, 1.0, 10.0});
    DriverOptions sequential;
    sequential.runner.num_workers = 1;
    DriverOptions parallel;
    parallel.runner.num_workers = 4;

    DynamicResult one = RunDynamicNestedSampling(sampler, 0.5, settings_, 25, 100, sequential);
    DynamicResult four = RunDynamicNestedSampling(sampler, 0.5, settings_, 25, 100, parallel);

    ASSERT_GT(one.summary.nthreads, 0u);
    EXPECT_EQ(one.summary.nthreads, four.summary.nthreads);
    ASSERT_EQ(one.run.size(), four.run.size());
    EXPECT_EQ(one.run.nlive(), four.run.nlive());
    for (size_t i = 0; i < one.run.size(); ++i) {
        ASSERT_EQ(one.run.points()[i].logl, four.run.points()[i].logl) << i;
        ASSERT_EQ(one.run.points()[i].theta, four.run.points()[i].theta) << i;
    }
    EXPECT_EQ(one.summary.log_evidence, four.summary.log_evidence);
}

TEST_F(DriverTest, GaussianParameterEstimationEndToEnd) {
    GaussianSampler sampler(GaussianProblem{10, 1.0, 10.0});
    DriverOptions options;
    options.runner.num_workers = 4;
    DynamicResult result = RunDynamicNestedSampling(sampler, 1.0, settings_, 100, 500, options);
    const RunRecord& run = result.run;

    ASSERT_FALSE(run.empty());
    EXPECT_GT(result.summary.nthreads, 0u);
    EXPECT_EQ(result.summary.ndead, run.size());
    // Nothing is added where the posterior has no mass.
    EXPECT_EQ(run.nlive().front(), 100);
    for (int n : run.nlive()) {
        ASSERT_GE(n, 1);
    }

    EXPECT_NEAR(LogEvidence(run), sampler.AnalyticLogEvidence(), 1.5);
    EXPECT_NEAR(ParamMean(run, 0), 0.0, 0.25);

    // Live points peak where the posterior mass does.
    std::vector<double> logx = run.LogX();
    std::vector<double> log_mass(run.size());
    for (size_t i = 0; i < run.size(); ++i) {
        log_mass[i] = run.points()[i].logl + logx[i];
    }
    size_t peak_nlive = std::max_element(run.nlive().begin(), run.nlive().end()) - run.nlive().begin();
    size_t peak_mass = std::max_element(log_mass.begin(), log_mass.end()) - log_mass.begin();
    EXPECT_NEAR(logx[peak_nlive], logx[peak_mass], 3.0);
    EXPECT_GT(run.nlive()[peak_nlive], 500);

    EXPECT_TRUE(std::filesystem::exists(DeadBirthPath(settings_.base_dir, settings_.file_root)));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "gaussian.stats"));
    RunRecord written = ReadDeadBirthFile(DeadBirthPath(settings_.base_dir, settings_.file_root));
    EXPECT_EQ(written.nlive(), run.nlive());

    ASSERT_EQ(result.summary.param_means.size(), 10u);
    EXPECT_DOUBLE_EQ(result.summary.param_means[0], ParamMean(run, 0));
    EXPECT_NEAR(result.summary.param_sigmas[0], 1.0, 0.25);

    // Columns: weight / max weight, -2 logl, parameters.
    std::ifstream posteriors(PosteriorsPath(settings_.base_dir, settings_.file_root));
    ASSERT_TRUE(posteriors.is_open());
    double weighted = 0.0;
    double total = 0.0;
    size_t rows = 0;
    std::string line;
    while (std::getline(posteriors, line)) {
        std::istringstream row(line);
        double weight, minus_two_logl, theta1;
        ASSERT_TRUE(row >> weight >> minus_two_logl >> theta1);
        EXPECT_LE(weight, 1.0);
        weighted += weight * theta1;
        total += weight;
        ++rows;
    }
    EXPECT_EQ(rows, run.size());
    EXPECT_NEAR(weighted / total, ParamMean(run, 0), 1e-9);
}
