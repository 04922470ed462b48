/**
 * @file test_fitness.cpp
 * @brief Unit tests for trajectory cost evaluation
 */

#include <gtest/gtest.h>
#include <smcpso/optim/fitness.hpp>

#include <cmath>
#include <limits>

using namespace smcpso::optim;
using smcpso::core::StateVector;
using smcpso::sim::Trajectory;
using smcpso::sim::TrajectoryStatus;

class FitnessTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.weights = CostWeights{1.0, 1.0, 1.0, 1.0};
        fitness_ = FitnessEvaluator(config_);

        // Two ticks of 0.1 s:
        //   state error  = 1^2 * 0.1             = 0.1
        //   effort       = (1^2 + 3^2) * 0.1     = 1.0
        //   rate         = (0^2 + 2^2) * 0.1     = 0.4
        //   sliding      = (1^2 + 1^2) * 0.1     = 0.2
        stable_.status = TrajectoryStatus::Completed;
        stable_.dt = 0.1;
        stable_.horizon = 0.2;
        stable_.failureTime = 0.2;
        stable_.time = {0.0, 0.1, 0.2};
        StateVector tilted = StateVector::Zero();
        tilted[1] = 1.0;
        stable_.states = {StateVector::Zero(), tilted, StateVector::Zero()};
        stable_.control = {1.0, 3.0};
        stable_.surface = {1.0, -1.0};
    }

    Trajectory unstableAt(double failureTime) const {
        Trajectory traj = stable_;
        traj.status = TrajectoryStatus::Unstable;
        traj.horizon = 5.0;
        traj.failureTime = failureTime;
        return traj;
    }

    FitnessConfig config_;
    FitnessEvaluator fitness_;
    Trajectory stable_;
};

TEST_F(FitnessTest, CostTerms) {
    const CostTerms terms = FitnessEvaluator::computeTerms(stable_);
    EXPECT_NEAR(terms.stateError, 0.1, 1e-12);
    EXPECT_NEAR(terms.controlEffort, 1.0, 1e-12);
    EXPECT_NEAR(terms.controlRate, 0.4, 1e-12);
    EXPECT_NEAR(terms.sliding, 0.2, 1e-12);
}

TEST_F(FitnessTest, WeightedSum) {
    EXPECT_NEAR(fitness_.evaluate(stable_), 1.7, 1e-12);

    config_.weights = CostWeights{2.0, 0.0, 0.5, 0.0};
    FitnessEvaluator weighted(config_);
    EXPECT_NEAR(weighted.evaluate(stable_), 2.0 * 0.1 + 0.5 * 0.4, 1e-12);
}

TEST_F(FitnessTest, Normalisation) {
    config_.norms.controlEffort = 2.0;
    config_.norms.sliding = 1e-15;  // below the threshold, ignored
    FitnessEvaluator normalised(config_);
    EXPECT_NEAR(normalised.evaluate(stable_), 0.1 + 0.5 + 0.4 + 0.2, 1e-12);
}

TEST_F(FitnessTest, DefaultPenalty) {
    EXPECT_DOUBLE_EQ(fitness_.instabilityPenalty(), 1e3 * 4.0);
    EXPECT_DOUBLE_EQ(fitness_.maxPenalty(), 8e3);

    config_.instabilityPenalty = 500.0;
    EXPECT_DOUBLE_EQ(FitnessEvaluator(config_).instabilityPenalty(), 500.0);
}

TEST_F(FitnessTest, InstabilityDominatesStableCost) {
    const double penalty = fitness_.instabilityPenalty();

    Trajectory huge = stable_;
    huge.control = {1e9, -1e9};
    const double capped = fitness_.evaluate(huge);
    EXPECT_LT(capped, penalty);

    const double lateFailure = fitness_.evaluate(unstableAt(5.0));
    EXPECT_GT(lateFailure, capped);
    EXPECT_GE(lateFailure, penalty);
}

TEST_F(FitnessTest, EarlierFailureCostsMore) {
    const double early = fitness_.evaluate(unstableAt(0.5));
    const double late = fitness_.evaluate(unstableAt(4.0));
    const double penalty = fitness_.instabilityPenalty();

    EXPECT_GT(early, late);
    EXPECT_NEAR(early, penalty * (1.0 + 4.5 / 5.0), 1e-9);
    EXPECT_NEAR(late, penalty * (1.0 + 1.0 / 5.0), 1e-9);
}

TEST_F(FitnessTest, InvalidAndTimedOutGetMaximalPenalty) {
    Trajectory invalid;
    invalid.status = TrajectoryStatus::Invalid;
    EXPECT_DOUBLE_EQ(fitness_.evaluate(invalid), fitness_.maxPenalty());

    Trajectory timedOut = stable_;
    timedOut.status = TrajectoryStatus::TimedOut;
    EXPECT_DOUBLE_EQ(fitness_.evaluate(timedOut), fitness_.maxPenalty());

    EXPECT_GE(fitness_.maxPenalty(), fitness_.evaluate(unstableAt(0.0)));
}

TEST_F(FitnessTest, NonFiniteCostGetsMaximalPenalty) {
    Trajectory broken = stable_;
    broken.control = {std::numeric_limits<double>::infinity(), 0.0};
    EXPECT_DOUBLE_EQ(fitness_.evaluate(broken), fitness_.maxPenalty());
}

TEST_F(FitnessTest, EvaluateBatchKeepsOrder) {
    const std::vector<double> costs = fitness_.evaluateBatch({stable_, unstableAt(1.0), stable_});
    ASSERT_EQ(costs.size(), 3u);
    EXPECT_DOUBLE_EQ(costs[0], costs[2]);
    EXPECT_GT(costs[1], costs[0]);
}

TEST_F(FitnessTest, CombineDraws) {
    EXPECT_NEAR(fitness_.combine({1.0, 3.0}), 0.7 * 2.0 + 0.3 * 3.0, 1e-12);
    EXPECT_NEAR(fitness_.combine({2.5}), 2.5, 1e-12);

    const double unstable = fitness_.evaluate(unstableAt(1.0));
    EXPECT_DOUBLE_EQ(fitness_.combine({1.0, unstable, 2.0}), unstable);
    EXPECT_DOUBLE_EQ(fitness_.combine({}), fitness_.maxPenalty());
}

TEST_F(FitnessTest, CalibrateNormsFromBaseline) {
    ASSERT_TRUE(fitness_.calibrateNorms(stable_));
    EXPECT_NEAR(fitness_.getConfig().norms.controlEffort, 1.0, 1e-12);
    EXPECT_NEAR(fitness_.getConfig().norms.controlRate, 0.4, 1e-12);

    // Each normalised term of the baseline is 1
    EXPECT_NEAR(fitness_.evaluate(stable_), 4.0, 1e-9);

    EXPECT_FALSE(fitness_.calibrateNorms(unstableAt(1.0)));
}
