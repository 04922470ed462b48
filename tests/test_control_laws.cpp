/**
 * @file test_control_laws.cpp
 * @brief Unit tests for the classical, super-twisting and adaptive laws
 */

#include <gtest/gtest.h>
#include <smcpso/control/adaptive_smc.hpp>
#include <smcpso/control/classical_smc.hpp>
#include <smcpso/control/controller_factory.hpp>
#include <smcpso/control/super_twisting_smc.hpp>
#include <smcpso/core/registry.hpp>
#include <smcpso/plant/dip_dynamics.hpp>

#include <Eigen/Cholesky>

#include <cmath>

using namespace smcpso::control;
using smcpso::core::ControllerVariant;
using smcpso::core::StateVector;

namespace {

StateVector makeState(double x, double th1, double th2,
                      double xd = 0.0, double th1d = 0.0, double th2d = 0.0) {
    StateVector s;
    s << x, th1, th2, xd, th1d, th2d;
    return s;
}

}  // namespace

class ClassicalSmcTest : public ::testing::Test {
protected:
    void SetUp() override {
        gains_ = {10, 8, 15, 12, 50, 5};
    }

    smcpso::core::GainVector gains_;
    smcpso::plant::DipDynamics plant_;
};

TEST_F(ClassicalSmcTest, ZeroStateGivesZeroControl) {
    ClassicalSmc law(gains_, 150.0, ClassicalSmc::Params{}, &plant_);
    const ControlOutput out = law.compute(StateVector::Zero(), law.initialState(), 0.01);

    EXPECT_NEAR(out.control, 0.0, 1e-9);
    EXPECT_NEAR(out.diagnostics.surface, 0.0, 1e-12);
    EXPECT_NEAR(out.diagnostics.equivalent, 0.0, 1e-9);
}

TEST_F(ClassicalSmcTest, SurfaceDefinition) {
    ClassicalSmc law(gains_, 150.0, ClassicalSmc::Params{});
    const StateVector x = makeState(0.0, 0.01, -0.02, 0.0, 0.03, 0.04);
    const double expected = 15 * 0.01 + 12 * -0.02 + 10 * 0.03 + 8 * 0.04;
    EXPECT_NEAR(law.getSurface().evaluate(x), expected, 1e-12);
}

TEST_F(ClassicalSmcTest, SwitchingAndDampingWithoutModel) {
    ClassicalSmc law(gains_, 150.0, ClassicalSmc::Params{});
    const ControlOutput out = law.compute(makeState(0.0, 0.01, 0.0), law.initialState(), 0.01);

    const double s = 0.15;
    const double expected = -50.0 * std::tanh(s / 0.02) - 5.0 * s;
    EXPECT_NEAR(out.control, expected, 1e-9);
    EXPECT_DOUBLE_EQ(out.diagnostics.equivalent, 0.0);
    EXPECT_FALSE(out.diagnostics.saturated);
}

TEST_F(ClassicalSmcTest, HysteresisFreezesSwitchingNearSurface) {
    ClassicalSmc::Params params;
    params.hysteresisRatio = 0.5;
    ClassicalSmc law(gains_, 150.0, params);

    // s = 0.005 < 0.5 * 0.02
    const ControlOutput out = law.compute(makeState(0.0, 0.005 / 15.0, 0.0), law.initialState(), 0.01);
    EXPECT_NEAR(out.control, -5.0 * 0.005, 1e-12);
}

TEST_F(ClassicalSmcTest, BoundaryLayerSlopeWidensLayer) {
    ClassicalSmc::Params params;
    params.boundaryLayerSlope = 1.0;
    ClassicalSmc law(gains_, 150.0, params);

    const ControlOutput out = law.compute(makeState(0.0, 0.01, 0.0), law.initialState(), 0.01);
    const double s = 0.15;
    const double expected = -50.0 * std::tanh(s / (0.02 + s)) - 5.0 * s;
    EXPECT_NEAR(out.control, expected, 1e-9);
}

TEST_F(ClassicalSmcTest, OutputSaturates) {
    ClassicalSmc law(gains_, 20.0, ClassicalSmc::Params{}, &plant_);
    const ControlOutput out = law.compute(makeState(0.0, 0.5, -0.4, 0.0, 3.0, -2.0),
                                          law.initialState(), 0.01);
    EXPECT_LE(std::abs(out.control), 20.0);
    EXPECT_TRUE(out.diagnostics.saturated);
}

TEST(SuperTwistingSmcTest, TwistingTermAndIntegrator) {
    SuperTwistingSmc law({10, 5, 8, 6, 2, 1.5}, 150.0, SuperTwistingSmc::Params{});
    const ControlOutput out = law.compute(makeState(0.0, 0.1, 0.0), law.initialState(), 0.01);

    // s = 8 * (0 + 2 * 0.1) = 1.6, linear saturation gives sgn = 1
    EXPECT_NEAR(out.diagnostics.surface, 1.6, 1e-12);
    EXPECT_NEAR(out.control, -10.0 * std::sqrt(1.6), 1e-9);
    EXPECT_NEAR(out.state.z, -5.0 * 0.01, 1e-12);
}

TEST(SuperTwistingSmcTest, IntegratorFeedsNextStep) {
    SuperTwistingSmc law({10, 5, 8, 6, 2, 1.5}, 150.0, SuperTwistingSmc::Params{});
    ControllerState state = law.initialState();
    state.z = 2.0;

    const ControlOutput out = law.compute(StateVector::Zero(), state, 0.01);
    EXPECT_NEAR(out.control, 2.0, 1e-12);
    EXPECT_NEAR(out.state.z, 2.0, 1e-12);
}

TEST(SuperTwistingSmcTest, SurfaceBelowFloorTreatedAsZero) {
    SuperTwistingSmc law({10, 5, 8, 6, 2, 1.5}, 150.0, SuperTwistingSmc::Params{});
    // s = 8 * 2 * 1e-8 = 1.6e-7
    const ControlOutput out = law.compute(makeState(0.0, 1e-8, 0.0), law.initialState(), 0.01);

    EXPECT_DOUBLE_EQ(out.control, 0.0);
    EXPECT_DOUBLE_EQ(out.state.z, 0.0);
}

TEST(SuperTwistingSmcTest, AntiWindupBacksOffIntegrator) {
    SuperTwistingSmc::Params params;
    params.antiWindupGain = 1.0;
    SuperTwistingSmc law({10, 5, 8, 6, 2, 1.5}, 5.0, params);

    const ControlOutput out = law.compute(makeState(0.0, 0.1, 0.0), law.initialState(), 0.01);
    const double raw = -10.0 * std::sqrt(1.6);
    EXPECT_DOUBLE_EQ(out.control, -5.0);
    EXPECT_NEAR(out.state.z, -0.05 + (-5.0 - raw) * 0.01, 1e-12);
    EXPECT_TRUE(out.diagnostics.saturated);
}

TEST(SuperTwistingSmcTest, IntegratorClippedToMaxForce) {
    SuperTwistingSmc law({10, 5, 8, 6, 2, 1.5}, 150.0, SuperTwistingSmc::Params{});
    ControllerState state = law.initialState();
    state.z = -149.99;

    const ControlOutput out = law.compute(makeState(0.0, 0.1, 0.0), state, 0.01);
    EXPECT_DOUBLE_EQ(out.state.z, -150.0);
}

TEST(AdaptiveSmcTest, ControlAndGainGrowth) {
    AdaptiveSmc law({12, 10, 6, 5, 2.5}, 150.0, AdaptiveSmc::Params{});
    const ControllerState initial = law.initialState();
    EXPECT_DOUBLE_EQ(initial.adaptiveGain, 10.0);

    // s = 12 * 6 * 0.1 = 7.2
    const ControlOutput out = law.compute(makeState(0.0, 0.1, 0.0), initial, 0.01);
    EXPECT_NEAR(out.control, -10.0 - 0.5 * 7.2, 1e-9);

    // dK = 2.5 * 7.2 = 18, rate limited to 10
    EXPECT_NEAR(out.state.adaptiveGain, 10.0 + 10.0 * 0.01, 1e-12);
}

TEST(AdaptiveSmcTest, DeadZoneFreezesAdaptation) {
    AdaptiveSmc law({12, 10, 6, 5, 2.5}, 150.0, AdaptiveSmc::Params{});
    // s = 0.005, inside the 0.05 dead zone and the 0.01 boundary layer
    const ControlOutput out = law.compute(makeState(0.0, 0.005 / 72.0, 0.0), law.initialState(), 0.01);
    EXPECT_DOUBLE_EQ(out.state.adaptiveGain, 10.0);
    EXPECT_DOUBLE_EQ(out.state.timeInSliding, 0.01);
}

TEST(AdaptiveSmcTest, LeakPullsGainTowardsInitial) {
    AdaptiveSmc law({12, 10, 6, 5, 2.5}, 150.0, AdaptiveSmc::Params{});
    ControllerState state = law.initialState();
    state.adaptiveGain = 50.0;

    // s = 0.1: dK = 2.5 * 0.1 - 0.01 * (50 - 10) = -0.15
    const ControlOutput out = law.compute(makeState(0.0, 0.1 / 72.0, 0.0), state, 0.01);
    EXPECT_NEAR(out.state.adaptiveGain, 50.0 - 0.15 * 0.01, 1e-12);
}

TEST(AdaptiveSmcTest, GainClampedToLimits) {
    AdaptiveSmc::Params params;
    params.kMax = 10.05;
    AdaptiveSmc law({12, 10, 6, 5, 2.5}, 150.0, params);

    const ControlOutput out = law.compute(makeState(0.0, 0.1, 0.0), law.initialState(), 0.01);
    EXPECT_DOUBLE_EQ(out.state.adaptiveGain, 10.05);
}

TEST(AdaptiveSmcTest, EquivalentControlAddedWithModel) {
    smcpso::plant::DipDynamics plant;
    AdaptiveSmc withModel({2, 15, 4, 20, 3}, 150.0, AdaptiveSmc::Params{}, &plant);
    AdaptiveSmc withoutModel({2, 15, 4, 20, 3}, 150.0, AdaptiveSmc::Params{});

    const StateVector x = makeState(0.0, 0.05, -0.02, 0.0, 0.1, 0.2);
    const ControlOutput a = withModel.compute(x, withModel.initialState(), 0.01);
    const ControlOutput b = withoutModel.compute(x, withoutModel.initialState(), 0.01);

    EXPECT_DOUBLE_EQ(b.diagnostics.equivalent, 0.0);
    EXPECT_GT(std::abs(a.diagnostics.equivalent), 1e-3);
    EXPECT_NEAR(a.control, b.control + a.diagnostics.equivalent, 1e-9);
    EXPECT_DOUBLE_EQ(a.state.adaptiveGain, b.state.adaptiveGain);
}

TEST(ControlLawTest, DeterministicAndBoundedForEveryVariant) {
    smcpso::plant::DipDynamics plant;
    ControllerParams params;
    params.model = &plant;

    const StateVector states[] = {
        StateVector::Zero(),
        makeState(0.1, 0.2, -0.1, 0.5, 1.0, -1.0),
        makeState(-2.0, 1.2, 1.4, -3.0, 8.0, -9.0),
        makeState(50.0, -1.5, 1.5, 40.0, -30.0, 30.0),
    };

    for (ControllerVariant variant : smcpso::core::allVariants()) {
        const auto* spec = smcpso::core::findVariantSpec(variant);
        FactoryResult first = ControllerFactory::create(variant, spec->defaultGains, 25.0, 0.01, params);
        FactoryResult second = ControllerFactory::create(variant, spec->defaultGains, 25.0, 0.01, params);
        ASSERT_TRUE(first.ok()) << first.message;
        ASSERT_TRUE(second.ok()) << second.message;

        for (const StateVector& x : states) {
            for (int k = 0; k < 5; ++k) {
                const double a = first.controller->compute(x);
                const double b = second.controller->compute(x);
                EXPECT_EQ(a, b) << spec->name;
                EXPECT_LE(std::abs(a), 25.0) << spec->name;
            }
        }
    }
}

TEST(ControlLawTest, SwitchingFunctions) {
    EXPECT_DOUBLE_EQ(switchingFunction(0.5, 0.1, SwitchMethod::Sign), 1.0);
    EXPECT_DOUBLE_EQ(switchingFunction(-0.5, 0.1, SwitchMethod::Sign), -1.0);
    EXPECT_DOUBLE_EQ(switchingFunction(0.0, 0.1, SwitchMethod::Sign), 0.0);
    EXPECT_DOUBLE_EQ(switchingFunction(0.05, 0.1, SwitchMethod::Linear), 0.5);
    EXPECT_DOUBLE_EQ(switchingFunction(-0.5, 0.1, SwitchMethod::Linear), -1.0);
    EXPECT_NEAR(switchingFunction(0.05, 0.1, SwitchMethod::Tanh), std::tanh(0.5), 1e-15);
}

TEST(ControlLawTest, DefaultSurfacesHavePositiveInputAuthority) {
    smcpso::plant::DipDynamics plant;
    smcpso::plant::PhysicsMatrices m;
    ASSERT_TRUE(plant.physicsMatrices(StateVector::Zero(), m));
    const smcpso::plant::Vector3 mInvB = m.inertia.ldlt().solve(smcpso::plant::Vector3::UnitX());

    // A cart force accelerates the two links in opposite directions
    EXPECT_LT(mInvB[1], 0.0);
    EXPECT_GT(mInvB[2], 0.0);

    for (ControllerVariant variant : smcpso::core::allVariants()) {
        const auto* spec = smcpso::core::findVariantSpec(variant);
        const smcpso::core::GainVector& g = spec->defaultGains;
        SlidingSurface surface;
        switch (variant) {
            case ControllerVariant::Classical:
                surface = SlidingSurface::classical(g[0], g[1], g[2], g[3]);
                break;
            case ControllerVariant::SuperTwisting:
                surface = SlidingSurface::weighted(g[2], g[3], g[4], g[5]);
                break;
            default:
                surface = SlidingSurface::weighted(g[0], g[1], g[2], g[3]);
                break;
        }
        const double authority = surface.rate1 * mInvB[1] + surface.rate2 * mInvB[2];
        EXPECT_GT(authority, 1.0) << spec->name;
    }
}
