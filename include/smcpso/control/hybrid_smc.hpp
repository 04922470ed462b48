/**
 * @file hybrid_smc.hpp
 * @brief Hybrid controller switching between adaptive and super-twisting SMC
 */

#pragma once

#include "smcpso/control/adaptive_smc.hpp"
#include "smcpso/control/super_twisting_smc.hpp"

#include <string>

namespace smcpso::control {

/**
 * @brief Criterion that selects the active sub-law
 */
enum class SwitchingCriterion {
    SurfaceMagnitude,   // Super-twisting while |s| is large
    TrackingError,      // Super-twisting while the angle error is large
    TimeBased           // Super-twisting during the reaching phase only
};

/**
 * @brief Hybrid adaptive / super-twisting SMC
 *
 * Gains [k1, k2, lambda1, lambda2] define the shared surface. Both sub-laws
 * are evaluated every tick on one internal state record, so the inactive
 * law stays warm. Mode changes respect hysteresis and a minimum dwell
 * time; the output is low-pass blended for a short window after a switch.
 */
class HybridSmc : public IControlLaw {
public:
    /**
     * @brief Controller parameters
     */
    struct Params {
        SwitchingCriterion criterion = SwitchingCriterion::SurfaceMagnitude;
        double lowThreshold = 0.1;          // Return to adaptive below this |s|
        double highThreshold = 1.0;         // Engage super-twisting above this |s|
        double hysteresisMargin = 0.02;
        double errorThreshold = 0.1;        // rad, TrackingError criterion
        double switchTime = 1.0;            // s, TimeBased criterion
        double minSwitchingTime = 0.1;      // s between mode changes
        bool transitionSmoothing = true;
        double smoothingTimeConstant = 0.01;    // s
        double twistingK1 = 10.0;
        double twistingK2 = 5.0;
        double gamma = 2.5;
        HybridMode initialMode = HybridMode::Adaptive;
        AdaptiveSmc::Params adaptive;
        SuperTwistingSmc::Params superTwisting;
    };

    HybridSmc(const core::GainVector& gains, double maxForce, const Params& params,
              const plant::IDynamicsModel* model = nullptr);

    core::ControllerVariant variant() const override {
        return core::ControllerVariant::HybridAdaptiveSuperTwisting;
    }
    ControllerState initialState() const override;
    ControlOutput compute(const core::StateVector& x, const ControllerState& state,
                          double dt) const override;
    double maxForce() const override { return maxForce_; }

    const Params& getParams() const { return params_; }

    static bool validateParams(const Params& params, std::string& reason);

private:
    HybridMode selectMode(const core::StateVector& x, double s, const ControllerState& state) const;

    double maxForce_;
    Params params_;
    SlidingSurface surface_;
    AdaptiveSmc adaptive_;
    SuperTwistingSmc twisting_;
};

}  // namespace smcpso::control
