/**
 * @file super_twisting_smc.hpp
 * @brief Second-order super-twisting sliding mode controller
 */

#pragma once

#include "smcpso/control/control_law.hpp"
#include "smcpso/control/equivalent_control.hpp"
#include "smcpso/plant/dynamics_model.hpp"

#include <string>

namespace smcpso::control {

/**
 * @brief Super-twisting SMC
 *
 * Gains [K1, K2, k1, k2, lambda1, lambda2], K1 > K2 > 0. Surface
 * s = k1*(th1_dot + lambda1*th1) + k2*(th2_dot + lambda2*th2).
 *
 * u = sat(u_eq - K1*sqrt|s|*sgn(s) + z - d*s)
 * z+ = sat(z - K2*sgn(s)*dt + Kaw*(u - u_raw)*dt)
 *
 * sgn() is the boundary-layer approximation selected by switchMethod.
 */
class SuperTwistingSmc : public IControlLaw {
public:
    /**
     * @brief Controller parameters
     */
    struct Params {
        double boundaryLayer = 0.01;        // > 0
        SwitchMethod switchMethod = SwitchMethod::Linear;
        double dampingGain = 0.0;           // d, linear surface damping
        double antiWindupGain = 0.0;        // Kaw, back-calculation on the integrator
        double surfaceFloor = 1e-6;         // |s| below this is treated as zero
        double regularization = 1e-10;
        double controllabilityThreshold = 1e-4;
    };

    SuperTwistingSmc(const core::GainVector& gains, double maxForce, const Params& params,
                     const plant::IDynamicsModel* model = nullptr);

    core::ControllerVariant variant() const override { return core::ControllerVariant::SuperTwisting; }
    ControllerState initialState() const override { return ControllerState{}; }
    ControlOutput compute(const core::StateVector& x, const ControllerState& state,
                          double dt) const override;
    double maxForce() const override { return maxForce_; }

    const Params& getParams() const { return params_; }
    const SlidingSurface& getSurface() const { return surface_; }

    static bool validateParams(const Params& params, std::string& reason);

private:
    double alpha_;      // K1
    double beta_;       // K2
    double maxForce_;
    Params params_;
    SlidingSurface surface_;
    EquivalentControlParams equivalent_;
    const plant::IDynamicsModel* model_;
};

}  // namespace smcpso::control
