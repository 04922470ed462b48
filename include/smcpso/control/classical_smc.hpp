/**
 * @file classical_smc.hpp
 * @brief Classical sliding mode controller with boundary layer
 */

#pragma once

#include "smcpso/control/control_law.hpp"
#include "smcpso/control/equivalent_control.hpp"
#include "smcpso/plant/dynamics_model.hpp"

#include <string>

namespace smcpso::control {

/**
 * @brief Classical SMC
 *
 * Gains [k1, k2, lambda1, lambda2, K, kd]. Surface
 * s = lambda1*th1 + lambda2*th2 + k1*th1_dot + k2*th2_dot and
 * u = sat(u_eq - K*sat(s/eps) - kd*s), where eps = eps0 + eps1*|s|.
 */
class ClassicalSmc : public IControlLaw {
public:
    /**
     * @brief Controller parameters
     */
    struct Params {
        double boundaryLayer = 0.02;        // eps0, > 0
        double boundaryLayerSlope = 0.0;    // eps1, widens the layer with |s|
        double hysteresisRatio = 0.0;       // Switching term frozen for |s| < ratio*eps0
        SwitchMethod switchMethod = SwitchMethod::Tanh;
        double controllabilityThreshold = 0.0;  // 0 selects 0.05*(k1 + k2)
        double regularization = 1e-10;
        double equivalentLimitFactor = 5.0;     // |u_eq| <= factor * maxForce
    };

    ClassicalSmc(const core::GainVector& gains, double maxForce, const Params& params,
                 const plant::IDynamicsModel* model = nullptr);

    core::ControllerVariant variant() const override { return core::ControllerVariant::Classical; }
    ControllerState initialState() const override { return ControllerState{}; }
    ControlOutput compute(const core::StateVector& x, const ControllerState& state,
                          double dt) const override;
    double maxForce() const override { return maxForce_; }

    const Params& getParams() const { return params_; }
    const SlidingSurface& getSurface() const { return surface_; }

    /**
     * @brief Check parameter ranges
     * @param reason Receives a description of the first problem
     */
    static bool validateParams(const Params& params, std::string& reason);

private:
    double switchingGain_;
    double dampingGain_;
    double maxForce_;
    Params params_;
    SlidingSurface surface_;
    EquivalentControlParams equivalent_;
    const plant::IDynamicsModel* model_;
};

}  // namespace smcpso::control
