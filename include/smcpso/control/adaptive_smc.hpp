/**
 * @file adaptive_smc.hpp
 * @brief Sliding mode controller with online switching-gain adaptation
 */

#pragma once

#include "smcpso/control/control_law.hpp"
#include "smcpso/control/equivalent_control.hpp"
#include "smcpso/plant/dynamics_model.hpp"

#include <string>

namespace smcpso::control {

/**
 * @brief Adaptive SMC
 *
 * Gains [k1, k2, lambda1, lambda2, gamma]. The switching gain K_hat grows
 * with |s| outside a dead zone and leaks back towards kInit:
 * dK = gamma*|s| - leakRate*(K_hat - kInit), rate limited, then
 * K_hat += dK*dt clamped to [kMin, kMax].
 *
 * u = sat(u_eq - K_hat*sgn(s) - alpha*s), u_eq = 0 without a model.
 */
class AdaptiveSmc : public IControlLaw {
public:
    /**
     * @brief Controller parameters
     */
    struct Params {
        double boundaryLayer = 0.01;
        bool smoothSwitch = true;           // tanh if true, linear saturation otherwise
        double deadZone = 0.05;             // No adaptation while |s| <= deadZone
        double leakRate = 0.01;
        double adaptRateLimit = 10.0;       // |dK/dt| limit
        double kMin = 0.1;
        double kMax = 100.0;
        double kInit = 10.0;
        double alpha = 0.5;                 // Proportional surface term
        double gammaUpperBound = 20.0;      // Admissible adaptation rate limit
        double regularization = 1e-10;
        double controllabilityThreshold = 1e-4;
    };

    AdaptiveSmc(const core::GainVector& gains, double maxForce, const Params& params,
                const plant::IDynamicsModel* model = nullptr);

    core::ControllerVariant variant() const override { return core::ControllerVariant::Adaptive; }
    ControllerState initialState() const override;
    ControlOutput compute(const core::StateVector& x, const ControllerState& state,
                          double dt) const override;
    double maxForce() const override { return maxForce_; }

    const Params& getParams() const { return params_; }
    const SlidingSurface& getSurface() const { return surface_; }

    static bool validateParams(const Params& params, std::string& reason);

private:
    double gamma_;
    double maxForce_;
    Params params_;
    SlidingSurface surface_;
    EquivalentControlParams equivalent_;
    const plant::IDynamicsModel* model_;
};

}  // namespace smcpso::control
