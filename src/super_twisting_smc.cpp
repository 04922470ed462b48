/**
 * @file super_twisting_smc.cpp
 * @brief Super-twisting SMC implementation
 */

#include "smcpso/control/super_twisting_smc.hpp"
#include "smcpso/utils/math_utils.hpp"

#include <cmath>

namespace smcpso::control {

SuperTwistingSmc::SuperTwistingSmc(const core::GainVector& gains, double maxForce,
                                   const Params& params, const plant::IDynamicsModel* model)
    : alpha_(gains[0])
    , beta_(gains[1])
    , maxForce_(maxForce)
    , params_(params)
    , surface_(SlidingSurface::weighted(gains[2], gains[3], gains[4], gains[5]))
    , model_(model)
{
    equivalent_.regularization = params.regularization;
    equivalent_.controllabilityThreshold = params.controllabilityThreshold;
}

ControlOutput SuperTwistingSmc::compute(const core::StateVector& x, const ControllerState& state,
                                        double dt) const {
    ControlOutput out;
    out.state = state;
    out.state.elapsed += dt;

    const double s = surface_.evaluate(x);
    const double sTwist = std::abs(s) < params_.surfaceFloor ? 0.0 : s;
    const double sgn = switchingFunction(sTwist, params_.boundaryLayer, params_.switchMethod);

    const double ueq = computeEquivalentControl(model_, surface_, x, equivalent_);
    const double twisting = -alpha_ * std::sqrt(std::abs(sTwist)) * sgn;

    const double unsaturated = ueq + twisting + state.z - params_.dampingGain * s;
    const double u = utils::saturate(unsaturated, maxForce_);

    const double zNext = state.z - beta_ * sgn * dt +
                         params_.antiWindupGain * (u - unsaturated) * dt;
    out.state.z = utils::saturate(zNext, maxForce_);

    if (std::abs(s) <= params_.boundaryLayer) {
        out.state.timeInSliding += dt;
    }

    out.control = u;
    out.diagnostics.surface = s;
    out.diagnostics.equivalent = ueq;
    out.diagnostics.switching = twisting + state.z;
    out.diagnostics.unsaturated = unsaturated;
    out.diagnostics.control = u;
    out.diagnostics.z = out.state.z;
    out.diagnostics.mode = HybridMode::SuperTwisting;
    out.diagnostics.saturated = std::abs(unsaturated) > maxForce_;
    return out;
}

bool SuperTwistingSmc::validateParams(const Params& params, std::string& reason) {
    if (!(params.boundaryLayer > 0.0)) {
        reason = "super-twisting boundary layer must be > 0";
        return false;
    }
    if (!(params.dampingGain >= 0.0) || !(params.antiWindupGain >= 0.0)) {
        reason = "super-twisting damping and anti-windup gains must be >= 0";
        return false;
    }
    if (!(params.surfaceFloor >= 0.0)) {
        reason = "super-twisting surface floor must be >= 0";
        return false;
    }
    if (!(params.regularization >= 0.0) || !(params.controllabilityThreshold >= 0.0)) {
        reason = "super-twisting equivalent control thresholds must be >= 0";
        return false;
    }
    return true;
}

}  // namespace smcpso::control
