/**
 * @file classical_smc.cpp
 * @brief Classical SMC implementation
 */

#include "smcpso/control/classical_smc.hpp"
#include "smcpso/utils/math_utils.hpp"

#include <cmath>

namespace smcpso::control {

ClassicalSmc::ClassicalSmc(const core::GainVector& gains, double maxForce, const Params& params,
                           const plant::IDynamicsModel* model)
    : switchingGain_(gains[4])
    , dampingGain_(gains[5])
    , maxForce_(maxForce)
    , params_(params)
    , surface_(SlidingSurface::classical(gains[0], gains[1], gains[2], gains[3]))
    , model_(model)
{
    equivalent_.regularization = params.regularization;
    equivalent_.controllabilityThreshold = params.controllabilityThreshold > 0.0
        ? params.controllabilityThreshold
        : 0.05 * (gains[0] + gains[1]);
}

ControlOutput ClassicalSmc::compute(const core::StateVector& x, const ControllerState& state,
                                    double dt) const {
    ControlOutput out;
    out.state = state;
    out.state.elapsed += dt;

    const double s = surface_.evaluate(x);
    const double eps = params_.boundaryLayer + params_.boundaryLayerSlope * std::abs(s);

    const double limit = params_.equivalentLimitFactor * maxForce_;
    const double ueq = utils::saturate(computeEquivalentControl(model_, surface_, x, equivalent_), limit);

    double sw = 0.0;
    if (std::abs(s) >= params_.hysteresisRatio * params_.boundaryLayer) {
        sw = switchingFunction(s, eps, params_.switchMethod);
    }
    const double robust = -switchingGain_ * sw - dampingGain_ * s;

    const double unsaturated = ueq + robust;
    const double u = utils::saturate(unsaturated, maxForce_);

    if (std::abs(s) <= eps) {
        out.state.timeInSliding += dt;
    }

    out.control = u;
    out.diagnostics.surface = s;
    out.diagnostics.equivalent = ueq;
    out.diagnostics.switching = robust;
    out.diagnostics.unsaturated = unsaturated;
    out.diagnostics.control = u;
    out.diagnostics.saturated = std::abs(unsaturated) > maxForce_;
    return out;
}

bool ClassicalSmc::validateParams(const Params& params, std::string& reason) {
    if (!(params.boundaryLayer > 0.0)) {
        reason = "classical boundary layer must be > 0";
        return false;
    }
    if (!(params.boundaryLayerSlope >= 0.0)) {
        reason = "classical boundary layer slope must be >= 0";
        return false;
    }
    if (!(params.hysteresisRatio >= 0.0 && params.hysteresisRatio <= 1.0)) {
        reason = "classical hysteresis ratio must be in [0, 1]";
        return false;
    }
    if (!(params.controllabilityThreshold >= 0.0) || !(params.regularization >= 0.0)) {
        reason = "classical equivalent control thresholds must be >= 0";
        return false;
    }
    if (!(params.equivalentLimitFactor > 0.0)) {
        reason = "classical equivalent limit factor must be > 0";
        return false;
    }
    return true;
}

}  // namespace smcpso::control
