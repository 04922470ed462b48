/**
 * @file adaptive_smc.cpp
 * @brief Adaptive SMC implementation
 */

#include "smcpso/control/adaptive_smc.hpp"
#include "smcpso/utils/math_utils.hpp"

#include <algorithm>
#include <cmath>

namespace smcpso::control {

AdaptiveSmc::AdaptiveSmc(const core::GainVector& gains, double maxForce, const Params& params,
                         const plant::IDynamicsModel* model)
    : gamma_(gains[4])
    , maxForce_(maxForce)
    , params_(params)
    , surface_(SlidingSurface::weighted(gains[0], gains[1], gains[2], gains[3]))
    , model_(model)
{
    equivalent_.regularization = params.regularization;
    equivalent_.controllabilityThreshold = params.controllabilityThreshold;
}

ControllerState AdaptiveSmc::initialState() const {
    ControllerState state;
    state.adaptiveGain = params_.kInit;
    return state;
}

ControlOutput AdaptiveSmc::compute(const core::StateVector& x, const ControllerState& state,
                                   double dt) const {
    ControlOutput out;
    out.state = state;
    out.state.elapsed += dt;

    const double s = surface_.evaluate(x);
    const double gain = state.adaptiveGain;
    const SwitchMethod method = params_.smoothSwitch ? SwitchMethod::Tanh : SwitchMethod::Linear;

    const double ueq = computeEquivalentControl(model_, surface_, x, equivalent_);
    const double robust = -gain * switchingFunction(s, params_.boundaryLayer, method);
    const double unsaturated = ueq + robust - params_.alpha * s;
    const double u = utils::saturate(unsaturated, maxForce_);

    double rate = 0.0;
    if (std::abs(s) > params_.deadZone) {
        rate = gamma_ * std::abs(s) - params_.leakRate * (gain - params_.kInit);
    }
    rate = utils::saturate(rate, params_.adaptRateLimit);
    out.state.adaptiveGain = std::clamp(gain + rate * dt, params_.kMin, params_.kMax);

    if (std::abs(s) <= params_.boundaryLayer) {
        out.state.timeInSliding += dt;
    }

    out.control = u;
    out.diagnostics.surface = s;
    out.diagnostics.equivalent = ueq;
    out.diagnostics.switching = robust;
    out.diagnostics.unsaturated = unsaturated;
    out.diagnostics.control = u;
    out.diagnostics.adaptiveGain = gain;
    out.diagnostics.mode = HybridMode::Adaptive;
    out.diagnostics.saturated = std::abs(unsaturated) > maxForce_;
    return out;
}

bool AdaptiveSmc::validateParams(const Params& params, std::string& reason) {
    if (!(params.boundaryLayer > 0.0)) {
        reason = "adaptive boundary layer must be > 0";
        return false;
    }
    if (!(params.deadZone >= 0.0) || !(params.leakRate >= 0.0)) {
        reason = "adaptive dead zone and leak rate must be >= 0";
        return false;
    }
    if (!(params.adaptRateLimit > 0.0)) {
        reason = "adaptive rate limit must be > 0";
        return false;
    }
    if (!(params.kMin > 0.0 && params.kMin <= params.kInit && params.kInit <= params.kMax)) {
        reason = "adaptive gain limits must satisfy 0 < kMin <= kInit <= kMax";
        return false;
    }
    if (!(params.alpha >= 0.0)) {
        reason = "adaptive alpha must be >= 0";
        return false;
    }
    if (!(params.gammaUpperBound > 0.0)) {
        reason = "adaptive gamma upper bound must be > 0";
        return false;
    }
    if (!(params.controllabilityThreshold >= 0.0) || !(params.regularization >= 0.0)) {
        reason = "adaptive equivalent control thresholds must be >= 0";
        return false;
    }
    return true;
}

}  // namespace smcpso::control
