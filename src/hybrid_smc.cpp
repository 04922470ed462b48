/**
 * @file hybrid_smc.cpp
 * @brief Hybrid SMC mode selection and transition filter
 */

#include "smcpso/control/hybrid_smc.hpp"
#include "smcpso/utils/math_utils.hpp"

#include <cmath>

namespace smcpso::control {

namespace {

// Transition window expressed in filter time constants
constexpr double kTransitionWindow = 5.0;

core::GainVector adaptiveGains(const core::GainVector& gains, double gamma) {
    return {gains[0], gains[1], gains[2], gains[3], gamma};
}

core::GainVector twistingGains(const core::GainVector& gains, double k1, double k2) {
    return {k1, k2, gains[0], gains[1], gains[2], gains[3]};
}

}  // namespace

HybridSmc::HybridSmc(const core::GainVector& gains, double maxForce, const Params& params,
                     const plant::IDynamicsModel* model)
    : maxForce_(maxForce)
    , params_(params)
    , surface_(SlidingSurface::weighted(gains[0], gains[1], gains[2], gains[3]))
    , adaptive_(adaptiveGains(gains, params.gamma), maxForce, params.adaptive, model)
    , twisting_(twistingGains(gains, params.twistingK1, params.twistingK2), maxForce,
                params.superTwisting, model)
{
}

ControllerState HybridSmc::initialState() const {
    ControllerState state = adaptive_.initialState();
    state.mode = params_.initialMode;
    return state;
}

HybridMode HybridSmc::selectMode(const core::StateVector& x, double s,
                                 const ControllerState& state) const {
    const double margin = params_.hysteresisMargin;
    const HybridMode current = state.mode;

    switch (params_.criterion) {
        case SwitchingCriterion::SurfaceMagnitude: {
            const double magnitude = std::abs(s);
            if (current == HybridMode::Adaptive && magnitude > params_.highThreshold + margin) {
                return HybridMode::SuperTwisting;
            }
            if (current == HybridMode::SuperTwisting && magnitude < params_.lowThreshold - margin) {
                return HybridMode::Adaptive;
            }
            return current;
        }

        case SwitchingCriterion::TrackingError: {
            const double error = std::hypot(x[core::Theta1], x[core::Theta2]);
            if (current == HybridMode::Adaptive && error > params_.errorThreshold + margin) {
                return HybridMode::SuperTwisting;
            }
            if (current == HybridMode::SuperTwisting && error < params_.errorThreshold - margin) {
                return HybridMode::Adaptive;
            }
            return current;
        }

        case SwitchingCriterion::TimeBased:
        default:
            return state.elapsed < params_.switchTime ? HybridMode::SuperTwisting
                                                      : HybridMode::Adaptive;
    }
}

ControlOutput HybridSmc::compute(const core::StateVector& x, const ControllerState& state,
                                 double dt) const {
    const double s = surface_.evaluate(x);

    const ControlOutput adaptiveOut = adaptive_.compute(x, state, dt);
    const ControlOutput twistingOut = twisting_.compute(x, state, dt);

    ControlOutput out;
    out.state = state;
    out.state.elapsed = state.elapsed + dt;
    out.state.z = twistingOut.state.z;
    out.state.adaptiveGain = adaptiveOut.state.adaptiveGain;
    out.state.timeInSliding = adaptiveOut.state.timeInSliding;

    const HybridMode desired = selectMode(x, s, state);
    const bool dwellElapsed = state.switchCount == 0 ||
        state.elapsed - state.lastSwitchTime >= params_.minSwitchingTime;
    if (desired != state.mode && dwellElapsed) {
        out.state.mode = desired;
        out.state.lastSwitchTime = state.elapsed;
        out.state.switchCount = state.switchCount + 1;
    }

    const ControlOutput& active =
        out.state.mode == HybridMode::SuperTwisting ? twistingOut : adaptiveOut;

    double u = active.control;
    const bool inTransition = out.state.switchCount > 0 &&
        out.state.elapsed - out.state.lastSwitchTime <
            kTransitionWindow * params_.smoothingTimeConstant;
    if (params_.transitionSmoothing && state.filterPrimed && inTransition) {
        const double alpha = dt / (params_.smoothingTimeConstant + dt);
        u = state.filteredControl + alpha * (u - state.filteredControl);
    }
    u = utils::saturate(u, maxForce_);
    out.state.filteredControl = u;
    out.state.filterPrimed = true;

    out.control = u;
    out.diagnostics = active.diagnostics;
    out.diagnostics.surface = s;
    out.diagnostics.control = u;
    out.diagnostics.adaptiveGain = state.adaptiveGain;
    out.diagnostics.z = out.state.z;
    out.diagnostics.mode = out.state.mode;
    return out;
}

bool HybridSmc::validateParams(const Params& params, std::string& reason) {
    if (!(params.lowThreshold > 0.0 && params.lowThreshold < params.highThreshold)) {
        reason = "hybrid surface thresholds must satisfy 0 < low < high";
        return false;
    }
    if (!(params.hysteresisMargin >= 0.0) || !(params.errorThreshold > 0.0)) {
        reason = "hybrid hysteresis margin must be >= 0 and error threshold > 0";
        return false;
    }
    if (!(params.switchTime >= 0.0) || !(params.minSwitchingTime >= 0.0)) {
        reason = "hybrid switching times must be >= 0";
        return false;
    }
    if (params.transitionSmoothing && !(params.smoothingTimeConstant > 0.0)) {
        reason = "hybrid smoothing time constant must be > 0";
        return false;
    }
    if (!(params.twistingK2 > 0.0 && params.twistingK1 > params.twistingK2)) {
        reason = "hybrid twisting gains must satisfy K1 > K2 > 0";
        return false;
    }
    if (!(params.gamma > 0.0 && params.gamma <= params.adaptive.gammaUpperBound)) {
        reason = "hybrid adaptation rate must be in (0, gammaUpperBound]";
        return false;
    }
    return AdaptiveSmc::validateParams(params.adaptive, reason) &&
           SuperTwistingSmc::validateParams(params.superTwisting, reason);
}

}  // namespace smcpso::control
