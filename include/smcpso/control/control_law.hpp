/**
 * @file control_law.hpp
 * @brief Control law interface, per-step records and sliding-surface helpers
 */

#pragma once

#include "smcpso/core/types.hpp"
#include "smcpso/utils/math_utils.hpp"

#include <cmath>
#include <algorithm>

namespace smcpso::control {

/**
 * @brief Continuous approximation used inside the boundary layer
 */
enum class SwitchMethod {
    Sign,       // Discontinuous sign(s), chattering prone
    Tanh,       // tanh(s / eps)
    Linear      // clamp(s / eps, -1, 1)
};

/**
 * @brief Active sub-law of the hybrid controller
 */
enum class HybridMode {
    Adaptive,
    SuperTwisting
};

/**
 * @brief Internal controller state carried between steps
 *
 * One record shape serves every variant; fields a variant does not use
 * stay at their initial values.
 */
struct ControllerState {
    double z = 0.0;                 // Super-twisting integrator
    double adaptiveGain = 0.0;      // Adapted switching gain (K hat)
    double timeInSliding = 0.0;     // Time spent inside the boundary layer, s
    double elapsed = 0.0;           // Controller time, s
    HybridMode mode = HybridMode::Adaptive;
    double lastSwitchTime = 0.0;    // Controller time of the last mode switch, s
    double filteredControl = 0.0;   // Transition filter output
    bool filterPrimed = false;
    int switchCount = 0;
};

/**
 * @brief Per-step diagnostics record
 */
struct Diagnostics {
    double surface = 0.0;           // Sliding surface value s
    double equivalent = 0.0;        // Model-based equivalent control
    double switching = 0.0;         // Robust / switching contribution
    double unsaturated = 0.0;       // Control before actuator saturation
    double control = 0.0;           // Applied control
    double adaptiveGain = 0.0;
    double z = 0.0;
    HybridMode mode = HybridMode::Adaptive;
    bool saturated = false;
};

/**
 * @brief Result of one control-law evaluation
 */
struct ControlOutput {
    double control = 0.0;
    ControllerState state;
    Diagnostics diagnostics;
};

/**
 * @brief Control law evaluator
 *
 * Holds validated gains and parameters. compute() is const and
 * deterministic: the same (state, internal state, dt) always gives the same
 * output, and the caller owns the state between steps.
 */
class IControlLaw {
public:
    virtual ~IControlLaw() = default;

    virtual core::ControllerVariant variant() const = 0;

    /**
     * @brief Internal state at construction / reset
     */
    virtual ControllerState initialState() const = 0;

    /**
     * @brief Evaluate the law for one tick
     * @param x Plant state
     * @param state Internal state from the previous tick
     * @param dt Tick length in seconds
     */
    virtual ControlOutput compute(const core::StateVector& x, const ControllerState& state,
                                  double dt) const = 0;

    virtual double maxForce() const = 0;
};

/**
 * @brief Linear sliding surface s = a1*th1 + a2*th2 + c1*th1_dot + c2*th2_dot
 */
struct SlidingSurface {
    double angle1 = 0.0;    // Coefficient on theta1
    double angle2 = 0.0;    // Coefficient on theta2
    double rate1 = 0.0;     // Coefficient on theta1_dot
    double rate2 = 0.0;     // Coefficient on theta2_dot

    /**
     * @brief s = lambda1*th1 + lambda2*th2 + k1*th1_dot + k2*th2_dot
     */
    static SlidingSurface classical(double k1, double k2, double lambda1, double lambda2) {
        return {lambda1, lambda2, k1, k2};
    }

    /**
     * @brief s = k1*(th1_dot + lambda1*th1) + k2*(th2_dot + lambda2*th2)
     */
    static SlidingSurface weighted(double k1, double k2, double lambda1, double lambda2) {
        return {k1 * lambda1, k2 * lambda2, k1, k2};
    }

    double evaluate(const core::StateVector& x) const {
        return angle1 * x[core::Theta1] + angle2 * x[core::Theta2] +
               rate1 * x[core::Theta1Rate] + rate2 * x[core::Theta2Rate];
    }
};

/**
 * @brief Switching function approximating sign(s)
 * @param epsilon Boundary layer width (> 0 for Tanh / Linear)
 */
inline double switchingFunction(double s, double epsilon, SwitchMethod method) {
    switch (method) {
        case SwitchMethod::Tanh:
            return std::tanh(s / epsilon);
        case SwitchMethod::Linear:
            return std::clamp(s / epsilon, -1.0, 1.0);
        case SwitchMethod::Sign:
        default:
            return utils::sign(s);
    }
}

}  // namespace smcpso::control
