/**
 * @file equivalent_control.hpp
 * @brief Model-based equivalent control for a linear sliding surface
 */

#pragma once

#include "smcpso/control/control_law.hpp"
#include "smcpso/plant/dynamics_model.hpp"

namespace smcpso::control {

/**
 * @brief Equivalent control settings
 */
struct EquivalentControlParams {
    double regularization = 1e-10;      // Tikhonov term added to M before solving
    double controllabilityThreshold = 0.0;  // Minimum |L M^-1 B|; below it u_eq = 0
};

/**
 * @brief Control that holds s_dot = 0 on the nominal model
 *
 * With L the rate coefficients of the surface and B = [1, 0, 0]^T:
 * u_eq = (L M^-1 (C q_dot + G) - a . q_dot) / (L M^-1 B).
 *
 * @param model Dynamics model, may be nullptr
 * @return 0 when there is no model, the model exposes no matrices, the
 *         solve is not finite, or the input is not controllable enough
 */
double computeEquivalentControl(const plant::IDynamicsModel* model,
                                const SlidingSurface& surface,
                                const core::StateVector& x,
                                const EquivalentControlParams& params);

}  // namespace smcpso::control
