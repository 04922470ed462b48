/**
 * @file smcpso.hpp
 * @brief Main smcpso library header - includes all components
 */

#pragma once

// Core types, variant registry and gain validation
#include "smcpso/core/types.hpp"
#include "smcpso/core/registry.hpp"
#include "smcpso/core/gain_validator.hpp"

// Plant interface and reference double inverted pendulum
#include "smcpso/plant/dynamics_model.hpp"
#include "smcpso/plant/dip_dynamics.hpp"

// Sliding mode control laws
#include "smcpso/control/control_law.hpp"
#include "smcpso/control/classical_smc.hpp"
#include "smcpso/control/super_twisting_smc.hpp"
#include "smcpso/control/adaptive_smc.hpp"
#include "smcpso/control/hybrid_smc.hpp"
#include "smcpso/control/controller.hpp"
#include "smcpso/control/controller_factory.hpp"

// Simulation and optimization
#include "smcpso/sim/batch_simulator.hpp"
#include "smcpso/optim/fitness.hpp"
#include "smcpso/optim/pso_optimizer.hpp"

// Utilities
#include "smcpso/utils/utils.hpp"

/**
 * @namespace smcpso
 * @brief Sliding-mode controller design and PSO gain tuning
 *
 * Builds validated sliding-mode controllers for a double inverted pendulum
 * on a cart and tunes their gains with a particle swarm driven by batch
 * closed-loop simulation.
 *
 * @example Basic Usage:
 * @code
 * #include <smcpso/smcpso.hpp>
 *
 * smcpso::plant::DipDynamics plant;
 *
 * smcpso::optim::OptimizationRequest request;
 * request.variant = smcpso::core::ControllerVariant::Classical;
 * request.model = &plant;
 * request.controllerParams.model = &plant;
 *
 * smcpso::optim::PsoOptimizer pso;
 * auto result = pso.optimize(request);
 *
 * auto created = smcpso::control::ControllerFactory::create(
 *     request.variant, result.bestGains, 150.0, 0.01, request.controllerParams);
 * double u = created.controller->compute(state);
 * @endcode
 */
namespace smcpso {

/**
 * @brief Library version information
 */
struct Version {
    static constexpr int MAJOR = 1;
    static constexpr int MINOR = 0;
    static constexpr int PATCH = 0;

    static const char* getString() {
        return "1.0.0";
    }
};

/**
 * @brief Version string of the compiled library
 */
const char* getVersion();

}  // namespace smcpso
