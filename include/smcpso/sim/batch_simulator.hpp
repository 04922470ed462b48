/**
 * @file batch_simulator.hpp
 * @brief Parallel closed-loop simulation of a swarm of gain vectors
 */

#pragma once

#include "smcpso/control/controller_factory.hpp"
#include "smcpso/plant/dip_dynamics.hpp"
#include "smcpso/sim/trajectory.hpp"
#include "smcpso/utils/math_utils.hpp"

#include <string>
#include <vector>

namespace smcpso::sim {

/**
 * @brief Simulation configuration
 */
struct SimulationConfig {
    double simTime = 5.0;               // Horizon T, s
    double dt = 0.01;                   // Tick, s
    double uMax = 150.0;                // Actuator limit, N
    double convergenceTol = 0.0;        // max |s| for early stop, 0 disables
    double gracePeriod = 0.0;           // No early stop before this time, s
    size_t convergenceWindow = 20;      // Trailing samples checked for convergence
    double stateCeiling = 1e6;          // Divergence when any |state_i| exceeds this
    double fallAngle = utils::HALF_PI;  // |theta| beyond this counts as a fall, 0 disables
    core::StateVector initialState = (core::StateVector() << 0.0, 0.1, -0.05, 0.0, 0.0, 0.0).finished();
    plant::Integrator integrator = plant::Integrator::Rk4;
    double timeout = 0.0;               // Per-rollout wall-clock budget, s, 0 disables
    bool recordDiagnostics = false;
    int threads = 0;                    // OpenMP threads, 0 keeps the runtime default

    /**
     * @brief Number of ticks, round(simTime / dt)
     */
    size_t horizonSteps() const;

    /**
     * @brief Check ranges
     * @param reason Receives the first problem found
     */
    bool validate(std::string& reason) const;
};

/**
 * @brief Batch output
 *
 * error is set only for structural failures that abort the whole batch;
 * per-particle problems are reported through each trajectory's status.
 */
struct BatchResult {
    core::ErrorCode error = core::ErrorCode::None;
    std::string message;
    std::vector<Trajectory> trajectories;   // One per particle, in input order

    bool ok() const { return error == core::ErrorCode::None; }
};

/**
 * @brief Roll out one controller against a model
 *
 * The controller is reset first and runs without history recording; its
 * recording setting is restored on return. Never fails structurally;
 * divergence and timeout are reported through the trajectory status.
 */
Trajectory simulate(control::Controller& controller, const plant::IDynamicsModel& model,
                    const SimulationConfig& config);

/**
 * @brief Simulate every particle's gains in parallel
 * @param bounds Validation bounds, empty to use the registry defaults
 */
BatchResult simulateBatch(core::ControllerVariant variant,
                          const std::vector<core::GainVector>& particleGains,
                          const plant::IDynamicsModel& model,
                          const SimulationConfig& config,
                          const control::ControllerParams& params = control::ControllerParams{},
                          const std::vector<core::GainBounds>& bounds = {});

/**
 * @brief Simulate the batch once per model (nominal plus perturbed draws)
 * @return One BatchResult per model, in model order; stops at the first
 *         structural failure
 */
std::vector<BatchResult> simulateBatchRobust(core::ControllerVariant variant,
                                             const std::vector<core::GainVector>& particleGains,
                                             const std::vector<const plant::IDynamicsModel*>& models,
                                             const SimulationConfig& config,
                                             const control::ControllerParams& params = control::ControllerParams{},
                                             const std::vector<core::GainBounds>& bounds = {});

}  // namespace smcpso::sim
