/**
 * @file pso_optimizer.hpp
 * @brief Particle swarm search over controller gain space
 */

#pragma once

#include "smcpso/control/controller_factory.hpp"
#include "smcpso/optim/fitness.hpp"
#include "smcpso/sim/batch_simulator.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace smcpso::optim {

/**
 * @brief Why an optimization run ended
 */
enum class TerminationReason {
    None,                   // Aborted before iterating (see error)
    Converged,              // Swarm diversity fell below the floor
    MaxIterationsReached,
    Stagnated,              // No relative improvement for `patience` iterations
    Cancelled               // Stop requested between iterations
};

const char* terminationReasonName(TerminationReason reason);

/**
 * @brief PSO coefficients
 */
struct PsoHyperparameters {
    double w = 0.7298;      // Inertia
    double c1 = 1.49618;    // Cognitive (personal best) weight
    double c2 = 1.49618;    // Social (global best) weight
};

/**
 * @brief PSO configuration
 */
struct PsoConfig {
    size_t nParticles = 20;
    size_t nIterations = 50;
    PsoHyperparameters hyper;
    bool useInertiaSchedule = false;    // Linear w from inertiaStart to inertiaEnd
    double inertiaStart = 0.9;
    double inertiaEnd = 0.4;
    double velocityClamp = 0.0;         // |v_d| <= clamp * span_d, 0 disables
    double stagnationTolerance = 1e-6;  // Relative improvement counted as progress
    size_t patience = 10;
    double diversityFloor = 1e-6;       // Normalised position spread, 0 disables
    uint64_t seed = 42;
    bool seedWithDefaults = false;      // Place particle 0 at the registry defaults

    bool validate(std::string& reason) const;
};

/**
 * @brief Everything one optimization run needs
 */
struct OptimizationRequest {
    core::ControllerVariant variant = core::ControllerVariant::Classical;
    std::vector<core::GainBounds> bounds;   // Empty uses the registry defaults
    PsoConfig pso;
    sim::SimulationConfig sim;
    FitnessConfig fitness;
    control::ControllerParams controllerParams;
    const plant::IDynamicsModel* model = nullptr;   // Nominal plant, required
    std::vector<const plant::IDynamicsModel*> robustnessModels;   // Extra perturbed plants
    core::GainVector baselineGains;         // Non-empty calibrates the cost norms
};

/**
 * @brief Progress snapshot passed to the iteration callback
 */
struct IterationInfo {
    size_t iteration = 0;       // Zero-based
    double bestCost = 0.0;
    double diversity = 0.0;
    double inertia = 0.0;       // Weight applied to the next velocity update
    core::GainVector bestGains;
    std::vector<core::GainVector> positions;    // Evaluated particle positions
};

/**
 * @brief Outcome of an optimization run
 */
struct OptimizationResult {
    core::ErrorCode error = core::ErrorCode::None;
    std::string message;
    TerminationReason reason = TerminationReason::None;
    core::GainVector bestGains;
    double bestCost = 0.0;
    std::vector<double> costHistory;        // Global best after each iteration
    std::vector<double> diversityHistory;
    size_t iterations = 0;
    size_t evaluations = 0;                 // Rollouts simulated
    bool stableSolutionFound = false;       // Best cost below the instability penalty
    double wallTime = 0.0;                  // s

    bool ok() const { return error == core::ErrorCode::None; }
};

/**
 * @brief Particle swarm optimizer
 *
 * Iterations run sequentially on the calling thread; each iteration
 * simulates the whole swarm through the batch simulator. All random
 * draws come from one seeded engine in a fixed order, so a request
 * always produces the same result.
 */
class PsoOptimizer {
public:
    using IterationCallback = std::function<void(const IterationInfo&)>;

    PsoOptimizer() = default;

    /**
     * @brief Run the search
     */
    OptimizationResult optimize(const OptimizationRequest& request);

    /**
     * @brief Ask the running search to stop after the current iteration
     *
     * Safe to call from another thread or from the iteration callback.
     */
    void requestStop() { stopRequested_.store(true); }
    bool isStopRequested() const { return stopRequested_.load(); }

    /**
     * @brief Set callback invoked after every iteration
     */
    void setIterationCallback(IterationCallback callback) { callback_ = std::move(callback); }

private:
    struct Particle {
        core::GainVector position;
        core::GainVector velocity;
        core::GainVector bestPosition;
        double bestCost;
        double cost;
    };

    std::vector<double> evaluateSwarm(const OptimizationRequest& request,
                                      const std::vector<core::GainBounds>& bounds,
                                      const FitnessEvaluator& fitness,
                                      OptimizationResult& result) const;

    static double diversity(const std::vector<Particle>& swarm,
                            const std::vector<core::GainBounds>& bounds);

    std::atomic<bool> stopRequested_{false};
    IterationCallback callback_;
    std::vector<Particle> swarm_;
};

}  // namespace smcpso::optim
