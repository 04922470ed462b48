/**
 * @file pso_optimizer.cpp
 * @brief PSO main loop, swarm update and termination checks
 */

#include "smcpso/optim/pso_optimizer.hpp"
#include "smcpso/core/gain_validator.hpp"
#include "smcpso/core/registry.hpp"
#include "smcpso/utils/logger.hpp"
#include "smcpso/utils/math_utils.hpp"
#include "smcpso/utils/timer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>

namespace smcpso::optim {

using core::ErrorCode;
using core::GainBounds;
using core::GainVector;

const char* terminationReasonName(TerminationReason reason) {
    switch (reason) {
        case TerminationReason::None:                 return "None";
        case TerminationReason::Converged:            return "Converged";
        case TerminationReason::MaxIterationsReached: return "MaxIterationsReached";
        case TerminationReason::Stagnated:            return "Stagnated";
        case TerminationReason::Cancelled:            return "Cancelled";
        default:                                      return "Unknown";
    }
}

bool PsoConfig::validate(std::string& reason) const {
    if (nParticles == 0 || nIterations == 0) {
        reason = "swarm size and iteration count must be >= 1";
        return false;
    }
    if (!std::isfinite(hyper.w) || !(hyper.c1 >= 0.0) || !(hyper.c2 >= 0.0) ||
        !std::isfinite(hyper.c1) || !std::isfinite(hyper.c2)) {
        reason = "PSO coefficients must be finite, c1 and c2 >= 0";
        return false;
    }
    if (useInertiaSchedule && (!std::isfinite(inertiaStart) || !std::isfinite(inertiaEnd))) {
        reason = "inertia schedule endpoints must be finite";
        return false;
    }
    if (!(velocityClamp >= 0.0) || !(stagnationTolerance >= 0.0) || patience == 0 ||
        !(diversityFloor >= 0.0)) {
        reason = "velocity clamp, stagnation tolerance and diversity floor must be >= 0, patience >= 1";
        return false;
    }
    return true;
}

namespace {

OptimizationResult abortRun(ErrorCode error, const std::string& message) {
    SMCPSO_LOG_ERROR("optimization aborted: %s", message.c_str());
    OptimizationResult result;
    result.error = error;
    result.message = message;
    result.bestCost = std::numeric_limits<double>::infinity();
    return result;
}

void clipToBounds(GainVector& position, const std::vector<GainBounds>& bounds) {
    for (size_t d = 0; d < position.size(); ++d) {
        position[d] = std::clamp(position[d], bounds[d].lower, bounds[d].upper);
    }
}

}  // namespace

double PsoOptimizer::diversity(const std::vector<Particle>& swarm,
                               const std::vector<GainBounds>& bounds) {
    if (swarm.size() < 2 || bounds.empty()) return 0.0;

    const double n = static_cast<double>(swarm.size());
    double total = 0.0;
    for (size_t d = 0; d < bounds.size(); ++d) {
        double mean = 0.0;
        for (const auto& p : swarm) mean += p.position[d];
        mean /= n;

        double variance = 0.0;
        for (const auto& p : swarm) {
            const double diff = p.position[d] - mean;
            variance += diff * diff;
        }
        const double span = bounds[d].span();
        const double spread = std::sqrt(variance / n);
        total += span > 0.0 ? spread / span : 0.0;
    }
    return total / static_cast<double>(bounds.size());
}

std::vector<double> PsoOptimizer::evaluateSwarm(const OptimizationRequest& request,
                                                const std::vector<GainBounds>& bounds,
                                                const FitnessEvaluator& fitness,
                                                OptimizationResult& result) const {
    std::vector<GainVector> positions;
    positions.reserve(swarm_.size());
    for (const auto& p : swarm_) positions.push_back(p.position);

    std::vector<const plant::IDynamicsModel*> models{request.model};
    models.insert(models.end(), request.robustnessModels.begin(), request.robustnessModels.end());

    const std::vector<sim::BatchResult> batches = sim::simulateBatchRobust(
        request.variant, positions, models, request.sim, request.controllerParams, bounds);

    std::vector<double> costs(positions.size(), fitness.maxPenalty());
    for (const auto& batch : batches) {
        if (!batch.ok()) {
            result.error = batch.error;
            result.message = batch.message;
            return costs;
        }
    }

    std::vector<double> draws(batches.size());
    for (size_t i = 0; i < positions.size(); ++i) {
        for (size_t m = 0; m < batches.size(); ++m) {
            draws[m] = fitness.evaluate(batches[m].trajectories[i]);
        }
        costs[i] = draws.size() == 1 ? draws.front() : fitness.combine(draws);
    }
    result.evaluations += positions.size() * batches.size();
    return costs;
}

OptimizationResult PsoOptimizer::optimize(const OptimizationRequest& request) {
    utils::ElapsedTimer timer;
    timer.start();

    // Initializing
    const core::VariantSpec* spec = core::findVariantSpec(request.variant);
    if (!spec) {
        return abortRun(ErrorCode::UnknownVariant, "unknown controller variant");
    }

    const std::vector<GainBounds> bounds = request.bounds.empty() ? spec->bounds : request.bounds;
    if (core::validateBounds(request.variant, bounds) != ErrorCode::None) {
        return abortRun(ErrorCode::ConfigError, "gain bounds must be finite, ordered and one per gain");
    }

    std::string reason;
    if (!request.pso.validate(reason) || !request.sim.validate(reason) ||
        !control::ControllerFactory::validateParams(request.variant, request.controllerParams, reason)) {
        return abortRun(ErrorCode::ConfigError, reason);
    }
    if (!request.model) {
        return abortRun(ErrorCode::ConfigError, "dynamics model is required");
    }
    for (const plant::IDynamicsModel* model : request.robustnessModels) {
        if (!model) return abortRun(ErrorCode::ConfigError, "null robustness model");
    }

    const PsoConfig& cfg = request.pso;
    if (cfg.nParticles < 10 || cfg.nParticles > 50) {
        SMCPSO_LOG_WARNING("swarm size %zu outside the usual range [10, 50]", cfg.nParticles);
    }
    if (std::abs(cfg.hyper.c1 - cfg.hyper.c2) > 0.5) {
        SMCPSO_LOG_WARNING("unbalanced PSO weights c1=%.3f c2=%.3f", cfg.hyper.c1, cfg.hyper.c2);
    }

    FitnessEvaluator fitness(request.fitness);
    OptimizationResult result;
    result.bestCost = std::numeric_limits<double>::infinity();

    if (!request.baselineGains.empty()) {
        const sim::BatchResult baseline = sim::simulateBatch(
            request.variant, {request.baselineGains}, *request.model, request.sim,
            request.controllerParams, bounds);
        if (!baseline.ok()) {
            return abortRun(baseline.error, baseline.message);
        }
        fitness.calibrateNorms(baseline.trajectories.front());
    }

    const size_t dim = bounds.size();
    std::mt19937_64 rng(cfg.seed);
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    swarm_.assign(cfg.nParticles, Particle{});
    for (auto& p : swarm_) {
        p.position.resize(dim);
        p.velocity.resize(dim);
        for (size_t d = 0; d < dim; ++d) {
            const double span = bounds[d].span();
            p.position[d] = bounds[d].lower + unit(rng) * span;
            p.velocity[d] = (unit(rng) - 0.5) * span * 0.1;
        }
        p.bestPosition = p.position;
        p.bestCost = std::numeric_limits<double>::infinity();
        p.cost = std::numeric_limits<double>::infinity();
    }
    if (cfg.seedWithDefaults) {
        swarm_.front().position = spec->defaultGains;
        clipToBounds(swarm_.front().position, bounds);
        swarm_.front().bestPosition = swarm_.front().position;
    }

    SMCPSO_LOG_INFO("PSO start: variant=%s particles=%zu iterations=%zu seed=%llu",
                    spec->name, cfg.nParticles, cfg.nIterations,
                    static_cast<unsigned long long>(cfg.seed));

    // Iterating
    size_t stagnation = 0;
    for (size_t iter = 0; iter < cfg.nIterations; ++iter) {
        for (auto& p : swarm_) clipToBounds(p.position, bounds);

        const std::vector<double> costs = evaluateSwarm(request, bounds, fitness, result);
        if (!result.ok()) {
            SMCPSO_LOG_ERROR("optimization aborted: %s", result.message.c_str());
            result.reason = TerminationReason::None;
            result.wallTime = timer.getElapsedSec();
            stopRequested_.store(false);
            return result;
        }

        const double previousBest = result.bestCost;
        for (size_t i = 0; i < swarm_.size(); ++i) {
            Particle& p = swarm_[i];
            p.cost = costs[i];
            if (p.cost < p.bestCost) {
                p.bestCost = p.cost;
                p.bestPosition = p.position;
            }
            // Strict comparison in index order: the first particle wins ties
            if (p.cost < result.bestCost) {
                result.bestCost = p.cost;
                result.bestGains = p.position;
            }
        }

        const double spread = diversity(swarm_, bounds);
        result.costHistory.push_back(result.bestCost);
        result.diversityHistory.push_back(spread);
        result.iterations = iter + 1;

        const double inertia = cfg.useInertiaSchedule && cfg.nIterations > 1
            ? utils::lerp(cfg.inertiaStart, cfg.inertiaEnd,
                          static_cast<double>(iter) / static_cast<double>(cfg.nIterations - 1))
            : (cfg.useInertiaSchedule ? cfg.inertiaStart : cfg.hyper.w);

        SMCPSO_LOG_DEBUG("iteration %zu: best=%.6g diversity=%.4g", iter, result.bestCost, spread);
        if (callback_) {
            IterationInfo info;
            info.iteration = iter;
            info.bestCost = result.bestCost;
            info.diversity = spread;
            info.inertia = inertia;
            info.bestGains = result.bestGains;
            info.positions.reserve(swarm_.size());
            for (const auto& p : swarm_) info.positions.push_back(p.position);
            callback_(info);
        }

        // Termination checks
        if (iter > 0 && std::isfinite(previousBest)) {
            const double scale = std::max(std::abs(previousBest), 1e-12);
            const double improvement = (previousBest - result.bestCost) / scale;
            stagnation = improvement < cfg.stagnationTolerance ? stagnation + 1 : 0;
        }
        if (iter + 1 >= cfg.nIterations) {
            result.reason = TerminationReason::MaxIterationsReached;
            break;
        }
        if (stagnation >= cfg.patience) {
            result.reason = TerminationReason::Stagnated;
            break;
        }
        if (cfg.diversityFloor > 0.0 && spread < cfg.diversityFloor) {
            result.reason = TerminationReason::Converged;
            break;
        }
        if (stopRequested_.load()) {
            result.reason = TerminationReason::Cancelled;
            break;
        }

        // Velocity and position update
        for (auto& p : swarm_) {
            for (size_t d = 0; d < dim; ++d) {
                const double r1 = unit(rng);
                const double r2 = unit(rng);
                double v = inertia * p.velocity[d] +
                           cfg.hyper.c1 * r1 * (p.bestPosition[d] - p.position[d]) +
                           cfg.hyper.c2 * r2 * (result.bestGains[d] - p.position[d]);
                if (cfg.velocityClamp > 0.0) {
                    v = utils::saturate(v, cfg.velocityClamp * bounds[d].span());
                }
                p.velocity[d] = v;
                p.position[d] += v;
            }
        }
    }

    stopRequested_.store(false);
    result.wallTime = timer.getElapsedSec();
    result.stableSolutionFound = result.bestCost < fitness.instabilityPenalty();

    if (!result.stableSolutionFound) {
        result.message = "no stable solution found";
        SMCPSO_LOG_WARNING("PSO finished without a stable solution (best cost %.6g)", result.bestCost);
    }
    SMCPSO_LOG_INFO("PSO done: reason=%s iterations=%zu best=%.6g time=%.2fs",
                    terminationReasonName(result.reason), result.iterations, result.bestCost,
                    result.wallTime);
    return result;
}

}  // namespace smcpso::optim
