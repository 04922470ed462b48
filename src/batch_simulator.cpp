/**
 * @file batch_simulator.cpp
 * @brief Closed-loop rollouts and the parallel particle loop
 */

#include "smcpso/sim/batch_simulator.hpp"
#include "smcpso/core/gain_validator.hpp"
#include "smcpso/core/registry.hpp"
#include "smcpso/utils/logger.hpp"
#include "smcpso/utils/ring_buffer.hpp"
#include "smcpso/utils/timer.hpp"

#include <cmath>

#ifdef _OPENMP
  #include <omp.h>
#endif

namespace smcpso::sim {

using core::ErrorCode;
using core::StateVector;

size_t SimulationConfig::horizonSteps() const {
    if (!(dt > 0.0) || !(simTime > 0.0)) return 0;
    return static_cast<size_t>(std::llround(simTime / dt));
}

bool SimulationConfig::validate(std::string& reason) const {
    if (!std::isfinite(simTime) || simTime <= 0.0) {
        reason = "simulation time must be finite and > 0";
        return false;
    }
    if (!std::isfinite(dt) || dt <= 0.0) {
        reason = "time step must be finite and > 0";
        return false;
    }
    if (horizonSteps() == 0) {
        reason = "simulation time shorter than one time step";
        return false;
    }
    if (!std::isfinite(uMax) || uMax <= 0.0) {
        reason = "actuator limit must be finite and > 0";
        return false;
    }
    if (!(convergenceTol >= 0.0) || !(gracePeriod >= 0.0) || convergenceWindow == 0) {
        reason = "convergence tolerance and grace period must be >= 0, window >= 1";
        return false;
    }
    if (!(stateCeiling > 0.0) || !(fallAngle >= 0.0)) {
        reason = "divergence limits must be positive";
        return false;
    }
    if (!initialState.allFinite()) {
        reason = "initial state must be finite";
        return false;
    }
    if (!(timeout >= 0.0) || threads < 0) {
        reason = "timeout and thread count must be >= 0";
        return false;
    }
    return true;
}

namespace {

bool hasDiverged(const StateVector& x, const plant::IDynamicsModel& model,
                 const SimulationConfig& config) {
    if (!x.allFinite()) return true;
    if (x.cwiseAbs().maxCoeff() > config.stateCeiling) return true;
    if (config.fallAngle > 0.0 &&
        (std::abs(x[core::Theta1]) > config.fallAngle ||
         std::abs(x[core::Theta2]) > config.fallAngle)) {
        return true;
    }
    return !model.validateState(x);
}

Trajectory invalidTrajectory(const SimulationConfig& config, ErrorCode error,
                             const std::string& message) {
    Trajectory traj;
    traj.status = TrajectoryStatus::Invalid;
    traj.horizon = config.simTime;
    traj.dt = config.dt;
    traj.error = error;
    traj.message = message;
    return traj;
}

Trajectory rollout(control::Controller& controller, const plant::IDynamicsModel& model,
                   const SimulationConfig& config) {
    const size_t steps = config.horizonSteps();
    const double dt = config.dt;

    Trajectory traj;
    traj.horizon = config.simTime;
    traj.dt = dt;
    traj.time.reserve(steps + 1);
    traj.states.reserve(steps + 1);
    traj.control.reserve(steps);
    traj.surface.reserve(steps);
    if (config.recordDiagnostics) traj.diagnostics.reserve(steps);

    StateVector x = config.initialState;
    traj.time.push_back(0.0);
    traj.states.push_back(x);

    utils::RingBuffer<double> window(config.convergenceWindow);
    utils::ElapsedTimer timer;
    timer.start();

    for (size_t k = 0; k < steps; ++k) {
        const double t = static_cast<double>(k) * dt;
        if (timer.hasExpired(config.timeout)) {
            traj.status = TrajectoryStatus::TimedOut;
            traj.failureTime = t;
            traj.error = ErrorCode::EvaluationTimeout;
            traj.message = "evaluation exceeded its time budget";
            return traj;
        }

        const control::ControlOutput out = controller.step(x, dt);
        const StateVector next = plant::integrate(model, x, out.control, dt, config.integrator);
        const double tNext = static_cast<double>(k + 1) * dt;

        traj.control.push_back(out.control);
        traj.surface.push_back(out.diagnostics.surface);
        if (config.recordDiagnostics) traj.diagnostics.push_back(out.diagnostics);
        traj.time.push_back(tNext);
        traj.states.push_back(next);

        if (hasDiverged(next, model, config)) {
            traj.status = TrajectoryStatus::Unstable;
            traj.failureTime = tNext;
            traj.error = ErrorCode::SimulationDivergence;
            traj.message = "state diverged";
            return traj;
        }
        x = next;

        window.pushOverwrite(std::abs(out.diagnostics.surface));
        if (config.convergenceTol > 0.0 && tNext >= config.gracePeriod &&
            window.full() && window.max() < config.convergenceTol) {
            traj.status = TrajectoryStatus::Converged;
            traj.failureTime = config.simTime;
            return traj;
        }
    }

    traj.status = TrajectoryStatus::Completed;
    traj.failureTime = config.simTime;
    return traj;
}

}  // namespace

Trajectory simulate(control::Controller& controller, const plant::IDynamicsModel& model,
                    const SimulationConfig& config) {
    const bool recording = controller.isRecordingHistory();
    controller.reset();
    controller.setRecordHistory(false);

    Trajectory traj = rollout(controller, model, config);

    controller.setRecordHistory(recording);
    return traj;
}

BatchResult simulateBatch(core::ControllerVariant variant,
                          const std::vector<core::GainVector>& particleGains,
                          const plant::IDynamicsModel& model,
                          const SimulationConfig& config,
                          const control::ControllerParams& params,
                          const std::vector<core::GainBounds>& bounds) {
    BatchResult result;

    const core::VariantSpec* spec = core::findVariantSpec(variant);
    if (!spec) {
        result.error = ErrorCode::UnknownVariant;
        result.message = "unknown controller variant";
        SMCPSO_LOG_ERROR("batch aborted: %s", result.message.c_str());
        return result;
    }

    std::string reason;
    if (!config.validate(reason) ||
        !control::ControllerFactory::validateParams(variant, params, reason)) {
        result.error = ErrorCode::ConfigError;
        result.message = reason;
        SMCPSO_LOG_ERROR("batch aborted: %s", reason.c_str());
        return result;
    }

    const std::vector<core::GainBounds>& activeBounds = bounds.empty() ? spec->bounds : bounds;
    if (core::validateBounds(variant, activeBounds) != ErrorCode::None) {
        result.error = ErrorCode::ConfigError;
        result.message = "gain bounds must be finite, ordered and one per gain";
        SMCPSO_LOG_ERROR("batch aborted: %s", result.message.c_str());
        return result;
    }

    result.trajectories.resize(particleGains.size());
    const int count = static_cast<int>(particleGains.size());

#ifdef _OPENMP
    const int threads = config.threads > 0 ? config.threads : omp_get_max_threads();
    #pragma omp parallel for schedule(dynamic) num_threads(threads)
#endif
    for (int i = 0; i < count; ++i) {
        const size_t idx = static_cast<size_t>(i);
        control::FactoryResult created = control::ControllerFactory::create(
            variant, particleGains[idx], activeBounds, config.uMax, config.dt, params);

        if (!created.ok()) {
            result.trajectories[idx] = invalidTrajectory(config, created.error, created.message);
            continue;
        }

        Trajectory traj = simulate(*created.controller, model, config);
        if (traj.status == TrajectoryStatus::Unstable) {
            SMCPSO_LOG_DEBUG("particle %d diverged at t=%.3f s", i, traj.failureTime);
        } else if (traj.status == TrajectoryStatus::TimedOut) {
            SMCPSO_LOG_WARNING("particle %d exceeded %.3f s evaluation budget", i, config.timeout);
        }
        result.trajectories[idx] = std::move(traj);
    }

    return result;
}

std::vector<BatchResult> simulateBatchRobust(core::ControllerVariant variant,
                                             const std::vector<core::GainVector>& particleGains,
                                             const std::vector<const plant::IDynamicsModel*>& models,
                                             const SimulationConfig& config,
                                             const control::ControllerParams& params,
                                             const std::vector<core::GainBounds>& bounds) {
    std::vector<BatchResult> results;
    results.reserve(models.size());

    for (const plant::IDynamicsModel* model : models) {
        if (!model) {
            BatchResult missing;
            missing.error = ErrorCode::ConfigError;
            missing.message = "null dynamics model";
            results.push_back(std::move(missing));
            break;
        }
        results.push_back(simulateBatch(variant, particleGains, *model, config, params, bounds));
        if (!results.back().ok()) break;
    }
    return results;
}

}  // namespace smcpso::sim
