/**
 * @file fitness.cpp
 * @brief Trajectory cost integrals and penalties
 */

#include "smcpso/optim/fitness.hpp"
#include "smcpso/utils/logger.hpp"
#include "smcpso/utils/math_utils.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace smcpso::optim {

using sim::Trajectory;
using sim::TrajectoryStatus;

CostTerms FitnessEvaluator::computeTerms(const Trajectory& traj) {
    CostTerms terms;
    const double dt = traj.dt;

    for (size_t k = 1; k < traj.states.size(); ++k) {
        terms.stateError += traj.states[k].squaredNorm() * dt;
    }

    double previous = traj.control.empty() ? 0.0 : traj.control.front();
    for (double u : traj.control) {
        const double du = u - previous;
        terms.controlEffort += u * u * dt;
        terms.controlRate += du * du * dt;
        previous = u;
    }

    for (double s : traj.surface) {
        terms.sliding += s * s * dt;
    }
    return terms;
}

double FitnessEvaluator::instabilityPenalty() const {
    const double penalty = config_.instabilityPenalty > 0.0
        ? config_.instabilityPenalty
        : config_.penaltyFactor * config_.norms.sum();
    return penalty > 0.0 ? penalty : 1.0;
}

double FitnessEvaluator::evaluate(const Trajectory& traj) const {
    const double penalty = instabilityPenalty();

    switch (traj.status) {
        case TrajectoryStatus::Invalid:
        case TrajectoryStatus::TimedOut:
            return 2.0 * penalty;

        case TrajectoryStatus::Unstable: {
            if (!(traj.horizon > 0.0)) return 2.0 * penalty;
            const double failure = std::clamp(traj.failureTime, 0.0, traj.horizon);
            return penalty * (1.0 + (traj.horizon - failure) / traj.horizon);
        }

        case TrajectoryStatus::Completed:
        case TrajectoryStatus::Converged:
        default:
            break;
    }

    const CostTerms terms = computeTerms(traj);
    const double threshold = config_.normalizationThreshold;
    const CostWeights& w = config_.weights;
    const CostNorms& n = config_.norms;

    const double cost =
        w.stateError * utils::safeNormalize(terms.stateError, n.stateError, threshold) +
        w.controlEffort * utils::safeNormalize(terms.controlEffort, n.controlEffort, threshold) +
        w.controlRate * utils::safeNormalize(terms.controlRate, n.controlRate, threshold) +
        w.sliding * utils::safeNormalize(terms.sliding, n.sliding, threshold);

    if (!std::isfinite(cost)) {
        return 2.0 * penalty;
    }
    // Stable costs stay strictly below any instability penalty
    return std::min(cost, std::nextafter(penalty, 0.0));
}

std::vector<double> FitnessEvaluator::evaluateBatch(const std::vector<Trajectory>& trajectories) const {
    std::vector<double> costs;
    costs.reserve(trajectories.size());
    for (const auto& traj : trajectories) {
        costs.push_back(evaluate(traj));
    }
    return costs;
}

double FitnessEvaluator::combine(const std::vector<double>& costsPerDraw) const {
    const double penalty = instabilityPenalty();
    if (costsPerDraw.empty()) return 2.0 * penalty;

    const double worst = *std::max_element(costsPerDraw.begin(), costsPerDraw.end());
    if (!std::isfinite(worst)) return 2.0 * penalty;
    if (worst >= penalty) return worst;

    const double mean = std::accumulate(costsPerDraw.begin(), costsPerDraw.end(), 0.0) /
                        static_cast<double>(costsPerDraw.size());
    const double combined = config_.meanWeight * mean + config_.maxWeight * worst;
    return std::min(combined, std::nextafter(penalty, 0.0));
}

bool FitnessEvaluator::calibrateNorms(const Trajectory& baseline) {
    if (!baseline.isStable()) {
        SMCPSO_LOG_WARNING("baseline trajectory is %s, keeping cost norms",
                           sim::trajectoryStatusName(baseline.status));
        return false;
    }

    const CostTerms terms = computeTerms(baseline);
    const double threshold = config_.normalizationThreshold;
    CostNorms& n = config_.norms;
    if (terms.stateError > threshold) n.stateError = terms.stateError;
    if (terms.controlEffort > threshold) n.controlEffort = terms.controlEffort;
    if (terms.controlRate > threshold) n.controlRate = terms.controlRate;
    if (terms.sliding > threshold) n.sliding = terms.sliding;

    SMCPSO_LOG_DEBUG("cost norms: state=%.4g effort=%.4g rate=%.4g sliding=%.4g",
                     n.stateError, n.controlEffort, n.controlRate, n.sliding);
    return true;
}

}  // namespace smcpso::optim
