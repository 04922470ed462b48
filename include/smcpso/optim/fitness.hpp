/**
 * @file fitness.hpp
 * @brief Multi-term trajectory cost with graded instability penalty
 */

#pragma once

#include "smcpso/sim/trajectory.hpp"

#include <vector>

namespace smcpso::optim {

/**
 * @brief Weights of the four cost terms
 */
struct CostWeights {
    double stateError = 1.0;        // Integrated squared state error
    double controlEffort = 0.1;     // Integrated u^2
    double controlRate = 0.01;      // Integrated (du)^2
    double sliding = 1.0;           // Integrated s^2
};

/**
 * @brief Normalisers for the four cost terms
 */
struct CostNorms {
    double stateError = 1.0;
    double controlEffort = 1.0;
    double controlRate = 1.0;
    double sliding = 1.0;

    double sum() const { return stateError + controlEffort + controlRate + sliding; }
};

/**
 * @brief Raw (unweighted, unnormalised) cost integrals
 */
struct CostTerms {
    double stateError = 0.0;
    double controlEffort = 0.0;
    double controlRate = 0.0;
    double sliding = 0.0;
};

/**
 * @brief Fitness configuration
 */
struct FitnessConfig {
    CostWeights weights;
    CostNorms norms;
    double normalizationThreshold = 1e-12;  // Norms at or below this are not divided by
    double instabilityPenalty = 0.0;        // P; 0 selects penaltyFactor * norms.sum()
    double penaltyFactor = 1e3;
    double meanWeight = 0.7;                // Robust combination over model draws
    double maxWeight = 0.3;
};

/**
 * @brief Fitness evaluator
 *
 * Stable trajectories cost the weighted sum of normalised terms, capped
 * strictly below P. A trajectory that diverges at t_fail costs
 * P * (1 + (T - t_fail) / T), so earlier failures cost more and every
 * failure costs more than any stable trajectory. Invalid and timed-out
 * particles cost maxPenalty() = 2P.
 */
class FitnessEvaluator {
public:
    FitnessEvaluator() = default;
    explicit FitnessEvaluator(const FitnessConfig& config) : config_(config) {}

    /**
     * @brief Cost of one trajectory
     */
    double evaluate(const sim::Trajectory& traj) const;

    /**
     * @brief Cost of every trajectory, in order
     */
    std::vector<double> evaluateBatch(const std::vector<sim::Trajectory>& trajectories) const;

    /**
     * @brief Combine the costs of one particle across model draws
     *
     * meanWeight * mean + maxWeight * max, or the worst draw when any draw
     * is unstable.
     */
    double combine(const std::vector<double>& costsPerDraw) const;

    /**
     * @brief Raw cost integrals of a trajectory
     */
    static CostTerms computeTerms(const sim::Trajectory& traj);

    /**
     * @brief Set the norms from a baseline trajectory's integrals
     * @return false if the baseline is not stable (norms unchanged)
     */
    bool calibrateNorms(const sim::Trajectory& baseline);

    /**
     * @brief Instability penalty P
     */
    double instabilityPenalty() const;

    /**
     * @brief Largest cost ever returned, 2P
     */
    double maxPenalty() const { return 2.0 * instabilityPenalty(); }

    void setConfig(const FitnessConfig& config) { config_ = config; }
    const FitnessConfig& getConfig() const { return config_; }

private:
    FitnessConfig config_;
};

}  // namespace smcpso::optim
