/**
 * @file trajectory.hpp
 * @brief Recorded closed-loop rollout of one particle
 */

#pragma once

#include "smcpso/control/control_law.hpp"
#include "smcpso/core/types.hpp"

#include <string>
#include <vector>

namespace smcpso::sim {

/**
 * @brief How a rollout ended
 */
enum class TrajectoryStatus {
    Completed,      // Ran to the horizon
    Converged,      // Stopped early, surface settled below tolerance
    Unstable,       // Diverged at failureTime
    Invalid,        // Gains rejected, nothing simulated
    TimedOut        // Wall-clock budget exceeded
};

/**
 * @brief Sampled trajectory
 *
 * time and states hold N+1 samples (including the initial state);
 * control and surface hold the N applied inputs.
 */
struct Trajectory {
    TrajectoryStatus status = TrajectoryStatus::Completed;
    std::vector<double> time;
    std::vector<core::StateVector> states;
    std::vector<double> control;
    std::vector<double> surface;
    std::vector<control::Diagnostics> diagnostics;  // Filled when recording is enabled
    double failureTime = 0.0;   // Divergence time for Unstable / TimedOut
    double horizon = 0.0;       // Requested simulation time T
    double dt = 0.0;
    core::ErrorCode error = core::ErrorCode::None;
    std::string message;

    /**
     * @brief Completed or converged without divergence
     */
    bool isStable() const {
        return status == TrajectoryStatus::Completed || status == TrajectoryStatus::Converged;
    }

    size_t steps() const { return control.size(); }
};

inline const char* trajectoryStatusName(TrajectoryStatus status) {
    switch (status) {
        case TrajectoryStatus::Completed: return "Completed";
        case TrajectoryStatus::Converged: return "Converged";
        case TrajectoryStatus::Unstable:  return "Unstable";
        case TrajectoryStatus::Invalid:   return "Invalid";
        case TrajectoryStatus::TimedOut:  return "TimedOut";
        default:                          return "Unknown";
    }
}

}  // namespace smcpso::sim
