/**
 * @file types.hpp
 * @brief Common types: gain vectors, plant state, variants and error codes
 */

#pragma once

#include <Eigen/Core>

#include <string>
#include <vector>

namespace smcpso::core {

/**
 * @brief Plant state [x, theta1, theta2, x_dot, theta1_dot, theta2_dot]
 *
 * Angles are measured from the upright position, in radians.
 */
using StateVector = Eigen::Matrix<double, 6, 1>;

/**
 * @brief Indices into StateVector
 */
enum StateIndex : int {
    CartPosition = 0,
    Theta1 = 1,
    Theta2 = 2,
    CartVelocity = 3,
    Theta1Rate = 4,
    Theta2Rate = 5
};

/**
 * @brief Ordered controller gains; length and meaning fixed per variant
 */
using GainVector = std::vector<double>;

/**
 * @brief Closed set of sliding-mode controller variants
 */
enum class ControllerVariant {
    Classical,
    SuperTwisting,
    Adaptive,
    HybridAdaptiveSuperTwisting
};

/**
 * @brief Closed [lower, upper] interval for one gain
 */
struct GainBounds {
    double lower = 0.0;
    double upper = 0.0;

    bool contains(double value) const { return value >= lower && value <= upper; }
    double span() const { return upper - lower; }
};

/**
 * @brief Error codes reported by the factory, simulator and optimizer
 */
enum class ErrorCode {
    None,
    UnknownVariant,         // Variant identifier not in the registry
    GainViolation,          // Gain vector rejected by the validator
    ConfigError,            // Invalid configuration value
    SimulationDivergence,   // Non-finite or exploding plant state
    EvaluationTimeout       // Evaluation exceeded its wall-clock budget
};

/**
 * @brief Kind of gain-vector violation
 */
enum class ViolationKind {
    LengthMismatch,
    NonFiniteGain,
    OutOfBounds,
    StabilityConstraint
};

/**
 * @brief One validator finding
 */
struct GainViolation {
    ViolationKind kind = ViolationKind::StabilityConstraint;
    int index = -1;         // Offending gain index, -1 when not gain-specific
    std::string reason;
};

/**
 * @brief Validator verdict
 */
struct GainCheck {
    ErrorCode error = ErrorCode::None;
    std::vector<GainViolation> violations;

    bool valid() const { return error == ErrorCode::None; }

    /**
     * @brief All violation reasons joined with "; "
     */
    std::string summary() const {
        std::string text;
        for (const auto& violation : violations) {
            if (!text.empty()) text += "; ";
            text += violation.reason;
        }
        return text;
    }
};

/**
 * @brief Human-readable error code name
 */
inline const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:                 return "None";
        case ErrorCode::UnknownVariant:       return "UnknownVariant";
        case ErrorCode::GainViolation:        return "GainViolation";
        case ErrorCode::ConfigError:          return "ConfigError";
        case ErrorCode::SimulationDivergence: return "SimulationDivergence";
        case ErrorCode::EvaluationTimeout:    return "EvaluationTimeout";
        default:                              return "Unknown";
    }
}

/**
 * @brief Human-readable violation kind name
 */
inline const char* violationKindName(ViolationKind kind) {
    switch (kind) {
        case ViolationKind::LengthMismatch:      return "LengthMismatch";
        case ViolationKind::NonFiniteGain:       return "NonFiniteGain";
        case ViolationKind::OutOfBounds:         return "OutOfBounds";
        case ViolationKind::StabilityConstraint: return "StabilityConstraint";
        default:                                 return "Unknown";
    }
}

}  // namespace smcpso::core
