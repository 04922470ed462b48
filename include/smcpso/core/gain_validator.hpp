/**
 * @file gain_validator.hpp
 * @brief Layered admissibility checks for controller gain vectors
 */

#pragma once

#include "smcpso/core/types.hpp"

#include <vector>

namespace smcpso::core {

/**
 * @brief Default upper bound on the adaptive variant's adaptation rate
 */
constexpr double kDefaultAdaptRateUpperBound = 20.0;

/**
 * @brief Validate gains against the variant's registered bounds
 *
 * Checks run in layers and stop at the first failing layer:
 * length, finiteness, bounds, stability predicates. Every violation found
 * within the failing layer is reported.
 */
GainCheck validateGains(ControllerVariant variant, const GainVector& gains);

/**
 * @brief Validate gains against explicit bounds
 * @param bounds One interval per gain (an optimizer override); a count that
 *        differs from the gain count is a LengthMismatch violation
 * @param adaptRateUpperBound Upper limit on the adaptive variant's gamma
 */
GainCheck validateGains(ControllerVariant variant, const GainVector& gains,
                        const std::vector<GainBounds>& bounds,
                        double adaptRateUpperBound = kDefaultAdaptRateUpperBound);

/**
 * @brief Check a bounds override: one finite, ordered interval per gain
 * @return ErrorCode::None, UnknownVariant or ConfigError
 */
ErrorCode validateBounds(ControllerVariant variant, const std::vector<GainBounds>& bounds);

}  // namespace smcpso::core
