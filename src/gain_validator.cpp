/**
 * @file gain_validator.cpp
 * @brief Gain validation layers and per-variant stability predicates
 */

#include "smcpso/core/gain_validator.hpp"
#include "smcpso/core/registry.hpp"

#include <cmath>
#include <cstdio>
#include <string>

namespace smcpso::core {

namespace {

std::string describeGain(const VariantSpec& spec, size_t index) {
    std::string text = "gain '";
    text += spec.gainNames[index];
    text += "' (";
    text += spec.gainRoles[index];
    text += ")";
    return text;
}

std::string formatValue(double value) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%g", value);
    return buffer;
}

void requirePositive(const VariantSpec& spec, const GainVector& gains, size_t index,
                     std::vector<GainViolation>& out) {
    if (gains[index] > 0.0) return;
    out.push_back({ViolationKind::StabilityConstraint, static_cast<int>(index),
                   describeGain(spec, index) + " must be > 0, got " + formatValue(gains[index])});
}

void requireNonNegative(const VariantSpec& spec, const GainVector& gains, size_t index,
                        std::vector<GainViolation>& out) {
    if (gains[index] >= 0.0) return;
    out.push_back({ViolationKind::StabilityConstraint, static_cast<int>(index),
                   describeGain(spec, index) + " must be >= 0, got " + formatValue(gains[index])});
}

void checkStability(const VariantSpec& spec, const GainVector& gains,
                    double adaptRateUpperBound, std::vector<GainViolation>& out) {
    switch (spec.variant) {
        case ControllerVariant::Classical:
            // [k1, k2, lambda1, lambda2, K, kd]
            for (size_t i = 0; i < 5; ++i) requirePositive(spec, gains, i, out);
            requireNonNegative(spec, gains, 5, out);
            break;

        case ControllerVariant::SuperTwisting:
            // [K1, K2, k1, k2, lambda1, lambda2]
            for (size_t i = 0; i < 6; ++i) requirePositive(spec, gains, i, out);
            if (gains[0] <= gains[1]) {
                out.push_back({ViolationKind::StabilityConstraint, 0,
                               describeGain(spec, 0) + " must exceed " + describeGain(spec, 1) +
                               ", got K1=" + formatValue(gains[0]) +
                               " K2=" + formatValue(gains[1])});
            }
            break;

        case ControllerVariant::Adaptive:
            // [k1, k2, lambda1, lambda2, gamma]
            for (size_t i = 0; i < 5; ++i) requirePositive(spec, gains, i, out);
            if (gains[4] > adaptRateUpperBound) {
                out.push_back({ViolationKind::StabilityConstraint, 4,
                               describeGain(spec, 4) + " must be <= " +
                               formatValue(adaptRateUpperBound) + ", got " +
                               formatValue(gains[4])});
            }
            break;

        case ControllerVariant::HybridAdaptiveSuperTwisting:
            for (size_t i = 0; i < 4; ++i) requirePositive(spec, gains, i, out);
            break;
    }
}

}  // namespace

GainCheck validateGains(ControllerVariant variant, const GainVector& gains) {
    const VariantSpec* spec = findVariantSpec(variant);
    if (!spec) {
        GainCheck check;
        check.error = ErrorCode::UnknownVariant;
        check.violations.push_back({ViolationKind::StabilityConstraint, -1, "unknown controller variant"});
        return check;
    }
    return validateGains(variant, gains, spec->bounds);
}

GainCheck validateGains(ControllerVariant variant, const GainVector& gains,
                        const std::vector<GainBounds>& bounds,
                        double adaptRateUpperBound) {
    GainCheck check;
    const VariantSpec* spec = findVariantSpec(variant);
    if (!spec) {
        check.error = ErrorCode::UnknownVariant;
        check.violations.push_back({ViolationKind::StabilityConstraint, -1, "unknown controller variant"});
        return check;
    }

    // Layer 1: length
    if (gains.size() != spec->gainCount()) {
        check.violations.push_back({ViolationKind::LengthMismatch, -1,
                                    std::string(spec->name) + " expects " +
                                    std::to_string(spec->gainCount()) + " gains, got " +
                                    std::to_string(gains.size())});
    }

    // Layer 2: finiteness
    if (check.violations.empty()) {
        for (size_t i = 0; i < gains.size(); ++i) {
            if (!std::isfinite(gains[i])) {
                check.violations.push_back({ViolationKind::NonFiniteGain, static_cast<int>(i),
                                            describeGain(*spec, i) + " is not finite"});
            }
        }
    }

    // Layer 3: bounds
    if (check.violations.empty() && bounds.size() != gains.size()) {
        check.violations.push_back({ViolationKind::LengthMismatch, -1,
                                    std::string(spec->name) + " expects " +
                                    std::to_string(gains.size()) + " bounds, got " +
                                    std::to_string(bounds.size())});
    }
    if (check.violations.empty()) {
        for (size_t i = 0; i < gains.size(); ++i) {
            if (!bounds[i].contains(gains[i])) {
                check.violations.push_back({ViolationKind::OutOfBounds, static_cast<int>(i),
                                            describeGain(*spec, i) + " = " + formatValue(gains[i]) +
                                            " outside [" + formatValue(bounds[i].lower) + ", " +
                                            formatValue(bounds[i].upper) + "]"});
            }
        }
    }

    // Layer 4: stability predicates
    if (check.violations.empty()) {
        checkStability(*spec, gains, adaptRateUpperBound, check.violations);
    }

    if (!check.violations.empty()) {
        check.error = ErrorCode::GainViolation;
    }
    return check;
}

ErrorCode validateBounds(ControllerVariant variant, const std::vector<GainBounds>& bounds) {
    const VariantSpec* spec = findVariantSpec(variant);
    if (!spec) return ErrorCode::UnknownVariant;
    if (bounds.size() != spec->gainCount()) return ErrorCode::ConfigError;

    for (const auto& b : bounds) {
        if (!std::isfinite(b.lower) || !std::isfinite(b.upper) || b.lower > b.upper) {
            return ErrorCode::ConfigError;
        }
    }
    return ErrorCode::None;
}

}  // namespace smcpso::core
