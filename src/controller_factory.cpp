/**
 * @file controller_factory.cpp
 * @brief Controller factory implementation
 */

#include "smcpso/control/controller_factory.hpp"
#include "smcpso/core/gain_validator.hpp"
#include "smcpso/core/registry.hpp"
#include "smcpso/utils/logger.hpp"

#include <cmath>

namespace smcpso::control {

using core::ControllerVariant;
using core::ErrorCode;

namespace {

FactoryResult failure(ErrorCode error, std::string message) {
    FactoryResult result;
    result.error = error;
    result.message = std::move(message);
    return result;
}

std::unique_ptr<IControlLaw> makeLaw(ControllerVariant variant, const core::GainVector& gains,
                                     double maxForce, const ControllerParams& params) {
    switch (variant) {
        case ControllerVariant::Classical:
            return std::make_unique<ClassicalSmc>(gains, maxForce, params.classical, params.model);
        case ControllerVariant::SuperTwisting:
            return std::make_unique<SuperTwistingSmc>(gains, maxForce, params.superTwisting,
                                                      params.model);
        case ControllerVariant::Adaptive:
            return std::make_unique<AdaptiveSmc>(gains, maxForce, params.adaptive, params.model);
        case ControllerVariant::HybridAdaptiveSuperTwisting:
            return std::make_unique<HybridSmc>(gains, maxForce, params.hybrid, params.model);
    }
    return nullptr;
}

}  // namespace

bool ControllerFactory::validateParams(ControllerVariant variant, const ControllerParams& params,
                                       std::string& reason) {
    switch (variant) {
        case ControllerVariant::Classical:
            return ClassicalSmc::validateParams(params.classical, reason);
        case ControllerVariant::SuperTwisting:
            return SuperTwistingSmc::validateParams(params.superTwisting, reason);
        case ControllerVariant::Adaptive:
            return AdaptiveSmc::validateParams(params.adaptive, reason);
        case ControllerVariant::HybridAdaptiveSuperTwisting:
            return HybridSmc::validateParams(params.hybrid, reason);
    }
    reason = "unknown controller variant";
    return false;
}

FactoryResult ControllerFactory::create(ControllerVariant variant, const core::GainVector& gains,
                                        double maxForce, double dt,
                                        const ControllerParams& params) {
    const core::VariantSpec* spec = core::findVariantSpec(variant);
    if (!spec) {
        return failure(ErrorCode::UnknownVariant, "unknown controller variant");
    }
    return create(variant, gains, spec->bounds, maxForce, dt, params);
}

FactoryResult ControllerFactory::create(ControllerVariant variant, const core::GainVector& gains,
                                        const std::vector<core::GainBounds>& bounds,
                                        double maxForce, double dt,
                                        const ControllerParams& params) {
    const ErrorCode boundsError = core::validateBounds(variant, bounds);
    if (boundsError == ErrorCode::UnknownVariant) {
        return failure(boundsError, "unknown controller variant");
    }
    if (boundsError != ErrorCode::None) {
        return failure(boundsError, "gain bounds must be finite, ordered and one per gain");
    }

    if (!std::isfinite(maxForce) || maxForce <= 0.0) {
        return failure(ErrorCode::ConfigError, "max force must be finite and > 0");
    }
    if (!std::isfinite(dt) || dt <= 0.0) {
        return failure(ErrorCode::ConfigError, "time step must be finite and > 0");
    }

    std::string reason;
    if (!validateParams(variant, params, reason)) {
        return failure(ErrorCode::ConfigError, reason);
    }

    FactoryResult result;
    result.gainCheck = core::validateGains(variant, gains, bounds, params.adaptive.gammaUpperBound);
    if (!result.gainCheck.valid()) {
        result.error = result.gainCheck.error;
        result.message = result.gainCheck.summary();
        SMCPSO_LOG_DEBUG("%s gains rejected (%s): %s", core::variantName(variant),
                         core::violationKindName(result.gainCheck.violations.front().kind),
                         result.message.c_str());
        return result;
    }

    result.controller = std::make_unique<Controller>(makeLaw(variant, gains, maxForce, params),
                                                     gains, dt);
    return result;
}

}  // namespace smcpso::control
