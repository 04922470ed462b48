/**
 * @file controller_factory.hpp
 * @brief Validated construction of controller instances
 */

#pragma once

#include "smcpso/control/adaptive_smc.hpp"
#include "smcpso/control/classical_smc.hpp"
#include "smcpso/control/controller.hpp"
#include "smcpso/control/hybrid_smc.hpp"
#include "smcpso/control/super_twisting_smc.hpp"
#include "smcpso/plant/dynamics_model.hpp"

#include <memory>
#include <string>
#include <vector>

namespace smcpso::control {

/**
 * @brief Variant-specific parameters beyond the gain vector
 *
 * Value-initialised fields are the documented defaults. The model pointer
 * enables equivalent control; it must outlive every controller built with
 * it and is only read through const methods.
 */
struct ControllerParams {
    ClassicalSmc::Params classical;
    SuperTwistingSmc::Params superTwisting;
    AdaptiveSmc::Params adaptive;
    HybridSmc::Params hybrid;
    const plant::IDynamicsModel* model = nullptr;
};

/**
 * @brief Factory result
 */
struct FactoryResult {
    core::ErrorCode error = core::ErrorCode::None;
    core::GainCheck gainCheck;
    std::string message;
    std::unique_ptr<Controller> controller;

    bool ok() const { return error == core::ErrorCode::None && controller != nullptr; }
};

/**
 * @brief Controller factory
 *
 * Pure: no I/O beyond debug logging and no global state. The variant is
 * resolved to a concrete IControlLaw once, here.
 */
class ControllerFactory {
public:
    /**
     * @brief Create a controller using the registry's default bounds
     * @param maxForce Actuator limit, > 0
     * @param dt Default time step, > 0
     */
    static FactoryResult create(core::ControllerVariant variant, const core::GainVector& gains,
                                double maxForce, double dt,
                                const ControllerParams& params = ControllerParams{});

    /**
     * @brief Create a controller validating against explicit bounds
     */
    static FactoryResult create(core::ControllerVariant variant, const core::GainVector& gains,
                                const std::vector<core::GainBounds>& bounds,
                                double maxForce, double dt,
                                const ControllerParams& params = ControllerParams{});

    /**
     * @brief Check the parameters relevant to one variant
     * @param reason Receives the first problem found
     */
    static bool validateParams(core::ControllerVariant variant, const ControllerParams& params,
                               std::string& reason);
};

}  // namespace smcpso::control
