/**
 * @file controller.hpp
 * @brief Stateful controller instance wrapping one control law
 */

#pragma once

#include "smcpso/control/control_law.hpp"

#include <memory>
#include <vector>

namespace smcpso::control {

/**
 * @brief Controller instance
 *
 * Owns a validated control law, its internal state and an append-only
 * diagnostics history. Created by ControllerFactory. Not thread-safe;
 * each simulated particle owns its own instance.
 */
class Controller {
public:
    Controller(std::unique_ptr<IControlLaw> law, core::GainVector gains, double dt);

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;
    Controller(Controller&&) = default;
    Controller& operator=(Controller&&) = default;

    /**
     * @brief Compute control with the configured time step
     * @return Control force, |u| <= maxForce
     */
    double compute(const core::StateVector& x) { return step(x, dt_).control; }

    /**
     * @brief Compute control with an explicit time step
     */
    double compute(const core::StateVector& x, double dt) { return step(x, dt).control; }

    /**
     * @brief Evaluate one tick and advance the internal state
     * @return Control, next internal state and diagnostics
     */
    ControlOutput step(const core::StateVector& x) { return step(x, dt_); }
    ControlOutput step(const core::StateVector& x, double dt);

    /**
     * @brief Restore the initial internal state and clear history
     */
    void reset();

    /**
     * @brief Enable/disable diagnostics history (enabled by default)
     */
    void setRecordHistory(bool enable) { recordHistory_ = enable; }
    bool isRecordingHistory() const { return recordHistory_; }

    core::ControllerVariant variant() const { return law_->variant(); }
    const core::GainVector& getGains() const { return gains_; }
    double getMaxForce() const { return law_->maxForce(); }
    double getDt() const { return dt_; }
    const ControllerState& getState() const { return state_; }
    const std::vector<Diagnostics>& getHistory() const { return history_; }
    const IControlLaw& getLaw() const { return *law_; }

private:
    std::unique_ptr<IControlLaw> law_;
    core::GainVector gains_;
    double dt_;
    ControllerState state_;
    std::vector<Diagnostics> history_;
    bool recordHistory_;
};

}  // namespace smcpso::control
