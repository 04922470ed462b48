/**
 * @file controller.cpp
 * @brief Controller instance implementation
 */

#include "smcpso/control/controller.hpp"

#include <utility>

namespace smcpso::control {

Controller::Controller(std::unique_ptr<IControlLaw> law, core::GainVector gains, double dt)
    : law_(std::move(law))
    , gains_(std::move(gains))
    , dt_(dt)
    , state_(law_->initialState())
    , recordHistory_(true)
{
}

ControlOutput Controller::step(const core::StateVector& x, double dt) {
    ControlOutput out = law_->compute(x, state_, dt);
    state_ = out.state;
    if (recordHistory_) {
        history_.push_back(out.diagnostics);
    }
    return out;
}

void Controller::reset() {
    state_ = law_->initialState();
    history_.clear();
}

}  // namespace smcpso::control
