/**
 * @file dip_dynamics.hpp
 * @brief Reference double-inverted-pendulum-on-cart model
 */

#pragma once

#include "smcpso/plant/dynamics_model.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace smcpso::plant {

/**
 * @brief Physical parameters of the cart and both links
 */
struct DipParams {
    double cartMass = 1.0;              // kg
    double pendulum1Mass = 0.1;         // kg
    double pendulum2Mass = 0.1;         // kg
    double pendulum1Length = 0.5;       // m, pivot to pivot
    double pendulum2Length = 0.5;       // m
    double pendulum1Com = 0.25;         // m, pivot to centre of mass
    double pendulum2Com = 0.25;         // m
    double pendulum1Inertia = 0.00208;  // kg m^2 about the centre of mass
    double pendulum2Inertia = 0.00208;  // kg m^2
    double gravity = 9.81;              // m/s^2
    double cartFriction = 0.1;          // N s/m
    double joint1Friction = 0.001;      // N m s/rad
    double joint2Friction = 0.001;      // N m s/rad
    double cartPositionLimit = 1e6;     // m, validateState() limit

    /**
     * @brief All masses, lengths and inertias positive, frictions non-negative
     */
    bool isValid() const;
};

/**
 * @brief Relative parameter uncertainty for robustness draws
 */
struct PhysicsUncertainty {
    double mass = 0.05;         // Relative spread on the three masses
    double length = 0.02;       // Relative spread on lengths and COM offsets
    double inertia = 0.05;      // Relative spread on link inertias
    double friction = 0.10;     // Relative spread on frictions
};

/**
 * @brief Lagrangian cart-and-two-link model with viscous friction
 */
class DipDynamics : public IDynamicsModel {
public:
    DipDynamics() = default;
    explicit DipDynamics(const DipParams& params) : params_(params) {}

    core::StateVector derivative(const core::StateVector& state, double control) const override;
    double totalEnergy(const core::StateVector& state) const override;
    bool validateState(const core::StateVector& state) const override;
    bool physicsMatrices(const core::StateVector& state, PhysicsMatrices& out) const override;

    const DipParams& getParams() const { return params_; }

private:
    DipParams params_;
};

/**
 * @brief Integration scheme for one simulation tick
 */
enum class Integrator {
    Euler,
    Rk4
};

/**
 * @brief Advance the state by dt under constant control
 */
core::StateVector integrate(const IDynamicsModel& model, const core::StateVector& state,
                            double control, double dt, Integrator method = Integrator::Rk4);

/**
 * @brief Draw parameter sets uniformly within the relative uncertainty
 * @param count Number of perturbed models
 * @param seed RNG seed; equal seeds give equal draws
 */
std::vector<std::unique_ptr<DipDynamics>> perturbedModels(const DipParams& nominal,
                                                          const PhysicsUncertainty& uncertainty,
                                                          size_t count, uint64_t seed);

}  // namespace smcpso::plant
