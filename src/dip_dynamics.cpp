/**
 * @file dip_dynamics.cpp
 * @brief Double inverted pendulum equations of motion and integrators
 */

#include "smcpso/plant/dip_dynamics.hpp"

#include <Eigen/Cholesky>

#include <cmath>
#include <random>

namespace smcpso::plant {

using core::StateVector;

bool DipParams::isValid() const {
    return cartMass > 0 && pendulum1Mass > 0 && pendulum2Mass > 0 &&
           pendulum1Length > 0 && pendulum2Length > 0 &&
           pendulum1Com > 0 && pendulum2Com > 0 &&
           pendulum1Inertia >= 0 && pendulum2Inertia >= 0 &&
           gravity > 0 &&
           cartFriction >= 0 && joint1Friction >= 0 && joint2Friction >= 0 &&
           cartPositionLimit > 0;
}

bool DipDynamics::physicsMatrices(const StateVector& state, PhysicsMatrices& out) const {
    const DipParams& p = params_;
    const double th1 = state[core::Theta1];
    const double th2 = state[core::Theta2];
    const double th1d = state[core::Theta1Rate];
    const double th2d = state[core::Theta2Rate];

    const double c1 = std::cos(th1);
    const double s1 = std::sin(th1);
    const double c2 = std::cos(th2);
    const double s2 = std::sin(th2);
    const double c12 = std::cos(th1 - th2);
    const double s12 = std::sin(th1 - th2);

    // Coupling coefficients
    const double h1 = p.pendulum1Mass * p.pendulum1Com + p.pendulum2Mass * p.pendulum1Length;
    const double h2 = p.pendulum2Mass * p.pendulum2Com;
    const double h12 = p.pendulum2Mass * p.pendulum1Length * p.pendulum2Com;

    Matrix3& M = out.inertia;
    M(0, 0) = p.cartMass + p.pendulum1Mass + p.pendulum2Mass;
    M(0, 1) = h1 * c1;
    M(0, 2) = h2 * c2;
    M(1, 0) = M(0, 1);
    M(1, 1) = p.pendulum1Mass * p.pendulum1Com * p.pendulum1Com +
              p.pendulum2Mass * p.pendulum1Length * p.pendulum1Length + p.pendulum1Inertia;
    M(1, 2) = h12 * c12;
    M(2, 0) = M(0, 2);
    M(2, 1) = M(1, 2);
    M(2, 2) = p.pendulum2Mass * p.pendulum2Com * p.pendulum2Com + p.pendulum2Inertia;

    Matrix3& C = out.coriolis;
    C.setZero();
    C(0, 1) = -h1 * s1 * th1d;
    C(0, 2) = -h2 * s2 * th2d;
    C(1, 2) = h12 * s12 * th2d;
    C(2, 1) = -h12 * s12 * th1d;

    out.gravity = Vector3(0.0, -h1 * p.gravity * s1, -h2 * p.gravity * s2);
    return true;
}

StateVector DipDynamics::derivative(const StateVector& state, double control) const {
    PhysicsMatrices m;
    physicsMatrices(state, m);

    const Vector3 qd = state.tail<3>();
    const Vector3 friction(params_.cartFriction * qd[0],
                           params_.joint1Friction * qd[1],
                           params_.joint2Friction * qd[2]);
    const Vector3 input(control, 0.0, 0.0);

    const Vector3 qdd = m.inertia.ldlt().solve(input - m.coriolis * qd - m.gravity - friction);

    StateVector dx;
    dx.head<3>() = qd;
    dx.tail<3>() = qdd;
    return dx;
}

double DipDynamics::totalEnergy(const StateVector& state) const {
    PhysicsMatrices m;
    physicsMatrices(state, m);

    const Vector3 qd = state.tail<3>();
    const double kinetic = 0.5 * qd.dot(m.inertia * qd);

    const DipParams& p = params_;
    const double potential = p.gravity * (
        p.pendulum1Mass * p.pendulum1Com * std::cos(state[core::Theta1]) +
        p.pendulum2Mass * (p.pendulum1Length * std::cos(state[core::Theta1]) +
                           p.pendulum2Com * std::cos(state[core::Theta2])));
    return kinetic + potential;
}

bool DipDynamics::validateState(const StateVector& state) const {
    if (!state.allFinite()) return false;
    return std::abs(state[core::CartPosition]) <= params_.cartPositionLimit;
}

StateVector integrate(const IDynamicsModel& model, const StateVector& state,
                      double control, double dt, Integrator method) {
    if (method == Integrator::Euler) {
        return state + dt * model.derivative(state, control);
    }

    const StateVector k1 = model.derivative(state, control);
    const StateVector k2 = model.derivative(state + 0.5 * dt * k1, control);
    const StateVector k3 = model.derivative(state + 0.5 * dt * k2, control);
    const StateVector k4 = model.derivative(state + dt * k3, control);
    return state + (dt / 6.0) * (k1 + 2.0 * k2 + 2.0 * k3 + k4);
}

std::vector<std::unique_ptr<DipDynamics>> perturbedModels(const DipParams& nominal,
                                                          const PhysicsUncertainty& uncertainty,
                                                          size_t count, uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> unit(-1.0, 1.0);
    auto scale = [&](double value, double spread) {
        return value * (1.0 + spread * unit(rng));
    };

    std::vector<std::unique_ptr<DipDynamics>> models;
    models.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        DipParams p = nominal;
        p.cartMass = scale(p.cartMass, uncertainty.mass);
        p.pendulum1Mass = scale(p.pendulum1Mass, uncertainty.mass);
        p.pendulum2Mass = scale(p.pendulum2Mass, uncertainty.mass);
        p.pendulum1Length = scale(p.pendulum1Length, uncertainty.length);
        p.pendulum2Length = scale(p.pendulum2Length, uncertainty.length);
        p.pendulum1Com = scale(p.pendulum1Com, uncertainty.length);
        p.pendulum2Com = scale(p.pendulum2Com, uncertainty.length);
        p.pendulum1Inertia = scale(p.pendulum1Inertia, uncertainty.inertia);
        p.pendulum2Inertia = scale(p.pendulum2Inertia, uncertainty.inertia);
        p.cartFriction = scale(p.cartFriction, uncertainty.friction);
        p.joint1Friction = scale(p.joint1Friction, uncertainty.friction);
        p.joint2Friction = scale(p.joint2Friction, uncertainty.friction);
        models.push_back(std::make_unique<DipDynamics>(p));
    }
    return models;
}

}  // namespace smcpso::plant
