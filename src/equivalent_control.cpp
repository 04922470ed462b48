/**
 * @file equivalent_control.cpp
 * @brief Equivalent control solve
 */

#include "smcpso/control/equivalent_control.hpp"

#include <Eigen/LU>

#include <cmath>

namespace smcpso::control {

double computeEquivalentControl(const plant::IDynamicsModel* model,
                                const SlidingSurface& surface,
                                const core::StateVector& x,
                                const EquivalentControlParams& params) {
    if (!model) return 0.0;

    plant::PhysicsMatrices m;
    if (!model->physicsMatrices(x, m)) return 0.0;

    const plant::Matrix3 regularized =
        m.inertia + params.regularization * plant::Matrix3::Identity();
    const Eigen::PartialPivLU<plant::Matrix3> lu(regularized);

    const plant::Vector3 L(0.0, surface.rate1, surface.rate2);
    const plant::Vector3 B(1.0, 0.0, 0.0);

    const double gain = L.dot(lu.solve(B));
    if (!std::isfinite(gain) || std::abs(gain) < params.controllabilityThreshold ||
        gain == 0.0) {
        return 0.0;
    }

    const plant::Vector3 qd = x.tail<3>();
    const double drift = L.dot(lu.solve(m.coriolis * qd + m.gravity));
    const double surfaceRate = surface.angle1 * x[core::Theta1Rate] +
                               surface.angle2 * x[core::Theta2Rate];

    const double ueq = (drift - surfaceRate) / gain;
    return std::isfinite(ueq) ? ueq : 0.0;
}

}  // namespace smcpso::control
