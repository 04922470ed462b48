/**
 * @file dynamics_model.hpp
 * @brief Plant dynamics interface consumed by the simulator and control laws
 */

#pragma once

#include "smcpso/core/types.hpp"

#include <Eigen/Core>

namespace smcpso::plant {

using Matrix3 = Eigen::Matrix3d;
using Vector3 = Eigen::Vector3d;

/**
 * @brief Manipulator-form matrices: M(q) q_ddot + C(q, q_dot) q_dot + G(q) = B u
 */
struct PhysicsMatrices {
    Matrix3 inertia = Matrix3::Identity();      // M
    Matrix3 coriolis = Matrix3::Zero();         // C
    Vector3 gravity = Vector3::Zero();          // G
};

/**
 * @brief Abstract dynamics model
 *
 * Implementations must be safe to call concurrently through const methods;
 * one model instance is shared by all particles of a batch.
 */
class IDynamicsModel {
public:
    virtual ~IDynamicsModel() = default;

    /**
     * @brief State derivative for a scalar cart force
     */
    virtual core::StateVector derivative(const core::StateVector& state, double control) const = 0;

    /**
     * @brief Kinetic plus potential energy
     */
    virtual double totalEnergy(const core::StateVector& state) const = 0;

    /**
     * @brief Physical admissibility of a state (finite, inside model limits)
     */
    virtual bool validateState(const core::StateVector& state) const = 0;

    virtual int stateDimension() const { return 6; }
    virtual int controlDimension() const { return 1; }

    /**
     * @brief Optional capability used by equivalent control
     * @return false when the model does not expose its matrices
     */
    virtual bool physicsMatrices(const core::StateVector& state, PhysicsMatrices& out) const {
        (void)state;
        (void)out;
        return false;
    }
};

}  // namespace smcpso::plant
