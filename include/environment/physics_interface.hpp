#pragma once

#include "core/types.hpp"
#include <string>

namespace larcc {

/**
 * @brief Capabilities the reaching task needs from a physics backend
 *
 * The episode controller only talks to the simulator through this interface,
 * so validation, sampling and reward logic run without a physics engine.
 * Implementations throw PhysicsError for unknown body or joint names.
 */
class PhysicsInterface {
public:
    virtual ~PhysicsInterface() = default;

    // World pose (x, y, z, qw, qx, qy, qz) of a named body
    virtual Pose3D get_body_pose(const std::string& body_name) const = 0;

    // World position of a named body
    virtual Position3 get_body_position(const std::string& body_name) const = 0;

    // Scalar position of a hinge or slide joint
    virtual double get_joint_position(const std::string& joint_name) const = 0;
    virtual void set_joint_position(const std::string& joint_name, double value) = 0;

    /**
     * @brief Recompute derived quantities after joint or model edits
     */
    virtual void forward_kinematics() = 0;

    /**
     * @brief Place a (typically visual-only) body at a pose in the model
     *
     * Used to display the current goal. Takes effect on the next
     * forward_kinematics() call.
     */
    virtual void set_body_model_pose(const std::string& body_name, const Pose3D& pose) = 0;
};

} // namespace larcc
