#pragma once

#include "core/types.hpp"
#include "environment/physics_interface.hpp"
#include <string>
#include <memory>

extern "C" {
#include "mujoco/mujoco.h"
}

namespace larcc {

/**
 * @brief Thin MuJoCo wrapper implementing the PhysicsInterface
 *
 * Direct MuJoCo API integration without abstraction layers. Name lookups
 * go through mj_name2id on every call.
 */
class MujocoWrapper : public PhysicsInterface {
private:
    mjModel* m_ = nullptr;
    mjData* d_ = nullptr;
    bool owns_model_ = true;

public:
    /**
     * @brief Construct wrapper from XML file path
     */
    explicit MujocoWrapper(const std::string& model_path);

    /**
     * @brief Construct wrapper from existing mjModel (doesn't take ownership)
     */
    explicit MujocoWrapper(mjModel* model);

    ~MujocoWrapper() override;

    // Disable copy/move to avoid accidental double-free
    MujocoWrapper(const MujocoWrapper&) = delete;
    MujocoWrapper& operator=(const MujocoWrapper&) = delete;
    MujocoWrapper(MujocoWrapper&&) = delete;
    MujocoWrapper& operator=(MujocoWrapper&&) = delete;

    /**
     * @brief Reset simulation to the model's initial state
     */
    void reset();

    // PhysicsInterface
    Pose3D get_body_pose(const std::string& body_name) const override;
    Position3 get_body_position(const std::string& body_name) const override;
    double get_joint_position(const std::string& joint_name) const override;
    void set_joint_position(const std::string& joint_name, double value) override;
    void forward_kinematics() override;
    void set_body_model_pose(const std::string& body_name, const Pose3D& pose) override;

    /**
     * @brief Direct access to MuJoCo objects (for advanced usage)
     */
    mjModel* model() { return m_; }
    mjData* data() { return d_; }
    const mjModel* model() const { return m_; }
    const mjData* data() const { return d_; }

    int get_body_id(const std::string& name) const;
    int get_joint_id(const std::string& name) const;

    double get_simulation_time() const { return d_ ? d_->time : 0.0; }

private:
    int require_body_id(const std::string& name) const;
    int require_joint_qpos_address(const std::string& name) const;
};

} // namespace larcc
