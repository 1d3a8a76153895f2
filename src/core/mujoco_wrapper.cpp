#include "core/mujoco_wrapper.hpp"
#include "core/errors.hpp"
#include <string>

namespace larcc {

MujocoWrapper::MujocoWrapper(const std::string& model_path) : owns_model_(true) {
    // Load model from file
    char error[1000] = "Could not load binary model";
    m_ = mj_loadXML(model_path.c_str(), nullptr, error, 1000);

    if (!m_) {
        throw PhysicsError("Failed to load MuJoCo model: " + std::string(error));
    }

    // Create data structure
    d_ = mj_makeData(m_);
    if (!d_) {
        mj_deleteModel(m_);
        throw PhysicsError("Failed to create MuJoCo data structure");
    }

    mj_forward(m_, d_);
}

MujocoWrapper::MujocoWrapper(mjModel* model) : m_(model), owns_model_(false) {
    if (!m_) {
        throw PhysicsError("Invalid MuJoCo model provided");
    }

    d_ = mj_makeData(m_);
    if (!d_) {
        throw PhysicsError("Failed to create MuJoCo data structure");
    }

    mj_forward(m_, d_);
}

MujocoWrapper::~MujocoWrapper() {
    if (d_) {
        mj_deleteData(d_);
    }

    if (m_ && owns_model_) {
        mj_deleteModel(m_);
    }
}

void MujocoWrapper::reset() {
    mj_resetData(m_, d_);
    mj_forward(m_, d_);
}

Pose3D MujocoWrapper::get_body_pose(const std::string& body_name) const {
    int id = require_body_id(body_name);

    Pose3D pose;
    // Position
    pose[0] = d_->xpos[3 * id];
    pose[1] = d_->xpos[3 * id + 1];
    pose[2] = d_->xpos[3 * id + 2];

    // Quaternion
    pose[3] = d_->xquat[4 * id];     // w
    pose[4] = d_->xquat[4 * id + 1]; // x
    pose[5] = d_->xquat[4 * id + 2]; // y
    pose[6] = d_->xquat[4 * id + 3]; // z
    return pose;
}

Position3 MujocoWrapper::get_body_position(const std::string& body_name) const {
    int id = require_body_id(body_name);
    return {d_->xpos[3 * id], d_->xpos[3 * id + 1], d_->xpos[3 * id + 2]};
}

double MujocoWrapper::get_joint_position(const std::string& joint_name) const {
    return d_->qpos[require_joint_qpos_address(joint_name)];
}

void MujocoWrapper::set_joint_position(const std::string& joint_name, double value) {
    d_->qpos[require_joint_qpos_address(joint_name)] = value;
}

void MujocoWrapper::forward_kinematics() {
    mj_forward(m_, d_);
}

void MujocoWrapper::set_body_model_pose(const std::string& body_name, const Pose3D& pose) {
    int id = require_body_id(body_name);

    for (int i = 0; i < 3; i++) {
        m_->body_pos[3 * id + i] = pose[i];
    }
    for (int i = 0; i < 4; i++) {
        m_->body_quat[4 * id + i] = pose[3 + i];
    }
}

int MujocoWrapper::get_body_id(const std::string& name) const {
    return mj_name2id(m_, mjOBJ_BODY, name.c_str());
}

int MujocoWrapper::get_joint_id(const std::string& name) const {
    return mj_name2id(m_, mjOBJ_JOINT, name.c_str());
}

int MujocoWrapper::require_body_id(const std::string& name) const {
    int id = get_body_id(name);
    if (id < 0) {
        throw PhysicsError("Unknown MuJoCo body: " + name);
    }
    return id;
}

int MujocoWrapper::require_joint_qpos_address(const std::string& name) const {
    int id = get_joint_id(name);
    if (id < 0) {
        throw PhysicsError("Unknown MuJoCo joint: " + name);
    }

    // Only single-dof joints carry a scalar position
    int type = m_->jnt_type[id];
    if (type != mjJNT_HINGE && type != mjJNT_SLIDE) {
        throw PhysicsError("Joint is not a hinge or slide joint: " + name);
    }
    return m_->jnt_qposadr[id];
}

} // namespace larcc
