#include "environment/pose_validator.hpp"
#include "core/errors.hpp"

namespace larcc {

Pose3D to_pose(const std::vector<double>& values) {
    if (values.size() != POSE_SIZE) {
        throw InvalidPoseShape(values.size());
    }
    Pose3D pose;
    for (size_t i = 0; i < POSE_SIZE; i++) {
        pose[i] = values[i];
    }
    return pose;
}

PoseValidator::PoseValidator(const WorkspaceRegion& region, const OrientationCone& cone)
    : region_(region), cone_(cone) {
}

bool PoseValidator::is_reset_valid(const Pose3D& pose) const {
    if (!is_position_in_workspace(utils::position_of(pose))) {
        return false;
    }
    return is_orientation_valid(utils::quaternion_of(pose));
}

bool PoseValidator::is_reset_valid(const std::vector<double>& pose) const {
    return is_reset_valid(to_pose(pose));
}

bool PoseValidator::is_position_in_workspace(const Position3& position) const {
    return region_.contains(position);
}

bool PoseValidator::is_orientation_valid(const Quaternion& quaternion) const {
    return geometry::is_facing_forward_and_down(quaternion, cone_);
}

} // namespace larcc
