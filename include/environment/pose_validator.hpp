#pragma once

#include "environment/workspace_region.hpp"
#include "core/geometry.hpp"
#include "core/types.hpp"
#include <vector>

namespace larcc {

/**
 * @brief Decides whether an end-effector pose is acceptable as an episode start
 *
 * A pose is accepted when its position lies inside the workspace box and its
 * orientation passes the shared forward-and-down cone test.
 */
class PoseValidator {
public:
    PoseValidator(const WorkspaceRegion& region, const OrientationCone& cone);

    /**
     * @brief Full check: position first, then orientation
     */
    bool is_reset_valid(const Pose3D& pose) const;

    /**
     * @brief Full check for a dynamically sized pose
     * @throws InvalidPoseShape if pose does not hold exactly 7 values
     */
    bool is_reset_valid(const std::vector<double>& pose) const;

    bool is_position_in_workspace(const Position3& position) const;
    bool is_orientation_valid(const Quaternion& quaternion) const;

    const WorkspaceRegion& region() const { return region_; }
    const OrientationCone& cone() const { return cone_; }

private:
    WorkspaceRegion region_;
    OrientationCone cone_;
};

/**
 * @brief Copy a dynamically sized pose into a Pose3D
 * @throws InvalidPoseShape if the size is not 7
 */
Pose3D to_pose(const std::vector<double>& values);

} // namespace larcc
