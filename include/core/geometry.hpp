#pragma once

#include "core/types.hpp"
#include <random>

namespace larcc {

/**
 * @brief Orientation acceptance region for the end-effector z-axis
 *
 * A rotation is accepted when its world z-axis points forward (negative y)
 * and downward (negative z) past the two thresholds.
 */
struct OrientationCone {
    double max_z_axis_z = std::sin(-M_PI / 6.0);
    double max_z_axis_y = -std::sin(M_PI / 4.0);

    OrientationCone() = default;
    OrientationCone(double max_z, double max_y) : max_z_axis_z(max_z), max_z_axis_y(max_y) {}
};

namespace geometry {

/**
 * @brief Convert roll/pitch/yaw to a unit quaternion (w, x, y, z)
 *
 * Composition order is Rz(yaw) * Ry(pitch) * Rx(roll).
 */
Quaternion euler_to_quaternion(double roll, double pitch, double yaw);
Quaternion euler_to_quaternion(const EulerAngles& angles);

/**
 * @brief Homogeneous 4x4 transform with the rotation of q and zero translation
 */
Matrix4 quaternion_to_transform(const Quaternion& q);

/**
 * @brief World-frame direction of the local z-axis, i.e. T * [0, 0, 1, 0]
 */
Position3 world_z_axis(const Quaternion& q);

// Euclidean distance between two 3D points
double point_distance(const Position3& a, const Position3& b);

/**
 * @brief Draw roll, pitch and yaw independently and uniformly in [-pi, pi)
 */
EulerAngles random_euler_angles(std::mt19937& rng);

/**
 * @brief Canonical orientation test shared by reset validation and goal sampling
 * @return True when the world z-axis satisfies both cone thresholds
 */
bool is_facing_forward_and_down(const Quaternion& q, const OrientationCone& cone = OrientationCone{});

} // namespace geometry

} // namespace larcc
