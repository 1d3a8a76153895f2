#include "core/geometry.hpp"
#include <cmath>

namespace larcc {
namespace geometry {

Quaternion euler_to_quaternion(double roll, double pitch, double yaw) {
    double cr = std::cos(roll * 0.5);
    double sr = std::sin(roll * 0.5);
    double cp = std::cos(pitch * 0.5);
    double sp = std::sin(pitch * 0.5);
    double cy = std::cos(yaw * 0.5);
    double sy = std::sin(yaw * 0.5);

    return {
        cr * cp * cy + sr * sp * sy,  // w
        sr * cp * cy - cr * sp * sy,  // x
        cr * sp * cy + sr * cp * sy,  // y
        cr * cp * sy - sr * sp * cy   // z
    };
}

Quaternion euler_to_quaternion(const EulerAngles& angles) {
    return euler_to_quaternion(angles.roll, angles.pitch, angles.yaw);
}

Matrix4 quaternion_to_transform(const Quaternion& q) {
    const double w = q[0], x = q[1], y = q[2], z = q[3];

    Matrix4 tf = {{
        {1.0 - 2.0 * (y * y + z * z), 2.0 * (x * y - z * w),       2.0 * (x * z + y * w),       0.0},
        {2.0 * (x * y + z * w),       1.0 - 2.0 * (x * x + z * z), 2.0 * (y * z - x * w),       0.0},
        {2.0 * (x * z - y * w),       2.0 * (y * z + x * w),       1.0 - 2.0 * (x * x + y * y), 0.0},
        {0.0,                         0.0,                         0.0,                         1.0}
    }};
    return tf;
}

Position3 world_z_axis(const Quaternion& q) {
    Matrix4 tf = quaternion_to_transform(q);
    const std::array<double, 4> local_z = {0.0, 0.0, 1.0, 0.0};

    Position3 axis = {0.0, 0.0, 0.0};
    for (int row = 0; row < 3; row++) {
        for (int col = 0; col < 4; col++) {
            axis[row] += tf[row][col] * local_z[col];
        }
    }
    return axis;
}

double point_distance(const Position3& a, const Position3& b) {
    double dx = a[0] - b[0];
    double dy = a[1] - b[1];
    double dz = a[2] - b[2];
    return std::sqrt(dx * dx + dy * dy + dz * dz);
}

EulerAngles random_euler_angles(std::mt19937& rng) {
    std::uniform_real_distribution<double> angle_dist(-M_PI, M_PI);
    double roll = angle_dist(rng);
    double pitch = angle_dist(rng);
    double yaw = angle_dist(rng);
    return EulerAngles(roll, pitch, yaw);
}

bool is_facing_forward_and_down(const Quaternion& q, const OrientationCone& cone) {
    Position3 z_axis = world_z_axis(q);
    return z_axis[2] < cone.max_z_axis_z && z_axis[1] < cone.max_z_axis_y;
}

} // namespace geometry
} // namespace larcc
