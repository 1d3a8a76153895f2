/**
 * @file test_geometry.cpp
 * @brief Euler/quaternion conversion, z-axis extraction and the orientation cone
 */

#include "core/geometry.hpp"
#include "fixtures/test_helpers.hpp"
#include <iostream>
#include <cmath>
#include <algorithm>

using namespace larcc;
using larcc::test::check;
using larcc::test::near;

namespace {

double norm(const Quaternion& q) {
    return std::sqrt(utils::dot(q, q));
}

void test_euler_to_quaternion() {
    std::cout << "\n1. Euler to quaternion" << std::endl;

    Quaternion identity = geometry::euler_to_quaternion(0.0, 0.0, 0.0);
    check(near(identity[0], 1.0) && near(identity[1], 0.0) && near(identity[2], 0.0) && near(identity[3], 0.0),
          "zero angles give the identity quaternion");

    Quaternion yaw90 = geometry::euler_to_quaternion(0.0, 0.0, M_PI / 2.0);
    check(near(yaw90[0], std::cos(M_PI / 4.0)) && near(yaw90[3], std::sin(M_PI / 4.0)),
          "pure yaw rotates about z");

    Quaternion roll90 = geometry::euler_to_quaternion(M_PI / 2.0, 0.0, 0.0);
    check(near(roll90[0], std::cos(M_PI / 4.0)) && near(roll90[1], std::sin(M_PI / 4.0)),
          "pure roll rotates about x");

    Quaternion mixed = geometry::euler_to_quaternion(0.3, -1.1, 2.4);
    check(near(norm(mixed), 1.0, 1e-12), "result is unit length");
}

void test_quaternion_to_transform() {
    std::cout << "\n2. Quaternion to transform" << std::endl;

    Matrix4 tf = geometry::quaternion_to_transform({1.0, 0.0, 0.0, 0.0});
    bool is_identity = true;
    for (int r = 0; r < 4; r++) {
        for (int c = 0; c < 4; c++) {
            is_identity = is_identity && near(tf[r][c], r == c ? 1.0 : 0.0);
        }
    }
    check(is_identity, "identity quaternion gives the identity matrix");

    // 90 degrees about z maps x onto y
    Matrix4 rz = geometry::quaternion_to_transform(geometry::euler_to_quaternion(0.0, 0.0, M_PI / 2.0));
    check(near(rz[0][0], 0.0) && near(rz[1][0], 1.0) && near(rz[2][0], 0.0), "yaw 90 maps x-axis to y-axis");
    check(near(rz[3][3], 1.0) && near(rz[0][3], 0.0) && near(rz[3][0], 0.0), "homogeneous row and column");

    // Rotation part is orthonormal
    Matrix4 m = geometry::quaternion_to_transform(geometry::euler_to_quaternion(0.7, 0.2, -1.9));
    bool orthonormal = true;
    for (int a = 0; a < 3; a++) {
        for (int b = 0; b < 3; b++) {
            double d = m[0][a] * m[0][b] + m[1][a] * m[1][b] + m[2][a] * m[2][b];
            orthonormal = orthonormal && near(d, a == b ? 1.0 : 0.0, 1e-12);
        }
    }
    check(orthonormal, "rotation block is orthonormal");
}

void test_world_z_axis() {
    std::cout << "\n3. World z-axis" << std::endl;

    Position3 up = geometry::world_z_axis({1.0, 0.0, 0.0, 0.0});
    check(near(up[0], 0.0) && near(up[1], 0.0) && near(up[2], 1.0), "identity keeps z pointing up");

    // Roll about x by r sends z to (0, -sin r, cos r)
    double roll = std::atan2(0.8, -0.6);
    Position3 z = geometry::world_z_axis(geometry::euler_to_quaternion(roll, 0.0, 0.0));
    check(near(z[0], 0.0, 1e-12) && near(z[1], -0.8, 1e-12) && near(z[2], -0.6, 1e-12),
          "roll moves z-axis in the y-z plane");

    Position3 flipped = geometry::world_z_axis(utils::negate(geometry::euler_to_quaternion(roll, 0.0, 0.0)));
    check(near(flipped[1], -0.8, 1e-12) && near(flipped[2], -0.6, 1e-12), "q and -q give the same axis");
}

void test_point_distance() {
    std::cout << "\n4. Point distance" << std::endl;

    check(near(geometry::point_distance({0.0, 0.0, 0.0}, {3.0, 4.0, 0.0}), 5.0), "3-4-5 triangle");
    check(near(geometry::point_distance({1.0, 2.0, 3.0}, {1.0, 2.0, 3.0}), 0.0), "zero for identical points");
    check(near(geometry::point_distance({1.0, -2.0, 0.5}, {-1.0, 0.0, 1.5}),
               geometry::point_distance({-1.0, 0.0, 1.5}, {1.0, -2.0, 0.5})), "symmetric");
}

void test_random_euler_angles() {
    std::cout << "\n5. Random Euler angles" << std::endl;

    std::mt19937 rng(7);
    bool in_range = true;
    double min_roll = M_PI, max_roll = -M_PI;
    for (int i = 0; i < 5000; i++) {
        EulerAngles a = geometry::random_euler_angles(rng);
        in_range = in_range && a.roll >= -M_PI && a.roll < M_PI && a.pitch >= -M_PI && a.pitch < M_PI &&
                   a.yaw >= -M_PI && a.yaw < M_PI;
        min_roll = std::min(min_roll, a.roll);
        max_roll = std::max(max_roll, a.roll);
    }
    check(in_range, "all angles lie in [-pi, pi)");
    check(min_roll < -3.0 && max_roll > 3.0, "draws cover the full range");

    std::mt19937 a(11), b(11);
    EulerAngles first = geometry::random_euler_angles(a);
    EulerAngles second = geometry::random_euler_angles(b);
    check(first.roll == second.roll && first.pitch == second.pitch && first.yaw == second.yaw,
          "same seed gives the same angles");
}

void test_orientation_cone() {
    std::cout << "\n6. Forward-and-down cone" << std::endl;

    OrientationCone cone;
    check(near(cone.max_z_axis_z, -0.5, 1e-12), "down threshold is sin(-30 deg)");
    check(near(cone.max_z_axis_y, -std::sqrt(0.5), 1e-12), "forward threshold is -sin(45 deg)");

    Quaternion good = geometry::euler_to_quaternion(std::atan2(0.8, -0.6), 0.0, 0.0);
    check(geometry::is_facing_forward_and_down(good, cone), "z-axis (0, -0.8, -0.6) is accepted");
    check(geometry::is_facing_forward_and_down(utils::negate(good), cone), "negated quaternion is accepted too");

    check(!geometry::is_facing_forward_and_down({1.0, 0.0, 0.0, 0.0}, cone), "z-axis up is rejected");

    // Straight down fails the forward test
    Quaternion down = geometry::euler_to_quaternion(M_PI, 0.0, 0.0);
    check(!geometry::is_facing_forward_and_down(down, cone), "straight down is rejected");

    // Straight forward fails the down test
    Quaternion forward = geometry::euler_to_quaternion(M_PI / 2.0, 0.0, 0.0);
    check(!geometry::is_facing_forward_and_down(forward, cone), "horizontal forward is rejected");
}

} // namespace

int main() {
    std::cout << "=== Geometry Utilities Test ===" << std::endl;

    test_euler_to_quaternion();
    test_quaternion_to_transform();
    test_world_z_axis();
    test_point_distance();
    test_random_euler_angles();
    test_orientation_cone();

    return larcc::test::finish("Geometry Utilities Test");
}
