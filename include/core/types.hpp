#pragma once

#include <array>
#include <vector>
#include <string>
#include <cstddef>
#include <cmath>
#include <random>

namespace larcc {

// Forward declarations
class PhysicsInterface;
class PoseValidator;
class GoalSampler;
class RewardEngine;
class EpisodeController;

// Fixed sizes of the reaching task
constexpr size_t POSE_SIZE = 7;
constexpr size_t NUM_ARM_JOINTS = 6;

// Commonly used fixed-size types
using Position3 = std::array<double, 3>;   // x, y, z
using Quaternion = std::array<double, 4>;  // w, x, y, z
using Pose3D = std::array<double, 7>;      // x, y, z, qw, qx, qy, qz
using Matrix4 = std::array<std::array<double, 4>, 4>;
using JointVector = std::array<double, NUM_ARM_JOINTS>;

// Euler angles in radians, composed as Rz(yaw) * Ry(pitch) * Rx(roll)
struct EulerAngles {
    double roll = 0.0;
    double pitch = 0.0;
    double yaw = 0.0;

    EulerAngles() = default;
    EulerAngles(double roll_, double pitch_, double yaw_) : roll(roll_), pitch(pitch_), yaw(yaw_) {}
};

// Axis-aligned box in world coordinates
struct WorkspaceBounds {
    Position3 min = {0.0, 0.0, 0.0};
    Position3 max = {0.0, 0.0, 0.0};

    bool contains(const Position3& p) const {
        for (int i = 0; i < 3; i++) {
            if (p[i] < min[i] || p[i] > max[i]) return false;
        }
        return true;
    }
};

// Per-call reward breakdown
struct RewardTerms {
    double position = 0.0;     // [-1, 1]
    double orientation = 0.0;  // [-1, 1]
    double bonus = 0.0;        // 0 or 1
    double total = 0.0;
};

// Utility functions for pose manipulation
namespace utils {

inline Position3 position_of(const Pose3D& pose) {
    return {pose[0], pose[1], pose[2]};
}

inline Quaternion quaternion_of(const Pose3D& pose) {
    return {pose[3], pose[4], pose[5], pose[6]};
}

inline Pose3D make_pose(const Position3& pos, const Quaternion& quat) {
    return {pos[0], pos[1], pos[2], quat[0], quat[1], quat[2], quat[3]};
}

inline Quaternion negate(const Quaternion& q) {
    return {-q[0], -q[1], -q[2], -q[3]};
}

inline double dot(const Quaternion& a, const Quaternion& b) {
    return a[0] * b[0] + a[1] * b[1] + a[2] * b[2] + a[3] * b[3];
}

inline double clip(double value, double lo, double hi) {
    return value < lo ? lo : (value > hi ? hi : value);
}

// Negative seeds request a nondeterministic seed
inline unsigned int resolve_seed(int configured_seed) {
    if (configured_seed < 0) {
        return std::random_device{}();
    }
    return static_cast<unsigned int>(configured_seed);
}

} // namespace utils

} // namespace larcc
