#include "environment/goal_sampler.hpp"
#include "core/errors.hpp"

namespace larcc {

GoalSampler::GoalSampler(const WorkspaceRegion& region,
                         const OrientationCone& cone,
                         int max_attempts,
                         unsigned int seed)
    : region_(region)
    , cone_(cone)
    , max_attempts_(max_attempts)
    , rng_(seed) {
    if (max_attempts_ < 1) {
        throw ConfigurationInvalid("goal sampler needs at least one attempt");
    }
}

Pose3D GoalSampler::sample_goal() {
    Position3 position = sample_position();
    Quaternion orientation = sample_orientation();
    stats_.goals_sampled++;
    return utils::make_pose(position, orientation);
}

Position3 GoalSampler::sample_position() {
    const WorkspaceBounds& b = region_.bounds();
    Position3 position;
    for (int i = 0; i < 3; i++) {
        std::uniform_real_distribution<double> dist(b.min[i], b.max[i]);
        position[i] = dist(rng_);
    }
    return position;
}

Quaternion GoalSampler::sample_orientation() {
    for (int attempt = 1; attempt <= max_attempts_; attempt++) {
        Quaternion q = geometry::euler_to_quaternion(geometry::random_euler_angles(rng_));
        if (geometry::is_facing_forward_and_down(q, cone_)) {
            stats_.last_attempts = attempt;
            stats_.total_attempts += attempt;
            return q;
        }
    }

    stats_.last_attempts = max_attempts_;
    stats_.total_attempts += max_attempts_;
    stats_.timeouts++;
    throw SamplingTimeout(max_attempts_);
}

} // namespace larcc
