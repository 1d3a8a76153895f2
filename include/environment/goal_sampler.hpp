#pragma once

#include "environment/workspace_region.hpp"
#include "core/geometry.hpp"
#include "core/types.hpp"
#include <random>

namespace larcc {

/**
 * @brief Rejection sampler for goal poses
 *
 * The goal position is drawn uniformly inside the workspace box once per
 * call. Orientations are then drawn from random Euler angles until one passes
 * the forward-and-down cone, or until the attempt budget runs out.
 */
class GoalSampler {
public:
    /**
     * @brief Constructor
     * @param region Workspace box for goal positions
     * @param cone Orientation acceptance region
     * @param max_attempts Orientation draws allowed per goal
     * @param seed Seed for the internal generator
     */
    GoalSampler(const WorkspaceRegion& region,
                const OrientationCone& cone,
                int max_attempts = 10000,
                unsigned int seed = std::random_device{}());

    /**
     * @brief Sample one goal pose
     * @throws SamplingTimeout if no orientation passes within max_attempts draws
     */
    Pose3D sample_goal();

    /**
     * @brief Uniform position inside the workspace box
     */
    Position3 sample_position();

    /**
     * @brief Orientation satisfying the cone
     * @throws SamplingTimeout
     */
    Quaternion sample_orientation();

    void reseed(unsigned int seed) { rng_.seed(seed); }
    int get_max_attempts() const { return max_attempts_; }
    const WorkspaceRegion& region() const { return region_; }
    const OrientationCone& cone() const { return cone_; }

    /**
     * @brief Statistics for monitoring acceptance rate
     */
    struct SamplingStats {
        int last_attempts = 0;          // orientation draws for the latest goal
        long long total_attempts = 0;
        long long goals_sampled = 0;
        long long timeouts = 0;
    };

    const SamplingStats& get_statistics() const { return stats_; }
    void reset_statistics() { stats_ = SamplingStats{}; }

private:
    WorkspaceRegion region_;
    OrientationCone cone_;
    int max_attempts_;

    std::mt19937 rng_;
    SamplingStats stats_;
};

} // namespace larcc
