#pragma once

#include "environment/physics_interface.hpp"
#include "environment/pose_validator.hpp"
#include "environment/goal_sampler.hpp"
#include "environment/reward_engine.hpp"
#include "config/config_manager.hpp"
#include "core/types.hpp"
#include <memory>
#include <random>
#include <vector>

namespace larcc {

/**
 * @brief Episode lifecycle for the reaching task
 *
 * Places the arm at the start of each episode (fixed or randomized), draws
 * the goal, owns the per-episode reward history and applies joint-delta
 * actions. The physics backend is injected and must outlive the controller.
 */
class EpisodeController {
public:
    struct StepResult {
        Pose3D achieved_goal{};
        Pose3D desired_goal{};
        double reward = 0.0;
        bool is_success = false;
        bool truncated = false;     // step budget for the episode used up
        int step = 0;
    };

    struct ResetStats {
        int last_attempts = 0;      // joint configurations drawn by the latest reset
        long long total_attempts = 0;
        long long episodes = 0;
    };

    /**
     * @brief Constructor
     * @param physics Physics backend (not owned)
     * @param config Validated configuration
     */
    EpisodeController(PhysicsInterface& physics, std::shared_ptr<const ConfigManager> config);

    /**
     * @brief Start a new episode using the configured start mode
     */
    Pose3D reset_episode();

    /**
     * @brief Start a new episode
     * @param random_start Draw random joint angles until a valid start is found;
     *                     otherwise use the configured initial joint values
     * @return End-effector pose at the start of the episode
     * @throws ResetTimeout if no valid random start is found within the budget
     * @throws SamplingTimeout if goal sampling fails
     */
    Pose3D reset_episode(bool random_start);

    // Task queries
    bool validate(const Pose3D& pose) const { return validator_.is_reset_valid(pose); }
    bool validate(const std::vector<double>& pose) const { return validator_.is_reset_valid(pose); }
    Pose3D sample_goal() { return goal_sampler_.sample_goal(); }

    // Goal management
    const Pose3D& goal() const { return goal_; }
    bool has_goal() const { return has_goal_; }
    void set_goal(const Pose3D& goal);

    /**
     * @brief Reward for a pose pair, recorded into the current episode history
     */
    double compute_reward(const Pose3D& achieved, const Pose3D& desired);
    double compute_reward(const std::vector<double>& achieved, const std::vector<double>& desired);

    /**
     * @brief True when the latest recorded bonus term was awarded
     */
    bool is_success() const { return reward_engine_.is_success(*history_); }

    // Robot state
    Pose3D end_effector_pose() const;
    JointVector joint_positions() const;

    /**
     * @brief Apply normalized joint deltas
     *
     * Each component is scaled by the configured action scale, added to the
     * current joint position and clipped to the joint limit.
     */
    void apply_action(const JointVector& action);
    void apply_action(const std::vector<double>& action);

    /**
     * @brief Apply an action and score the resulting end-effector pose against the goal
     */
    StepResult step(const JointVector& action);
    StepResult step(const std::vector<double>& action);

    // Accessors
    const EpisodeRewardHistory& history() const { return *history_; }
    int step_count() const { return step_count_; }
    const PoseValidator& validator() const { return validator_; }
    const GoalSampler& goal_sampler() const { return goal_sampler_; }
    const RewardEngine& reward_engine() const { return reward_engine_; }
    const ResetStats& get_reset_statistics() const { return reset_stats_; }

private:
    PhysicsInterface& physics_;
    std::shared_ptr<const ConfigManager> config_;

    PoseValidator validator_;
    GoalSampler goal_sampler_;
    RewardEngine reward_engine_;

    std::unique_ptr<EpisodeRewardHistory> history_;
    Pose3D goal_{};
    bool has_goal_ = false;
    int step_count_ = 0;

    std::mt19937 rng_;
    ResetStats reset_stats_;

    // Reset helpers
    void place_at_initial_configuration();
    int place_at_random_configuration();
    bool robot_in_table() const;
    void set_joint_positions(const JointVector& joints);
};

} // namespace larcc
