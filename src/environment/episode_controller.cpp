#include "environment/episode_controller.hpp"
#include "core/errors.hpp"
#include <iostream>
#include <utility>

namespace larcc {

namespace {

OrientationCone make_cone(const ConfigManager::OrientationConfig& config) {
    return OrientationCone(config.max_z_axis_z, config.max_z_axis_y);
}

} // namespace

EpisodeController::EpisodeController(PhysicsInterface& physics, std::shared_ptr<const ConfigManager> config)
    : physics_(physics)
    , config_(std::move(config))
    , validator_(WorkspaceRegion(config_->workspace()), make_cone(config_->orientation()))
    , goal_sampler_(WorkspaceRegion(config_->workspace()), make_cone(config_->orientation()),
                    config_->sampling().max_goal_attempts, utils::resolve_seed(config_->sampling().seed))
    , reward_engine_(config_->reward())
    , history_(std::make_unique<EpisodeRewardHistory>())
    , rng_(utils::resolve_seed(config_->sampling().seed) + 1u) {
}

Pose3D EpisodeController::reset_episode() {
    return reset_episode(config_->episode().random_start);
}

Pose3D EpisodeController::reset_episode(bool random_start) {
    // New episode, new history. The old goal is dropped until placement and
    // sampling both succeed.
    has_goal_ = false;
    history_ = std::make_unique<EpisodeRewardHistory>();
    step_count_ = 0;

    int attempts = 1;
    if (random_start) {
        attempts = place_at_random_configuration();
    } else {
        place_at_initial_configuration();
    }
    reset_stats_.last_attempts = attempts;
    reset_stats_.total_attempts += attempts;
    reset_stats_.episodes++;

    set_goal(goal_sampler_.sample_goal());

    if (config_->system().verbose) {
        std::cout << "EpisodeController: episode " << reset_stats_.episodes
                  << " started (" << (random_start ? "random" : "fixed") << " start, "
                  << attempts << " attempt(s), goal sampled in "
                  << goal_sampler_.get_statistics().last_attempts << " draw(s))" << std::endl;
    }

    return end_effector_pose();
}

void EpisodeController::set_goal(const Pose3D& goal) {
    goal_ = goal;
    has_goal_ = true;

    // Move the visual target
    const std::string& marker = config_->robot().goal_marker_body;
    if (!marker.empty()) {
        physics_.set_body_model_pose(marker, goal_);
    }
    physics_.forward_kinematics();
}

double EpisodeController::compute_reward(const Pose3D& achieved, const Pose3D& desired) {
    return reward_engine_.compute_reward(achieved, desired, *history_);
}

double EpisodeController::compute_reward(const std::vector<double>& achieved, const std::vector<double>& desired) {
    return reward_engine_.compute_reward(achieved, desired, *history_);
}

Pose3D EpisodeController::end_effector_pose() const {
    return physics_.get_body_pose(config_->robot().end_effector_body);
}

JointVector EpisodeController::joint_positions() const {
    const auto& names = config_->robot().joint_names;
    JointVector joints;
    for (size_t i = 0; i < NUM_ARM_JOINTS; i++) {
        joints[i] = physics_.get_joint_position(names[i]);
    }
    return joints;
}

void EpisodeController::apply_action(const JointVector& action) {
    const auto& robot = config_->robot();

    JointVector joints = joint_positions();
    for (size_t i = 0; i < NUM_ARM_JOINTS; i++) {
        joints[i] = utils::clip(joints[i] + action[i] * robot.action_scale[i],
                                -robot.joint_limit, robot.joint_limit);
    }
    set_joint_positions(joints);
    physics_.forward_kinematics();
}

void EpisodeController::apply_action(const std::vector<double>& action) {
    if (action.size() != NUM_ARM_JOINTS) {
        throw InvalidActionShape(action.size());
    }
    JointVector fixed;
    for (size_t i = 0; i < NUM_ARM_JOINTS; i++) {
        fixed[i] = action[i];
    }
    apply_action(fixed);
}

EpisodeController::StepResult EpisodeController::step(const JointVector& action) {
    if (!has_goal_) {
        throw LarccError("step() called before reset_episode()");
    }

    apply_action(action);
    step_count_++;

    StepResult result;
    result.achieved_goal = end_effector_pose();
    result.desired_goal = goal_;
    result.reward = compute_reward(result.achieved_goal, result.desired_goal);
    result.is_success = is_success();
    result.truncated = step_count_ >= config_->episode().max_episode_steps;
    result.step = step_count_;
    return result;
}

EpisodeController::StepResult EpisodeController::step(const std::vector<double>& action) {
    if (action.size() != NUM_ARM_JOINTS) {
        throw InvalidActionShape(action.size());
    }
    JointVector fixed;
    for (size_t i = 0; i < NUM_ARM_JOINTS; i++) {
        fixed[i] = action[i];
    }
    return step(fixed);
}

void EpisodeController::place_at_initial_configuration() {
    const auto& initial = config_->robot().initial_joint_values;
    JointVector joints;
    for (size_t i = 0; i < NUM_ARM_JOINTS; i++) {
        joints[i] = initial[i];
    }
    set_joint_positions(joints);
    physics_.forward_kinematics();
}

int EpisodeController::place_at_random_configuration() {
    const double limit = config_->robot().joint_limit;
    const int max_attempts = config_->sampling().max_reset_attempts;
    std::uniform_real_distribution<double> joint_dist(-limit, limit);

    for (int attempt = 1; attempt <= max_attempts; attempt++) {
        JointVector joints;
        for (size_t i = 0; i < NUM_ARM_JOINTS; i++) {
            joints[i] = joint_dist(rng_);
        }
        set_joint_positions(joints);
        physics_.forward_kinematics();

        if (validator_.is_reset_valid(end_effector_pose()) && !robot_in_table()) {
            return attempt;
        }
    }

    reset_stats_.last_attempts = max_attempts;
    reset_stats_.total_attempts += max_attempts;
    throw ResetTimeout(max_attempts);
}

bool EpisodeController::robot_in_table() const {
    const double min_height = config_->workspace().link_min_height;
    for (const auto& link : config_->robot().collision_links) {
        if (physics_.get_body_position(link)[2] < min_height) {
            return true;
        }
    }
    return false;
}

void EpisodeController::set_joint_positions(const JointVector& joints) {
    const auto& names = config_->robot().joint_names;
    for (size_t i = 0; i < NUM_ARM_JOINTS; i++) {
        physics_.set_joint_position(names[i], joints[i]);
    }
}

} // namespace larcc
