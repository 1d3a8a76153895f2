#include "python/reach_env.hpp"
#include <iostream>

namespace larcc {

namespace {

template<size_t N>
std::vector<double> to_list(const std::array<double, N>& values) {
    return std::vector<double>(values.begin(), values.end());
}

} // namespace

ReachEnvironment::ReachEnvironment(const std::string& xml_path, const std::string& config_path) {
    try {
        config_ = ConfigManager::create_from_file(config_path);
        sim_ = std::make_unique<MujocoWrapper>(xml_path);
        controller_ = std::make_unique<EpisodeController>(*sim_, config_);
    } catch (const std::exception& e) {
        std::cerr << "Error during ReachEnvironment initialization: " << e.what() << std::endl;
        throw;
    }
}

ReachEnvironment::~ReachEnvironment() = default;

std::vector<double> ReachEnvironment::reset(bool random_start) {
    sim_->reset();
    return to_list(controller_->reset_episode(random_start));
}

std::vector<double> ReachEnvironment::reset_default() {
    return reset(config_->episode().random_start);
}

ReachEnvironment::StepResult ReachEnvironment::step(const std::vector<double>& action) {
    EpisodeController::StepResult result = controller_->step(action);

    StepResult py_result;
    py_result.achieved_goal = to_list(result.achieved_goal);
    py_result.desired_goal = to_list(result.desired_goal);
    py_result.reward = result.reward;
    // Continuing task: only the step limit ends an episode, success goes to info
    py_result.terminated = false;
    py_result.truncated = result.truncated;
    py_result.info["is_success"] = result.is_success ? 1.0 : 0.0;
    py_result.info["step"] = static_cast<double>(result.step);
    return py_result;
}

double ReachEnvironment::compute_reward(const std::vector<double>& achieved, const std::vector<double>& desired) {
    return controller_->compute_reward(achieved, desired);
}

bool ReachEnvironment::is_success() const {
    return controller_->is_success();
}

bool ReachEnvironment::validate(const std::vector<double>& pose) const {
    return controller_->validate(pose);
}

std::vector<double> ReachEnvironment::sample_goal() {
    return to_list(controller_->sample_goal());
}

std::vector<double> ReachEnvironment::get_goal() const {
    if (!controller_->has_goal()) {
        return std::vector<double>(POSE_SIZE, 0.0);
    }
    return to_list(controller_->goal());
}

void ReachEnvironment::set_goal(const std::vector<double>& goal) {
    controller_->set_goal(to_pose(goal));
}

std::vector<double> ReachEnvironment::get_end_effector_pose() const {
    return to_list(controller_->end_effector_pose());
}

std::vector<double> ReachEnvironment::get_joint_positions() const {
    return to_list(controller_->joint_positions());
}

std::vector<double> ReachEnvironment::get_workspace_bounds() const {
    const WorkspaceBounds& b = controller_->validator().region().bounds();
    return {b.min[0], b.max[0], b.min[1], b.max[1], b.min[2], b.max[2]};
}

} // namespace larcc
