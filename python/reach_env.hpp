#pragma once

#include "environment/episode_controller.hpp"
#include "core/mujoco_wrapper.hpp"
#include "config/config_manager.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace larcc {

/**
 * @brief MuJoCo-backed reaching environment for the Python training shell
 *
 * Poses and joint vectors cross the boundary as plain lists.
 */
class ReachEnvironment {
public:
    struct StepResult {
        std::vector<double> achieved_goal;
        std::vector<double> desired_goal;
        double reward = 0.0;
        bool terminated = false;
        bool truncated = false;
        std::map<std::string, double> info;
    };

    ReachEnvironment(const std::string& xml_path, const std::string& config_path);
    ~ReachEnvironment();

    // Standard RL methods
    std::vector<double> reset(bool random_start);
    std::vector<double> reset_default();
    StepResult step(const std::vector<double>& action);

    // Goal-conditioned task interface
    double compute_reward(const std::vector<double>& achieved, const std::vector<double>& desired);
    bool is_success() const;
    bool validate(const std::vector<double>& pose) const;
    std::vector<double> sample_goal();

    std::vector<double> get_goal() const;
    void set_goal(const std::vector<double>& goal);
    std::vector<double> get_end_effector_pose() const;
    std::vector<double> get_joint_positions() const;
    std::vector<double> get_workspace_bounds() const;

private:
    std::shared_ptr<ConfigManager> config_;
    std::unique_ptr<MujocoWrapper> sim_;
    std::unique_ptr<EpisodeController> controller_;
};

} // namespace larcc
