#pragma once

#include "core/parameter_loader.hpp"
#include "core/types.hpp"
#include <memory>
#include <string>
#include <vector>
#include <array>
#include <cmath>

namespace larcc {

/**
 * @brief Centralized configuration for the reaching task
 *
 * Every value has a default matching the reference LARCC cell (UR arm over
 * a 1.2 x 0.68 x 0.76 m table). A YAML file may override any subset of keys.
 * The configuration is validated on every construction path.
 */
class ConfigManager {
public:
    struct WorkspaceConfig {
        Position3 table_position = {0.1, 0.16, 0.38};   // table center
        Position3 table_size = {1.2, 0.68, 0.76};       // full extents
        
        // Insets of the goal/reset box relative to the table
        double x_margin = 0.1;                          // both sides
        double y_margin_low = 0.0;
        double y_margin_high = 0.1;
        double z_min_offset = 0.1;                      // above table top
        double z_max_offset = 0.6;
        
        // Links below this world height count as inside the table
        double link_min_height = 0.76;
    };

    struct OrientationConfig {
        double max_z_axis_z = std::sin(-M_PI / 6.0);    // z-axis points down
        double max_z_axis_y = -std::sin(M_PI / 4.0);    // z-axis points forward
    };

    struct RewardConfig {
        double kp = 0.5;                        // position weight
        double ko = 0.25;                       // orientation weight
        double distance_threshold = 0.02;       // meters
        double orientation_threshold = 0.98;    // quaternion dot product
    };

    struct SamplingConfig {
        int max_goal_attempts = 10000;
        int max_reset_attempts = 100000;
        int seed = -1;                          // negative: seed from std::random_device
    };

    struct RobotConfig {
        std::vector<std::string> joint_names = {
            "shoulder_pan_joint",
            "shoulder_lift_joint",
            "elbow_joint",
            "wrist_1_joint",
            "wrist_2_joint",
            "wrist_3_joint"
        };
        std::vector<double> initial_joint_values = {
            -0.004053417836324513,
            -1.7941252193846644,
            1.5798662344561976,
            -1.4848967355540772,
            -1.63149339357485,
            -0.07133704820741826
        };
        std::vector<std::string> collision_links = {
            "shoulder_link",
            "upper_arm_link",
            "forearm_link",
            "wrist_1_link",
            "wrist_2_link",
            "wrist_3_link"
        };
        std::string end_effector_body = "eef";
        std::string goal_marker_body = "target0";
        
        // Joint deltas per unit action
        std::vector<double> action_scale = {0.08, 0.08, 0.12, 0.12, 0.12, 0.12};
        double joint_limit = M_PI;              // symmetric, radians
    };

    struct EpisodeConfig {
        bool random_start = false;
        int max_episode_steps = 50;
    };

    struct SystemConfig {
        std::string model_path = "models/env.xml";
        bool verbose = false;
    };

private:
    std::unique_ptr<FastParameterLoader> loader_;

    // Configuration sections
    WorkspaceConfig workspace_;
    OrientationConfig orientation_;
    RewardConfig reward_;
    SamplingConfig sampling_;
    RobotConfig robot_;
    EpisodeConfig episode_;
    SystemConfig system_;

    // Internal helpers
    void load_workspace_config();
    void load_orientation_config();
    void load_reward_config();
    void load_sampling_config();
    void load_robot_config();
    void load_episode_config();
    void load_system_config();

    void validate_configuration() const;

public:
    /**
     * @brief Constructor with configuration file
     * @param config_file Path to YAML configuration file
     *
     * An unreadable file falls back to defaults with a warning. Present but
     * malformed or out-of-range values throw ConfigurationInvalid.
     */
    explicit ConfigManager(const std::string& config_file);

    /**
     * @brief Default constructor using default configuration
     */
    ConfigManager();

    ~ConfigManager();

    // Configuration access
    const WorkspaceConfig& workspace() const { return workspace_; }
    const OrientationConfig& orientation() const { return orientation_; }
    const RewardConfig& reward() const { return reward_; }
    const SamplingConfig& sampling() const { return sampling_; }
    const RobotConfig& robot() const { return robot_; }
    const EpisodeConfig& episode() const { return episode_; }
    const SystemConfig& system() const { return system_; }

    // Runtime configuration updates (re-validated)
    void set_reward_weights(double kp, double ko);
    void set_seed(int seed) { sampling_.seed = seed; }
    void set_random_start(bool enabled) { episode_.random_start = enabled; }
    void set_verbose(bool enabled) { system_.verbose = enabled; }

    // Diagnostics
    void print_configuration() const;

    // Static factory methods
    static std::unique_ptr<ConfigManager> create_default();
    static std::unique_ptr<ConfigManager> create_from_file(const std::string& config_file);
};

} // namespace larcc
