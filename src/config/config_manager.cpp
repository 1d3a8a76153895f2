#include "config/config_manager.hpp"
#include <iostream>
#include <iomanip>
#include <stdexcept>

namespace larcc {

namespace {

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw ConfigurationInvalid(message);
    }
}

std::string format_vector(const std::vector<double>& values) {
    std::ostringstream ss;
    ss << "[";
    for (size_t i = 0; i < values.size(); i++) {
        if (i > 0) ss << ", ";
        ss << values[i];
    }
    ss << "]";
    return ss.str();
}

} // namespace

ConfigManager::ConfigManager(const std::string& config_file) {
    try {
        loader_ = std::make_unique<FastParameterLoader>(config_file);
    } catch (const ConfigurationInvalid& e) {
        std::cerr << "ConfigManager: Failed to load config file '" << config_file
                  << "': " << e.what() << std::endl;
        std::cerr << "ConfigManager: Using default configuration" << std::endl;
    }

    // Load all configuration sections
    load_workspace_config();
    load_orientation_config();
    load_reward_config();
    load_sampling_config();
    load_robot_config();
    load_episode_config();
    load_system_config();

    validate_configuration();
}

ConfigManager::ConfigManager() {
    // Use default values (already set in struct definitions)
    validate_configuration();
}

ConfigManager::~ConfigManager() = default;

void ConfigManager::load_workspace_config() {
    if (!loader_) return;

    if (loader_->has_key("workspace.table_position")) {
        workspace_.table_position = loader_->get_array<3>("workspace.table_position");
    }
    if (loader_->has_key("workspace.table_size")) {
        workspace_.table_size = loader_->get_array<3>("workspace.table_size");
        // Table height doubles as the link clearance unless set explicitly
        workspace_.link_min_height = workspace_.table_size[2];
    }

    // Box insets
    if (loader_->has_key("workspace.margins.x")) {
        workspace_.x_margin = loader_->get_double("workspace.margins.x");
    }
    if (loader_->has_key("workspace.margins.y_low")) {
        workspace_.y_margin_low = loader_->get_double("workspace.margins.y_low");
    }
    if (loader_->has_key("workspace.margins.y_high")) {
        workspace_.y_margin_high = loader_->get_double("workspace.margins.y_high");
    }
    if (loader_->has_key("workspace.margins.z_min")) {
        workspace_.z_min_offset = loader_->get_double("workspace.margins.z_min");
    }
    if (loader_->has_key("workspace.margins.z_max")) {
        workspace_.z_max_offset = loader_->get_double("workspace.margins.z_max");
    }

    if (loader_->has_key("workspace.link_min_height")) {
        workspace_.link_min_height = loader_->get_double("workspace.link_min_height");
    }
}

void ConfigManager::load_orientation_config() {
    if (!loader_) return;

    // Thresholds are given as angles in degrees and stored as their sines
    if (loader_->has_key("orientation.max_down_angle_deg")) {
        double deg = loader_->get_double("orientation.max_down_angle_deg");
        orientation_.max_z_axis_z = std::sin(deg * M_PI / 180.0);
    }
    if (loader_->has_key("orientation.min_forward_angle_deg")) {
        double deg = loader_->get_double("orientation.min_forward_angle_deg");
        orientation_.max_z_axis_y = -std::sin(deg * M_PI / 180.0);
    }
}

void ConfigManager::load_reward_config() {
    if (!loader_) return;

    if (loader_->has_key("reward.kp")) {
        reward_.kp = loader_->get_double("reward.kp");
    }
    if (loader_->has_key("reward.ko")) {
        reward_.ko = loader_->get_double("reward.ko");
    }
    if (loader_->has_key("reward.distance_threshold")) {
        reward_.distance_threshold = loader_->get_double("reward.distance_threshold");
    }
    if (loader_->has_key("reward.orientation_threshold")) {
        reward_.orientation_threshold = loader_->get_double("reward.orientation_threshold");
    }
}

void ConfigManager::load_sampling_config() {
    if (!loader_) return;

    if (loader_->has_key("sampling.max_goal_attempts")) {
        sampling_.max_goal_attempts = loader_->get_int("sampling.max_goal_attempts");
    }
    if (loader_->has_key("sampling.max_reset_attempts")) {
        sampling_.max_reset_attempts = loader_->get_int("sampling.max_reset_attempts");
    }
    if (loader_->has_key("sampling.seed")) {
        sampling_.seed = loader_->get_int("sampling.seed");
    }
}

void ConfigManager::load_robot_config() {
    if (!loader_) return;

    if (loader_->has_key("robot.joint_names")) {
        robot_.joint_names = loader_->get_string_vector("robot.joint_names");
    }
    if (loader_->has_key("robot.initial_joint_values")) {
        robot_.initial_joint_values = loader_->get_vector("robot.initial_joint_values");
    }
    if (loader_->has_key("robot.collision_links")) {
        robot_.collision_links = loader_->get_string_vector("robot.collision_links");
    }
    if (loader_->has_key("robot.end_effector_body")) {
        robot_.end_effector_body = loader_->get_string("robot.end_effector_body");
    }
    if (loader_->has_key("robot.goal_marker_body")) {
        robot_.goal_marker_body = loader_->get_string("robot.goal_marker_body");
    }
    if (loader_->has_key("robot.action_scale")) {
        robot_.action_scale = loader_->get_vector("robot.action_scale");
    }
    if (loader_->has_key("robot.joint_limit")) {
        robot_.joint_limit = loader_->get_double("robot.joint_limit");
    }
}

void ConfigManager::load_episode_config() {
    if (!loader_) return;

    if (loader_->has_key("episode.random_start")) {
        episode_.random_start = loader_->get_bool("episode.random_start");
    }
    if (loader_->has_key("episode.max_steps")) {
        episode_.max_episode_steps = loader_->get_int("episode.max_steps");
    }
}

void ConfigManager::load_system_config() {
    if (!loader_) return;

    if (loader_->has_key("system.model_path")) {
        system_.model_path = loader_->get_string("system.model_path");
    }
    if (loader_->has_key("system.verbose")) {
        system_.verbose = loader_->get_bool("system.verbose");
    }
}

void ConfigManager::validate_configuration() const {
    // Workspace
    for (int i = 0; i < 3; i++) {
        require(workspace_.table_size[i] > 0.0, "workspace.table_size must be positive");
    }
    double x_span = workspace_.table_size[0] - 2.0 * workspace_.x_margin;
    double y_span = workspace_.table_size[1] - workspace_.y_margin_low - workspace_.y_margin_high;
    double z_span = workspace_.z_max_offset - workspace_.z_min_offset;
    require(x_span >= 0.0, "workspace x margins exceed the table width");
    require(y_span >= 0.0, "workspace y margins exceed the table depth");
    require(z_span >= 0.0, "workspace.margins.z_max must not be below z_min");

    // Reward weights
    require(reward_.kp >= 0.0 && reward_.kp <= 1.0, "reward.kp must lie in [0, 1]");
    require(reward_.ko >= 0.0 && reward_.ko <= 1.0, "reward.ko must lie in [0, 1]");
    require(reward_.kp + reward_.ko <= 1.0, "reward.kp + reward.ko must not exceed 1");
    require(reward_.distance_threshold >= 0.0, "reward.distance_threshold must be non-negative");

    // Sampling
    require(sampling_.max_goal_attempts >= 1, "sampling.max_goal_attempts must be at least 1");
    require(sampling_.max_reset_attempts >= 1, "sampling.max_reset_attempts must be at least 1");

    // Robot
    require(robot_.joint_names.size() == NUM_ARM_JOINTS, "robot.joint_names must list 6 joints");
    require(robot_.initial_joint_values.size() == NUM_ARM_JOINTS,
            "robot.initial_joint_values must hold 6 values");
    require(robot_.action_scale.size() == NUM_ARM_JOINTS, "robot.action_scale must hold 6 values");
    require(robot_.joint_limit > 0.0, "robot.joint_limit must be positive");
    require(!robot_.end_effector_body.empty(), "robot.end_effector_body must be set");

    // Episode
    require(episode_.max_episode_steps >= 1, "episode.max_steps must be at least 1");
}

void ConfigManager::set_reward_weights(double kp, double ko) {
    RewardConfig previous = reward_;
    reward_.kp = kp;
    reward_.ko = ko;
    try {
        validate_configuration();
    } catch (const ConfigurationInvalid&) {
        reward_ = previous;
        throw;
    }
}

void ConfigManager::print_configuration() const {
    std::cout << "=== LARCC Reach Configuration ===" << std::endl;
    std::cout << std::fixed << std::setprecision(4);

    std::cout << "Workspace:" << std::endl;
    std::cout << "  table_position: " << format_vector(std::vector<double>(workspace_.table_position.begin(), workspace_.table_position.end())) << std::endl;
    std::cout << "  table_size: " << format_vector(std::vector<double>(workspace_.table_size.begin(), workspace_.table_size.end())) << std::endl;
    std::cout << "  link_min_height: " << workspace_.link_min_height << std::endl;

    std::cout << "Orientation:" << std::endl;
    std::cout << "  max_z_axis_z: " << orientation_.max_z_axis_z << std::endl;
    std::cout << "  max_z_axis_y: " << orientation_.max_z_axis_y << std::endl;

    std::cout << "Reward:" << std::endl;
    std::cout << "  kp: " << reward_.kp << ", ko: " << reward_.ko
              << ", bonus: " << (1.0 - reward_.kp - reward_.ko) << std::endl;
    std::cout << "  distance_threshold: " << reward_.distance_threshold << std::endl;
    std::cout << "  orientation_threshold: " << reward_.orientation_threshold << std::endl;

    std::cout << "Sampling:" << std::endl;
    std::cout << "  max_goal_attempts: " << sampling_.max_goal_attempts << std::endl;
    std::cout << "  max_reset_attempts: " << sampling_.max_reset_attempts << std::endl;
    std::cout << "  seed: " << sampling_.seed << std::endl;

    std::cout << "Robot:" << std::endl;
    std::cout << "  end_effector_body: " << robot_.end_effector_body << std::endl;
    std::cout << "  initial_joint_values: " << format_vector(robot_.initial_joint_values) << std::endl;
    std::cout << "  action_scale: " << format_vector(robot_.action_scale) << std::endl;

    std::cout << "Episode:" << std::endl;
    std::cout << "  random_start: " << (episode_.random_start ? "true" : "false") << std::endl;
    std::cout << "  max_steps: " << episode_.max_episode_steps << std::endl;

    std::cout << "System:" << std::endl;
    std::cout << "  model_path: " << system_.model_path << std::endl;
}

std::unique_ptr<ConfigManager> ConfigManager::create_default() {
    return std::make_unique<ConfigManager>();
}

std::unique_ptr<ConfigManager> ConfigManager::create_from_file(const std::string& config_file) {
    return std::make_unique<ConfigManager>(config_file);
}

} // namespace larcc
