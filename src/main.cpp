#include <iostream>
#include <iomanip>
#include <random>
#include <string>

#include "config/config_manager.hpp"
#include "core/mujoco_wrapper.hpp"
#include "core/errors.hpp"
#include "environment/episode_controller.hpp"

using namespace larcc;

int main(int argc, char* argv[]) {
    // Check command line arguments
    if (argc < 2 || argc > 3) {
        std::cerr << "Usage: " << argv[0] << " <config.yaml> [num_episodes]" << std::endl;
        std::cerr << "Example: " << argv[0] << " config/larcc_reach.yaml 5" << std::endl;
        return 1;
    }

    try {
        // Load configuration
        std::shared_ptr<ConfigManager> config = ConfigManager::create_from_file(argv[1]);
        int num_episodes = argc == 3 ? std::stoi(argv[2]) : 1;

        if (config->system().verbose) {
            config->print_configuration();
        }

        MujocoWrapper sim(config->system().model_path);
        EpisodeController controller(sim, config);

        // Random policy, uniform in [-1, 1] per joint
        std::mt19937 policy_rng(utils::resolve_seed(config->sampling().seed) + 2u);
        std::uniform_real_distribution<double> action_dist(-1.0, 1.0);

        int successes = 0;
        for (int episode = 0; episode < num_episodes; episode++) {
            sim.reset();
            Pose3D start = controller.reset_episode();
            const Pose3D& goal = controller.goal();

            std::cout << std::fixed << std::setprecision(3);
            std::cout << "Episode " << episode << ": start [" << start[0] << ", " << start[1] << ", " << start[2]
                      << "] goal [" << goal[0] << ", " << goal[1] << ", " << goal[2] << "]" << std::endl;

            // Episodes only end on truncation; success is read at the last step
            double episode_return = 0.0;
            int success_steps = 0;
            EpisodeController::StepResult result;
            do {
                JointVector action;
                for (auto& a : action) a = action_dist(policy_rng);
                result = controller.step(action);
                episode_return += result.reward;
                if (result.is_success) success_steps++;
            } while (!result.truncated);

            if (result.is_success) successes++;
            std::cout << "  steps: " << result.step << ", return: " << episode_return
                      << ", steps in success: " << success_steps
                      << ", final success: " << (result.is_success ? "yes" : "no") << std::endl;
        }

        std::cout << "Successes: " << successes << "/" << num_episodes << std::endl;
        return 0;

    } catch (const LarccError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
