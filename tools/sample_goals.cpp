/**
 * @file sample_goals.cpp
 * @brief Sample goal poses from a configuration and report acceptance statistics
 *
 * Usage: larcc_sample_goals [config.yaml] [num_goals]
 */

#include "config/config_manager.hpp"
#include "environment/goal_sampler.hpp"
#include "environment/pose_validator.hpp"
#include "core/errors.hpp"
#include <iostream>
#include <iomanip>
#include <chrono>
#include <limits>
#include <algorithm>

using namespace larcc;

int main(int argc, char* argv[]) {
    if (argc > 3) {
        std::cerr << "Usage: " << argv[0] << " [config.yaml] [num_goals]" << std::endl;
        return 1;
    }

    try {
        auto config = argc >= 2 ? ConfigManager::create_from_file(argv[1]) : ConfigManager::create_default();
        int num_goals = argc == 3 ? std::stoi(argv[2]) : 10000;

        WorkspaceRegion region(config->workspace());
        OrientationCone cone(config->orientation().max_z_axis_z, config->orientation().max_z_axis_y);
        GoalSampler sampler(region, cone, config->sampling().max_goal_attempts,
                            utils::resolve_seed(config->sampling().seed));
        PoseValidator validator(region, cone);

        Position3 lo, hi;
        lo.fill(std::numeric_limits<double>::max());
        hi.fill(std::numeric_limits<double>::lowest());
        int max_draws = 0;
        int rejected = 0;

        auto start_time = std::chrono::high_resolution_clock::now();
        for (int i = 0; i < num_goals; i++) {
            Pose3D goal = sampler.sample_goal();
            if (!validator.is_reset_valid(goal)) {
                rejected++;
            }
            for (int k = 0; k < 3; k++) {
                lo[k] = std::min(lo[k], goal[k]);
                hi[k] = std::max(hi[k], goal[k]);
            }
            max_draws = std::max(max_draws, sampler.get_statistics().last_attempts);
        }
        auto end_time = std::chrono::high_resolution_clock::now();
        double elapsed_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

        const auto& stats = sampler.get_statistics();
        const auto& bounds = region.bounds();

        std::cout << std::fixed << std::setprecision(4);
        std::cout << "Sampled " << stats.goals_sampled << " goals in " << elapsed_ms << " ms" << std::endl;
        std::cout << "Workspace box: x [" << bounds.min[0] << ", " << bounds.max[0] << "]"
                  << " y [" << bounds.min[1] << ", " << bounds.max[1] << "]"
                  << " z [" << bounds.min[2] << ", " << bounds.max[2] << "]" << std::endl;
        std::cout << "Observed:      x [" << lo[0] << ", " << hi[0] << "]"
                  << " y [" << lo[1] << ", " << hi[1] << "]"
                  << " z [" << lo[2] << ", " << hi[2] << "]" << std::endl;
        std::cout << "Orientation draws: mean "
                  << static_cast<double>(stats.total_attempts) / std::max<long long>(1, stats.goals_sampled)
                  << ", max " << max_draws << " (cap " << sampler.get_max_attempts() << ")" << std::endl;
        std::cout << "Goals rejected by validator: " << rejected << std::endl;

        return rejected == 0 ? 0 : 2;

    } catch (const SamplingTimeout& e) {
        std::cerr << "Sampling failed: " << e.what() << std::endl;
        return 3;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
