/**
 * @file test_episode_controller.cpp
 * @brief Episode reset, goal handling, history scoping and stepping against a fake arm
 */

#include "environment/episode_controller.hpp"
#include "config/config_manager.hpp"
#include "core/errors.hpp"
#include "fixtures/fake_physics.hpp"
#include "fixtures/test_helpers.hpp"
#include <iostream>
#include <memory>
#include <fstream>
#include <cstdio>
#include <vector>

using namespace larcc;
using larcc::test::check;
using larcc::test::near;
using larcc::test::throws;
using larcc::test::FakePhysics;

namespace {

std::shared_ptr<ConfigManager> make_config(int seed = 17) {
    auto config = std::make_shared<ConfigManager>();
    config->set_seed(seed);
    return config;
}

std::unique_ptr<FakePhysics> make_physics(const ConfigManager& config) {
    WorkspaceRegion region(config.workspace());
    return std::make_unique<FakePhysics>(config.robot().joint_names, config.robot().collision_links, region.bounds());
}

void test_fixed_start() {
    std::cout << "\n1. Fixed start" << std::endl;

    auto config = make_config();
    auto physics = make_physics(*config);
    EpisodeController controller(*physics, config);

    check(!controller.has_goal(), "no goal before the first reset");
    check(!controller.is_success(), "no success before any reward");

    Pose3D start = controller.reset_episode(false);
    JointVector joints = controller.joint_positions();
    bool initial = true;
    for (size_t i = 0; i < NUM_ARM_JOINTS; i++) {
        initial = initial && near(joints[i], config->robot().initial_joint_values[i]);
    }
    check(initial, "joints set to the configured initial values");
    check(start == physics->get_body_pose("eef"), "returns the end-effector pose");
    check(controller.get_reset_statistics().last_attempts == 1, "fixed start takes one attempt");

    check(controller.has_goal(), "goal sampled at reset");
    check(controller.validator().is_reset_valid(controller.goal()), "goal lies in the workspace with a valid orientation");
    check(physics->has_model_pose("target0") && physics->model_pose("target0") == controller.goal(),
          "goal marker moved to the goal");
}

void test_random_start() {
    std::cout << "\n2. Random start" << std::endl;

    auto config = make_config(31);
    auto physics = make_physics(*config);
    EpisodeController controller(*physics, config);

    bool all_valid = true;
    bool all_clear = true;
    for (int episode = 0; episode < 5; episode++) {
        Pose3D start = controller.reset_episode(true);
        all_valid = all_valid && controller.validate(start);
        for (const auto& link : config->robot().collision_links) {
            all_clear = all_clear && physics->get_body_position(link)[2] >= config->workspace().link_min_height;
        }
    }
    check(all_valid, "every random start passes validation");
    check(all_clear, "no link below the table");
    check(controller.get_reset_statistics().episodes == 5, "five episodes counted");
    check(controller.get_reset_statistics().last_attempts <= config->sampling().max_reset_attempts,
          "terminates within the attempt cap");

    std::cout << "  mean attempts per random reset: "
              << static_cast<double>(controller.get_reset_statistics().total_attempts) / 5.0 << std::endl;
}

void test_random_start_is_reproducible() {
    std::cout << "\n3. Seeded resets" << std::endl;

    auto config = make_config(8);
    auto physics_a = make_physics(*config);
    auto physics_b = make_physics(*config);
    EpisodeController a(*physics_a, config);
    EpisodeController b(*physics_b, config);

    Pose3D start_a = a.reset_episode(true);
    Pose3D start_b = b.reset_episode(true);
    check(start_a == start_b, "same seed gives the same start pose");
    check(a.goal() == b.goal(), "same seed gives the same goal");
}

void test_reset_timeout() {
    std::cout << "\n4. Reset attempt cap" << std::endl;

    std::string path = "larcc_test_reset_cap.yaml";
    {
        std::ofstream file(path);
        file << "sampling:\n  max_reset_attempts: 50\n  seed: 3\n";
    }
    auto config = std::make_shared<ConfigManager>(path);
    std::remove(path.c_str());

    auto physics = make_physics(*config);
    EpisodeController controller(*physics, config);
    controller.reset_episode(false);
    check(controller.has_goal(), "fixed reset sets a goal");

    // End effector stuck far outside the table box
    physics->override_end_effector(utils::make_pose({5.0, 5.0, 5.0}, {1.0, 0.0, 0.0, 0.0}));
    int calls_before = physics->forward_calls();

    int reported = 0;
    try {
        controller.reset_episode(true);
    } catch (const ResetTimeout& e) {
        reported = e.attempts();
    }
    check(reported == 50, "ResetTimeout after the configured 50 attempts");
    check(physics->forward_calls() - calls_before >= 50, "forward kinematics run for every attempt");
    check(!controller.has_goal(), "failed reset drops the previous goal");

    JointVector zero = {0.0, 0.0, 0.0, 0.0, 0.0, 0.0};
    check(throws<LarccError>([&] { controller.step(zero); }), "step after a failed reset rejected");
}

void test_history_scoped_to_episode() {
    std::cout << "\n5. Reward history per episode" << std::endl;

    auto config = make_config();
    auto physics = make_physics(*config);
    EpisodeController controller(*physics, config);
    controller.reset_episode(false);

    Pose3D goal = controller.goal();
    double reward = controller.compute_reward(goal, goal);
    check(near(reward, 1.0, 1e-12), "perfect match scores 1");
    check(controller.is_success(), "success after a perfect match");
    check(controller.history().size() == 1, "history holds one entry");

    controller.reset_episode(false);
    check(controller.history().empty(), "history empty after reset");
    check(!controller.is_success(), "success cleared by reset");

    std::vector<double> short_pose = {0.0, 0.0, 0.0};
    std::vector<double> full(goal.begin(), goal.end());
    check(throws<InvalidPoseShape>([&] { controller.compute_reward(short_pose, full); }),
          "wrong pose length raises InvalidPoseShape");
}

void test_actions_and_steps() {
    std::cout << "\n6. Actions and steps" << std::endl;

    auto config = make_config();
    auto physics = make_physics(*config);
    EpisodeController controller(*physics, config);

    JointVector zero = {0.0, 0.0, 0.0, 0.0, 0.0, 0.0};
    check(throws<LarccError>([&] { controller.step(zero); }), "step before reset rejected");

    controller.reset_episode(false);
    JointVector before = controller.joint_positions();
    JointVector action = {1.0, -1.0, 1.0, -1.0, 0.5, 0.0};
    controller.apply_action(action);
    JointVector after = controller.joint_positions();

    const auto& scale = config->robot().action_scale;
    check(near(after[0] - before[0], scale[0]) && near(after[1] - before[1], -scale[1]), "shoulder deltas scaled by 0.08");
    check(near(after[2] - before[2], scale[2]) && near(after[4] - before[4], 0.5 * scale[4]), "wrist deltas scaled by 0.12");
    check(near(after[5], before[5]), "zero action leaves the joint");

    // Drive the elbow into its limit
    JointVector elbow_up = {0.0, 0.0, 1.0, 0.0, 0.0, 0.0};
    for (int i = 0; i < 100; i++) {
        controller.apply_action(elbow_up);
    }
    check(near(controller.joint_positions()[2], M_PI), "joint clipped at +pi");

    check(throws<InvalidActionShape>([&] { controller.apply_action(std::vector<double>(5, 0.0)); }),
          "wrong action length rejected");

    controller.reset_episode(false);
    EpisodeController::StepResult result;
    int steps = 0;
    do {
        result = controller.step(zero);
        steps++;
    } while (!result.truncated && steps < 1000);

    check(steps == config->episode().max_episode_steps, "truncated after the configured number of steps");
    check(result.step == steps && controller.step_count() == steps, "step counter matches");
    check(result.desired_goal == controller.goal(), "step reports the episode goal");
    check(result.achieved_goal == controller.end_effector_pose(), "step reports the end-effector pose");
    check(controller.history().size() == static_cast<size_t>(steps), "one history entry per step");
    check(result.is_success == controller.is_success(), "step success matches the latest bonus");
}

void test_step_reaches_goal() {
    std::cout << "\n7. Success through step" << std::endl;

    auto config = make_config();
    auto physics = make_physics(*config);
    EpisodeController controller(*physics, config);
    controller.reset_episode(false);

    // Put the goal exactly where the end effector will be after a zero action
    controller.set_goal(controller.end_effector_pose());
    JointVector zero = {0.0, 0.0, 0.0, 0.0, 0.0, 0.0};
    EpisodeController::StepResult result = controller.step(zero);
    check(result.is_success, "zero-distance step reports success");
    check(near(result.reward, 1.0, 1e-12), "zero-distance step scores 1");
    check(physics->model_pose("target0") == controller.goal(), "set_goal moves the marker");

    // Success does not end the episode; it keeps running to the step limit
    int steps = 1;
    int success_steps = 1;
    while (!result.truncated && steps < 1000) {
        result = controller.step(zero);
        steps++;
        if (result.is_success) success_steps++;
    }
    check(success_steps == steps, "success reported on every step while the goal is held");
    check(steps == config->episode().max_episode_steps, "successful episode still runs to truncation");
    check(result.is_success, "success still reported on the final step");
}

} // namespace

int main() {
    std::cout << "=== Episode Controller Test ===" << std::endl;

    test_fixed_start();
    test_random_start();
    test_random_start_is_reproducible();
    test_reset_timeout();
    test_history_scoped_to_episode();
    test_actions_and_steps();
    test_step_reaches_goal();

    return larcc::test::finish("Episode Controller Test");
}
