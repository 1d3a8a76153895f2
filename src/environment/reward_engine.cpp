#include "environment/reward_engine.hpp"
#include "environment/pose_validator.hpp"
#include "core/geometry.hpp"
#include "core/errors.hpp"
#include <algorithm>

namespace larcc {

RewardEngine::RewardEngine(const ConfigManager::RewardConfig& config)
    : kp_(config.kp)
    , ko_(config.ko)
    , distance_threshold_(config.distance_threshold)
    , orientation_threshold_(config.orientation_threshold) {
    if (!(kp_ >= 0.0 && kp_ <= 1.0)) {
        throw ConfigurationInvalid("position weight kp must lie in [0, 1], got " + std::to_string(kp_));
    }
    if (!(ko_ >= 0.0 && ko_ <= 1.0)) {
        throw ConfigurationInvalid("orientation weight ko must lie in [0, 1], got " + std::to_string(ko_));
    }
    if (!(kp_ + ko_ <= 1.0)) {
        throw ConfigurationInvalid("kp + ko must not exceed 1, got " + std::to_string(kp_ + ko_));
    }
}

RewardTerms RewardEngine::compute_terms(const Pose3D& achieved, const Pose3D& desired) const {
    RewardTerms terms;

    double pos_error = geometry::point_distance(utils::position_of(desired), utils::position_of(achieved));
    terms.position = utils::clip(1.0 - pos_error, -1.0, 1.0);

    // q and -q encode the same rotation
    Quaternion desired_quat = utils::quaternion_of(desired);
    Quaternion achieved_quat = utils::quaternion_of(achieved);
    terms.orientation = std::max(utils::dot(desired_quat, achieved_quat),
                                 utils::dot(desired_quat, utils::negate(achieved_quat)));

    bool close_enough = terms.position > 1.0 - distance_threshold_ &&
                        terms.orientation > orientation_threshold_;
    terms.bonus = close_enough ? 1.0 : 0.0;

    terms.total = kp_ * terms.position + ko_ * terms.orientation + (1.0 - kp_ - ko_) * terms.bonus;
    return terms;
}

double RewardEngine::compute_reward(const Pose3D& achieved, const Pose3D& desired,
                                    EpisodeRewardHistory& history) const {
    RewardTerms terms = compute_terms(achieved, desired);
    history.record(terms);
    return terms.total;
}

double RewardEngine::compute_reward(const std::vector<double>& achieved, const std::vector<double>& desired,
                                    EpisodeRewardHistory& history) const {
    return compute_reward(to_pose(achieved), to_pose(desired), history);
}

} // namespace larcc
