#pragma once

#include "config/config_manager.hpp"
#include "core/types.hpp"
#include <vector>

namespace larcc {

/**
 * @brief Reward terms recorded during one episode
 *
 * Three parallel append-only sequences. A fresh instance is created for
 * every episode so nothing carries over between resets.
 */
class EpisodeRewardHistory {
public:
    void record(const RewardTerms& terms) {
        position_rewards_.push_back(terms.position);
        orientation_rewards_.push_back(terms.orientation);
        bonus_rewards_.push_back(terms.bonus);
    }

    size_t size() const { return bonus_rewards_.size(); }
    bool empty() const { return bonus_rewards_.empty(); }

    const std::vector<double>& position_rewards() const { return position_rewards_; }
    const std::vector<double>& orientation_rewards() const { return orientation_rewards_; }
    const std::vector<double>& bonus_rewards() const { return bonus_rewards_; }

    // Success is a read of the latest bonus term
    bool last_bonus_awarded() const { return !empty() && bonus_rewards_.back() == 1.0; }

private:
    std::vector<double> position_rewards_;
    std::vector<double> orientation_rewards_;
    std::vector<double> bonus_rewards_;
};

/**
 * @brief Dense shaped reward comparing achieved and desired poses
 *
 *   position    = clip(1 - |p_desired - p_achieved|, -1, 1)
 *   orientation = max(q_d . q_a, q_d . -q_a)
 *   bonus       = 1 if position > 1 - distance_threshold and
 *                    orientation > orientation_threshold, else 0
 *   total       = kp * position + ko * orientation + (1 - kp - ko) * bonus
 */
class RewardEngine {
public:
    /**
     * @throws ConfigurationInvalid if kp, ko or kp + ko fall outside [0, 1]
     */
    explicit RewardEngine(const ConfigManager::RewardConfig& config);

    /**
     * @brief Compute the reward terms without recording them
     */
    RewardTerms compute_terms(const Pose3D& achieved, const Pose3D& desired) const;

    /**
     * @brief Compute the total reward and append its terms to history
     */
    double compute_reward(const Pose3D& achieved, const Pose3D& desired,
                          EpisodeRewardHistory& history) const;

    /**
     * @throws InvalidPoseShape if either pose does not hold exactly 7 values
     */
    double compute_reward(const std::vector<double>& achieved, const std::vector<double>& desired,
                          EpisodeRewardHistory& history) const;

    bool is_success(const EpisodeRewardHistory& history) const {
        return history.last_bonus_awarded();
    }

    double position_weight() const { return kp_; }
    double orientation_weight() const { return ko_; }
    double bonus_weight() const { return 1.0 - kp_ - ko_; }
    double distance_threshold() const { return distance_threshold_; }
    double orientation_threshold() const { return orientation_threshold_; }

private:
    double kp_;
    double ko_;
    double distance_threshold_;
    double orientation_threshold_;
};

} // namespace larcc
