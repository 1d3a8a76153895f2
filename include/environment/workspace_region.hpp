#pragma once

#include "config/config_manager.hpp"
#include "core/types.hpp"

namespace larcc {

/**
 * @brief Table-relative box in which goals are sampled and reset poses accepted
 *
 * Built once from the workspace configuration and never mutated.
 */
class WorkspaceRegion {
public:
    explicit WorkspaceRegion(const ConfigManager::WorkspaceConfig& config)
        : table_position_(config.table_position), table_size_(config.table_size) {
        const Position3& t = table_position_;
        const Position3& s = table_size_;
        double table_top = t[2] + s[2] / 2.0;

        bounds_.min = {t[0] - s[0] / 2.0 + config.x_margin,
                       t[1] - s[1] / 2.0 + config.y_margin_low,
                       table_top + config.z_min_offset};
        bounds_.max = {t[0] + s[0] / 2.0 - config.x_margin,
                       t[1] + s[1] / 2.0 - config.y_margin_high,
                       table_top + config.z_max_offset};
    }

    const WorkspaceBounds& bounds() const { return bounds_; }
    const Position3& table_position() const { return table_position_; }
    const Position3& table_size() const { return table_size_; }

    bool contains(const Position3& position) const { return bounds_.contains(position); }

private:
    Position3 table_position_;
    Position3 table_size_;
    WorkspaceBounds bounds_;
};

} // namespace larcc
