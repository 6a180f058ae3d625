#pragma once

#include "layout_policy.hpp"

namespace shyradar {
namespace layout {

/**
 * DistanceLayoutPolicy - Continuous radar
 *
 * Radius grows with distance: (sqrt(min(1, d / max_distance)) * 0.5 + 0.3) * R.
 * The angle is drawn once per user and persisted. Closer users are placed
 * first. A colliding candidate is corrected in stages (radial push, angle
 * jitter, both, then a random point on the outer edge) for at most
 * max_attempts tries; a user that still collides is left unplaced.
 *
 * Every candidate is clamped into [center_buffer, usable radius] before it
 * is tested, so accepted positions satisfy both bounds and min_separation.
 */
class DistanceLayoutPolicy : public LayoutPolicy {
public:
    DistanceLayoutPolicy(const LayoutConfig& config,
                         std::shared_ptr<PlacementAttributeStore> attributes);

    LayoutPolicyType type() const override { return LayoutPolicyType::DISTANCE; }
    std::string getName() const override { return "Distance"; }
    const LayoutConfig& getConfig() const override { return config_; }

    LayoutResult compute(const std::vector<DiscoveredUser>& users) override;
    void reset() override {}

    // Radius before collision correction and clamping
    float radiusForDistance(float distance_m) const;

private:
    LayoutConfig config_;
    std::shared_ptr<PlacementAttributeStore> attributes_;

    float clampRadius(float radius) const;
};

} // namespace layout
} // namespace shyradar
