#pragma once

#include "layout_policy.hpp"

namespace shyradar {
namespace layout {

// FixedSlotLayoutPolicy - Discrete radar
//
// max_slots points on a circle of radius slot_radius_fraction * S, slot 0
// at the top, proceeding clockwise. The most recently seen users take the
// slots in recency order; the rest are unplaced. The previous result is
// reused while membership and recency order are unchanged.
class FixedSlotLayoutPolicy : public LayoutPolicy {
public:
    explicit FixedSlotLayoutPolicy(const LayoutConfig& config);

    LayoutPolicyType type() const override { return LayoutPolicyType::FIXED_SLOT; }
    std::string getName() const override { return "Fixed slots"; }
    const LayoutConfig& getConfig() const override { return config_; }

    LayoutResult compute(const std::vector<DiscoveredUser>& users) override;
    void reset() override;

    const std::vector<Position>& slots() const { return slots_; }

    // Number of compute() calls served from the cached result
    int cacheHits() const { return cache_hits_; }

private:
    LayoutConfig config_;
    std::vector<Position> slots_;

    std::vector<UserId> cached_order_;
    std::optional<LayoutResult> cached_;
    int cache_hits_ = 0;
};

} // namespace layout
} // namespace shyradar
