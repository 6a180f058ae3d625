#pragma once

#include "layout_policy.hpp"
#include <memory>
#include <vector>

namespace shyradar {
namespace layout {

class LayoutPolicyFactory {
public:
    // Policies that persist per-user attributes share the given store;
    // a fresh one is created when none is passed.
    static LayoutPolicyPtr create(LayoutPolicyType type, const LayoutConfig& config,
                                  std::shared_ptr<PlacementAttributeStore> attributes = nullptr);

    static std::vector<LayoutPolicyType> getAvailablePolicies();
};

/**
 * LayoutEngine - Owns the active placement policy and the current positions
 *
 * Positions are only ever written by compute(); callers read them through
 * lastResult()/positionOf(). Switching policy drops the cached result but
 * keeps the persisted per-user angles and placeholder distances.
 */
class LayoutEngine {
public:
    LayoutEngine(LayoutPolicyType type, const LayoutConfig& config);

    const LayoutResult& compute(const std::vector<DiscoveredUser>& users);

    void setPolicy(LayoutPolicyType type);
    LayoutPolicyType policyType() const { return policy_->type(); }
    const LayoutPolicy& policy() const { return *policy_; }

    const LayoutResult& lastResult() const { return result_; }
    std::optional<Position> positionOf(const UserId& user_id) const {
        return result_.positionOf(user_id);
    }

    // Forget results and persisted attributes (session teardown)
    void reset();

    const LayoutConfig& getConfig() const { return config_; }
    const PlacementAttributeStore& attributes() const { return *attributes_; }

private:
    LayoutConfig config_;
    std::shared_ptr<PlacementAttributeStore> attributes_;
    LayoutPolicyPtr policy_;
    LayoutResult result_;
};

} // namespace layout
} // namespace shyradar
