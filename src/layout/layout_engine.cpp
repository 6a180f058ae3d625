#include "layout_engine.hpp"
#include "distance_layout.hpp"
#include "slot_layout.hpp"
#include "shyradar/logging.hpp"
#include <stdexcept>

namespace shyradar {
namespace layout {

LayoutPolicyPtr LayoutPolicyFactory::create(LayoutPolicyType type, const LayoutConfig& config,
                                            std::shared_ptr<PlacementAttributeStore> attributes) {
    switch (type) {
        case LayoutPolicyType::DISTANCE:
            if (!attributes) {
                attributes = std::make_shared<PlacementAttributeStore>(config.angle_seed);
            }
            return std::make_unique<DistanceLayoutPolicy>(config, std::move(attributes));

        case LayoutPolicyType::FIXED_SLOT:
            return std::make_unique<FixedSlotLayoutPolicy>(config);

        default:
            LOG_LAYOUT(ERROR, "LayoutPolicyFactory: Unknown policy %d", static_cast<int>(type));
            return nullptr;
    }
}

std::vector<LayoutPolicyType> LayoutPolicyFactory::getAvailablePolicies() {
    return {
        LayoutPolicyType::FIXED_SLOT,
        LayoutPolicyType::DISTANCE,
    };
}

LayoutEngine::LayoutEngine(LayoutPolicyType type, const LayoutConfig& config)
    : config_(config),
      attributes_(std::make_shared<PlacementAttributeStore>(config.angle_seed)) {
    policy_ = LayoutPolicyFactory::create(type, config_, attributes_);
    if (!policy_) {
        throw std::invalid_argument("unknown layout policy");
    }
    result_.anchor = config_.anchor();
    LOG_LAYOUT(INFO, "Layout policy %s, surface %.0f", policy_->getName().c_str(),
               config_.surface_diameter);
}

const LayoutResult& LayoutEngine::compute(const std::vector<DiscoveredUser>& users) {
    result_ = policy_->compute(users);
    return result_;
}

void LayoutEngine::setPolicy(LayoutPolicyType type) {
    if (type == policy_->type()) {
        return;
    }
    LayoutPolicyPtr next = LayoutPolicyFactory::create(type, config_, attributes_);
    if (!next) {
        throw std::invalid_argument("unknown layout policy");
    }
    LOG_LAYOUT(INFO, "Layout policy %s -> %s", policy_->getName().c_str(),
               next->getName().c_str());
    policy_ = std::move(next);
    result_ = LayoutResult{};
    result_.anchor = config_.anchor();
}

void LayoutEngine::reset() {
    policy_->reset();
    attributes_->clear();
    result_ = LayoutResult{};
    result_.anchor = config_.anchor();
}

} // namespace layout
} // namespace shyradar
