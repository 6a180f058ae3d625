#include "slot_layout.hpp"
#include "shyradar/logging.hpp"
#include <algorithm>
#include <cmath>

namespace shyradar {
namespace layout {

namespace {
constexpr float PI = 3.14159265358979323846f;
}

FixedSlotLayoutPolicy::FixedSlotLayoutPolicy(const LayoutConfig& config)
    : config_(config) {
    config_.validate();

    const Position anchor = config_.anchor();
    const float radius = config_.slotRadius();
    const int n = config_.max_slots;

    slots_.reserve(static_cast<size_t>(n));
    for (int k = 0; k < n; k++) {
        float angle = (2.0f * PI * static_cast<float>(k)) / static_cast<float>(n) - PI / 2.0f;
        slots_.push_back(polarToCartesian(anchor, radius, angle));
    }

    LOG_LAYOUT(DEBUG, "%d slots at radius %.1f, spacing %.1f", n, radius,
               config_.slotSpacing());
}

void FixedSlotLayoutPolicy::reset() {
    cached_.reset();
    cached_order_.clear();
}

LayoutResult FixedSlotLayoutPolicy::compute(const std::vector<DiscoveredUser>& users) {
    std::vector<const DiscoveredUser*> ordered;
    ordered.reserve(users.size());
    for (const auto& user : users) {
        ordered.push_back(&user);
    }
    std::sort(ordered.begin(), ordered.end(), [](const DiscoveredUser* a, const DiscoveredUser* b) {
        if (a->last_seen_at != b->last_seen_at) return a->last_seen_at > b->last_seen_at;
        return a->user_id < b->user_id;
    });

    std::vector<UserId> order;
    order.reserve(ordered.size());
    for (const auto* user : ordered) {
        order.push_back(user->user_id);
    }

    if (cached_ && order == cached_order_) {
        cache_hits_++;
        return *cached_;
    }

    LayoutResult result;
    result.anchor = config_.anchor();
    for (size_t i = 0; i < order.size(); i++) {
        if (i < slots_.size()) {
            result.placed.push_back(PlacedUser{order[i], slots_[i]});
        } else {
            result.unplaced.push_back(order[i]);
        }
    }

    LOG_LAYOUT(DEBUG, "Slot layout recomputed: %zu placed, %zu waiting for a slot",
               result.placed.size(), result.unplaced.size());

    cached_order_ = std::move(order);
    cached_ = result;
    return result;
}

} // namespace layout
} // namespace shyradar
