#include "layout_policy.hpp"
#include <cmath>
#include <stdexcept>

namespace shyradar {
namespace layout {

namespace {
constexpr float TWO_PI = 6.28318530717958647692f;
}

float LayoutConfig::slotSpacing() const {
    if (max_slots < 2) {
        return 0.0f;
    }
    return 2.0f * slotRadius() * std::sin(TWO_PI / (2.0f * static_cast<float>(max_slots)));
}

void LayoutConfig::validate() const {
    if (!(surface_diameter > 0.0f)) {
        throw std::invalid_argument("surface_diameter must be positive");
    }
    if (!(bubble_diameter > 0.0f)) {
        throw std::invalid_argument("bubble_diameter must be positive");
    }
    if (min_separation < 0.0f) {
        throw std::invalid_argument("min_separation must not be negative");
    }
    if (edge_margin < 0.0f) {
        throw std::invalid_argument("edge_margin must not be negative");
    }
    if (!(usableRadius() > 0.0f)) {
        throw std::invalid_argument("bubble and margin leave no usable radius");
    }
    if (center_buffer > usableRadius()) {
        throw std::invalid_argument("center_buffer exceeds the usable radius");
    }
    if (!(max_distance_m > 0.0f)) {
        throw std::invalid_argument("max_distance_m must be positive");
    }
    if (max_slots <= 0) {
        throw std::invalid_argument("max_slots must be positive");
    }
    if (!(slot_radius_fraction > 0.0f) || slotRadius() > usableRadius()) {
        throw std::invalid_argument("slot_radius_fraction must place slots on the surface");
    }
    if (slotRadius() < center_buffer) {
        throw std::invalid_argument("slot circle lies inside the center buffer");
    }
    if (max_slots > 1 && slotSpacing() < min_separation) {
        throw std::invalid_argument("slot spacing is below min_separation");
    }
    if (max_attempts <= 0) {
        throw std::invalid_argument("max_attempts must be positive");
    }
}

std::optional<Position> LayoutResult::positionOf(const UserId& user_id) const {
    for (const auto& entry : placed) {
        if (entry.user_id == user_id) {
            return entry.position;
        }
    }
    return std::nullopt;
}

PlacementAttributeStore::PlacementAttributeStore(uint32_t seed)
    : seed_(seed), rng_(seed) {}

const PlacementAttributes& PlacementAttributeStore::getOrAssign(const UserId& user_id,
                                                                float max_distance_m) {
    auto it = attributes_.find(user_id);
    if (it != attributes_.end()) {
        return it->second;
    }

    std::uniform_real_distribution<float> angle_dist(0.0f, TWO_PI);
    std::uniform_real_distribution<float> distance_dist(0.25f, 1.0f);

    PlacementAttributes attrs;
    attrs.angle_rad = angle_dist(rng_);
    attrs.placeholder_distance_m = distance_dist(rng_) * max_distance_m;
    return attributes_.emplace(user_id, attrs).first->second;
}

std::optional<PlacementAttributes> PlacementAttributeStore::find(const UserId& user_id) const {
    auto it = attributes_.find(user_id);
    if (it == attributes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void PlacementAttributeStore::clear() {
    attributes_.clear();
    rng_.seed(seed_);
}

uint32_t hashUserId(const UserId& user_id, uint32_t seed) {
    uint32_t hash = 2166136261u ^ seed;
    for (unsigned char c : user_id) {
        hash ^= c;
        hash *= 16777619u;
    }
    return hash;
}

} // namespace layout
} // namespace shyradar
