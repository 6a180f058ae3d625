#pragma once

// LayoutPolicy - Interface for radar placement strategies
//
// A policy maps the current set of discovered users onto the circular
// layout surface. Every policy is deterministic: the same users with the
// same persisted attributes always produce the same positions.

#include "shyradar/types.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace shyradar {
namespace layout {

struct LayoutConfig {
    float surface_diameter = 500.0f;    // S
    float bubble_diameter = 60.0f;
    float min_separation = 108.0f;      // 1.8 x bubble
    float center_buffer = 100.0f;       // Keep-out radius around the anchor
    float edge_margin = 10.0f;
    float max_distance_m = 10.0f;       // Distance mapped to the outer radius
    int max_slots = 10;
    float slot_radius_fraction = 0.35f; // Slot circle radius as a fraction of S
    uint32_t angle_seed = 0x5EED;
    int max_attempts = 40;              // Collision correction cap

    float surfaceRadius() const { return surface_diameter * 0.5f; }
    float bubbleRadius() const { return bubble_diameter * 0.5f; }
    float usableRadius() const { return surfaceRadius() - bubbleRadius() - edge_margin; }
    float slotRadius() const { return slot_radius_fraction * surface_diameter; }
    Position anchor() const { return Position{surfaceRadius(), surfaceRadius()}; }

    // Chord between neighbouring slots, 0 with fewer than two slots
    float slotSpacing() const;

    // Throws std::invalid_argument. The slot circle must sit between the
    // center buffer and the usable radius with neighbours at least
    // min_separation apart.
    void validate() const;
};

struct PlacedUser {
    UserId user_id;
    Position position;
};

struct LayoutResult {
    Position anchor;
    std::vector<PlacedUser> placed;     // In processing order
    std::vector<UserId> unplaced;       // Not displayed this pass

    std::optional<Position> positionOf(const UserId& user_id) const;
    bool isPlaced(const UserId& user_id) const { return positionOf(user_id).has_value(); }
};

// Per-user values drawn once and then persisted
struct PlacementAttributes {
    float angle_rad = 0.0f;
    float placeholder_distance_m = 0.0f;   // Used when no ranging distance is known
};

// Seeded store of persisted per-user placement attributes. Survives policy
// switches; cleared only on session teardown.
class PlacementAttributeStore {
public:
    explicit PlacementAttributeStore(uint32_t seed = 0x5EED);

    // Draws the attributes on first use, returns the persisted ones afterwards
    const PlacementAttributes& getOrAssign(const UserId& user_id, float max_distance_m);

    std::optional<PlacementAttributes> find(const UserId& user_id) const;
    void clear();
    size_t size() const { return attributes_.size(); }

private:
    uint32_t seed_;
    std::mt19937 rng_;
    std::unordered_map<UserId, PlacementAttributes> attributes_;
};

class LayoutPolicy {
public:
    virtual ~LayoutPolicy() = default;

    virtual LayoutPolicyType type() const = 0;
    virtual std::string getName() const = 0;
    virtual const LayoutConfig& getConfig() const = 0;

    // Users may arrive in any order; policies impose their own
    virtual LayoutResult compute(const std::vector<DiscoveredUser>& users) = 0;

    // Drop any cached result
    virtual void reset() = 0;
};

using LayoutPolicyPtr = std::unique_ptr<LayoutPolicy>;

// Stable 32-bit hash (FNV-1a) for per-user seeding
uint32_t hashUserId(const UserId& user_id, uint32_t seed);

} // namespace layout
} // namespace shyradar
