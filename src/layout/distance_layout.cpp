#include "distance_layout.hpp"
#include "shyradar/logging.hpp"
#include <algorithm>
#include <cmath>

namespace shyradar {
namespace layout {

namespace {

constexpr float TWO_PI = 6.28318530717958647692f;

// Float rounding in polarToCartesian must not put a point inside the buffer
constexpr float RADIUS_EPSILON = 1e-3f;

constexpr float PUSH_FRACTION = 0.25f;   // Radial push, fraction of min_separation
constexpr float ANGLE_JITTER = 0.25f;    // rad

struct Candidate {
    const DiscoveredUser* user;
    float distance_m;
    float angle_rad;
};

bool collides(const Position& candidate, const std::vector<PlacedUser>& placed, float min_sep) {
    for (const auto& other : placed) {
        if (distanceBetween(candidate, other.position) < min_sep) {
            return true;
        }
    }
    return false;
}

} // namespace

DistanceLayoutPolicy::DistanceLayoutPolicy(const LayoutConfig& config,
                                           std::shared_ptr<PlacementAttributeStore> attributes)
    : config_(config), attributes_(std::move(attributes)) {
    config_.validate();
    if (!attributes_) {
        attributes_ = std::make_shared<PlacementAttributeStore>(config_.angle_seed);
    }
}

float DistanceLayoutPolicy::radiusForDistance(float distance_m) const {
    float ratio = std::min(1.0f, std::max(0.0f, distance_m / config_.max_distance_m));
    return (std::sqrt(ratio) * 0.5f + 0.3f) * config_.surfaceRadius();
}

float DistanceLayoutPolicy::clampRadius(float radius) const {
    float inner = std::max(config_.center_buffer, 0.0f) + RADIUS_EPSILON;
    float outer = config_.usableRadius();
    if (inner > outer) inner = outer;
    return std::min(outer, std::max(inner, radius));
}

LayoutResult DistanceLayoutPolicy::compute(const std::vector<DiscoveredUser>& users) {
    LayoutResult result;
    result.anchor = config_.anchor();

    std::vector<Candidate> candidates;
    candidates.reserve(users.size());
    for (const auto& user : users) {
        const PlacementAttributes& attrs =
            attributes_->getOrAssign(user.user_id, config_.max_distance_m);
        float distance = user.distance_m ? *user.distance_m : attrs.placeholder_distance_m;
        candidates.push_back(Candidate{&user, distance, attrs.angle_rad});
    }

    // Closer users claim contested space first
    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        if (a.distance_m != b.distance_m) return a.distance_m < b.distance_m;
        return a.user->user_id < b.user->user_id;
    });

    const float min_sep = config_.min_separation;
    const float push = PUSH_FRACTION * min_sep;

    for (const auto& candidate : candidates) {
        const UserId& user_id = candidate.user->user_id;

        // Seeded per user, so the pass is a pure function of its input
        std::mt19937 rng(hashUserId(user_id, config_.angle_seed));
        std::uniform_real_distribution<float> jitter(-ANGLE_JITTER, ANGLE_JITTER);
        std::uniform_real_distribution<float> full_turn(0.0f, TWO_PI);

        float radius = clampRadius(radiusForDistance(candidate.distance_m));
        float angle = candidate.angle_rad;
        Position pos = polarToCartesian(result.anchor, radius, angle);

        int attempt = 0;
        while (collides(pos, result.placed, min_sep) && attempt < config_.max_attempts) {
            attempt++;
            if (attempt <= 10) {
                radius += push;
            } else if (attempt <= 20) {
                angle += jitter(rng);
            } else if (attempt <= 30) {
                radius += push;
                angle += jitter(rng);
            } else {
                angle = full_turn(rng);
                radius = config_.usableRadius();
            }
            radius = clampRadius(radius);
            pos = polarToCartesian(result.anchor, radius, angle);
        }

        if (collides(pos, result.placed, min_sep)) {
            LOG_LAYOUT(WARN, "No free space for user %s after %d attempts, not displayed",
                       user_id.c_str(), attempt);
            result.unplaced.push_back(user_id);
            continue;
        }

        if (attempt > 0) {
            LOG_LAYOUT(DEBUG, "User %s placed after %d corrections", user_id.c_str(), attempt);
        }
        result.placed.push_back(PlacedUser{user_id, pos});
    }

    LOG_LAYOUT(TRACE, "Distance layout: %zu placed, %zu unplaced", result.placed.size(),
               result.unplaced.size());
    return result;
}

} // namespace layout
} // namespace shyradar
