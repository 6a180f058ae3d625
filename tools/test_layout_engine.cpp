// test_layout_engine.cpp - Unit test for radar placement
//
// Tests:
// 1. Distance policy: separation and radial bounds over random user sets
// 2. Distance policy: determinism and persisted angles
// 3. Slot policy: recency order, capacity, cache
// 4. Engine: policy switch keeps attributes, reset forgets them
// 5. Config validation

#include "layout/distance_layout.hpp"
#include "layout/layout_engine.hpp"
#include "layout/slot_layout.hpp"
#include "shyradar/logging.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>

using namespace shyradar;
using namespace shyradar::layout;

static int pass = 0, fail = 0;

static void check(bool ok, const std::string& what) {
    if (ok) {
        std::cout << "  [PASS] " << what << "\n";
        pass++;
    } else {
        std::cout << "  [FAIL] " << what << "\n";
        fail++;
    }
}

static std::vector<DiscoveredUser> makeUsers(int count, Timestamp base) {
    std::vector<DiscoveredUser> users;
    for (int i = 0; i < count; i++) {
        DiscoveredUser u;
        u.user_id = "u" + std::to_string(i);
        u.display_name = "User " + std::to_string(i);
        u.last_seen_at = base + Milliseconds(i * 10);   // Higher index = more recent
        users.push_back(u);
    }
    return users;
}

// Every placed pair respects min_separation; every position lies inside the
// annulus [center_buffer, usable radius]
static bool layoutValid(const LayoutResult& result, const LayoutConfig& config) {
    const float tol = 1e-2f;
    for (size_t i = 0; i < result.placed.size(); i++) {
        float r = distanceBetween(result.placed[i].position, result.anchor);
        if (r < config.center_buffer - tol || r > config.usableRadius() + tol) {
            return false;
        }
        for (size_t j = i + 1; j < result.placed.size(); j++) {
            if (distanceBetween(result.placed[i].position, result.placed[j].position) <
                config.min_separation - tol) {
                return false;
            }
        }
    }
    return true;
}

int main() {
    setLogLevel(LogLevel::NONE);
    std::cout << "=== Layout Engine Unit Test ===\n\n";

    const Timestamp t0 = Clock::now();

    // ========================================================================
    // TEST 1: Invariants over random sets
    // ========================================================================
    std::cout << "TEST 1: Distance policy separation and bounds\n";
    {
        LayoutConfig config;
        std::mt19937 rng(1234);
        std::uniform_int_distribution<int> count_dist(1, 15);
        std::uniform_real_distribution<float> dist_m(0.0f, 15.0f);

        int valid = 0, accounted = 0;
        const int rounds = 50;
        for (int round = 0; round < rounds; round++) {
            LayoutConfig cfg = config;
            cfg.angle_seed = static_cast<uint32_t>(round);
            DistanceLayoutPolicy policy(cfg, nullptr);

            auto users = makeUsers(count_dist(rng), t0);
            for (auto& u : users) {
                if (rng() % 2) u.distance_m = dist_m(rng);
            }
            LayoutResult result = policy.compute(users);
            if (layoutValid(result, cfg)) valid++;
            if (result.placed.size() + result.unplaced.size() == users.size()) accounted++;
        }
        check(valid == rounds, "no overlap and no bubble inside the center buffer");
        check(accounted == rounds, "every user either placed or unplaced");

        DistanceLayoutPolicy policy(config, nullptr);
        check(std::fabs(policy.radiusForDistance(0.0f) - 0.3f * 250.0f) < 1e-3f, "radius at 0 m");
        check(std::fabs(policy.radiusForDistance(10.0f) - 0.8f * 250.0f) < 1e-3f, "radius at max distance");
        check(std::fabs(policy.radiusForDistance(50.0f) - 0.8f * 250.0f) < 1e-3f, "radius capped past max");
    }

    // ========================================================================
    // TEST 2: Determinism
    // ========================================================================
    std::cout << "\nTEST 2: Distance policy determinism\n";
    {
        LayoutConfig config;
        LayoutEngine engine(LayoutPolicyType::DISTANCE, config);
        auto users = makeUsers(4, t0);
        users[0].distance_m = 1.0f;

        LayoutResult first = engine.compute(users);
        LayoutResult second = engine.compute(users);
        bool same = first.placed.size() == second.placed.size();
        for (size_t i = 0; same && i < first.placed.size(); i++) {
            same = first.placed[i].user_id == second.placed[i].user_id &&
                   first.placed[i].position == second.placed[i].position;
        }
        check(same, "same input gives the same positions");

        auto u0_angle = engine.attributes().find("u0");
        check(u0_angle.has_value(), "angle persisted for u0");

        std::vector<DiscoveredUser> reversed(users.rbegin(), users.rend());
        LayoutResult third = engine.compute(reversed);
        check(third.positionOf("u0") == first.positionOf("u0"), "input order does not matter");
        check(engine.attributes().find("u0")->angle_rad == u0_angle->angle_rad, "angle unchanged");

        const PlacementAttributes* placeholder = nullptr;
        PlacementAttributeStore store(7);
        placeholder = &store.getOrAssign("x", 10.0f);
        check(placeholder->placeholder_distance_m >= 2.5f && placeholder->placeholder_distance_m <= 10.0f,
              "placeholder distance within [0.25, 1] x max");
    }

    // ========================================================================
    // TEST 3: Slots
    // ========================================================================
    std::cout << "\nTEST 3: Slot policy\n";
    {
        LayoutConfig config;
        FixedSlotLayoutPolicy policy(config);
        check(policy.slots().size() == 10, "10 slots");
        check(std::fabs(policy.slots()[0].x - 250.0f) < 1e-3f &&
                  std::fabs(policy.slots()[0].y - (250.0f - 175.0f)) < 1e-3f,
              "slot 0 at the top");
        check(policy.slots()[1].x > policy.slots()[0].x, "slots proceed clockwise");

        // Every pair of slots, not just neighbours, keeps min_separation
        float closest = config.surface_diameter;
        const auto& slots = policy.slots();
        for (size_t i = 0; i < slots.size(); i++) {
            for (size_t j = i + 1; j < slots.size(); j++) {
                closest = std::min(closest, distanceBetween(slots[i], slots[j]));
            }
        }
        check(closest >= config.min_separation, "slots at least min_separation apart");
        check(std::fabs(closest - config.slotSpacing()) < 1e-2f, "neighbours are the closest pair");
        check(config.slotRadius() >= config.center_buffer &&
                  config.slotRadius() <= config.usableRadius(),
              "slot circle between the center buffer and the usable radius");

        auto users = makeUsers(15, t0);
        LayoutResult result = policy.compute(users);
        check(result.placed.size() == 10 && result.unplaced.size() == 5, "10 placed, 5 waiting");
        check(result.placed[0].user_id == "u14" && result.placed[9].user_id == "u5",
              "most recent users take the first slots");
        check(result.positionOf("u14") == policy.slots()[0], "u14 in slot 0");
        check(!result.isPlaced("u0"), "oldest user not displayed");

        policy.compute(users);
        check(policy.cacheHits() == 1, "unchanged order served from cache");

        users[0].last_seen_at = t0 + Milliseconds(1000);
        LayoutResult moved = policy.compute(users);
        check(policy.cacheHits() == 1, "order change recomputes");
        check(moved.positionOf("u0") == policy.slots()[0], "refreshed u0 moves to slot 0");
        check(!moved.isPlaced("u5"), "u5 drops out");
    }

    // ========================================================================
    // TEST 4: Engine policy switch
    // ========================================================================
    std::cout << "\nTEST 4: Policy switch and reset\n";
    {
        LayoutConfig config;
        LayoutEngine engine(LayoutPolicyType::DISTANCE, config);
        auto users = makeUsers(3, t0);
        engine.compute(users);
        float angle = engine.attributes().find("u1")->angle_rad;

        engine.setPolicy(LayoutPolicyType::FIXED_SLOT);
        check(engine.policyType() == LayoutPolicyType::FIXED_SLOT, "switched to slots");
        check(engine.lastResult().placed.empty(), "cached result dropped on switch");
        engine.compute(users);
        check(engine.positionOf("u2").has_value(), "slots placed users");

        engine.setPolicy(LayoutPolicyType::DISTANCE);
        engine.compute(users);
        check(engine.attributes().find("u1")->angle_rad == angle, "angle survived the round trip");

        engine.reset();
        check(engine.attributes().size() == 0 && !engine.positionOf("u1"), "reset forgets everything");
        check(LayoutPolicyFactory::getAvailablePolicies().size() == 2, "two policies available");
    }

    // ========================================================================
    // TEST 5: Validation
    // ========================================================================
    std::cout << "\nTEST 5: Config validation\n";
    {
        LayoutConfig bad;
        bad.center_buffer = 250.0f;
        bool threw = false;
        try {
            LayoutEngine engine(LayoutPolicyType::DISTANCE, bad);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        check(threw, "center buffer beyond usable radius rejected");

        LayoutConfig zero;
        zero.max_slots = 0;
        threw = false;
        try {
            zero.validate();
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        check(threw, "zero slots rejected");

        LayoutConfig crowded;
        crowded.max_slots = 20;
        threw = false;
        try {
            FixedSlotLayoutPolicy policy(crowded);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        check(threw, "slots closer than min_separation rejected");

        LayoutConfig buried;
        buried.center_buffer = 180.0f;
        threw = false;
        try {
            buried.validate();
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        check(threw, "slot circle inside the center buffer rejected");

        LayoutConfig small;
        small.surface_diameter = 360.0f;
        threw = false;
        try {
            small.validate();
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        check(threw, "360 surface with 10 slots rejected");

        threw = false;
        try {
            LayoutConfig().validate();
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        check(!threw, "defaults valid");
    }

    // ========================================================================
    // Summary
    // ========================================================================
    std::cout << "\n========================================\n";
    std::cout << "RESULTS: " << pass << " passed, " << fail << " failed\n";
    std::cout << "========================================\n";

    if (fail == 0) {
        std::cout << "\n[SUCCESS] All layout engine tests passed!\n";
        return 0;
    } else {
        std::cout << "\n[FAILURE] Some tests failed.\n";
        return 1;
    }
}
