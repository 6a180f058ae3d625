// test_proximity_engine.cpp - End-to-end test of the discovery-to-selection pipeline
//
// Tests:
// 1. Sightings resolve into a deduplicated roster and a layout
// 2. Positions stay put across scan cycles
// 3. Stale users are pruned
// 4. Drag a displayed user onto the anchor
// 5. Teardown discards lookups still in flight
// 6. Default timing keeps users displayed across a cycle restart

#include "engine/proximity_engine.hpp"
#include "identity/directory.hpp"
#include "radio/simulated_adapter.hpp"
#include "shyradar/logging.hpp"
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <string>

using namespace shyradar;
using namespace shyradar::engine;

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

static UserRecord makeUser(const std::string& id, const std::string& token, const std::string& name) {
    UserRecord r;
    r.user_id = id;
    r.token = token;
    r.display_name = name;
    return r;
}

// Directory whose lookups block until released
class GatedDirectory : public identity::Directory {
public:
    explicit GatedDirectory(identity::InMemoryDirectory& inner) : inner_(inner) {}

    std::optional<UserRecord> findByToken(const std::string& token) override {
        std::unique_lock<std::mutex> lock(mutex_);
        entered_++;
        cv_.notify_all();
        cv_.wait(lock, [this] { return open_; });
        lock.unlock();
        return inner_.findByToken(token);
    }

    std::vector<UserRecord> listAll() override { return inner_.listAll(); }

    bool waitEntered(int count) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::seconds(2), [&] { return entered_ >= count; });
    }

    void open() {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = true;
        cv_.notify_all();
    }

private:
    identity::InMemoryDirectory& inner_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
    int entered_ = 0;
};

static EngineConfig makeConfig(LayoutPolicyType policy) {
    EngineConfig config;
    config.discovery.local_user_id = "me";
    config.discovery.local_device_id = "DEV-ME";
    config.discovery.cycle_duration_ms = 1000;
    config.discovery.restart_cooldown_ms = 100;
    config.policy = policy;
    return config;
}

// Let the pool finish, then run one tick on the caller's thread
static bool settle(ProximityEngine& engine, Timestamp now) {
    bool idle = engine.resolverPool().waitIdle(std::chrono::milliseconds(2000));
    engine.tick(10, now);
    return idle;
}

int main() {
    setLogLevel(LogLevel::NONE);
    std::cout << "=== Proximity Engine Test ===\n\n";

    identity::InMemoryDirectory directory;
    directory.add(makeUser("u1", "alice@app", "Alice"));
    directory.add(makeUser("u2", "bob@app", "Bob"));
    directory.add(makeUser("u3", "carol@app", "Carol"));

    // ========================================================================
    // TEST 1: Pipeline
    // ========================================================================
    std::cout << "TEST 1: Sightings to roster and layout\n";
    {
        radio::SimulatedRadioAdapter radio;
        ProximityEngine engine(radio, directory, makeConfig(LayoutPolicyType::FIXED_SLOT));

        int observed = 0;
        engine.setSightingObserver([&](const Sighting&) { observed++; });

        check(engine.start(), "engine started");
        check(engine.session().getState() == discovery::DiscoveryState::Scanning, "scanning");
        check(radio.isAdvertising() && radio.lastAdvertisement()->local_name == "ShyText_me",
              "advertising the local user");

        radio.injectSighting("A", "ShyText_alice", -40);
        radio.injectSighting("A", "ShyText_alice", -40);
        radio.injectSighting("B", "ShyText_bob", -60);
        radio.injectSighting("DEV-ME", "ShyText_me", -10);
        radio.injectSighting("C", "Headphones", -70);

        check(observed == 3, "duplicate and self sightings never reach the engine");
        check(settle(engine, Clock::now()), "resolutions finished");

        EngineStats stats = engine.getStats();
        check(stats.sightings_submitted == 3, "three lookups submitted");
        check(stats.resolved == 2 && stats.not_found == 1, "two resolved, one foreign device");
        check(engine.roster().size() == 2, "roster holds alice and bob");
        check(engine.layout().placed.size() == 2, "both displayed");
        check(engine.layout().isPlaced("u1") && engine.layout().isPlaced("u2"), "u1 and u2 placed");

        engine.stop();
        check(!radio.isScanning() && !radio.isAdvertising(), "stop halts scan and advertisement");
        check(engine.roster().size() == 2, "users kept after stop");
    }

    // ========================================================================
    // TEST 2: Stable positions
    // ========================================================================
    std::cout << "\nTEST 2: Positions across cycles\n";
    {
        radio::SimulatedRadioAdapter radio;
        ProximityEngine engine(radio, directory, makeConfig(LayoutPolicyType::DISTANCE));
        engine.start();

        radio.injectSighting("A", "ShyText_alice", -40);
        radio.injectSighting("B", "ShyText_bob", -55);
        settle(engine, Clock::now());
        std::optional<Position> before = engine.layout().positionOf("u1");
        check(before.has_value(), "u1 displayed");

        // End the cycle and wait out the cooldown
        engine.tick(1000, Clock::now());
        check(engine.session().getState() == discovery::DiscoveryState::RestartingCycle, "cycle ended");
        engine.tick(100, Clock::now());
        check(engine.session().getState() == discovery::DiscoveryState::Scanning, "next cycle scanning");

        check(radio.injectSighting("A", "ShyText_alice", -41), "A seen again in the new cycle");
        settle(engine, Clock::now());
        check(engine.getStats().sightings_submitted == 3, "repeat sighting submitted");
        check(engine.roster().size() == 2, "still one entry per user");
        check(engine.layout().positionOf("u1") == before, "u1 did not move");

        engine.setLayoutPolicy(LayoutPolicyType::FIXED_SLOT);
        check(engine.layoutPolicy() == LayoutPolicyType::FIXED_SLOT, "policy switched");
        check(engine.layout().isPlaced("u1"), "switch relaid out immediately");
        engine.setLayoutPolicy(LayoutPolicyType::DISTANCE);
        check(engine.layout().positionOf("u1") == before, "angle kept across the switch");

        // 10 cm maps inside the center buffer, so u1 sits on the buffer edge
        check(engine.setUserDistance("u1", 0.1f), "ranging distance applied");
        engine.tick(10, Clock::now());
        std::optional<Position> close = engine.layout().positionOf("u1");
        const Position anchor = engine.layout().anchor;
        check(close && std::fabs(distanceBetween(*close, anchor) - 100.0f) < 0.1f,
              "closest user clamped to the center buffer");

        engine.setUserDistance("u1", 10.0f);
        engine.tick(10, Clock::now());
        check(engine.layout().positionOf("u1") != close, "distance moves the bubble");
        check(!engine.setUserDistance("nobody", 1.0f), "unknown user rejected");
    }

    // ========================================================================
    // TEST 3: Pruning
    // ========================================================================
    std::cout << "\nTEST 3: Stale users pruned\n";
    {
        radio::SimulatedRadioAdapter radio;
        ProximityEngine engine(radio, directory, makeConfig(LayoutPolicyType::FIXED_SLOT));
        engine.start();

        radio.injectSighting("A", "ShyText_alice", -40);
        settle(engine, Clock::now());
        check(engine.roster().size() == 1, "alice present");

        engine.tick(10, Clock::now() + std::chrono::seconds(10));
        check(engine.roster().size() == 1, "alice kept inside the window");

        engine.tick(10, Clock::now() + std::chrono::seconds(31));
        check(engine.roster().size() == 1, "alice kept through a full cycle");

        engine.tick(10, Clock::now() + std::chrono::seconds(61));
        check(engine.roster().empty(), "alice pruned after 60 s");
        check(engine.layout().placed.empty(), "layout emptied");
        check(engine.getStats().users_pruned == 1, "prune counted");
    }

    // ========================================================================
    // TEST 4: Selection
    // ========================================================================
    std::cout << "\nTEST 4: Drag onto the anchor\n";
    {
        radio::SimulatedRadioAdapter radio;
        ProximityEngine engine(radio, directory, makeConfig(LayoutPolicyType::FIXED_SLOT));
        engine.start();

        int conversations = 0;
        UserId opened;
        engine.setConversationHandler([&](const gesture::ConversationRequest& req) {
            conversations++;
            opened = req.user_id;
        });

        radio.injectSighting("C", "ShyText_carol", -45);
        settle(engine, Clock::now());

        std::optional<Position> bubble = engine.layout().positionOf("u3");
        check(bubble.has_value(), "carol displayed");
        check(!engine.beginDrag("u1", Position{0.0f, 0.0f}, Clock::now()), "undisplayed user not draggable");

        Timestamp t0 = Clock::now();
        Position anchor = engine.layout().anchor;
        check(engine.beginDrag("u3", *bubble, t0), "drag started on carol");
        engine.selection().move(anchor, t0 + Milliseconds(80));
        gesture::GestureOutcome outcome = engine.selection().release(anchor, t0 + Milliseconds(100));
        check(outcome == gesture::GestureOutcome::Selected, "dropped on anchor selects");
        check(conversations == 1 && opened == "u3", "conversation opened with carol");
        check(engine.layout().positionOf("u3") == bubble, "layout position unchanged by the drag");
    }

    // ========================================================================
    // TEST 5: Teardown
    // ========================================================================
    std::cout << "\nTEST 5: Teardown discards late results\n";
    {
        GatedDirectory gated(directory);
        radio::SimulatedRadioAdapter radio;
        ProximityEngine engine(radio, gated, makeConfig(LayoutPolicyType::FIXED_SLOT));
        engine.start();

        radio.injectSighting("B", "ShyText_bob", -50);
        check(gated.waitEntered(1), "bob lookup in flight");

        engine.teardown();
        check(engine.session().getState() == discovery::DiscoveryState::Idle, "session idle");
        check(!radio.isScanning(), "scan stopped");
        check(!radio.injectSighting("A", "ShyText_alice", -40), "no scan to deliver into");

        gated.open();
        check(settle(engine, Clock::now()), "in-flight lookup finished");
        check(engine.roster().empty(), "late result not applied");
        check(engine.getStats().resolved == 0, "nothing counted as resolved");
        check(engine.resolverPool().staleDropped() == 1, "stale result dropped");
    }

    // ========================================================================
    // TEST 6: Default timing
    // ========================================================================
    std::cout << "\nTEST 6: Default cycle timing\n";
    {
        EngineConfig config;
        config.discovery.local_user_id = "me";
        config.discovery.local_device_id = "DEV-ME";
        check(config.discovery.staleness_window_ms >
                  config.discovery.cycle_duration_ms + config.discovery.restart_cooldown_ms,
              "default window outlasts cycle plus cooldown");

        radio::SimulatedRadioAdapter radio;
        ProximityEngine engine(radio, directory, config);
        engine.start();

        const Timestamp t0 = Clock::now();
        radio.injectSighting(Sighting{"A", "ShyText_alice", -40, t0});
        settle(engine, t0);
        std::optional<Position> first = engine.layout().positionOf("u1");
        check(first.has_value(), "u1 displayed");

        // 60 fps frames through the cycle end and the cooldown
        bool always_placed = true;
        bool restarted = false;
        uint32_t ms = 0;
        while (ms < 31200) {
            ms += 16;
            engine.tick(16, t0 + Milliseconds(ms));
            if (engine.session().getState() == discovery::DiscoveryState::RestartingCycle) {
                restarted = true;
            }
            if (engine.layout().positionOf("u1") != first) {
                always_placed = false;
            }
        }
        check(restarted, "cycle restarted");
        check(always_placed, "u1 stayed in place through the restart");
        check(engine.session().getState() == discovery::DiscoveryState::Scanning, "second cycle scanning");
        check(engine.getStats().users_pruned == 0, "nobody pruned");

        const Timestamp t1 = t0 + Milliseconds(ms);
        check(radio.injectSighting(Sighting{"A", "ShyText_alice", -42, t1}), "A seen in the second cycle");
        settle(engine, t1);
        check(engine.roster().size() == 1, "still one entry for u1");
        check(engine.layout().positionOf("u1") == first, "same position in the second cycle");

        engine.tick(10, t1 + Milliseconds(59000));
        check(engine.roster().size() == 1, "window counts from the newest sighting");
        engine.tick(10, t1 + Milliseconds(61000));
        check(engine.roster().empty(), "pruned once the window passes");
    }

    // ========================================================================
    // Summary
    // ========================================================================
    std::cout << "\n========================================\n";
    std::cout << "RESULTS: " << pass << " passed, " << fail << " failed\n";
    std::cout << "========================================\n";

    if (fail == 0) {
        std::cout << "\n[SUCCESS] All proximity engine tests passed!\n";
        return 0;
    } else {
        std::cout << "\n[FAILURE] Some tests failed.\n";
        return 1;
    }
}
