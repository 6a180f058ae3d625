// test_selection_gesture.cpp - Unit test for drag-to-anchor selection
//
// Tests:
// 1. Drop threshold boundary
// 2. Tap and drag-delay classification
// 3. Snap zone and magnetic pull
// 4. Handlers and first message
// 5. Profile composer rule

#include "gesture/conversation.hpp"
#include "gesture/selection_gesture.hpp"
#include "shyradar/logging.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace shyradar;
using namespace shyradar::gesture;

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

static bool near(Position a, Position b) {
    return std::fabs(a.x - b.x) < 1e-3f && std::fabs(a.y - b.y) < 1e-3f;
}

int main() {
    setLogLevel(LogLevel::NONE);
    std::cout << "=== Selection Gesture Unit Test ===\n\n";

    const Position anchor{180.0f, 180.0f};
    const Position bubble{300.0f, 180.0f};
    const Position far_bubble{420.0f, 180.0f};   // Beyond the drop threshold
    const Timestamp t0 = Clock::now();
    auto at = [t0](int ms) { return t0 + Milliseconds(ms); };

    // Drag from the bubble and drop at the given distance right of the anchor
    auto dropAt = [&](SelectionGesture& g, float distance) {
        g.begin("u1", bubble, bubble, at(0));
        g.move(Position{anchor.x + distance, anchor.y}, at(100));
        return g.release(Position{anchor.x + distance, anchor.y}, at(120));
    };

    // ========================================================================
    // TEST 1: Threshold
    // ========================================================================
    std::cout << "TEST 1: Drop threshold\n";
    {
        SelectionGesture gesture(anchor);
        check(std::fabs(gesture.getConfig().dropThreshold() - 187.5f) < 1e-4f, "threshold is 187.5");
        check(std::fabs(gesture.getConfig().snapZoneRadius() - 90.0f) < 1e-4f, "snap zone is 90");

        check(dropAt(gesture, 186.5f) == GestureOutcome::Selected, "drop 1 inside threshold selects");
        check(dropAt(gesture, 188.5f) == GestureOutcome::Cancelled, "drop 1 outside threshold cancels");
        check(dropAt(gesture, 187.5f) == GestureOutcome::Cancelled, "exactly on threshold cancels");
        check(gesture.phase() == GesturePhase::Released && !gesture.isActive(), "gesture finished");
        check(gesture.lastUser() == "u1", "last user recorded");
    }

    // ========================================================================
    // TEST 2: Tap and delay
    // ========================================================================
    std::cout << "\nTEST 2: Tap and drag delay\n";
    {
        SelectionGesture gesture(anchor);

        gesture.begin("u1", bubble, bubble, at(0));
        check(gesture.phase() == GesturePhase::Pressed, "pressed");
        check(!gesture.begin("u2", bubble, bubble, at(1)), "second gesture refused while active");
        check(gesture.release(Position{bubble.x + 1.0f, bubble.y}, at(20)) == GestureOutcome::Tapped,
              "quick release is a tap");

        // Quick flick that ends right on the anchor
        gesture.begin("u1", bubble, bubble, at(0));
        gesture.move(anchor, at(10));
        check(gesture.phase() == GesturePhase::Pressed, "moves inside the delay ignored");
        check(gesture.release(anchor, at(30)) == GestureOutcome::Tapped,
              "release while still waiting is a tap, not a selection");

        // Long press that never moves
        gesture.begin("u1", far_bubble, far_bubble, at(0));
        check(gesture.release(far_bubble, at(300)) == GestureOutcome::Cancelled,
              "long press far from the anchor cancels");

        gesture.begin("u1", anchor, anchor, at(0));
        check(gesture.release(anchor, at(300)) == GestureOutcome::Selected,
              "long press on the anchor selects");

        gesture.begin("u1", far_bubble, far_bubble, at(0));
        check(gesture.release(far_bubble, at(50)) == GestureOutcome::Cancelled,
              "release exactly at the delay is a drag");

        gesture.begin("u1", bubble, bubble, at(0));
        gesture.move(Position{250.0f, 180.0f}, at(60));
        check(gesture.phase() == GesturePhase::Unsnapped, "dragging outside the snap zone");
        gesture.cancel();
        check(gesture.lastOutcome() == GestureOutcome::Cancelled && !gesture.isActive(), "cancel()");
        check(gesture.release(anchor, at(100)) == GestureOutcome::None, "release with no gesture");
    }

    // ========================================================================
    // TEST 3: Snap and pull
    // ========================================================================
    std::cout << "\nTEST 3: Snap zone and magnetic pull\n";
    {
        SelectionGesture gesture(anchor);
        gesture.begin("u1", bubble, bubble, at(0));

        gesture.move(Position{275.0f, 180.0f}, at(60));
        check(gesture.phase() == GesturePhase::Unsnapped, "95 from anchor: not snapped");
        check(near(gesture.visualPosition(), Position{275.0f, 180.0f}), "bubble follows the pointer");

        gesture.move(Position{260.0f, 180.0f}, at(70));
        check(gesture.phase() == GesturePhase::Snapped, "80 from anchor: snapped");
        check(gesture.dragState() && gesture.dragState()->is_snapped, "drag state snapped");
        check(near(gesture.visualPosition(), Position{188.0f, 180.0f}), "pulled 72 toward the anchor");

        gesture.move(Position{200.0f, 180.0f}, at(80));
        check(near(gesture.visualPosition(), anchor), "pull capped at the remaining distance");

        gesture.move(Position{275.0f, 180.0f}, at(90));
        check(gesture.phase() == GesturePhase::Unsnapped, "leaving the zone unsnaps");

        check(gesture.dragState()->start_position == bubble, "layout position untouched");
        gesture.cancel();
    }

    // ========================================================================
    // TEST 4: Handlers
    // ========================================================================
    std::cout << "\nTEST 4: Handlers and first message\n";
    {
        SelectionGesture gesture(anchor);
        int conversations = 0, taps = 0;
        ConversationRequest last;
        UserId tapped;
        gesture.setConversationHandler([&](const ConversationRequest& req) {
            conversations++;
            last = req;
        });
        gesture.setTapHandler([&](const UserId& id) {
            taps++;
            tapped = id;
        });

        gesture.begin("u7", bubble, bubble, at(0));
        gesture.move(Position{190.0f, 180.0f}, at(60));
        gesture.release(Position{190.0f, 180.0f}, at(80), std::string("  hi there  "));
        check(conversations == 1 && last.user_id == "u7", "selection opens a conversation");
        check(last.first_message == std::optional<std::string>("hi there"), "message trimmed");

        gesture.begin("u7", bubble, bubble, at(0));
        gesture.move(Position{190.0f, 180.0f}, at(60));
        gesture.release(Position{190.0f, 180.0f}, at(80), std::string("   "));
        check(conversations == 2 && !last.first_message, "blank message dropped, chat still opens");

        gesture.begin("u8", bubble, bubble, at(0));
        gesture.release(bubble, at(20));
        check(taps == 1 && tapped == "u8" && conversations == 2, "tap shows the profile only");

        check(dropAt(gesture, 300.0f) == GestureOutcome::Cancelled && conversations == 2,
              "cancel opens nothing");

        gesture.begin("u8", far_bubble, far_bubble, at(0));
        gesture.release(far_bubble, at(400));
        check(taps == 1 && conversations == 2, "long press shows no profile");
    }

    // ========================================================================
    // TEST 5: Composer
    // ========================================================================
    std::cout << "\nTEST 5: Profile composer\n";
    {
        auto ok = makeConversationRequest("u1", "  hello ");
        check(ok && ok->user_id == "u1" && ok->first_message == std::optional<std::string>("hello"),
              "non-blank message accepted");
        check(!makeConversationRequest("u1", "   "), "blank message rejected");
        check(!makeConversationRequest(" ", "hello"), "blank user rejected");

        GestureConfig bad;
        bad.magnetic_pull = -1.0f;
        bool threw = false;
        try {
            bad.validate();
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        check(threw, "negative pull rejected");
        check(std::string(gestureOutcomeToString(GestureOutcome::Selected)) == "Selected", "outcome names");
    }

    // ========================================================================
    // Summary
    // ========================================================================
    std::cout << "\n========================================\n";
    std::cout << "RESULTS: " << pass << " passed, " << fail << " failed\n";
    std::cout << "========================================\n";

    if (fail == 0) {
        std::cout << "\n[SUCCESS] All selection gesture tests passed!\n";
        return 0;
    } else {
        std::cout << "\n[FAILURE] Some tests failed.\n";
        return 1;
    }
}
