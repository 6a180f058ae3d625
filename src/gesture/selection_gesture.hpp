#pragma once

#include "conversation.hpp"
#include "shyradar/types.hpp"
#include <functional>
#include <optional>

namespace shyradar {
namespace gesture {

struct GestureConfig {
    float anchor_radius = 45.0f;
    float bubble_radius = 30.0f;
    float snap_multiplier = 1.2f;
    float magnetic_pull = 0.8f;          // Fraction of the snap zone radius
    float detection_multiplier = 2.5f;
    uint32_t drag_delay_ms = 50;         // Press held this long becomes a drag

    float snapZoneRadius() const { return (anchor_radius + bubble_radius) * snap_multiplier; }
    float dropThreshold() const { return (anchor_radius + bubble_radius) * detection_multiplier; }

    // Throws std::invalid_argument
    void validate() const;
};

enum class GesturePhase {
    Idle,
    Pressed,     // Waiting out the drag delay
    Dragging,
    Snapped,     // Inside the snap zone
    Unsnapped,   // Left the snap zone, or never entered it
    Released,
};

enum class GestureOutcome {
    None,
    Tapped,      // Show the user's profile
    Selected,    // Dropped on the anchor
    Cancelled,
};

const char* gesturePhaseToString(GesturePhase phase);
const char* gestureOutcomeToString(GestureOutcome outcome);

// Ephemeral per-gesture state; never written back to the layout
struct DragState {
    UserId user_id;
    Position start_position;     // Bubble's layout position at press
    Position current_offset;     // Pointer displacement since press
    bool is_snapped = false;
};

using TapHandler = std::function<void(const UserId&)>;

/**
 * SelectionGesture - Decides whether a bubble drag selects its user
 *
 * Pointer positions are absolute surface coordinates and distances are
 * measured from the pointer to the anchor. Classification on release:
 *   - released before drag_delay_ms              -> Tapped
 *   - distance < dropThreshold()                 -> Selected
 *   - otherwise                                  -> Cancelled
 *
 * A press held past the delay is a drag even if the pointer never moved.
 *
 * Each sample is O(1). One gesture is tracked at a time.
 */
class SelectionGesture {
public:
    explicit SelectionGesture(Position anchor, const GestureConfig& config = GestureConfig{});

    void setConversationHandler(ConversationHandler handler) { on_conversation_ = std::move(handler); }
    void setTapHandler(TapHandler handler) { on_tap_ = std::move(handler); }

    // Returns false if a gesture is already active
    bool begin(const UserId& user_id, Position bubble_position, Position pointer, Timestamp at);

    void move(Position pointer, Timestamp at);

    GestureOutcome release(Position pointer, Timestamp at,
                           const std::optional<std::string>& first_message = std::nullopt);

    // Abandon the active gesture
    void cancel();

    // ========================================================================
    // STATE
    // ========================================================================

    GesturePhase phase() const { return phase_; }
    bool isActive() const { return drag_.has_value(); }
    std::optional<DragState> dragState() const { return drag_; }

    // Where the bubble is drawn: layout position + offset + magnetic pull
    Position visualPosition() const;

    GestureOutcome lastOutcome() const { return last_outcome_; }
    const UserId& lastUser() const { return last_user_; }

    // ========================================================================
    // GEOMETRY
    // ========================================================================

    float distanceToAnchor(Position pointer) const { return distanceBetween(pointer, anchor_); }
    bool isInSnapZone(Position pointer) const;
    bool isWithinDropThreshold(Position pointer) const;

    void setAnchor(Position anchor) { anchor_ = anchor; }
    Position anchor() const { return anchor_; }
    const GestureConfig& getConfig() const { return config_; }

private:
    Position anchor_;
    GestureConfig config_;

    GesturePhase phase_ = GesturePhase::Idle;
    std::optional<DragState> drag_;
    Position press_pointer_;
    Timestamp pressed_at_{};

    GestureOutcome last_outcome_ = GestureOutcome::None;
    UserId last_user_;

    ConversationHandler on_conversation_;
    TapHandler on_tap_;

    void updateSnap(Position pointer);
    void finish(GestureOutcome outcome);
};

} // namespace gesture
} // namespace shyradar
