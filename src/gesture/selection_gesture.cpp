#include "selection_gesture.hpp"
#include "shyradar/logging.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace shyradar {
namespace gesture {

const char* gesturePhaseToString(GesturePhase phase) {
    switch (phase) {
        case GesturePhase::Idle:      return "Idle";
        case GesturePhase::Pressed:   return "Pressed";
        case GesturePhase::Dragging:  return "Dragging";
        case GesturePhase::Snapped:   return "Snapped";
        case GesturePhase::Unsnapped: return "Unsnapped";
        case GesturePhase::Released:  return "Released";
        default:                      return "Unknown";
    }
}

const char* gestureOutcomeToString(GestureOutcome outcome) {
    switch (outcome) {
        case GestureOutcome::None:      return "None";
        case GestureOutcome::Tapped:    return "Tapped";
        case GestureOutcome::Selected:  return "Selected";
        case GestureOutcome::Cancelled: return "Cancelled";
        default:                        return "Unknown";
    }
}

void GestureConfig::validate() const {
    if (anchor_radius < 0.0f || bubble_radius < 0.0f || anchor_radius + bubble_radius <= 0.0f) {
        throw std::invalid_argument("anchor and bubble radii must be positive");
    }
    if (!(snap_multiplier > 0.0f) || !(detection_multiplier > 0.0f)) {
        throw std::invalid_argument("snap and detection multipliers must be positive");
    }
    if (magnetic_pull < 0.0f) {
        throw std::invalid_argument("magnetic_pull must not be negative");
    }
}

SelectionGesture::SelectionGesture(Position anchor, const GestureConfig& config)
    : anchor_(anchor), config_(config) {
    config_.validate();
}

bool SelectionGesture::begin(const UserId& user_id, Position bubble_position, Position pointer,
                             Timestamp at) {
    if (drag_) {
        return false;
    }

    DragState state;
    state.user_id = user_id;
    state.start_position = bubble_position;
    drag_ = state;

    press_pointer_ = pointer;
    pressed_at_ = at;
    phase_ = GesturePhase::Pressed;
    LOG_GESTURE(DEBUG, "Press on %s at (%.1f, %.1f)", user_id.c_str(), pointer.x, pointer.y);
    return true;
}

void SelectionGesture::move(Position pointer, Timestamp at) {
    if (!drag_) {
        return;
    }

    if (phase_ == GesturePhase::Pressed) {
        // Moves during the delay are not tracked
        if (at - pressed_at_ < Milliseconds(config_.drag_delay_ms)) {
            return;
        }
        phase_ = GesturePhase::Dragging;
        LOG_GESTURE(DEBUG, "Drag started on %s", drag_->user_id.c_str());
    }

    drag_->current_offset = Position{pointer.x - press_pointer_.x, pointer.y - press_pointer_.y};
    updateSnap(pointer);
}

void SelectionGesture::updateSnap(Position pointer) {
    bool inside = isInSnapZone(pointer);
    if (inside && !drag_->is_snapped) {
        LOG_GESTURE(DEBUG, "%s snapped (%.1f from anchor)", drag_->user_id.c_str(),
                    distanceToAnchor(pointer));
    } else if (!inside && drag_->is_snapped) {
        LOG_GESTURE(DEBUG, "%s unsnapped", drag_->user_id.c_str());
    }
    drag_->is_snapped = inside;
    phase_ = inside ? GesturePhase::Snapped : GesturePhase::Unsnapped;
}

GestureOutcome SelectionGesture::release(Position pointer, Timestamp at,
                                         const std::optional<std::string>& first_message) {
    if (!drag_) {
        return GestureOutcome::None;
    }

    const UserId user_id = drag_->user_id;
    bool within_delay = (at - pressed_at_) < Milliseconds(config_.drag_delay_ms);
    float distance = distanceToAnchor(pointer);

    GestureOutcome outcome;
    if (within_delay) {
        outcome = GestureOutcome::Tapped;
    } else if (distance < config_.dropThreshold()) {
        outcome = GestureOutcome::Selected;
    } else {
        outcome = GestureOutcome::Cancelled;
    }

    LOG_GESTURE(INFO, "Release on %s: %s (%.1f from anchor, threshold %.1f)", user_id.c_str(),
                gestureOutcomeToString(outcome), distance, config_.dropThreshold());

    finish(outcome);

    if (outcome == GestureOutcome::Tapped && on_tap_) {
        on_tap_(user_id);
    } else if (outcome == GestureOutcome::Selected && on_conversation_) {
        on_conversation_(ConversationRequest{user_id, normalizeFirstMessage(first_message)});
    }
    return outcome;
}

void SelectionGesture::cancel() {
    if (!drag_) {
        return;
    }
    LOG_GESTURE(DEBUG, "Gesture on %s cancelled", drag_->user_id.c_str());
    finish(GestureOutcome::Cancelled);
}

void SelectionGesture::finish(GestureOutcome outcome) {
    last_user_ = drag_->user_id;
    last_outcome_ = outcome;
    drag_.reset();
    phase_ = GesturePhase::Released;
}

Position SelectionGesture::visualPosition() const {
    if (!drag_) {
        return anchor_;
    }

    Position pos{drag_->start_position.x + drag_->current_offset.x,
                 drag_->start_position.y + drag_->current_offset.y};
    if (!drag_->is_snapped) {
        return pos;
    }

    // Pull toward the anchor, never past it
    float dx = anchor_.x - pos.x;
    float dy = anchor_.y - pos.y;
    float remaining = std::sqrt(dx * dx + dy * dy);
    if (remaining <= 0.0f) {
        return pos;
    }
    float pull = std::min(config_.magnetic_pull * config_.snapZoneRadius(), remaining);
    return Position{pos.x + dx / remaining * pull, pos.y + dy / remaining * pull};
}

bool SelectionGesture::isInSnapZone(Position pointer) const {
    return distanceToAnchor(pointer) < config_.snapZoneRadius();
}

bool SelectionGesture::isWithinDropThreshold(Position pointer) const {
    return distanceToAnchor(pointer) < config_.dropThreshold();
}

} // namespace gesture
} // namespace shyradar
