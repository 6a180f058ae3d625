#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace shyradar {

// Core types
using Clock = std::chrono::steady_clock;
using Timestamp = Clock::time_point;
using Milliseconds = std::chrono::milliseconds;
using UserId = std::string;                    // Opaque identity key from the directory
using DeviceId = std::string;                  // Radio-layer address, stable for one scan session

// One radio detection event
struct Sighting {
    DeviceId device_id;
    std::string advertised_name;   // Raw broadcast string, may be empty
    int signal_strength = 0;       // Adapter-defined sign convention, only ever compared
    Timestamp observed_at{};
};

// Directory entry for an application user
struct UserRecord {
    UserId user_id;
    std::string token;             // Canonical broadcast token (e.g. "alice@app")
    std::string display_name;
    std::optional<std::string> photo_ref;
    bool is_verified = false;
    std::string status;            // Free-form presence line ("Open to chat")
};

// Resolved, displayable entity
struct DiscoveredUser {
    UserId user_id;
    std::string display_name;
    std::optional<std::string> photo_ref;
    bool is_verified = false;
    std::string status;
    Timestamp last_seen_at{};
    DeviceId last_device_id;            // Device that produced the most recent sighting
    std::optional<float> distance_m;    // From an external ranging/location source, if any

    // Uppercase first letter of the display name, for the placeholder bubble
    char displayInitial() const;

    // Photo refs are shown only for inline images or absolute http(s) URLs
    bool hasDisplayablePhoto() const;
};

// Point on the layout surface [0, S] x [0, S]
struct Position {
    float x = 0.0f;
    float y = 0.0f;

    bool operator==(const Position& other) const {
        return x == other.x && y == other.y;
    }
    bool operator!=(const Position& other) const { return !(*this == other); }
};

inline float distanceBetween(const Position& a, const Position& b) {
    float dx = a.x - b.x;
    float dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

// Polar offset around a centre. Angle 0 points right, positive angles turn clockwise
// on a y-down screen.
inline Position polarToCartesian(const Position& center, float radius, float angle_rad) {
    return Position{center.x + radius * std::cos(angle_rad),
                    center.y + radius * std::sin(angle_rad)};
}

// Placement policies for the radar surface
enum class LayoutPolicyType : uint8_t {
    DISTANCE = 0,   // Continuous radar, radius from distance, collision avoidance
    FIXED_SLOT = 1, // Discrete radar, recency-ranked fixed slots
};

inline const char* layoutPolicyToString(LayoutPolicyType type) {
    switch (type) {
        case LayoutPolicyType::DISTANCE:   return "distance";
        case LayoutPolicyType::FIXED_SLOT: return "slots";
        default: return "unknown";
    }
}

// Accepts "distance"/"continuous" and "slots"/"slot"/"fixed"; anything else is nullopt
std::optional<LayoutPolicyType> stringToLayoutPolicy(const std::string& str);

// Trim ASCII whitespace from both ends
std::string trimCopy(const std::string& str);

// ASCII lowercase copy
std::string toLowerCopy(const std::string& str);

} // namespace shyradar
