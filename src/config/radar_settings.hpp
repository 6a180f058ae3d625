#pragma once

#include "discovery/discovery_session.hpp"
#include "engine/proximity_engine.hpp"
#include "gesture/selection_gesture.hpp"
#include "identity/identity_resolver.hpp"
#include "layout/layout_policy.hpp"
#include <string>

namespace shyradar {
namespace config {

// Settings that persist across sessions
struct RadarSettings {
    // Save/load to file. load() keeps defaults for missing or invalid keys.
    bool save(const std::string& path = "") const;
    bool load(const std::string& path = "");

    // SHYRADAR_CONFIG overrides, otherwise ~/.config/shyradar/settings.ini
    static std::string getDefaultPath();

    // Station
    std::string user_id;
    std::string device_id;
    std::string display_name;

    discovery::DiscoveryConfig discovery;
    identity::ResolverConfig resolver;
    layout::LayoutConfig layout;
    LayoutPolicyType policy = LayoutPolicyType::FIXED_SLOT;
    gesture::GestureConfig gesture;

    // Number of values rejected by the last load()
    int rejected_values = 0;

    // Station identity and the shared advertise prefix are copied into the
    // discovery and resolver configs
    engine::EngineConfig toEngineConfig() const;
};

} // namespace config
} // namespace shyradar
