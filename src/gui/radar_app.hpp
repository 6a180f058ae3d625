#pragma once

#include "config/radar_settings.hpp"
#include "engine/proximity_engine.hpp"
#include "identity/directory.hpp"
#include "radio/simulated_adapter.hpp"
#include "sim/scenario_player.hpp"

#include "imgui.h"

#include <deque>
#include <memory>
#include <mutex>
#include <string>

namespace shyradar {
namespace gui {

class RadarApp {
public:
    struct Options {
        std::string config_path;      // -c: settings file
        std::string directory_path;   // -d: [User] sections
        std::string scenario_path;    // -s: started with the engine
    };

    explicit RadarApp(const Options& opts);
    ~RadarApp();

    void render();

private:
    Options options_;
    config::RadarSettings settings_;

    radio::SimulatedRadioAdapter radio_;
    identity::InMemoryDirectory directory_;
    std::unique_ptr<sim::ScenarioPlayer> player_;
    std::unique_ptr<engine::ProximityEngine> engine_;

    uint32_t last_tick_time_ = 0;

    // Surface to screen mapping of the current frame
    ImVec2 canvas_origin_{0.0f, 0.0f};
    float canvas_scale_ = 1.0f;

    // Manual sighting injection
    char inject_device_[64] = "AA:BB:CC:00:00:01";
    char inject_name_[64] = "ShyText_";
    int inject_rssi_ = -55;

    char first_message_[256] = "";

    std::deque<std::string> event_log_;
    std::mutex event_log_mutex_;
    static const size_t MAX_EVENT_LOG = 40;

    void appendEvent(const std::string& line);

    void renderRadar();
    void renderControls();
    void renderEventLog();

    void handlePointer(Position pointer);
    void sightDirectoryUsers();
    void restartScenario();

    Position toSurface(ImVec2 screen) const;
    ImVec2 toScreen(Position surface) const;
};

} // namespace gui
} // namespace shyradar
