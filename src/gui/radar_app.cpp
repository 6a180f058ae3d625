#include "radar_app.hpp"
#include "shyradar/logging.hpp"

#include <SDL.h>

#include <algorithm>
#include <cstdio>

namespace shyradar {
namespace gui {

namespace {

radio::SimulatedRadioAdapter::Options radioOptions() {
    radio::SimulatedRadioAdapter::Options options;
    options.requires_power_callbacks = true;
    return options;
}

const ImU32 COLOR_SURFACE   = IM_COL32(30, 34, 44, 255);
const ImU32 COLOR_RING      = IM_COL32(70, 80, 100, 255);
const ImU32 COLOR_BUFFER    = IM_COL32(60, 66, 80, 255);
const ImU32 COLOR_SNAP      = IM_COL32(90, 200, 255, 160);
const ImU32 COLOR_THRESHOLD = IM_COL32(90, 200, 255, 70);
const ImU32 COLOR_ANCHOR    = IM_COL32(90, 200, 255, 255);
const ImU32 COLOR_BUBBLE    = IM_COL32(120, 130, 150, 255);
const ImU32 COLOR_VERIFIED  = IM_COL32(110, 200, 120, 255);
const ImU32 COLOR_DRAGGED   = IM_COL32(255, 200, 90, 255);
const ImU32 COLOR_TEXT      = IM_COL32(240, 240, 240, 255);

} // namespace

RadarApp::RadarApp(const Options& opts)
    : options_(opts), radio_(radioOptions()) {
    if (!settings_.load(options_.config_path)) {
        LOG_ENGINE(INFO, "No settings at %s, using defaults",
                   options_.config_path.empty() ? config::RadarSettings::getDefaultPath().c_str()
                                                : options_.config_path.c_str());
    }
    if (!settings_.user_id.empty()) {
        setLogStationTag(settings_.user_id.c_str());
    }

    if (!options_.directory_path.empty() && !directory_.loadFromFile(options_.directory_path)) {
        appendEvent("Cannot read directory " + options_.directory_path);
    }

    engine_ = std::make_unique<engine::ProximityEngine>(radio_, directory_, settings_.toEngineConfig());
    engine_->setTapHandler([this](const UserId& user_id) {
        std::optional<DiscoveredUser> user = engine_->roster().find(user_id);
        appendEvent("Profile: " + (user ? user->display_name : user_id));
    });
    engine_->setConversationHandler([this](const gesture::ConversationRequest& request) {
        std::string line = "Conversation with " + request.user_id;
        if (request.first_message) {
            line += ": \"" + *request.first_message + "\"";
        }
        appendEvent(line);
    });

    if (!engine_->start()) {
        appendEvent("Scanning unavailable: " + engine_->session().getLastError());
    }

    player_ = std::make_unique<sim::ScenarioPlayer>(radio_);
    if (!options_.scenario_path.empty()) {
        if (player_->loadFile(options_.scenario_path)) {
            player_->start();
        } else {
            appendEvent(player_->getLastError());
        }
    }
}

RadarApp::~RadarApp() {
    // Player first: it feeds the adapter the engine listens to
    player_->stop();
    engine_.reset();
    if (!settings_.save(options_.config_path)) {
        LOG_ENGINE(WARN, "Settings not saved");
    }
}

void RadarApp::appendEvent(const std::string& line) {
    std::lock_guard<std::mutex> lock(event_log_mutex_);
    event_log_.push_back(line);
    while (event_log_.size() > MAX_EVENT_LOG) {
        event_log_.pop_front();
    }
}

Position RadarApp::toSurface(ImVec2 screen) const {
    return Position{(screen.x - canvas_origin_.x) / canvas_scale_,
                    (screen.y - canvas_origin_.y) / canvas_scale_};
}

ImVec2 RadarApp::toScreen(Position surface) const {
    return ImVec2(canvas_origin_.x + surface.x * canvas_scale_,
                  canvas_origin_.y + surface.y * canvas_scale_);
}

void RadarApp::render() {
    uint32_t now_ms = SDL_GetTicks();
    uint32_t elapsed = (last_tick_time_ == 0) ? 0 : (now_ms - last_tick_time_);
    last_tick_time_ = now_ms;
    if (elapsed < 1000) {
        engine_->tick(elapsed, Clock::now());
    }

    ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);

    ImGuiWindowFlags window_flags =
        ImGuiWindowFlags_NoTitleBar |
        ImGuiWindowFlags_NoResize |
        ImGuiWindowFlags_NoMove |
        ImGuiWindowFlags_NoCollapse |
        ImGuiWindowFlags_NoBringToFrontOnFocus;

    ImGui::Begin("MainWindow", nullptr, window_flags);

    ImGui::TextColored(ImVec4(0.4f, 0.8f, 1.0f, 1.0f), "ShyRadar");
    ImGui::SameLine();
    ImGui::TextDisabled("%s", settings_.user_id.empty() ? "(no user id)" : settings_.user_id.c_str());
    ImGui::Separator();

    float total_width = ImGui::GetContentRegionAvail().x;
    float left_width = total_width * 0.60f;

    ImGui::BeginChild("RadarPanel", ImVec2(left_width, 0), true);
    renderRadar();
    ImGui::EndChild();

    ImGui::SameLine();

    ImGui::BeginChild("SidePanel", ImVec2(0, 0), true);
    renderControls();
    ImGui::Separator();
    renderEventLog();
    ImGui::EndChild();

    ImGui::End();
}

void RadarApp::renderRadar() {
    const layout::LayoutConfig& cfg = engine_->layoutEngine().getConfig();
    const gesture::SelectionGesture& selection = engine_->selection();
    const gesture::GestureConfig& gcfg = selection.getConfig();

    ImVec2 avail = ImGui::GetContentRegionAvail();
    float side = std::max(1.0f, std::min(avail.x, avail.y));
    canvas_scale_ = side / cfg.surface_diameter;
    canvas_origin_ = ImGui::GetCursorScreenPos();

    ImGui::InvisibleButton("radar", ImVec2(side, side));
    bool pressed = ImGui::IsItemActivated();
    handlePointer(toSurface(ImGui::GetIO().MousePos));
    if (pressed && !selection.isActive()) {
        Position pointer = toSurface(ImGui::GetIO().MousePos);
        for (const auto& placed : engine_->layout().placed) {
            if (distanceBetween(placed.position, pointer) <= cfg.bubbleRadius()) {
                engine_->beginDrag(placed.user_id, pointer, Clock::now());
                break;
            }
        }
    }

    ImDrawList* draw = ImGui::GetWindowDrawList();
    const Position anchor = selection.anchor();
    const ImVec2 center = toScreen(anchor);
    const float s = canvas_scale_;

    draw->AddCircleFilled(center, cfg.surfaceRadius() * s, COLOR_SURFACE, 96);
    draw->AddCircle(center, cfg.usableRadius() * s, COLOR_RING, 96);
    draw->AddCircle(center, cfg.center_buffer * s, COLOR_BUFFER, 64);
    draw->AddCircle(center, gcfg.dropThreshold() * s, COLOR_THRESHOLD, 64, 1.0f);
    draw->AddCircle(center, gcfg.snapZoneRadius() * s, COLOR_SNAP, 64, 1.5f);
    draw->AddCircleFilled(center, gcfg.anchor_radius * s, COLOR_ANCHOR, 48);

    std::optional<gesture::DragState> drag = selection.dragState();
    for (const auto& placed : engine_->layout().placed) {
        std::optional<DiscoveredUser> user = engine_->roster().find(placed.user_id);
        bool dragged = drag && drag->user_id == placed.user_id;

        Position pos = dragged ? selection.visualPosition() : placed.position;
        ImVec2 at = toScreen(pos);
        ImU32 fill = dragged ? COLOR_DRAGGED
                             : (user && user->is_verified ? COLOR_VERIFIED : COLOR_BUBBLE);
        draw->AddCircleFilled(at, cfg.bubbleRadius() * s, fill, 32);

        char initial[2] = {user ? user->displayInitial() : '?', '\0'};
        ImVec2 text_size = ImGui::CalcTextSize(initial);
        draw->AddText(ImVec2(at.x - text_size.x * 0.5f, at.y - text_size.y * 0.5f), COLOR_TEXT,
                      initial);
        if (user) {
            ImVec2 name_size = ImGui::CalcTextSize(user->display_name.c_str());
            draw->AddText(ImVec2(at.x - name_size.x * 0.5f, at.y + cfg.bubbleRadius() * s + 2.0f),
                          COLOR_TEXT, user->display_name.c_str());
        }
    }

    if (!engine_->layout().unplaced.empty()) {
        char hidden[64];
        std::snprintf(hidden, sizeof(hidden), "+%zu not shown", engine_->layout().unplaced.size());
        draw->AddText(ImVec2(canvas_origin_.x + 4.0f, canvas_origin_.y + 4.0f), COLOR_TEXT, hidden);
    }
}

void RadarApp::handlePointer(Position pointer) {
    gesture::SelectionGesture& selection = engine_->selection();
    if (!selection.isActive()) {
        return;
    }

    Timestamp now = Clock::now();
    if (ImGui::IsMouseDown(ImGuiMouseButton_Left)) {
        selection.move(pointer, now);
        return;
    }

    std::optional<std::string> message;
    if (first_message_[0] != '\0') {
        message = std::string(first_message_);
    }
    gesture::GestureOutcome outcome = selection.release(pointer, now, message);
    if (outcome == gesture::GestureOutcome::Selected) {
        first_message_[0] = '\0';
    }
}

void RadarApp::renderControls() {
    discovery::DiscoverySession& session = engine_->session();
    discovery::DiscoveryStats ds = session.getStats();
    engine::EngineStats es = engine_->getStats();

    ImGui::Text("Discovery: %s", discovery::discoveryStateToString(session.getState()));
    ImGui::Text("Advertising: %s", session.isAdvertising() ? "yes" : "no");
    ImGui::Text("Cycle ends in %.1f s", session.cycleRemainingMs() / 1000.0f);
    ImGui::Text("Sightings %llu raw, %llu emitted, %llu dup, %llu self",
                static_cast<unsigned long long>(ds.raw_sightings),
                static_cast<unsigned long long>(ds.emitted),
                static_cast<unsigned long long>(ds.rejected_duplicate),
                static_cast<unsigned long long>(ds.rejected_self));
    ImGui::Text("Cycles %llu, recoveries %llu, errors %llu",
                static_cast<unsigned long long>(ds.cycles_completed),
                static_cast<unsigned long long>(ds.recoveries),
                static_cast<unsigned long long>(ds.scan_errors));
    ImGui::Text("Resolved %llu, unknown %llu, directory errors %llu",
                static_cast<unsigned long long>(es.resolved),
                static_cast<unsigned long long>(es.not_found),
                static_cast<unsigned long long>(es.directory_unavailable));
    if (session.lastErrorKind() != discovery::DiscoveryError::None) {
        ImGui::TextColored(ImVec4(1.0f, 0.5f, 0.4f, 1.0f), "%s", session.getLastError().c_str());
    }

    ImGui::Separator();
    ImGui::Text("Layout");
    for (LayoutPolicyType type : layout::LayoutPolicyFactory::getAvailablePolicies()) {
        ImGui::SameLine();
        if (ImGui::RadioButton(layoutPolicyToString(type), engine_->layoutPolicy() == type)) {
            engine_->setLayoutPolicy(type);
            settings_.policy = type;
        }
    }
    ImGui::Text("%zu nearby, %zu shown", engine_->roster().size(), engine_->layout().placed.size());
    ImGui::InputText("First message", first_message_, sizeof(first_message_));

    ImGui::Separator();
    ImGui::Text("Simulated radio");
    bool powered = radio_.getPowerState() == radio::PowerState::PoweredOn;
    if (ImGui::Button(powered ? "Power off" : "Power on")) {
        radio_.setPowerState(powered ? radio::PowerState::PoweredOff : radio::PowerState::PoweredOn);
    }
    ImGui::SameLine();
    if (ImGui::Button("Scan error")) {
        if (!radio_.injectScanError("injected")) {
            appendEvent("No active scan");
        }
    }
    ImGui::SameLine();
    if (ImGui::Button(session.getState() == discovery::DiscoveryState::Idle ? "Start" : "Restart")) {
        engine_->teardown();
        if (!engine_->start()) {
            appendEvent("Scanning unavailable: " + session.getLastError());
        }
    }

    ImGui::InputText("Device", inject_device_, sizeof(inject_device_));
    ImGui::InputText("Name", inject_name_, sizeof(inject_name_));
    ImGui::SliderInt("RSSI", &inject_rssi_, -100, -20);
    if (ImGui::Button("Inject sighting")) {
        if (!radio_.injectSighting(inject_device_, inject_name_, inject_rssi_)) {
            appendEvent("No active scan");
        }
    }
    ImGui::SameLine();
    if (ImGui::Button("Sight directory")) {
        sightDirectoryUsers();
    }
    if (!options_.scenario_path.empty()) {
        ImGui::SameLine();
        if (ImGui::Button("Replay scenario")) {
            restartScenario();
        }
    }
}

void RadarApp::renderEventLog() {
    ImGui::Text("Events");
    ImGui::BeginChild("EventLog", ImVec2(0, 0), false);
    std::lock_guard<std::mutex> lock(event_log_mutex_);
    for (const auto& line : event_log_) {
        ImGui::TextUnformatted(line.c_str());
    }
    if (ImGui::GetScrollY() >= ImGui::GetScrollMaxY()) {
        ImGui::SetScrollHereY(1.0f);
    }
    ImGui::EndChild();
}

// One sighting per directory user, advertising the token's local part
void RadarApp::sightDirectoryUsers() {
    const std::string& prefix = settings_.discovery.advertise_prefix;
    int index = 0;
    for (const auto& record : directory_.listAll()) {
        std::string local = record.token.substr(0, record.token.find('@'));
        char device_id[32];
        std::snprintf(device_id, sizeof(device_id), "SIM:%04d", index++);
        if (!radio_.injectSighting(device_id, prefix + local, -50 - index)) {
            appendEvent("No active scan");
            return;
        }
    }
}

void RadarApp::restartScenario() {
    player_->stop();
    player_->rewind();
    if (!player_->start()) {
        appendEvent("Scenario already playing");
    }
}

} // namespace gui
} // namespace shyradar
