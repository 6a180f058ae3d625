/**
 * shyradar CLI - Proximity discovery and radar layout
 *
 * Runs the engine against the simulated adapter, fed by a scenario file.
 */

#include "config/radar_settings.hpp"
#include "engine/proximity_engine.hpp"
#include "identity/directory.hpp"
#include "radio/simulated_adapter.hpp"
#include "roster/user_roster.hpp"
#include "shyradar/logging.hpp"
#include "shyradar/types.hpp"
#include "sim/scenario_player.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>
#include <thread>

using namespace shyradar;

// Signal handling for clean shutdown
static std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

void printUsage(const char* prog) {
    std::cerr << "shyradar - proximity discovery and radar layout\n\n";
    std::cerr << "Usage: " << prog << " [options] <command>\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  info            Show the effective configuration\n";
    std::cerr << "  layout          Place every directory user and print positions\n";
    std::cerr << "  scan            Replay a scenario and print sightings and layout\n";
    std::cerr << "\nOptions:\n";
    std::cerr << "  -c <file>       Settings file (default: $SHYRADAR_CONFIG or ~/.config/shyradar/settings.ini)\n";
    std::cerr << "  -d <file>       Directory file with [User] sections\n";
    std::cerr << "  -s <file>       Scenario file (scan)\n";
    std::cerr << "  -u <user_id>    Local user id (self-filter and advertised name)\n";
    std::cerr << "  -p <policy>     Layout policy: distance, slots\n";
    std::cerr << "  -t <seconds>    Scan duration (default: scenario length + 1)\n";
    std::cerr << "  -v              Debug logging\n";
    std::cerr << "\nExamples:\n";
    std::cerr << "  " << prog << " -d users.ini -p distance layout\n";
    std::cerr << "  " << prog << " -d users.ini -s walk.scn -u u0 -t 5 scan\n";
    std::cerr << "\n";
}

void printInfo(const config::RadarSettings& settings) {
    const auto& d = settings.discovery;
    const auto& l = settings.layout;
    const auto& g = settings.gesture;

    std::cout << "=== ShyRadar ===\n\n";
    std::cout << "Station:\n";
    std::cout << "  User id:        " << (settings.user_id.empty() ? "(none)" : settings.user_id) << "\n";
    std::cout << "  Device id:      " << (settings.device_id.empty() ? "(none)" : settings.device_id) << "\n";
    std::cout << "  Advertises as:  " << d.advertise_prefix << settings.user_id << "\n\n";

    std::cout << "Discovery:\n";
    std::cout << "  Scan cycle:     " << d.cycle_duration_ms << " ms\n";
    std::cout << "  Cooldown:       " << d.restart_cooldown_ms << " ms\n";
    std::cout << "  Stale after:    " << d.staleness_window_ms << " ms\n";
    std::cout << "  Prefix gate:    " << (d.require_advertise_prefix ? "on" : "off") << "\n\n";

    std::cout << "Resolver:\n";
    std::cout << "  Token suffix:   " << settings.resolver.token_suffix << "\n";
    std::cout << "  In flight:      " << settings.resolver.max_in_flight << "\n\n";

    std::cout << "Layout (" << layoutPolicyToString(settings.policy) << "):\n";
    std::cout << "  Surface:        " << l.surface_diameter << " (usable radius " << l.usableRadius() << ")\n";
    std::cout << "  Bubble:         " << l.bubble_diameter << ", separation " << l.min_separation << "\n";
    std::cout << "  Center buffer:  " << l.center_buffer << "\n";
    std::cout << "  Slots:          " << l.max_slots << " at radius " << l.slotRadius() << "\n\n";

    std::cout << "Gesture:\n";
    std::cout << "  Snap zone:      " << g.snapZoneRadius() << "\n";
    std::cout << "  Drop threshold: " << g.dropThreshold() << "\n";
    std::cout << "  Drag delay:     " << g.drag_delay_ms << " ms\n";
}

void printLayout(const layout::LayoutResult& result, const std::vector<DiscoveredUser>& users) {
    std::printf("Anchor (%.1f, %.1f)\n", result.anchor.x, result.anchor.y);
    for (const auto& placed : result.placed) {
        std::string name;
        for (const auto& user : users) {
            if (user.user_id == placed.user_id) {
                name = user.display_name;
                break;
            }
        }
        float r = distanceBetween(placed.position, result.anchor);
        std::printf("  %-12s %-20s (%7.1f, %7.1f)  r=%.1f\n", placed.user_id.c_str(), name.c_str(),
                    placed.position.x, placed.position.y, r);
    }
    for (const auto& id : result.unplaced) {
        std::printf("  %-12s (not displayed)\n", id.c_str());
    }
}

int cmdLayout(const config::RadarSettings& settings, identity::InMemoryDirectory& directory) {
    // Directory order stands in for recency: first entry seen most recently
    roster::UserRoster roster;
    Timestamp now = Clock::now();
    int index = 0;
    for (const auto& record : directory.listAll()) {
        Sighting sighting;
        sighting.device_id = "dir:" + record.user_id;
        sighting.observed_at = now - std::chrono::seconds(index++);
        roster.upsert(record, sighting);
    }

    layout::LayoutEngine engine(settings.policy, settings.layout);
    std::vector<DiscoveredUser> users = roster.snapshot();
    printLayout(engine.compute(users), users);
    return 0;
}

int cmdScan(const config::RadarSettings& settings, identity::InMemoryDirectory& directory,
            const std::string& scenario_file, int seconds) {
    radio::SimulatedRadioAdapter::Options options;
    options.requires_power_callbacks = true;
    radio::SimulatedRadioAdapter radio(options);

    sim::ScenarioPlayer player(radio);
    if (!player.loadFile(scenario_file)) {
        std::cerr << "Error: " << player.getLastError() << "\n";
        return 1;
    }
    if (seconds <= 0) {
        seconds = static_cast<int>(player.durationMs() / 1000) + 1;
    }

    engine::ProximityEngine engine(radio, directory, settings.toEngineConfig());

    std::mutex print_mutex;
    engine.setSightingObserver([&print_mutex](const Sighting& s) {
        std::lock_guard<std::mutex> lock(print_mutex);
        std::printf("sighting  %-18s %-24s rssi %d\n", s.device_id.c_str(),
                    s.advertised_name.c_str(), s.signal_strength);
    });
    engine.setResolutionObserver([&print_mutex](const identity::ResolveCompletion& c) {
        std::lock_guard<std::mutex> lock(print_mutex);
        std::printf("resolve   %-18s -> %s %s\n", c.sighting.device_id.c_str(),
                    identity::resolveStatusToString(c.result.status), c.result.user_id.c_str());
    });

    if (!engine.start()) {
        std::cerr << "Error: " << engine.session().getLastError() << "\n";
        return 1;
    }
    player.start();

    const uint32_t tick_ms = 50;
    auto deadline = Clock::now() + std::chrono::seconds(seconds);
    while (g_running && Clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(tick_ms));
        engine.tick(tick_ms, Clock::now());
    }

    player.stop();
    if (!engine.resolverPool().waitIdle(std::chrono::milliseconds(1000))) {
        std::cerr << "Warning: " << engine.resolverPool().pendingCount()
                  << " resolutions still pending\n";
    }
    engine.tick(0, Clock::now());
    engine.stop();

    discovery::DiscoveryStats ds = engine.session().getStats();
    engine::EngineStats es = engine.getStats();
    std::lock_guard<std::mutex> lock(print_mutex);
    std::printf("\n%llu raw, %llu emitted, %llu duplicates, %llu self, %llu prefix, %llu cycles\n",
                static_cast<unsigned long long>(ds.raw_sightings),
                static_cast<unsigned long long>(ds.emitted),
                static_cast<unsigned long long>(ds.rejected_duplicate),
                static_cast<unsigned long long>(ds.rejected_self),
                static_cast<unsigned long long>(ds.rejected_prefix),
                static_cast<unsigned long long>(ds.cycles_completed));
    std::printf("%llu resolved, %llu not found, %llu directory errors\n\n",
                static_cast<unsigned long long>(es.resolved),
                static_cast<unsigned long long>(es.not_found),
                static_cast<unsigned long long>(es.directory_unavailable));
    printLayout(engine.layout(), engine.users());
    return 0;
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::string command;
    std::string settings_file;
    std::string directory_file;
    std::string scenario_file;
    std::string user_id;
    std::string policy_name;
    int seconds = 0;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
            settings_file = argv[++i];
        } else if (strcmp(argv[i], "-d") == 0 && i + 1 < argc) {
            directory_file = argv[++i];
        } else if (strcmp(argv[i], "-s") == 0 && i + 1 < argc) {
            scenario_file = argv[++i];
        } else if (strcmp(argv[i], "-u") == 0 && i + 1 < argc) {
            user_id = argv[++i];
        } else if (strcmp(argv[i], "-p") == 0 && i + 1 < argc) {
            policy_name = argv[++i];
        } else if (strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
            seconds = atoi(argv[++i]);
        } else if (strcmp(argv[i], "-v") == 0) {
            verbose = true;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-' && command.empty()) {
            command = argv[i];
        } else {
            std::cerr << "Unknown argument: " << argv[i] << "\n\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    if (command.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    setLogLevel(verbose ? LogLevel::DEBUG : LogLevel::WARN);

    config::RadarSettings settings;
    if (!settings.load(settings_file) && !settings_file.empty()) {
        std::cerr << "Error: cannot read settings " << settings_file << "\n";
        return 1;
    }
    if (!user_id.empty()) {
        settings.user_id = user_id;
    }
    if (!policy_name.empty()) {
        std::optional<LayoutPolicyType> policy = stringToLayoutPolicy(policy_name);
        if (!policy) {
            std::cerr << "Error: unknown policy '" << policy_name << "' (distance, slots)\n";
            return 1;
        }
        settings.policy = *policy;
    }
    if (!settings.user_id.empty()) {
        setLogStationTag(settings.user_id.c_str());
    }

    if (command == "info") {
        printInfo(settings);
        return 0;
    }

    identity::InMemoryDirectory directory;
    if (directory_file.empty()) {
        std::cerr << "Error: " << command << " needs a directory file (-d)\n";
        return 1;
    }
    if (!directory.loadFromFile(directory_file)) {
        std::cerr << "Error: cannot read directory " << directory_file << "\n";
        return 1;
    }

    if (command == "layout") {
        return cmdLayout(settings, directory);
    }
    if (command == "scan") {
        if (scenario_file.empty()) {
            std::cerr << "Error: scan needs a scenario file (-s)\n";
            return 1;
        }
        return cmdScan(settings, directory, scenario_file, seconds);
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    printUsage(argv[0]);
    return 1;
}
