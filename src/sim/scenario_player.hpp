/**
 * ScenarioPlayer - Replays a scripted radio environment into a SimulatedRadioAdapter
 *
 * Scenario files hold one event per line, times in ms from playback start:
 *
 *   # comment
 *   0     sight  AA:01  ShyText_alice  -40
 *   500   sight  BB:02  -              -70     ("-" = no advertised name)
 *   1200  error  adapter reset
 *   3000  power  off
 *   4000  power  on
 *
 * Two ways to play:
 *   - start(): real time on the player's own thread, like a radio stack
 *     delivering from its own context
 *   - advanceTo(): synchronous virtual time on the caller's thread
 *
 * Usage:
 *   SimulatedRadioAdapter radio;
 *   ScenarioPlayer player(radio);
 *   if (!player.loadFile("walk.scn")) { ... player.getLastError() ... }
 *   player.start();
 *   ...
 *   player.stop();
 */

#pragma once

#include "radio/simulated_adapter.hpp"
#include <atomic>
#include <condition_variable>
#include <iosfwd>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace shyradar {
namespace sim {

enum class ScenarioAction {
    Sight,
    Error,
    PowerOn,
    PowerOff,
};

const char* scenarioActionToString(ScenarioAction action);

struct ScenarioStep {
    uint32_t at_ms = 0;
    ScenarioAction action = ScenarioAction::Sight;
    std::string device_id;
    std::string advertised_name;
    int signal_strength = 0;
    std::string message;        // Error text
};

class ScenarioPlayer {
public:
    explicit ScenarioPlayer(radio::SimulatedRadioAdapter& radio);
    ~ScenarioPlayer();

    ScenarioPlayer(const ScenarioPlayer&) = delete;
    ScenarioPlayer& operator=(const ScenarioPlayer&) = delete;

    // ========================================================================
    // SCRIPT
    // ========================================================================

    // Replace the script. On a parse error nothing is replaced and
    // getLastError() names the offending line.
    bool loadFile(const std::string& path);
    bool loadString(const std::string& text);

    // Insert keeping time order (stable for equal times)
    void addStep(const ScenarioStep& step);

    const std::vector<ScenarioStep>& steps() const { return steps_; }
    uint32_t durationMs() const { return steps_.empty() ? 0 : steps_.back().at_ms; }

    // ========================================================================
    // PLAYBACK
    // ========================================================================

    // Real time playback on a worker thread; false if already running
    bool start();
    void stop();
    void join();
    bool isRunning() const { return running_; }

    // Virtual time: plays every not yet played step due at or before at_ms.
    // Sightings are stamped time_base + at_ms. Returns the number played.
    size_t advanceTo(uint32_t at_ms);
    void setTimeBase(Timestamp base) { time_base_ = base; }

    // Back to the first step
    void rewind();

    size_t played() const { return next_; }
    bool finished() const { return next_ >= steps_.size(); }

    // Steps the adapter refused (no active scan)
    uint64_t dropped() const { return dropped_; }

    std::string getLastError() const { return last_error_; }

private:
    radio::SimulatedRadioAdapter& radio_;
    std::vector<ScenarioStep> steps_;
    std::atomic<size_t> next_{0};
    Timestamp time_base_ = Clock::now();

    std::thread worker_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> running_{false};
    bool stop_requested_ = false;

    std::atomic<uint64_t> dropped_{0};
    std::string last_error_;

    bool parse(std::istream& in, const std::string& source);
    void play(const ScenarioStep& step);
    void workerLoop();
};

} // namespace sim
} // namespace shyradar
