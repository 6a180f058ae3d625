#include "scenario_player.hpp"
#include "shyradar/logging.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace shyradar {
namespace sim {

const char* scenarioActionToString(ScenarioAction action) {
    switch (action) {
        case ScenarioAction::Sight:    return "sight";
        case ScenarioAction::Error:    return "error";
        case ScenarioAction::PowerOn:  return "power on";
        case ScenarioAction::PowerOff: return "power off";
        default:                       return "unknown";
    }
}

namespace {

bool parseNumber(const std::string& token, long& out) {
    if (token.empty()) {
        return false;
    }
    char* end = nullptr;
    long v = std::strtol(token.c_str(), &end, 10);
    if (end == token.c_str() || *end != '\0') {
        return false;
    }
    out = v;
    return true;
}

} // namespace

ScenarioPlayer::ScenarioPlayer(radio::SimulatedRadioAdapter& radio)
    : radio_(radio) {
}

ScenarioPlayer::~ScenarioPlayer() {
    stop();
}

bool ScenarioPlayer::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        last_error_ = "Cannot open scenario " + path;
        return false;
    }
    return parse(file, path);
}

bool ScenarioPlayer::loadString(const std::string& text) {
    std::istringstream in(text);
    return parse(in, "<string>");
}

bool ScenarioPlayer::parse(std::istream& in, const std::string& source) {
    if (running_) {
        last_error_ = "Cannot load while playing";
        return false;
    }

    std::vector<ScenarioStep> parsed;
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        line = trimCopy(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::istringstream fields(line);
        std::string at_str, verb;
        fields >> at_str >> verb;

        long at = 0;
        if (!parseNumber(at_str, at) || at < 0) {
            last_error_ = source + ":" + std::to_string(line_no) + ": bad time '" + at_str + "'";
            return false;
        }

        ScenarioStep step;
        step.at_ms = static_cast<uint32_t>(at);

        if (verb == "sight") {
            std::string rssi_str;
            fields >> step.device_id >> step.advertised_name >> rssi_str;
            long rssi = 0;
            if (step.device_id.empty() || !parseNumber(rssi_str, rssi)) {
                last_error_ = source + ":" + std::to_string(line_no) +
                              ": expected 'sight <device_id> <name> <rssi>'";
                return false;
            }
            if (step.advertised_name == "-") {
                step.advertised_name.clear();
            }
            step.action = ScenarioAction::Sight;
            step.signal_strength = static_cast<int>(rssi);
        } else if (verb == "error") {
            std::string rest;
            std::getline(fields, rest);
            step.action = ScenarioAction::Error;
            step.message = trimCopy(rest);
            if (step.message.empty()) {
                step.message = "scan error";
            }
        } else if (verb == "power") {
            std::string state;
            fields >> state;
            if (state == "on") {
                step.action = ScenarioAction::PowerOn;
            } else if (state == "off") {
                step.action = ScenarioAction::PowerOff;
            } else {
                last_error_ = source + ":" + std::to_string(line_no) + ": expected 'power on|off'";
                return false;
            }
        } else {
            last_error_ = source + ":" + std::to_string(line_no) + ": unknown event '" + verb + "'";
            return false;
        }
        parsed.push_back(step);
    }

    std::stable_sort(parsed.begin(), parsed.end(),
                     [](const ScenarioStep& a, const ScenarioStep& b) { return a.at_ms < b.at_ms; });
    steps_ = std::move(parsed);
    next_ = 0;
    last_error_.clear();
    LOG_DISCOVERY(INFO, "Scenario %s: %zu events over %u ms", source.c_str(), steps_.size(),
                  durationMs());
    return true;
}

void ScenarioPlayer::addStep(const ScenarioStep& step) {
    auto pos = std::upper_bound(steps_.begin(), steps_.end(), step.at_ms,
                                [](uint32_t at, const ScenarioStep& s) { return at < s.at_ms; });
    steps_.insert(pos, step);
}

void ScenarioPlayer::play(const ScenarioStep& step) {
    switch (step.action) {
        case ScenarioAction::Sight: {
            Sighting sighting;
            sighting.device_id = step.device_id;
            sighting.advertised_name = step.advertised_name;
            sighting.signal_strength = step.signal_strength;
            sighting.observed_at = time_base_ + Milliseconds(step.at_ms);
            if (!radio_.injectSighting(sighting)) {
                dropped_++;
                LOG_DISCOVERY(TRACE, "Scenario sighting %s at %u ms dropped, not scanning",
                              step.device_id.c_str(), step.at_ms);
            }
            break;
        }
        case ScenarioAction::Error:
            if (!radio_.injectScanError(step.message)) {
                dropped_++;
            }
            break;
        case ScenarioAction::PowerOn:
            radio_.setPowerState(radio::PowerState::PoweredOn);
            break;
        case ScenarioAction::PowerOff:
            radio_.setPowerState(radio::PowerState::PoweredOff);
            break;
    }
}

size_t ScenarioPlayer::advanceTo(uint32_t at_ms) {
    size_t count = 0;
    while (next_ < steps_.size() && steps_[next_].at_ms <= at_ms) {
        play(steps_[next_]);
        next_++;
        count++;
    }
    return count;
}

void ScenarioPlayer::rewind() {
    next_ = 0;
    dropped_ = 0;
}

bool ScenarioPlayer::start() {
    if (running_) {
        return false;
    }
    join();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    time_base_ = Clock::now();
    running_ = true;
    worker_ = std::thread(&ScenarioPlayer::workerLoop, this);
    return true;
}

void ScenarioPlayer::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    join();
}

void ScenarioPlayer::join() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

void ScenarioPlayer::workerLoop() {
    while (next_ < steps_.size()) {
        Timestamp due = time_base_ + Milliseconds(steps_[next_].at_ms);
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_until(lock, due, [this] { return stop_requested_; })) {
                break;
            }
        }
        play(steps_[next_]);
        next_++;
    }
    LOG_DISCOVERY(DEBUG, "Scenario playback ended after %zu of %zu events", next_.load(), steps_.size());
    running_ = false;
}

} // namespace sim
} // namespace shyradar
