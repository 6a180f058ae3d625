#include "radar_settings.hpp"
#include "shyradar/logging.hpp"
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <sys/stat.h>
#define MKDIR(path) mkdir(path, 0755)

namespace shyradar {
namespace config {

namespace {

void ensureDirectory(const std::string& filepath) {
    size_t pos = 0;
    while ((pos = filepath.find('/', pos + 1)) != std::string::npos) {
        std::string dir = filepath.substr(0, pos);
        MKDIR(dir.c_str());
    }
}

bool parseLong(const std::string& value, long& out) {
    if (value.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(value.c_str(), &end, 0);  // base 0 accepts 0x...
    if (errno != 0 || end == value.c_str() || *end != '\0') {
        return false;
    }
    out = v;
    return true;
}

bool parseFloat(const std::string& value, float& out) {
    if (value.empty()) {
        return false;
    }
    char* end = nullptr;
    float v = std::strtof(value.c_str(), &end);
    if (end == value.c_str() || *end != '\0' || v != v) {
        return false;
    }
    out = v;
    return true;
}

// Integer/float setters keep the current (default) value when the input is
// unparsable or out of [lo, hi]

template <typename T>
void setInt(T& field, const std::string& section, const std::string& key,
            const std::string& value, long lo, long hi, int& rejected) {
    long v = 0;
    if (!parseLong(value, v) || v < lo || v > hi) {
        LOG_ENGINE(WARN, "Settings [%s] %s=%s out of range [%ld, %ld], using %ld",
                   section.c_str(), key.c_str(), value.c_str(), lo, hi, static_cast<long>(field));
        rejected++;
        return;
    }
    field = static_cast<T>(v);
}

void setFloat(float& field, const std::string& section, const std::string& key,
              const std::string& value, float lo, float hi, int& rejected) {
    float v = 0.0f;
    if (!parseFloat(value, v) || v < lo || v > hi) {
        LOG_ENGINE(WARN, "Settings [%s] %s=%s out of range [%g, %g], using %g",
                   section.c_str(), key.c_str(), value.c_str(), lo, hi, field);
        rejected++;
        return;
    }
    field = v;
}

void setBool(bool& field, const std::string& section, const std::string& key,
             const std::string& value, int& rejected) {
    if (value == "1" || value == "true") {
        field = true;
    } else if (value == "0" || value == "false") {
        field = false;
    } else {
        LOG_ENGINE(WARN, "Settings [%s] %s=%s is not a boolean, using %d", section.c_str(),
                   key.c_str(), value.c_str(), field ? 1 : 0);
        rejected++;
    }
}

} // namespace

std::string RadarSettings::getDefaultPath() {
    // Explicit override, e.g. for two stations on one machine
    const char* config_override = std::getenv("SHYRADAR_CONFIG");
    if (config_override && config_override[0] != '\0') {
        return std::string(config_override);
    }

    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.config/shyradar/settings.ini";
    }
    return "settings.ini";
}

bool RadarSettings::save(const std::string& path) const {
    std::string filepath = path.empty() ? getDefaultPath() : path;
    ensureDirectory(filepath);

    std::ofstream file(filepath);
    if (!file.is_open()) {
        LOG_ENGINE(ERROR, "Cannot write settings to %s", filepath.c_str());
        return false;
    }

    file << "[Station]\n";
    file << "user_id=" << user_id << "\n";
    file << "device_id=" << device_id << "\n";
    file << "display_name=" << display_name << "\n";

    file << "\n[Discovery]\n";
    file << "cycle_duration_ms=" << discovery.cycle_duration_ms << "\n";
    file << "restart_cooldown_ms=" << discovery.restart_cooldown_ms << "\n";
    file << "staleness_window_ms=" << discovery.staleness_window_ms << "\n";
    file << "max_init_retries=" << discovery.max_init_retries << "\n";
    file << "advertise_prefix=" << discovery.advertise_prefix << "\n";
    file << "require_advertise_prefix=" << (discovery.require_advertise_prefix ? "1" : "0") << "\n";
    file << "company_id=" << discovery.company_id << "\n";

    file << "\n[Resolver]\n";
    file << "token_suffix=" << resolver.token_suffix << "\n";
    file << "max_in_flight=" << resolver.max_in_flight << "\n";

    file << "\n[Layout]\n";
    file << "policy=" << layoutPolicyToString(policy) << "\n";
    file << "surface_diameter=" << layout.surface_diameter << "\n";
    file << "bubble_diameter=" << layout.bubble_diameter << "\n";
    file << "min_separation=" << layout.min_separation << "\n";
    file << "center_buffer=" << layout.center_buffer << "\n";
    file << "edge_margin=" << layout.edge_margin << "\n";
    file << "max_distance_m=" << layout.max_distance_m << "\n";
    file << "max_slots=" << layout.max_slots << "\n";
    file << "slot_radius_fraction=" << layout.slot_radius_fraction << "\n";
    file << "angle_seed=" << layout.angle_seed << "\n";

    file << "\n[Gesture]\n";
    file << "anchor_radius=" << gesture.anchor_radius << "\n";
    file << "bubble_radius=" << gesture.bubble_radius << "\n";
    file << "snap_multiplier=" << gesture.snap_multiplier << "\n";
    file << "magnetic_pull=" << gesture.magnetic_pull << "\n";
    file << "detection_multiplier=" << gesture.detection_multiplier << "\n";
    file << "drag_delay_ms=" << gesture.drag_delay_ms << "\n";

    return file.good();
}

bool RadarSettings::load(const std::string& path) {
    std::string filepath = path.empty() ? getDefaultPath() : path;

    std::ifstream file(filepath);
    if (!file.is_open()) {
        return false;
    }

    rejected_values = 0;
    int& rej = rejected_values;
    std::string section;
    std::string line;
    while (std::getline(file, line)) {
        line = trimCopy(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }
        if (line[0] == '[') {
            size_t close = line.find(']');
            section = line.substr(1, close == std::string::npos ? std::string::npos : close - 1);
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trimCopy(line.substr(0, eq));
        std::string value = trimCopy(line.substr(eq + 1));

        if (section == "Station") {
            if (key == "user_id") {
                user_id = value;
            } else if (key == "device_id") {
                device_id = value;
            } else if (key == "display_name") {
                display_name = value;
            }
        } else if (section == "Discovery") {
            if (key == "cycle_duration_ms") {
                setInt(discovery.cycle_duration_ms, section, key, value, 1, 3600000, rej);
            } else if (key == "restart_cooldown_ms") {
                setInt(discovery.restart_cooldown_ms, section, key, value, 0, 600000, rej);
            } else if (key == "staleness_window_ms") {
                setInt(discovery.staleness_window_ms, section, key, value, 1, 86400000, rej);
            } else if (key == "max_init_retries") {
                setInt(discovery.max_init_retries, section, key, value, 0, 100, rej);
            } else if (key == "advertise_prefix") {
                discovery.advertise_prefix = value;
            } else if (key == "require_advertise_prefix") {
                setBool(discovery.require_advertise_prefix, section, key, value, rej);
            } else if (key == "company_id") {
                setInt(discovery.company_id, section, key, value, 0, 0xFFFF, rej);
            }
        } else if (section == "Resolver") {
            if (key == "token_suffix") {
                resolver.token_suffix = value;
            } else if (key == "max_in_flight") {
                setInt(resolver.max_in_flight, section, key, value, 1, 64, rej);
            }
        } else if (section == "Layout") {
            if (key == "policy") {
                std::optional<LayoutPolicyType> type = stringToLayoutPolicy(value);
                if (type) {
                    policy = *type;
                } else {
                    LOG_ENGINE(WARN, "Settings [Layout] unknown policy '%s', using %s",
                               value.c_str(), layoutPolicyToString(policy));
                    rej++;
                }
            } else if (key == "surface_diameter") {
                setFloat(layout.surface_diameter, section, key, value, 1.0f, 100000.0f, rej);
            } else if (key == "bubble_diameter") {
                setFloat(layout.bubble_diameter, section, key, value, 1.0f, 10000.0f, rej);
            } else if (key == "min_separation") {
                setFloat(layout.min_separation, section, key, value, 0.0f, 10000.0f, rej);
            } else if (key == "center_buffer") {
                setFloat(layout.center_buffer, section, key, value, 0.0f, 100000.0f, rej);
            } else if (key == "edge_margin") {
                setFloat(layout.edge_margin, section, key, value, 0.0f, 10000.0f, rej);
            } else if (key == "max_distance_m") {
                setFloat(layout.max_distance_m, section, key, value, 0.1f, 10000.0f, rej);
            } else if (key == "max_slots") {
                setInt(layout.max_slots, section, key, value, 1, 64, rej);
            } else if (key == "slot_radius_fraction") {
                setFloat(layout.slot_radius_fraction, section, key, value, 0.01f, 0.5f, rej);
            } else if (key == "angle_seed") {
                setInt(layout.angle_seed, section, key, value, 0, 0x7FFFFFFFL, rej);
            }
        } else if (section == "Gesture") {
            if (key == "anchor_radius") {
                setFloat(gesture.anchor_radius, section, key, value, 0.0f, 10000.0f, rej);
            } else if (key == "bubble_radius") {
                setFloat(gesture.bubble_radius, section, key, value, 0.0f, 10000.0f, rej);
            } else if (key == "snap_multiplier") {
                setFloat(gesture.snap_multiplier, section, key, value, 0.01f, 100.0f, rej);
            } else if (key == "magnetic_pull") {
                setFloat(gesture.magnetic_pull, section, key, value, 0.0f, 1.0f, rej);
            } else if (key == "detection_multiplier") {
                setFloat(gesture.detection_multiplier, section, key, value, 0.01f, 100.0f, rej);
            } else if (key == "drag_delay_ms") {
                setInt(gesture.drag_delay_ms, section, key, value, 0, 10000, rej);
            }
        }
    }

    // Individually valid values can still combine into an unusable setup
    try {
        discovery.validate();
    } catch (const std::invalid_argument& e) {
        LOG_ENGINE(WARN, "Settings [Discovery] rejected (%s), using defaults", e.what());
        discovery = discovery::DiscoveryConfig{};
        rej++;
    }
    try {
        layout.validate();
    } catch (const std::invalid_argument& e) {
        LOG_ENGINE(WARN, "Settings [Layout] rejected (%s), using defaults", e.what());
        layout = layout::LayoutConfig{};
        rej++;
    }
    try {
        gesture.validate();
    } catch (const std::invalid_argument& e) {
        LOG_ENGINE(WARN, "Settings [Gesture] rejected (%s), using defaults", e.what());
        gesture = gesture::GestureConfig{};
        rej++;
    }

    return true;
}

engine::EngineConfig RadarSettings::toEngineConfig() const {
    engine::EngineConfig config;
    config.discovery = discovery;
    config.discovery.local_user_id = user_id;
    config.discovery.local_device_id = device_id;
    config.resolver = resolver;
    config.resolver.advertise_prefix = discovery.advertise_prefix;
    config.layout = layout;
    config.policy = policy;
    config.gesture = gesture;
    return config;
}

} // namespace config
} // namespace shyradar
