#include "simulated_adapter.hpp"
#include <vector>

namespace shyradar {
namespace radio {

SimulatedRadioAdapter::SimulatedRadioAdapter()
    : SimulatedRadioAdapter(Options{}) {}

SimulatedRadioAdapter::SimulatedRadioAdapter(const Options& options)
    : options_(options), power_(options.initial_power) {}

bool SimulatedRadioAdapter::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    initialize_calls_++;
    return power_ == PowerState::PoweredOn;
}

PowerState SimulatedRadioAdapter::getPowerState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return power_;
}

ScanHandle SimulatedRadioAdapter::startScan(ScanCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (power_ != PowerState::PoweredOn || !callback) {
        return 0;
    }
    if (fail_next_scan_start_) {
        fail_next_scan_start_ = false;
        return 0;
    }

    // A new scan replaces the previous one, as platform scanners do
    active_scan_ = next_scan_handle_++;
    scan_callback_ = std::move(callback);
    scan_starts_++;
    return active_scan_;
}

void SimulatedRadioAdapter::stopScan(ScanHandle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handle == 0 || handle != active_scan_) {
        return;
    }
    active_scan_ = 0;
    scan_callback_ = nullptr;
    scan_stops_++;
}

bool SimulatedRadioAdapter::startAdvertise(const AdvertisePayload& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!options_.supports_advertising || power_ != PowerState::PoweredOn) {
        return false;
    }
    advertising_ = true;
    last_advertisement_ = payload;
    return true;
}

void SimulatedRadioAdapter::stopAdvertise() {
    std::lock_guard<std::mutex> lock(mutex_);
    advertising_ = false;
}

SubscriptionId SimulatedRadioAdapter::onPowerStateChange(PowerStateCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!callback) {
        return 0;
    }
    SubscriptionId id = next_subscription_++;
    power_listeners_[id] = std::move(callback);
    return id;
}

void SimulatedRadioAdapter::removePowerStateListener(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    power_listeners_.erase(id);
}

bool SimulatedRadioAdapter::injectSighting(const Sighting& sighting) {
    ScanEvent event;
    event.type = ScanEventType::Sighting;
    event.sighting = sighting;
    return deliver(event);
}

bool SimulatedRadioAdapter::injectSighting(const std::string& device_id,
                                           const std::string& advertised_name,
                                           int signal_strength) {
    Sighting sighting;
    sighting.device_id = device_id;
    sighting.advertised_name = advertised_name;
    sighting.signal_strength = signal_strength;
    sighting.observed_at = Clock::now();
    return injectSighting(sighting);
}

bool SimulatedRadioAdapter::injectScanError(const std::string& message) {
    ScanEvent event;
    event.type = ScanEventType::Error;
    event.error_message = message;
    return deliver(event);
}

bool SimulatedRadioAdapter::deliver(const ScanEvent& event) {
    ScanCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_scan_ == 0 || !scan_callback_) {
            return false;
        }
        callback = scan_callback_;
    }
    callback(event);
    return true;
}

void SimulatedRadioAdapter::setPowerState(PowerState state) {
    std::vector<PowerStateCallback> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state == power_) {
            return;
        }
        power_ = state;
        if (state != PowerState::PoweredOn) {
            if (active_scan_ != 0) {
                active_scan_ = 0;
                scan_callback_ = nullptr;
                scan_stops_++;
            }
            advertising_ = false;
        }
        for (const auto& entry : power_listeners_) {
            listeners.push_back(entry.second);
        }
    }

    for (const auto& listener : listeners) {
        listener(state);
    }
}

void SimulatedRadioAdapter::failNextScanStart() {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_next_scan_start_ = true;
}

bool SimulatedRadioAdapter::isScanning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_scan_ != 0;
}

bool SimulatedRadioAdapter::isAdvertising() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return advertising_;
}

std::optional<AdvertisePayload> SimulatedRadioAdapter::lastAdvertisement() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_advertisement_;
}

int SimulatedRadioAdapter::initializeCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialize_calls_;
}

int SimulatedRadioAdapter::scanStarts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scan_starts_;
}

int SimulatedRadioAdapter::scanStops() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scan_stops_;
}

size_t SimulatedRadioAdapter::powerListenerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return power_listeners_.size();
}

} // namespace radio
} // namespace shyradar
