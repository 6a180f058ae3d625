/**
 * SimulatedRadioAdapter - Scriptable RadioAdapter for tests and the front-ends
 *
 * Sightings, scan errors and power changes are injected on the caller's
 * thread, which plays the role of the platform's radio delivery context.
 * Callbacks are always invoked with the adapter's lock released, so a
 * callback may call back into the adapter.
 *
 * Usage:
 *   SimulatedRadioAdapter radio;
 *   session.initialize();
 *   session.startScanning(onSighting);
 *   radio.injectSighting("AA:01", "ShyText_alice", -40);
 */

#pragma once

#include "radio_adapter.hpp"
#include <map>
#include <mutex>
#include <optional>

namespace shyradar {
namespace radio {

class SimulatedRadioAdapter : public RadioAdapter {
public:
    struct Options {
        bool supports_advertising = true;
        bool supports_scan_recovery = true;
        bool requires_power_callbacks = false;
        PowerState initial_power = PowerState::PoweredOn;
    };

    SimulatedRadioAdapter();
    explicit SimulatedRadioAdapter(const Options& options);
    ~SimulatedRadioAdapter() override = default;

    // ========================================================================
    // RadioAdapter
    // ========================================================================

    bool initialize() override;
    PowerState getPowerState() const override;

    ScanHandle startScan(ScanCallback callback) override;
    void stopScan(ScanHandle handle) override;

    bool startAdvertise(const AdvertisePayload& payload) override;
    void stopAdvertise() override;

    SubscriptionId onPowerStateChange(PowerStateCallback callback) override;
    void removePowerStateListener(SubscriptionId id) override;

    bool supportsAdvertising() const override { return options_.supports_advertising; }
    bool supportsScanRecovery() const override { return options_.supports_scan_recovery; }
    bool requiresPowerCallbacks() const override { return options_.requires_power_callbacks; }

    const char* adapterName() const override { return "Simulated"; }

    // ========================================================================
    // INJECTION - returns false when no scan is active
    // ========================================================================

    bool injectSighting(const Sighting& sighting);
    bool injectSighting(const std::string& device_id, const std::string& advertised_name,
                        int signal_strength);
    bool injectScanError(const std::string& message);

    // Powering off also drops any active scan and advertisement
    void setPowerState(PowerState state);

    // Make the next startScan() call fail
    void failNextScanStart();

    // ========================================================================
    // INSPECTION
    // ========================================================================

    bool isScanning() const;
    bool isAdvertising() const;
    std::optional<AdvertisePayload> lastAdvertisement() const;
    int initializeCalls() const;
    int scanStarts() const;
    int scanStops() const;
    size_t powerListenerCount() const;

private:
    Options options_;
    mutable std::mutex mutex_;

    PowerState power_;
    ScanHandle active_scan_ = 0;
    ScanCallback scan_callback_;
    ScanHandle next_scan_handle_ = 1;
    bool fail_next_scan_start_ = false;

    bool advertising_ = false;
    std::optional<AdvertisePayload> last_advertisement_;

    std::map<SubscriptionId, PowerStateCallback> power_listeners_;
    SubscriptionId next_subscription_ = 1;

    int initialize_calls_ = 0;
    int scan_starts_ = 0;
    int scan_stops_ = 0;

    bool deliver(const ScanEvent& event);
};

} // namespace radio
} // namespace shyradar
