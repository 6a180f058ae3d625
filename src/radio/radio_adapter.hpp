#pragma once

#include "shyradar/types.hpp"
#include <cstdint>
#include <functional>
#include <string>

namespace shyradar {
namespace radio {

// Adapter power state as reported by the platform
enum class PowerState {
    Unknown,
    PoweredOff,
    PoweredOn,
    Unauthorized,   // Permission denied
    Unsupported,    // No radio on this device
};

enum class ScanEventType {
    Sighting,
    Error,
};

// Delivered to the scan callback on the adapter's own thread
struct ScanEvent {
    ScanEventType type = ScanEventType::Sighting;
    Sighting sighting;
    std::string error_message;   // Set for ScanEventType::Error
};

struct AdvertisePayload {
    std::string local_name;      // e.g. "ShyText_u42"
    uint16_t company_id = 0x1234;
};

using ScanHandle = uint64_t;         // 0 = no scan
using SubscriptionId = uint64_t;     // 0 = no subscription
using ScanCallback = std::function<void(const ScanEvent&)>;
using PowerStateCallback = std::function<void(PowerState)>;

// Abstract short-range radio interface
class RadioAdapter {
public:
    virtual ~RadioAdapter() = default;

    // Readiness (false when powered off, unauthorized or unsupported)
    virtual bool initialize() = 0;
    virtual PowerState getPowerState() const = 0;

    // Scanning
    virtual ScanHandle startScan(ScanCallback callback) = 0;
    virtual void stopScan(ScanHandle handle) = 0;

    // Advertising (optional - returns false if not supported)
    virtual bool startAdvertise(const AdvertisePayload& payload) = 0;
    virtual void stopAdvertise() = 0;

    // Power state notifications
    virtual SubscriptionId onPowerStateChange(PowerStateCallback callback) = 0;
    virtual void removePowerStateListener(SubscriptionId id) = 0;

    // Capabilities
    virtual bool supportsAdvertising() const = 0;
    virtual bool supportsScanRecovery() const = 0;   // Stop+restart clears scan errors
    virtual bool requiresPowerCallbacks() const = 0; // Must wait for power-on before init

    virtual const char* adapterName() const = 0;
};

const char* powerStateToString(PowerState state);

} // namespace radio
} // namespace shyradar
