#pragma once

#include "radio/radio_adapter.hpp"
#include "sighting_filter.hpp"
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace shyradar {
namespace discovery {

// Scan/advertise lifecycle. Advertising is an orthogonal flag, see isAdvertising().
enum class DiscoveryState {
    Idle,
    Initializing,     // Waiting for the adapter to become ready
    Ready,
    Scanning,
    RestartingCycle,  // Scan stopped at cycle end, waiting out the cooldown
    Stopped,          // Halted after an unrecoverable scan error
};

enum class DiscoveryError {
    None,
    AdapterUnavailable,
    ScanCallbackError,
};

const char* discoveryStateToString(DiscoveryState state);
const char* discoveryErrorToString(DiscoveryError error);

struct DiscoveryConfig {
    uint32_t cycle_duration_ms = 30000;
    uint32_t restart_cooldown_ms = 1000;
    uint32_t staleness_window_ms = 60000;  // Must outlast a cycle plus its cooldown
    int max_init_retries = 3;

    std::string advertise_prefix = "ShyText_";
    bool require_advertise_prefix = false;
    uint16_t company_id = 0x1234;

    // Local identity, used for self-filtering and the advertised name
    std::string local_device_id;
    std::string local_user_id;

    // Throws std::invalid_argument
    void validate() const;
};

struct DiscoveryStats {
    uint64_t raw_sightings = 0;
    uint64_t rejected_prefix = 0;
    uint64_t rejected_self = 0;
    uint64_t rejected_duplicate = 0;
    uint64_t emitted = 0;
    uint64_t cycles_completed = 0;
    uint64_t scan_errors = 0;
    uint64_t recoveries = 0;
    uint64_t init_retries = 0;
};

using SightingCallback = std::function<void(const Sighting&)>;
using ErrorCallback = std::function<void(DiscoveryError, const std::string& detail)>;

/**
 * DiscoverySession - Radio scan lifecycle with per-cycle dedup and self-filtering
 *
 * Sightings arrive on the adapter's thread; all filter and state mutation is
 * serialized by one mutex. User callbacks are invoked with the lock released.
 *
 * The only delayed operations (cycle end, restart cooldown, scan recovery)
 * are driven by tick() from the owning loop, so stopScanning() and
 * teardown() cancel them simply by resetting state.
 *
 * The adapter must outlive the session.
 */
class DiscoverySession {
public:
    explicit DiscoverySession(radio::RadioAdapter& adapter,
                              const DiscoveryConfig& config = DiscoveryConfig{});
    ~DiscoverySession();

    DiscoverySession(const DiscoverySession&) = delete;
    DiscoverySession& operator=(const DiscoverySession&) = delete;

    // Throws std::invalid_argument for a zero cycle duration, a negative retry
    // count, or a staleness window that does not outlast cycle plus cooldown
    void configure(const DiscoveryConfig& config);
    DiscoveryConfig getConfig() const;

    void setErrorCallback(ErrorCallback callback);

    // ========================================================================
    // LIFECYCLE
    // ========================================================================

    // Idempotent. Returns false while the adapter is not ready; adapters with
    // power callbacks then stay Initializing and retry on power-on.
    bool initialize();

    // Ready -> Scanning. While Initializing the request is queued and
    // starts once the adapter becomes ready.
    bool startScanning(SightingCallback on_sighting);
    bool startScanning(SightingCallback on_sighting, uint32_t cycle_duration_ms);

    // Unconditional; returns to Ready. Idempotent.
    void stopScanning();

    // No-op success on scan-only adapters
    bool startAdvertising();
    void stopAdvertising();

    // Safe from any state, any number of times. Returns to Idle.
    void teardown();

    // Advance cycle, cooldown and recovery timers
    void tick(uint32_t elapsed_ms);

    // ========================================================================
    // STATUS
    // ========================================================================

    DiscoveryState getState() const;
    bool isAdvertising() const;
    DiscoveryStats getStats() const;
    std::string getLastError() const;
    DiscoveryError lastErrorKind() const;

    // Milliseconds until the current cycle ends, 0 when not scanning
    uint32_t cycleRemainingMs() const;

private:
    struct PendingError {
        DiscoveryError kind;
        std::string detail;
    };

    radio::RadioAdapter& adapter_;
    DiscoveryConfig config_;
    mutable std::mutex mutex_;

    DiscoveryState state_ = DiscoveryState::Idle;
    SightingFilter filter_;
    SightingCallback on_sighting_;
    ErrorCallback on_error_;

    // Scan subscription; generation guards against events from a replaced scan
    radio::ScanHandle scan_handle_ = 0;
    radio::ScanHandle pending_stop_handle_ = 0;
    uint64_t scan_generation_ = 0;
    bool scan_requested_ = false;       // Start scanning once initialized
    uint32_t active_cycle_ms_ = 30000;

    // Timers
    uint32_t cycle_elapsed_ms_ = 0;
    uint32_t cooldown_elapsed_ms_ = 0;
    bool recovery_pending_ = false;

    // Advertising
    bool advertising_ = false;
    bool advertise_requested_ = false;

    // Power handling
    radio::SubscriptionId power_subscription_ = 0;
    int init_attempts_after_power_ = 0;

    DiscoveryStats stats_;
    std::string last_error_;
    DiscoveryError last_error_kind_ = DiscoveryError::None;

    // Helpers (mutex_ held)
    bool startScanLocked();
    void stopScanLocked();
    bool startAdvertiseLocked();
    void resumeAfterInitLocked();
    void setErrorLocked(DiscoveryError kind, const std::string& detail,
                        std::optional<PendingError>& pending);
    void applyFilterConfigLocked();

    void handleScanEvent(uint64_t generation, const radio::ScanEvent& event);
    void handlePowerState(radio::PowerState state);
    void handlePowerLossLocked(radio::PowerState state);
    void notifyError(const std::optional<PendingError>& pending);
};

} // namespace discovery
} // namespace shyradar
