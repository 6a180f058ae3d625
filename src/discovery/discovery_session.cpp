#include "discovery_session.hpp"
#include "shyradar/logging.hpp"
#include <stdexcept>

namespace shyradar {
namespace discovery {

const char* discoveryStateToString(DiscoveryState state) {
    switch (state) {
        case DiscoveryState::Idle:            return "Idle";
        case DiscoveryState::Initializing:    return "Initializing";
        case DiscoveryState::Ready:           return "Ready";
        case DiscoveryState::Scanning:        return "Scanning";
        case DiscoveryState::RestartingCycle: return "RestartingCycle";
        case DiscoveryState::Stopped:         return "Stopped";
        default:                              return "Unknown";
    }
}

const char* discoveryErrorToString(DiscoveryError error) {
    switch (error) {
        case DiscoveryError::None:               return "None";
        case DiscoveryError::AdapterUnavailable: return "AdapterUnavailable";
        case DiscoveryError::ScanCallbackError:  return "ScanCallbackError";
        default:                                 return "Unknown";
    }
}

DiscoverySession::DiscoverySession(radio::RadioAdapter& adapter, const DiscoveryConfig& config)
    : adapter_(adapter) {
    configure(config);
}

DiscoverySession::~DiscoverySession() {
    teardown();
}

void DiscoveryConfig::validate() const {
    if (cycle_duration_ms == 0) {
        throw std::invalid_argument("cycle_duration_ms must be positive");
    }
    if (max_init_retries < 0) {
        throw std::invalid_argument("max_init_retries must not be negative");
    }
    // A user seen at the start of a cycle is only re-sighted in the next one
    uint64_t cycle_span = static_cast<uint64_t>(cycle_duration_ms) + restart_cooldown_ms;
    if (staleness_window_ms <= cycle_span) {
        throw std::invalid_argument("staleness_window_ms must exceed cycle_duration_ms + restart_cooldown_ms");
    }
}

void DiscoverySession::configure(const DiscoveryConfig& config) {
    config.validate();

    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    if (state_ != DiscoveryState::Scanning && state_ != DiscoveryState::RestartingCycle) {
        active_cycle_ms_ = config_.cycle_duration_ms;
    }
    applyFilterConfigLocked();
}

DiscoveryConfig DiscoverySession::getConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void DiscoverySession::setErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_error_ = std::move(callback);
}

void DiscoverySession::applyFilterConfigLocked() {
    filter_.setSelfTokens(config_.local_device_id, config_.local_user_id);
    filter_.setPrefixGate(config_.require_advertise_prefix, config_.advertise_prefix);
}

// ============================================================================
// LIFECYCLE
// ============================================================================

bool DiscoverySession::initialize() {
    std::optional<PendingError> pending;
    bool ok = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (state_ == DiscoveryState::Ready || state_ == DiscoveryState::Scanning ||
            state_ == DiscoveryState::RestartingCycle) {
            return true;
        }

        // Subscribe once; the listener lives until teardown()
        if (adapter_.requiresPowerCallbacks() && power_subscription_ == 0) {
            power_subscription_ = adapter_.onPowerStateChange(
                [this](radio::PowerState power) { handlePowerState(power); });
        }

        state_ = DiscoveryState::Initializing;
        init_attempts_after_power_ = 0;

        if (adapter_.initialize()) {
            state_ = DiscoveryState::Ready;
            last_error_.clear();
            last_error_kind_ = DiscoveryError::None;
            LOG_DISCOVERY(INFO, "Adapter %s ready", adapter_.adapterName());
            resumeAfterInitLocked();
            ok = true;
        } else {
            std::string detail = std::string("Adapter ") + adapter_.adapterName() +
                                 " not ready (power " +
                                 radio::powerStateToString(adapter_.getPowerState()) + ")";
            if (adapter_.requiresPowerCallbacks()) {
                last_error_ = detail + ", waiting for power-on";
                last_error_kind_ = DiscoveryError::AdapterUnavailable;
                LOG_DISCOVERY(WARN, "%s", last_error_.c_str());
            } else {
                state_ = DiscoveryState::Idle;
                scan_requested_ = false;
                setErrorLocked(DiscoveryError::AdapterUnavailable, detail, pending);
            }
        }
    }
    notifyError(pending);
    return ok;
}

bool DiscoverySession::startScanning(SightingCallback on_sighting) {
    uint32_t cycle_ms;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cycle_ms = config_.cycle_duration_ms;
    }
    return startScanning(std::move(on_sighting), cycle_ms);
}

bool DiscoverySession::startScanning(SightingCallback on_sighting, uint32_t cycle_duration_ms) {
    bool ok = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!on_sighting) {
            last_error_ = "startScanning requires a sighting callback";
            return false;
        }
        if (cycle_duration_ms == 0) {
            last_error_ = "Cycle duration must be positive";
            return false;
        }

        on_sighting_ = std::move(on_sighting);
        active_cycle_ms_ = cycle_duration_ms;

        switch (state_) {
            case DiscoveryState::Scanning:
            case DiscoveryState::RestartingCycle:
                // Already running; only the callback is replaced
                ok = true;
                break;

            case DiscoveryState::Initializing:
                scan_requested_ = true;
                LOG_DISCOVERY(INFO, "Scan queued until adapter is ready");
                ok = true;
                break;

            case DiscoveryState::Stopped:
                if (pending_stop_handle_ != 0) {
                    adapter_.stopScan(pending_stop_handle_);
                    pending_stop_handle_ = 0;
                }
                [[fallthrough]];
            case DiscoveryState::Ready:
                filter_.clearCycle();
                ok = startScanLocked();
                if (!ok) {
                    last_error_ = std::string("Adapter ") + adapter_.adapterName() +
                                  " refused to start scan";
                    last_error_kind_ = DiscoveryError::ScanCallbackError;
                    LOG_DISCOVERY(ERROR, "%s (state %s)", last_error_.c_str(),
                                  discoveryStateToString(state_));
                }
                break;

            case DiscoveryState::Idle:
            default:
                last_error_ = "Session not initialized";
                on_sighting_ = nullptr;
                ok = false;
                break;
        }
    }
    return ok;
}

void DiscoverySession::stopScanning() {
    std::lock_guard<std::mutex> lock(mutex_);

    stopScanLocked();
    if (pending_stop_handle_ != 0) {
        adapter_.stopScan(pending_stop_handle_);
        pending_stop_handle_ = 0;
    }

    filter_.clearCycle();
    cycle_elapsed_ms_ = 0;
    cooldown_elapsed_ms_ = 0;
    recovery_pending_ = false;
    scan_requested_ = false;
    on_sighting_ = nullptr;

    if (state_ == DiscoveryState::Scanning || state_ == DiscoveryState::RestartingCycle ||
        state_ == DiscoveryState::Stopped) {
        LOG_DISCOVERY(INFO, "Scanning stopped");
        state_ = DiscoveryState::Ready;
    }
}

bool DiscoverySession::startAdvertising() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!adapter_.supportsAdvertising()) {
        LOG_DISCOVERY(DEBUG, "Adapter %s is scan-only, advertising skipped",
                      adapter_.adapterName());
        return true;
    }

    if (advertising_) {
        return true;
    }

    switch (state_) {
        case DiscoveryState::Idle:
            last_error_ = "Session not initialized";
            return false;
        case DiscoveryState::Initializing:
            advertise_requested_ = true;
            return true;
        default:
            advertise_requested_ = true;
            return startAdvertiseLocked();
    }
}

void DiscoverySession::stopAdvertising() {
    std::lock_guard<std::mutex> lock(mutex_);
    advertise_requested_ = false;
    if (advertising_) {
        adapter_.stopAdvertise();
        advertising_ = false;
        LOG_DISCOVERY(INFO, "Advertising stopped");
    }
}

void DiscoverySession::teardown() {
    std::lock_guard<std::mutex> lock(mutex_);

    stopScanLocked();
    if (pending_stop_handle_ != 0) {
        adapter_.stopScan(pending_stop_handle_);
        pending_stop_handle_ = 0;
    }

    if (advertising_) {
        adapter_.stopAdvertise();
        advertising_ = false;
    }
    advertise_requested_ = false;

    if (power_subscription_ != 0) {
        adapter_.removePowerStateListener(power_subscription_);
        power_subscription_ = 0;
    }

    filter_.clearCycle();
    cycle_elapsed_ms_ = 0;
    cooldown_elapsed_ms_ = 0;
    recovery_pending_ = false;
    scan_requested_ = false;
    init_attempts_after_power_ = 0;
    on_sighting_ = nullptr;

    if (state_ != DiscoveryState::Idle) {
        LOG_DISCOVERY(INFO, "Session torn down from %s", discoveryStateToString(state_));
    }
    state_ = DiscoveryState::Idle;
}

void DiscoverySession::tick(uint32_t elapsed_ms) {
    std::optional<PendingError> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        // Scan halted from inside an adapter callback
        if (pending_stop_handle_ != 0) {
            adapter_.stopScan(pending_stop_handle_);
            pending_stop_handle_ = 0;
        }

        if (state_ == DiscoveryState::Scanning && recovery_pending_) {
            recovery_pending_ = false;
            stats_.recoveries++;

            uint32_t elapsed_in_cycle = cycle_elapsed_ms_;
            stopScanLocked();
            if (startScanLocked()) {
                // Same cycle: the dedup set and cycle timer carry over
                cycle_elapsed_ms_ = elapsed_in_cycle;
                LOG_DISCOVERY(INFO, "Scan restarted after adapter error");
            } else {
                state_ = DiscoveryState::Stopped;
                setErrorLocked(DiscoveryError::ScanCallbackError,
                               "Scan restart after adapter error failed", pending);
            }
        }

        if (state_ == DiscoveryState::Scanning) {
            cycle_elapsed_ms_ += elapsed_ms;
            if (cycle_elapsed_ms_ >= active_cycle_ms_) {
                stopScanLocked();
                filter_.clearCycle();
                stats_.cycles_completed++;
                cooldown_elapsed_ms_ = 0;
                state_ = DiscoveryState::RestartingCycle;
                LOG_DISCOVERY(DEBUG, "Cycle %llu complete, restarting in %u ms",
                              static_cast<unsigned long long>(stats_.cycles_completed),
                              config_.restart_cooldown_ms);
            }
        } else if (state_ == DiscoveryState::RestartingCycle) {
            cooldown_elapsed_ms_ += elapsed_ms;
        }

        if (state_ == DiscoveryState::RestartingCycle &&
            cooldown_elapsed_ms_ >= config_.restart_cooldown_ms) {
            if (!startScanLocked()) {
                state_ = DiscoveryState::Stopped;
                setErrorLocked(DiscoveryError::ScanCallbackError,
                               "Scan restart after cycle end failed", pending);
            }
        }
    }
    notifyError(pending);
}

// ============================================================================
// STATUS
// ============================================================================

DiscoveryState DiscoverySession::getState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool DiscoverySession::isAdvertising() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return advertising_;
}

DiscoveryStats DiscoverySession::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

std::string DiscoverySession::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

DiscoveryError DiscoverySession::lastErrorKind() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_kind_;
}

uint32_t DiscoverySession::cycleRemainingMs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != DiscoveryState::Scanning || cycle_elapsed_ms_ >= active_cycle_ms_) {
        return 0;
    }
    return active_cycle_ms_ - cycle_elapsed_ms_;
}

// ============================================================================
// INTERNAL
// ============================================================================

bool DiscoverySession::startScanLocked() {
    uint64_t generation = ++scan_generation_;
    radio::ScanHandle handle = adapter_.startScan(
        [this, generation](const radio::ScanEvent& event) { handleScanEvent(generation, event); });

    if (handle == 0) {
        return false;
    }

    scan_handle_ = handle;
    state_ = DiscoveryState::Scanning;
    cycle_elapsed_ms_ = 0;
    cooldown_elapsed_ms_ = 0;
    recovery_pending_ = false;
    scan_requested_ = false;
    LOG_DISCOVERY(INFO, "Scanning (cycle %u ms)", active_cycle_ms_);
    return true;
}

void DiscoverySession::stopScanLocked() {
    if (scan_handle_ != 0) {
        adapter_.stopScan(scan_handle_);
        scan_handle_ = 0;
    }
    // Late events from the old subscription are ignored
    scan_generation_++;
}

bool DiscoverySession::startAdvertiseLocked() {
    if (config_.local_user_id.empty()) {
        last_error_ = "No local user id to advertise";
        LOG_DISCOVERY(WARN, "%s", last_error_.c_str());
        return false;
    }

    radio::AdvertisePayload payload;
    payload.local_name = config_.advertise_prefix + config_.local_user_id;
    payload.company_id = config_.company_id;

    advertising_ = adapter_.startAdvertise(payload);
    if (advertising_) {
        LOG_DISCOVERY(INFO, "Advertising as %s (company 0x%04X)", payload.local_name.c_str(),
                      payload.company_id);
    } else {
        // Scanning carries on without advertising
        last_error_ = "Advertising failed to start";
        LOG_DISCOVERY(WARN, "%s on adapter %s (state %s)", last_error_.c_str(),
                      adapter_.adapterName(), discoveryStateToString(state_));
    }
    return advertising_;
}

void DiscoverySession::resumeAfterInitLocked() {
    if (scan_requested_ && on_sighting_) {
        filter_.clearCycle();
        if (!startScanLocked()) {
            last_error_ = "Queued scan failed to start";
            last_error_kind_ = DiscoveryError::ScanCallbackError;
            LOG_DISCOVERY(ERROR, "%s (state %s)", last_error_.c_str(),
                          discoveryStateToString(state_));
        }
    }
    scan_requested_ = false;

    if (advertise_requested_ && !advertising_ && adapter_.supportsAdvertising()) {
        startAdvertiseLocked();
    }
}

void DiscoverySession::setErrorLocked(DiscoveryError kind, const std::string& detail,
                                      std::optional<PendingError>& pending) {
    last_error_ = detail;
    last_error_kind_ = kind;
    pending = PendingError{kind, detail};
    LOG_DISCOVERY(ERROR, "%s: %s (state %s)", discoveryErrorToString(kind), detail.c_str(),
                  discoveryStateToString(state_));
}

void DiscoverySession::notifyError(const std::optional<PendingError>& pending) {
    if (!pending) {
        return;
    }
    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = on_error_;
    }
    if (callback) {
        callback(pending->kind, pending->detail);
    }
}

void DiscoverySession::handleScanEvent(uint64_t generation, const radio::ScanEvent& event) {
    std::optional<PendingError> pending;
    SightingCallback callback;
    Sighting accepted;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (generation != scan_generation_ || state_ != DiscoveryState::Scanning) {
            return;
        }

        if (event.type == radio::ScanEventType::Error) {
            stats_.scan_errors++;
            if (adapter_.supportsScanRecovery()) {
                // Restart on the next tick, never from inside the adapter's callback
                recovery_pending_ = true;
                last_error_ = "Scan error: " + event.error_message;
                LOG_DISCOVERY(WARN, "Scan error in state %s: %s, restart scheduled",
                              discoveryStateToString(state_), event.error_message.c_str());
            } else {
                pending_stop_handle_ = scan_handle_;
                scan_handle_ = 0;
                scan_generation_++;
                state_ = DiscoveryState::Stopped;
                setErrorLocked(DiscoveryError::ScanCallbackError,
                               "Scan error: " + event.error_message, pending);
            }
        } else {
            const Sighting& sighting = event.sighting;
            stats_.raw_sightings++;

            FilterVerdict verdict = filter_.admit(sighting);
            switch (verdict) {
                case FilterVerdict::RejectedPrefix:
                    stats_.rejected_prefix++;
                    break;
                case FilterVerdict::RejectedSelf:
                    stats_.rejected_self++;
                    break;
                case FilterVerdict::RejectedDuplicate:
                    stats_.rejected_duplicate++;
                    break;
                case FilterVerdict::Accepted:
                    stats_.emitted++;
                    callback = on_sighting_;
                    accepted = sighting;
                    break;
            }

            LOG_DISCOVERY(TRACE, "Sighting %s '%s' rssi=%d: %s", sighting.device_id.c_str(),
                          sighting.advertised_name.c_str(), sighting.signal_strength,
                          filterVerdictToString(verdict));
        }
    }

    notifyError(pending);
    if (callback) {
        callback(accepted);
    }
}

void DiscoverySession::handlePowerState(radio::PowerState power) {
    std::optional<PendingError> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        LOG_DISCOVERY(INFO, "Adapter power %s (state %s)", radio::powerStateToString(power),
                      discoveryStateToString(state_));

        if (power == radio::PowerState::PoweredOn) {
            if (state_ != DiscoveryState::Initializing) {
                return;
            }

            bool ready = false;
            if (init_attempts_after_power_ < config_.max_init_retries) {
                init_attempts_after_power_++;
                stats_.init_retries++;
                ready = adapter_.initialize();
            }

            if (ready) {
                state_ = DiscoveryState::Ready;
                init_attempts_after_power_ = 0;
                last_error_.clear();
                last_error_kind_ = DiscoveryError::None;
                LOG_DISCOVERY(INFO, "Adapter %s ready after power-on", adapter_.adapterName());
                resumeAfterInitLocked();
            } else if (init_attempts_after_power_ >= config_.max_init_retries) {
                state_ = DiscoveryState::Idle;
                scan_requested_ = false;
                advertise_requested_ = false;
                on_sighting_ = nullptr;
                setErrorLocked(DiscoveryError::AdapterUnavailable,
                               "Adapter unavailable after " +
                                   std::to_string(init_attempts_after_power_) + " retries",
                               pending);
            } else {
                LOG_DISCOVERY(WARN, "Initialize retry %d/%d failed", init_attempts_after_power_,
                              config_.max_init_retries);
            }
        } else if (state_ != DiscoveryState::Idle && state_ != DiscoveryState::Initializing) {
            handlePowerLossLocked(power);
        }
    }
    notifyError(pending);
}

void DiscoverySession::handlePowerLossLocked(radio::PowerState power) {
    bool was_scanning = state_ == DiscoveryState::Scanning ||
                        state_ == DiscoveryState::RestartingCycle;
    stopScanLocked();
    if (pending_stop_handle_ != 0) {
        adapter_.stopScan(pending_stop_handle_);
        pending_stop_handle_ = 0;
    }
    filter_.clearCycle();
    cycle_elapsed_ms_ = 0;
    cooldown_elapsed_ms_ = 0;
    recovery_pending_ = false;
    scan_requested_ = was_scanning;
    advertising_ = false;   // advertise_requested_ is kept for the resume

    init_attempts_after_power_ = 0;
    state_ = DiscoveryState::Initializing;
    last_error_kind_ = DiscoveryError::AdapterUnavailable;
    last_error_ = std::string("Adapter power ") + radio::powerStateToString(power);
}

} // namespace discovery
} // namespace shyradar
