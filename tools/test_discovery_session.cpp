// test_discovery_session.cpp - Unit test for the scan lifecycle
//
// Tests:
// 1. Per-cycle dedup (A, A, B -> A, B)
// 2. Self-filter through the session
// 3. Cycle end, cooldown and restart
// 4. Recoverable scan error keeps the cycle
// 5. Unrecoverable scan error stops and surfaces
// 6. Queued scan/advertise while waiting for power-on
// 7. Power loss and resume
// 8. Init failures: retries exhausted, adapter without power callbacks
// 9. Scan-only adapter, teardown, configuration errors

#include "discovery/discovery_session.hpp"
#include "radio/simulated_adapter.hpp"
#include "shyradar/logging.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace shyradar;
using namespace shyradar::discovery;
using radio::PowerState;
using radio::SimulatedRadioAdapter;

static int pass = 0, fail = 0;

static void check(bool ok, const std::string& what) {
    if (ok) {
        std::cout << "  [PASS] " << what << "\n";
        pass++;
    } else {
        std::cout << "  [FAIL] " << what << "\n";
        fail++;
    }
}

struct Collector {
    std::vector<std::string> devices;
    SightingCallback callback() {
        return [this](const Sighting& s) { devices.push_back(s.device_id); };
    }
};

struct ErrorLog {
    std::vector<DiscoveryError> kinds;
    ErrorCallback callback() {
        return [this](DiscoveryError kind, const std::string&) { kinds.push_back(kind); };
    }
};

static DiscoveryConfig testConfig() {
    DiscoveryConfig config;
    config.cycle_duration_ms = 1000;
    config.restart_cooldown_ms = 200;
    config.local_user_id = "u0";
    config.local_device_id = "SELF-DEV";
    return config;
}

int main() {
    setLogLevel(LogLevel::NONE);
    std::cout << "=== Discovery Session Unit Test ===\n\n";

    // ========================================================================
    // TEST 1: Dedup within a cycle
    // ========================================================================
    std::cout << "TEST 1: Per-cycle dedup\n";
    {
        SimulatedRadioAdapter radio;
        DiscoverySession session(radio, testConfig());
        Collector seen;

        check(session.initialize(), "initialize() on a powered adapter");
        check(session.getState() == DiscoveryState::Ready, "state Ready");
        check(session.startScanning(seen.callback()), "startScanning()");
        check(session.getState() == DiscoveryState::Scanning, "state Scanning");

        radio.injectSighting("A", "ShyText_alice", -40);
        radio.injectSighting("A", "ShyText_alice", -42);
        radio.injectSighting("B", "ShyText_bob", -60);

        check(seen.devices == std::vector<std::string>({"A", "B"}), "emitted A then B once each");
        DiscoveryStats stats = session.getStats();
        check(stats.raw_sightings == 3 && stats.emitted == 2 && stats.rejected_duplicate == 1,
              "stats: 3 raw, 2 emitted, 1 duplicate");
        check(session.initialize(), "initialize() is idempotent while scanning");
        check(radio.initializeCalls() == 1, "adapter initialized once");
    }

    // ========================================================================
    // TEST 2: Self-filter
    // ========================================================================
    std::cout << "\nTEST 2: Self-filter\n";
    {
        SimulatedRadioAdapter radio;
        DiscoverySession session(radio, testConfig());
        Collector seen;
        session.initialize();
        session.startScanning(seen.callback());

        radio.injectSighting("X1", "ShyText_u0", -30);
        radio.injectSighting("SELF-DEV", "", -30);
        radio.injectSighting("X2", "ShyText_carol", -50);

        check(seen.devices == std::vector<std::string>({"X2"}), "only the foreign device emitted");
        check(session.getStats().rejected_self == 2, "two self sightings counted");
    }

    // ========================================================================
    // TEST 3: Cycle restart
    // ========================================================================
    std::cout << "\nTEST 3: Cycle end and restart\n";
    {
        SimulatedRadioAdapter radio;
        DiscoverySession session(radio, testConfig());
        Collector seen;
        session.initialize();
        session.startScanning(seen.callback());

        radio.injectSighting("A", "ShyText_alice", -40);
        session.tick(600);
        check(session.cycleRemainingMs() == 400, "400 ms left in the cycle");

        session.tick(400);
        check(session.getState() == DiscoveryState::RestartingCycle, "cycle end -> RestartingCycle");
        check(!radio.isScanning(), "adapter scan stopped during cooldown");
        check(!radio.injectSighting("A", "ShyText_alice", -40), "no delivery during cooldown");

        session.tick(100);
        check(session.getState() == DiscoveryState::RestartingCycle, "still cooling down at 100 ms");
        session.tick(100);
        check(session.getState() == DiscoveryState::Scanning, "scan restarted after 200 ms");
        check(radio.scanStarts() == 2, "adapter scan started twice");

        radio.injectSighting("A", "ShyText_alice", -41);
        check(seen.devices == std::vector<std::string>({"A", "A"}), "A re-emitted in the new cycle");
        check(session.getStats().cycles_completed == 1, "one cycle completed");

        // Cycle length given to startScanning wins over the configured one
        session.stopScanning();
        session.startScanning(seen.callback(), 500);
        session.tick(500);
        check(session.getState() == DiscoveryState::RestartingCycle, "custom 500 ms cycle honoured");
    }
    {
        SimulatedRadioAdapter radio;
        DiscoveryConfig config = testConfig();
        config.restart_cooldown_ms = 0;
        DiscoverySession session(radio, config);
        Collector seen;
        session.initialize();
        session.startScanning(seen.callback());
        session.tick(1000);
        check(session.getState() == DiscoveryState::Scanning, "zero cooldown restarts in the same tick");
        check(session.getStats().cycles_completed == 1, "cycle still counted");
    }

    // ========================================================================
    // TEST 4: Recoverable scan error
    // ========================================================================
    std::cout << "\nTEST 4: Recoverable scan error\n";
    {
        SimulatedRadioAdapter radio;
        DiscoverySession session(radio, testConfig());
        Collector seen;
        ErrorLog errors;
        session.setErrorCallback(errors.callback());
        session.initialize();
        session.startScanning(seen.callback());

        radio.injectSighting("A", "ShyText_alice", -40);
        session.tick(300);
        radio.injectScanError("adapter hiccup");
        check(session.getState() == DiscoveryState::Scanning, "still Scanning until the next tick");

        session.tick(0);
        DiscoveryStats stats = session.getStats();
        check(stats.scan_errors == 1 && stats.recoveries == 1, "error counted and recovered");
        check(radio.scanStarts() == 2 && radio.isScanning(), "scan restarted on the adapter");
        check(session.cycleRemainingMs() == 700, "cycle timer carried over");

        radio.injectSighting("A", "ShyText_alice", -40);
        check(seen.devices.size() == 1, "dedup set survives recovery");
        check(errors.kinds.empty(), "recovery is not surfaced as an error");
    }

    // ========================================================================
    // TEST 5: Unrecoverable scan error
    // ========================================================================
    std::cout << "\nTEST 5: Unrecoverable scan error\n";
    {
        SimulatedRadioAdapter::Options options;
        options.supports_scan_recovery = false;
        SimulatedRadioAdapter radio(options);
        DiscoverySession session(radio, testConfig());
        Collector seen;
        ErrorLog errors;
        session.setErrorCallback(errors.callback());
        session.initialize();
        session.startScanning(seen.callback());

        radio.injectScanError("fatal");
        check(session.getState() == DiscoveryState::Stopped, "state Stopped");
        check(errors.kinds.size() == 1 && errors.kinds[0] == DiscoveryError::ScanCallbackError,
              "ScanCallbackError surfaced once");
        check(session.lastErrorKind() == DiscoveryError::ScanCallbackError, "lastErrorKind recorded");

        session.tick(10);
        check(!radio.isScanning(), "adapter scan released on the next tick");
        session.tick(5000);
        check(session.getState() == DiscoveryState::Stopped, "no automatic restart");

        check(session.startScanning(seen.callback()), "manual restart from Stopped");
        check(session.getState() == DiscoveryState::Scanning, "Scanning again");
    }

    // ========================================================================
    // TEST 6: Queued requests while waiting for power
    // ========================================================================
    std::cout << "\nTEST 6: Queued scan and advertise until power-on\n";
    {
        SimulatedRadioAdapter::Options options;
        options.requires_power_callbacks = true;
        options.initial_power = PowerState::PoweredOff;
        SimulatedRadioAdapter radio(options);
        DiscoverySession session(radio, testConfig());
        Collector seen;
        ErrorLog errors;
        session.setErrorCallback(errors.callback());

        check(!session.initialize(), "initialize() fails while powered off");
        check(session.getState() == DiscoveryState::Initializing, "waits in Initializing");
        check(errors.kinds.empty(), "not surfaced while waiting for power");
        check(session.startScanning(seen.callback()), "scan request queued");
        check(session.startAdvertising(), "advertise request queued");
        check(!radio.isScanning() && !radio.isAdvertising(), "nothing started yet");

        radio.setPowerState(PowerState::PoweredOn);
        check(session.getState() == DiscoveryState::Scanning, "queued scan started on power-on");
        check(session.isAdvertising() && radio.isAdvertising(), "queued advertising started");
        auto ad = radio.lastAdvertisement();
        check(ad && ad->local_name == "ShyText_u0" && ad->company_id == 0x1234,
              "advertised as ShyText_u0 under company 0x1234");
        check(session.getStats().init_retries == 1, "one retry after power-on");

        // ====================================================================
        // TEST 7: Power loss and resume (same adapter and session)
        // ====================================================================
        std::cout << "\nTEST 7: Power loss and resume\n";
        radio.injectSighting("A", "ShyText_alice", -40);
        radio.setPowerState(PowerState::PoweredOff);
        check(session.getState() == DiscoveryState::Initializing, "power loss -> Initializing");
        check(!session.isAdvertising(), "advertising flag cleared");
        check(session.lastErrorKind() == DiscoveryError::AdapterUnavailable, "AdapterUnavailable recorded");

        radio.setPowerState(PowerState::PoweredOn);
        check(session.getState() == DiscoveryState::Scanning, "scanning resumed on power-on");
        check(session.isAdvertising(), "advertising resumed on power-on");
        radio.injectSighting("A", "ShyText_alice", -40);
        check(seen.devices.size() == 2, "dedup reset across the power cycle");
    }

    // ========================================================================
    // TEST 8: Init failures
    // ========================================================================
    std::cout << "\nTEST 8: Init failures\n";
    {
        SimulatedRadioAdapter::Options options;
        options.requires_power_callbacks = true;
        options.initial_power = PowerState::PoweredOff;
        SimulatedRadioAdapter radio(options);
        DiscoveryConfig config = testConfig();
        config.max_init_retries = 0;
        DiscoverySession session(radio, config);
        ErrorLog errors;
        session.setErrorCallback(errors.callback());

        session.initialize();
        radio.setPowerState(PowerState::PoweredOn);
        check(session.getState() == DiscoveryState::Idle, "no retries left -> Idle");
        check(errors.kinds.size() == 1 && errors.kinds[0] == DiscoveryError::AdapterUnavailable,
              "AdapterUnavailable surfaced");
    }
    {
        SimulatedRadioAdapter::Options options;
        options.initial_power = PowerState::Unauthorized;
        SimulatedRadioAdapter radio(options);
        DiscoverySession session(radio, testConfig());
        ErrorLog errors;
        session.setErrorCallback(errors.callback());
        Collector seen;

        check(!session.initialize(), "initialize() fails without power callbacks");
        check(session.getState() == DiscoveryState::Idle, "back to Idle");
        check(errors.kinds.size() == 1 && errors.kinds[0] == DiscoveryError::AdapterUnavailable,
              "surfaced immediately");
        check(!session.startScanning(seen.callback()), "startScanning refused while Idle");
        check(!session.startAdvertising(), "startAdvertising refused while Idle");
    }

    // ========================================================================
    // TEST 9: Scan-only adapter, teardown, configuration
    // ========================================================================
    std::cout << "\nTEST 9: Scan-only adapter, teardown, configuration\n";
    {
        SimulatedRadioAdapter::Options options;
        options.supports_advertising = false;
        SimulatedRadioAdapter radio(options);
        DiscoverySession session(radio, testConfig());
        session.initialize();
        check(session.startAdvertising(), "advertising is a no-op success on scan-only adapters");
        check(!session.isAdvertising() && !radio.lastAdvertisement(), "nothing advertised");
    }
    {
        SimulatedRadioAdapter::Options options;
        options.requires_power_callbacks = true;
        SimulatedRadioAdapter radio(options);
        DiscoverySession session(radio, testConfig());
        Collector seen;
        session.initialize();
        session.startScanning(seen.callback());
        session.startAdvertising();
        check(radio.powerListenerCount() == 1, "one power listener registered");

        session.teardown();
        check(session.getState() == DiscoveryState::Idle, "teardown -> Idle");
        check(!radio.isScanning() && !radio.isAdvertising(), "adapter scan and advertising stopped");
        check(radio.powerListenerCount() == 0, "power listener removed");
        session.teardown();
        check(session.getState() == DiscoveryState::Idle, "second teardown is harmless");
        check(!radio.injectSighting("A", "ShyText_alice", -40) && seen.devices.empty(),
              "no sightings after teardown");

        session.stopScanning();
        check(session.getState() == DiscoveryState::Idle, "stopScanning on Idle is a no-op");
    }
    {
        SimulatedRadioAdapter radio;
        DiscoveryConfig bad = testConfig();
        bad.cycle_duration_ms = 0;
        bool threw = false;
        try {
            DiscoverySession session(radio, bad);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        check(threw, "zero cycle duration rejected");
    }
    {
        SimulatedRadioAdapter radio;
        DiscoveryConfig bad = testConfig();
        bad.staleness_window_ms = bad.cycle_duration_ms + bad.restart_cooldown_ms;
        bool threw = false;
        try {
            DiscoverySession session(radio, bad);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        check(threw, "staleness window no longer than cycle plus cooldown rejected");

        DiscoverySession session(radio, testConfig());
        bool rejected = false;
        try {
            session.configure(bad);
        } catch (const std::invalid_argument&) {
            rejected = true;
        }
        check(rejected && session.getConfig().staleness_window_ms == testConfig().staleness_window_ms,
              "configure() keeps the previous config on rejection");

        DiscoveryConfig defaults;
        check(defaults.staleness_window_ms > defaults.cycle_duration_ms + defaults.restart_cooldown_ms,
              "default window outlasts a cycle");
    }

    // ========================================================================
    // Summary
    // ========================================================================
    std::cout << "\n========================================\n";
    std::cout << "RESULTS: " << pass << " passed, " << fail << " failed\n";
    std::cout << "========================================\n";

    if (fail == 0) {
        std::cout << "\n[SUCCESS] All discovery session tests passed!\n";
        return 0;
    } else {
        std::cout << "\n[FAILURE] Some tests failed.\n";
        return 1;
    }
}
