#pragma once

#include "identity_resolver.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace shyradar {
namespace identity {

struct ResolveCompletion {
    uint64_t epoch = 0;
    Sighting sighting;
    ResolveResult result;
};

/**
 * ResolverPool - Concurrent, bounded identity resolution
 *
 * submit() never blocks on the directory: requests are queued and resolved
 * by up to max_in_flight worker threads. A device already queued or in
 * flight in the current epoch is coalesced; its completion carries the
 * most recent of the coalesced sightings.
 *
 * Completions are collected and handed to the owner thread by
 * drainCompleted(); completions from an earlier epoch are discarded there,
 * so results arriving after invalidate() never reach session state.
 */
class ResolverPool {
public:
    ResolverPool(IdentityResolver& resolver, int max_in_flight);
    ~ResolverPool();

    ResolverPool(const ResolverPool&) = delete;
    ResolverPool& operator=(const ResolverPool&) = delete;

    // Returns false when coalesced or after stop()
    bool submit(const Sighting& sighting);

    // Owner thread only
    std::vector<ResolveCompletion> drainCompleted();

    // New epoch: drop queued work, discard in-flight results, clear the cache
    void invalidate();

    // Join the workers. Queued work is dropped.
    void stop();

    // Block until nothing is queued or in flight (tests and the CLI)
    bool waitIdle(std::chrono::milliseconds timeout);

    uint64_t epoch() const;
    size_t pendingCount() const;   // Queued + in flight
    int maxInFlight() const { return max_in_flight_; }
    uint64_t staleDropped() const;

private:
    struct Request {
        uint64_t epoch;
        Sighting sighting;
    };

    IdentityResolver& resolver_;
    int max_in_flight_;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;

    std::deque<Request> queue_;
    struct Active {
        uint64_t epoch;
        Sighting latest;    // Newest sighting seen while the request is pending
    };

    std::unordered_map<DeviceId, Active> active_;     // Queued or in flight
    std::vector<ResolveCompletion> completed_;
    size_t in_flight_ = 0;
    uint64_t epoch_ = 1;
    uint64_t stale_dropped_ = 0;
    bool running_ = false;

    std::vector<std::thread> workers_;

    void workerLoop();
};

} // namespace identity
} // namespace shyradar
