#pragma once

#include "discovery/discovery_session.hpp"
#include "gesture/selection_gesture.hpp"
#include "identity/directory.hpp"
#include "identity/identity_resolver.hpp"
#include "identity/resolver_pool.hpp"
#include "layout/layout_engine.hpp"
#include "radio/radio_adapter.hpp"
#include "roster/user_roster.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>

namespace shyradar {
namespace engine {

struct EngineConfig {
    discovery::DiscoveryConfig discovery;
    identity::ResolverConfig resolver;
    layout::LayoutConfig layout;
    LayoutPolicyType policy = LayoutPolicyType::FIXED_SLOT;
    gesture::GestureConfig gesture;
};

struct EngineStats {
    uint64_t sightings_submitted = 0;
    uint64_t sightings_coalesced = 0;
    uint64_t resolved = 0;
    uint64_t not_found = 0;
    uint64_t directory_unavailable = 0;
    uint64_t users_pruned = 0;
    uint64_t layouts_computed = 0;
};

using SightingObserver = std::function<void(const Sighting&)>;
using ResolutionObserver = std::function<void(const identity::ResolveCompletion&)>;

/**
 * ProximityEngine - Composition root for discovery, resolution, layout and selection
 *
 * Threading:
 *   - Sightings arrive on the adapter's thread and are handed straight to
 *     the resolver pool; they never wait on directory I/O.
 *   - Everything else (roster, layout, gesture) belongs to the thread that
 *     calls tick(), which drains resolutions, prunes stale users and
 *     recomputes the layout when the roster changed.
 *
 * The adapter and directory must outlive the engine.
 */
class ProximityEngine {
public:
    ProximityEngine(radio::RadioAdapter& adapter, identity::Directory& directory,
                    const EngineConfig& config = EngineConfig{});
    ~ProximityEngine();

    ProximityEngine(const ProximityEngine&) = delete;
    ProximityEngine& operator=(const ProximityEngine&) = delete;

    // ========================================================================
    // LIFECYCLE
    // ========================================================================

    // Initialize, scan and advertise. Returns false when scanning could not
    // be started or queued.
    bool start();

    // Stop scanning and advertising; users stay until they go stale
    void stop();

    // Back to Idle: pending resolutions are discarded, roster and layout cleared
    void teardown();

    void tick(uint32_t elapsed_ms, Timestamp now);

    // ========================================================================
    // LAYOUT
    // ========================================================================

    void setLayoutPolicy(LayoutPolicyType type);
    LayoutPolicyType layoutPolicy() const { return layout_.policyType(); }
    const layout::LayoutResult& layout() const { return layout_.lastResult(); }
    const layout::LayoutEngine& layoutEngine() const { return layout_; }

    std::vector<DiscoveredUser> users() const { return roster_.snapshot(); }
    const roster::UserRoster& roster() const { return roster_; }

    // Distance from an external ranging/location source
    bool setUserDistance(const UserId& user_id, std::optional<float> meters);

    // ========================================================================
    // SELECTION
    // ========================================================================

    // Starts a gesture on a displayed user; false when the user has no position
    bool beginDrag(const UserId& user_id, Position pointer, Timestamp at);

    gesture::SelectionGesture& selection() { return gesture_; }
    const gesture::SelectionGesture& selection() const { return gesture_; }

    void setConversationHandler(gesture::ConversationHandler handler);
    void setTapHandler(gesture::TapHandler handler);

    // ========================================================================
    // OBSERVERS AND STATUS
    // ========================================================================

    // Called on the adapter's thread for every emitted sighting
    void setSightingObserver(SightingObserver observer);
    // Called on the tick() thread for every drained resolution
    void setResolutionObserver(ResolutionObserver observer);

    discovery::DiscoverySession& session() { return session_; }
    const discovery::DiscoverySession& session() const { return session_; }
    identity::ResolverPool& resolverPool() { return *pool_; }
    const identity::IdentityResolver& resolver() const { return resolver_; }

    EngineStats getStats() const;
    const EngineConfig& getConfig() const { return config_; }

private:
    EngineConfig config_;

    discovery::DiscoverySession session_;
    identity::IdentityResolver resolver_;
    std::unique_ptr<identity::ResolverPool> pool_;
    roster::UserRoster roster_;
    layout::LayoutEngine layout_;
    gesture::SelectionGesture gesture_;

    uint64_t laid_out_version_ = 0;
    bool layout_dirty_ = true;

    std::mutex observer_mutex_;
    SightingObserver sighting_observer_;
    ResolutionObserver resolution_observer_;

    // Written on the adapter thread
    std::atomic<uint64_t> sightings_submitted_{0};
    std::atomic<uint64_t> sightings_coalesced_{0};
    EngineStats stats_;

    void onSighting(const Sighting& sighting);
    void applyCompletion(const identity::ResolveCompletion& completion);
    void relayoutIfChanged();
};

} // namespace engine
} // namespace shyradar
