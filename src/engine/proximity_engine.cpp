#include "proximity_engine.hpp"
#include "shyradar/logging.hpp"

namespace shyradar {
namespace engine {

ProximityEngine::ProximityEngine(radio::RadioAdapter& adapter, identity::Directory& directory,
                                 const EngineConfig& config)
    : config_(config),
      session_(adapter, config.discovery),
      resolver_(directory, config.resolver),
      pool_(std::make_unique<identity::ResolverPool>(resolver_, config.resolver.max_in_flight)),
      layout_(config.policy, config.layout),
      gesture_(config.layout.anchor(), config.gesture) {
    session_.setErrorCallback([](discovery::DiscoveryError kind, const std::string& detail) {
        LOG_ENGINE(WARN, "Discovery error %s: %s", discovery::discoveryErrorToString(kind),
                   detail.c_str());
    });
}

ProximityEngine::~ProximityEngine() {
    // Session first: no more sightings may reach the pool once it stops
    session_.teardown();
    pool_->stop();
}

bool ProximityEngine::start() {
    if (!session_.initialize()) {
        LOG_ENGINE(WARN, "Adapter not ready: %s", session_.getLastError().c_str());
    }

    bool scanning = session_.startScanning([this](const Sighting& s) { onSighting(s); });
    if (!scanning) {
        LOG_ENGINE(ERROR, "Could not start scanning: %s", session_.getLastError().c_str());
        return false;
    }

    if (!session_.startAdvertising()) {
        LOG_ENGINE(WARN, "Advertising unavailable: %s", session_.getLastError().c_str());
    }
    return true;
}

void ProximityEngine::stop() {
    session_.stopScanning();
    session_.stopAdvertising();
}

void ProximityEngine::teardown() {
    session_.teardown();
    pool_->invalidate();
    gesture_.cancel();
    roster_.clear();
    layout_.reset();
    laid_out_version_ = roster_.version();
    layout_dirty_ = false;
    LOG_ENGINE(INFO, "Engine torn down");
}

void ProximityEngine::tick(uint32_t elapsed_ms, Timestamp now) {
    session_.tick(elapsed_ms);

    for (const auto& completion : pool_->drainCompleted()) {
        applyCompletion(completion);
    }

    Milliseconds window(session_.getConfig().staleness_window_ms);
    std::vector<UserId> pruned = roster_.prune(now, window);
    stats_.users_pruned += pruned.size();

    relayoutIfChanged();
}

void ProximityEngine::setLayoutPolicy(LayoutPolicyType type) {
    if (type == layout_.policyType()) {
        return;
    }
    gesture_.cancel();
    layout_.setPolicy(type);
    layout_dirty_ = true;
    relayoutIfChanged();
}

bool ProximityEngine::setUserDistance(const UserId& user_id, std::optional<float> meters) {
    return roster_.setDistance(user_id, meters);
}

bool ProximityEngine::beginDrag(const UserId& user_id, Position pointer, Timestamp at) {
    std::optional<Position> position = layout_.positionOf(user_id);
    if (!position) {
        LOG_ENGINE(DEBUG, "Drag on %s ignored, user not displayed", user_id.c_str());
        return false;
    }
    return gesture_.begin(user_id, *position, pointer, at);
}

void ProximityEngine::setConversationHandler(gesture::ConversationHandler handler) {
    gesture_.setConversationHandler(std::move(handler));
}

void ProximityEngine::setTapHandler(gesture::TapHandler handler) {
    gesture_.setTapHandler(std::move(handler));
}

void ProximityEngine::setSightingObserver(SightingObserver observer) {
    std::lock_guard<std::mutex> lock(observer_mutex_);
    sighting_observer_ = std::move(observer);
}

void ProximityEngine::setResolutionObserver(ResolutionObserver observer) {
    std::lock_guard<std::mutex> lock(observer_mutex_);
    resolution_observer_ = std::move(observer);
}

EngineStats ProximityEngine::getStats() const {
    EngineStats stats = stats_;
    stats.sightings_submitted = sightings_submitted_.load();
    stats.sightings_coalesced = sightings_coalesced_.load();
    return stats;
}

void ProximityEngine::onSighting(const Sighting& sighting) {
    if (pool_->submit(sighting)) {
        sightings_submitted_++;
    } else {
        sightings_coalesced_++;
    }

    SightingObserver observer;
    {
        std::lock_guard<std::mutex> lock(observer_mutex_);
        observer = sighting_observer_;
    }
    if (observer) {
        observer(sighting);
    }
}

void ProximityEngine::applyCompletion(const identity::ResolveCompletion& completion) {
    const identity::ResolveResult& result = completion.result;
    switch (result.status) {
        case identity::ResolveStatus::Resolved:
            stats_.resolved++;
            if (result.record) {
                roster_.upsert(*result.record, completion.sighting);
            }
            break;
        case identity::ResolveStatus::NotFound:
            stats_.not_found++;
            break;
        case identity::ResolveStatus::DirectoryUnavailable:
            stats_.directory_unavailable++;
            LOG_ENGINE(DEBUG, "Device %s unresolved (directory unavailable), waiting for next sighting",
                       completion.sighting.device_id.c_str());
            break;
    }

    ResolutionObserver observer;
    {
        std::lock_guard<std::mutex> lock(observer_mutex_);
        observer = resolution_observer_;
    }
    if (observer) {
        observer(completion);
    }
}

void ProximityEngine::relayoutIfChanged() {
    if (!layout_dirty_ && roster_.version() == laid_out_version_) {
        return;
    }
    layout_.compute(roster_.snapshot());
    laid_out_version_ = roster_.version();
    layout_dirty_ = false;
    stats_.layouts_computed++;
    LOG_ENGINE(DEBUG, "Layout v%llu: %zu displayed, %zu hidden",
               static_cast<unsigned long long>(laid_out_version_), layout_.lastResult().placed.size(),
               layout_.lastResult().unplaced.size());
}

} // namespace engine
} // namespace shyradar
