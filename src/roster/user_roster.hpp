#pragma once

#include "shyradar/types.hpp"
#include <map>
#include <optional>
#include <vector>

namespace shyradar {
namespace roster {

/**
 * UserRoster - The live set of discovered users, at most one per user id
 *
 * Repeated sightings refresh last_seen_at in place. version() changes
 * whenever membership, recency order or a ranging distance changes, which
 * is what the layout depends on.
 *
 * Not thread-safe: owned and mutated by the engine's owner thread.
 */
class UserRoster {
public:
    UserRoster() = default;

    // Returns true when the user is new. last_seen_at never moves backwards.
    bool upsert(const UserRecord& record, const Sighting& sighting);

    // Remove users not seen within the window. Returns the removed ids.
    std::vector<UserId> prune(Timestamp now, Milliseconds window);

    // Ordered by last_seen_at descending, ties by user id
    std::vector<DiscoveredUser> snapshot() const;

    std::optional<DiscoveredUser> find(const UserId& user_id) const;

    // Distance from an external ranging/location source; nullopt clears it
    bool setDistance(const UserId& user_id, std::optional<float> meters);

    bool remove(const UserId& user_id);
    void clear();

    size_t size() const { return users_.size(); }
    bool empty() const { return users_.empty(); }
    uint64_t version() const { return version_; }

private:
    std::map<UserId, DiscoveredUser> users_;
    std::vector<UserId> order_;   // Recency order as of the last version bump
    uint64_t version_ = 0;

    std::vector<UserId> computeOrder() const;
    void refreshOrder(bool force_bump);
};

} // namespace roster
} // namespace shyradar
