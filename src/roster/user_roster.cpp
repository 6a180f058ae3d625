#include "user_roster.hpp"
#include "shyradar/logging.hpp"
#include <algorithm>

namespace shyradar {
namespace roster {

namespace {

bool moreRecent(const DiscoveredUser& a, const DiscoveredUser& b) {
    if (a.last_seen_at != b.last_seen_at) {
        return a.last_seen_at > b.last_seen_at;
    }
    return a.user_id < b.user_id;
}

} // namespace

bool UserRoster::upsert(const UserRecord& record, const Sighting& sighting) {
    auto it = users_.find(record.user_id);
    bool created = (it == users_.end());

    if (created) {
        DiscoveredUser user;
        user.user_id = record.user_id;
        user.last_seen_at = sighting.observed_at;
        it = users_.emplace(record.user_id, std::move(user)).first;
        LOG_ENGINE(INFO, "User %s discovered via device %s", record.user_id.c_str(),
                   sighting.device_id.c_str());
    }

    DiscoveredUser& user = it->second;
    user.display_name = record.display_name;
    user.photo_ref = record.photo_ref;
    user.is_verified = record.is_verified;
    user.status = record.status;
    if (created || sighting.observed_at >= user.last_seen_at) {
        user.last_seen_at = sighting.observed_at;
        user.last_device_id = sighting.device_id;
    }

    refreshOrder(created);
    return created;
}

std::vector<UserId> UserRoster::prune(Timestamp now, Milliseconds window) {
    std::vector<UserId> removed;
    for (auto it = users_.begin(); it != users_.end();) {
        if (now - it->second.last_seen_at > window) {
            LOG_ENGINE(INFO, "User %s stale, removed", it->first.c_str());
            removed.push_back(it->first);
            it = users_.erase(it);
        } else {
            ++it;
        }
    }
    if (!removed.empty()) {
        refreshOrder(true);
    }
    return removed;
}

std::vector<DiscoveredUser> UserRoster::snapshot() const {
    std::vector<DiscoveredUser> users;
    users.reserve(users_.size());
    for (const auto& entry : users_) {
        users.push_back(entry.second);
    }
    std::sort(users.begin(), users.end(), moreRecent);
    return users;
}

std::optional<DiscoveredUser> UserRoster::find(const UserId& user_id) const {
    auto it = users_.find(user_id);
    if (it == users_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool UserRoster::setDistance(const UserId& user_id, std::optional<float> meters) {
    auto it = users_.find(user_id);
    if (it == users_.end()) {
        return false;
    }
    if (it->second.distance_m != meters) {
        it->second.distance_m = meters;
        version_++;
    }
    return true;
}

bool UserRoster::remove(const UserId& user_id) {
    if (users_.erase(user_id) == 0) {
        return false;
    }
    refreshOrder(true);
    return true;
}

void UserRoster::clear() {
    if (users_.empty()) {
        return;
    }
    users_.clear();
    refreshOrder(true);
}

std::vector<UserId> UserRoster::computeOrder() const {
    std::vector<UserId> order;
    order.reserve(users_.size());
    for (const auto& user : snapshot()) {
        order.push_back(user.user_id);
    }
    return order;
}

void UserRoster::refreshOrder(bool force_bump) {
    std::vector<UserId> order = computeOrder();
    if (force_bump || order != order_) {
        order_ = std::move(order);
        version_++;
    }
}

} // namespace roster
} // namespace shyradar
