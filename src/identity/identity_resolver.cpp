#include "identity_resolver.hpp"
#include "shyradar/logging.hpp"

namespace shyradar {
namespace identity {

const char* resolveStatusToString(ResolveStatus status) {
    switch (status) {
        case ResolveStatus::Resolved:             return "Resolved";
        case ResolveStatus::NotFound:             return "NotFound";
        case ResolveStatus::DirectoryUnavailable: return "DirectoryUnavailable";
        default:                                  return "Unknown";
    }
}

IdentityResolver::IdentityResolver(Directory& directory, const ResolverConfig& config)
    : directory_(directory), config_(config) {}

std::string IdentityResolver::normalizeToken(const std::string& advertised) const {
    std::string token = trimCopy(advertised);

    const std::string& prefix = config_.advertise_prefix;
    if (!prefix.empty() && token.compare(0, prefix.size(), prefix) == 0) {
        token = trimCopy(token.substr(prefix.size()));
    }

    if (token.empty()) {
        return token;
    }

    if (token.find('@') == std::string::npos) {
        token += config_.token_suffix;
    }
    return token;
}

ResolveResult IdentityResolver::resolve(const Sighting& sighting) {
    ResolveResult result;
    uint64_t generation;

    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        generation = cache_generation_;
        auto it = cache_.find(sighting.device_id);
        if (it != cache_.end()) {
            result.status = ResolveStatus::Resolved;
            result.user_id = it->second.user_id;
            result.record = it->second;
            result.from_cache = true;
            return result;
        }
    }

    std::string token = normalizeToken(sighting.advertised_name);
    if (token.empty()) {
        LOG_RESOLVE(DEBUG, "Device %s advertised no usable token", sighting.device_id.c_str());
        return result;
    }

    std::optional<UserRecord> match;
    try {
        match = directory_.findByToken(token);

        if (!match) {
            std::string lower = toLowerCopy(token);
            for (auto& candidate : directory_.listAll()) {
                if (toLowerCopy(candidate.token) == lower) {
                    LOG_RESOLVE(DEBUG, "Token %s matched %s case-insensitively", token.c_str(),
                                candidate.token.c_str());
                    match = std::move(candidate);
                    break;
                }
            }
        }
    } catch (const DirectoryError& e) {
        LOG_RESOLVE(WARN, "Directory unavailable resolving device %s (token %s): %s",
                    sighting.device_id.c_str(), token.c_str(), e.what());
        result.status = ResolveStatus::DirectoryUnavailable;
        return result;
    }

    if (!match) {
        LOG_RESOLVE(DEBUG, "No user for device %s (token %s)", sighting.device_id.c_str(),
                    token.c_str());
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        if (generation == cache_generation_) {
            cache_[sighting.device_id] = *match;
        }
    }

    LOG_RESOLVE(INFO, "Device %s -> user %s", sighting.device_id.c_str(), match->user_id.c_str());
    result.status = ResolveStatus::Resolved;
    result.user_id = match->user_id;
    result.record = std::move(match);
    return result;
}

void IdentityResolver::invalidate() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_.clear();
    cache_generation_++;
}

size_t IdentityResolver::cacheSize() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cache_.size();
}

std::optional<UserId> IdentityResolver::cachedUserFor(const DeviceId& device_id) const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = cache_.find(device_id);
    if (it == cache_.end()) {
        return std::nullopt;
    }
    return it->second.user_id;
}

} // namespace identity
} // namespace shyradar
