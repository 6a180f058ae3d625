#pragma once

#include "directory.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace shyradar {
namespace identity {

enum class ResolveStatus {
    Resolved,
    NotFound,              // Expected outcome; the sighting is dropped
    DirectoryUnavailable,  // Transient; retried on the next fresh sighting
};

const char* resolveStatusToString(ResolveStatus status);

struct ResolveResult {
    ResolveStatus status = ResolveStatus::NotFound;
    UserId user_id;
    std::optional<UserRecord> record;
    bool from_cache = false;

    bool resolved() const { return status == ResolveStatus::Resolved; }
};

struct ResolverConfig {
    std::string advertise_prefix = "ShyText_";
    std::string token_suffix = "@app";
    int max_in_flight = 4;
};

/**
 * IdentityResolver - Maps an advertised token to a directory user
 *
 * Lookup order: exact token match, then a case-insensitive scan of the full
 * directory. Positive results are cached per device id until invalidate().
 * Thread-safe; the directory is called without holding the cache lock.
 */
class IdentityResolver {
public:
    explicit IdentityResolver(Directory& directory, const ResolverConfig& config = ResolverConfig{});

    ResolveResult resolve(const Sighting& sighting);

    // Trim, strip the advertise prefix, append the suffix when there is no '@'.
    // Returns an empty string when nothing is left.
    std::string normalizeToken(const std::string& advertised) const;

    // Drop the device cache (session teardown)
    void invalidate();

    size_t cacheSize() const;
    std::optional<UserId> cachedUserFor(const DeviceId& device_id) const;

    const ResolverConfig& getConfig() const { return config_; }

private:
    Directory& directory_;
    ResolverConfig config_;

    mutable std::mutex cache_mutex_;
    std::unordered_map<DeviceId, UserRecord> cache_;
    uint64_t cache_generation_ = 0;   // Bumped by invalidate(); stale lookups are not cached
};

} // namespace identity
} // namespace shyradar
